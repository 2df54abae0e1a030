#ifndef RELAY_TESTS_FAKES_H
#define RELAY_TESTS_FAKES_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "frontend_gateway.h"
#include "json_util.h"
#include "provider_connection.h"
#include "relay_config.h"
#include "relay_errors.h"

/* In-memory browser socket: records what the relay sends, lets a test play the client. */
class FakeFrontendTransport : public FrontendTransport {
public:
    bool isOpen() const override { return m_open.load(); }

    void sendText(const std::string &text) override {
        if (!m_open.load()) throw ConnectionClosed("fake frontend closed");
        std::lock_guard<std::mutex> lk(m_mutex);
        m_texts.push_back(text);
        m_cv.notify_all();
    }

    void sendBinary(const std::vector<uint8_t> &data) override {
        if (!m_open.load()) throw ConnectionClosed("fake frontend closed");
        std::lock_guard<std::mutex> lk(m_mutex);
        m_binaries.push_back(data);
        m_cv.notify_all();
    }

    void startReading(FrameHandler onFrame, CloseHandler onClose) override {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_onFrame = std::move(onFrame);
        m_onClose = std::move(onClose);
        m_cv.notify_all();
    }

    bool close(uint16_t code, const std::string &reason,
               std::chrono::milliseconds grace) override {
        std::lock_guard<std::mutex> lk(m_mutex);
        ++m_closeCalls;
        m_closeCode = code;
        m_closeGrace = grace;
        m_open.store(false);
        m_cv.notify_all();
        return true;
    }

    std::string remoteAddress() const override { return "127.0.0.1:50000"; }

    /* ── client side ─────────────────────────────────────────────────────── */

    /* Deliver a frame the way the socket read loop would.  Handlers stay
     * installed after close() so late frames can still be injected. */
    void deliverText(const std::string &text) { deliver(text, false); }

    void deliverBinary(const std::vector<uint8_t> &pcm) {
        deliver(std::string(pcm.begin(), pcm.end()), true);
    }

    void peerClose(const std::string &reason) {
        CloseHandler handler;
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            m_open.store(false);
            handler = std::move(m_onClose);
            m_onClose = nullptr;
        }
        if (handler) handler(reason);
    }

    bool waitReading(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(m_mutex);
        return m_cv.wait_for(lk, timeout, [this]() { return static_cast<bool>(m_onFrame); });
    }

    bool waitClosed(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(m_mutex);
        return m_cv.wait_for(lk, timeout, [this]() { return m_closeCalls > 0; });
    }

    std::vector<std::string> texts() const {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_texts;
    }

    std::vector<std::vector<uint8_t>> binaries() const {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_binaries;
    }

    /* Text frames whose "type" equals `type`, parsed. */
    std::vector<jsonPtr> framesOfType(const std::string &type) const {
        std::vector<jsonPtr> out;
        for (const auto &t : texts()) {
            jsonPtr root = jsonParse(t);
            if (root && jsonGetString(root.get(), "type") == type) out.push_back(std::move(root));
        }
        return out;
    }

    /* Control frames carrying `action`. */
    size_t countAction(const std::string &action) const {
        size_t n = 0;
        for (const auto &f : framesOfType("control")) {
            if (jsonGetString(f.get(), "action") == action) ++n;
        }
        return n;
    }

    int closeCalls() const {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_closeCalls;
    }

    std::chrono::milliseconds closeGrace() const {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_closeGrace;
    }

    uint16_t closeCode() const {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_closeCode;
    }

private:
    void deliver(const std::string &payload, bool binary) {
        FrameHandler handler;
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            handler = m_onFrame;
        }
        if (handler) handler(payload, binary);
    }

    std::atomic<bool>                   m_open{true};
    mutable std::mutex                  m_mutex;
    std::condition_variable             m_cv;
    std::vector<std::string>            m_texts;
    std::vector<std::vector<uint8_t>>   m_binaries;
    FrameHandler                        m_onFrame;
    CloseHandler                        m_onClose;
    int                                 m_closeCalls = 0;
    uint16_t                            m_closeCode = 0;
    std::chrono::milliseconds           m_closeGrace{0};
};

/* Scripted upstream socket. */
class FakeProviderTransport : public ProviderTransport {
public:
    /* MANUAL_OPEN waits for openNow(); NEVER_OPEN leaves the connect hanging. */
    enum Mode { OPEN_ON_CONNECT, FAIL_ON_CONNECT, NEVER_OPEN, MANUAL_OPEN };

    explicit FakeProviderTransport(Mode mode = OPEN_ON_CONNECT) : m_mode(mode) {}

    void open(const Callbacks &cb) override {
        std::lock_guard<std::mutex> lk(m_cbMutex);
        m_cb = cb;
        ++m_openCalls;
        if (m_mode == OPEN_ON_CONNECT) {
            m_connected.store(true);
            if (m_cb.onOpen) m_cb.onOpen();
        } else if (m_mode == FAIL_ON_CONNECT) {
            if (m_cb.onError) m_cb.onError(1006, "connection refused");
        }
    }

    bool isConnected() const override { return m_connected.load(); }

    bool sendText(const std::string &text) override {
        if (!m_connected.load()) return false;
        std::lock_guard<std::mutex> lk(m_sentMutex);
        m_sent.push_back(text);
        return true;
    }

    void detach() override {
        std::lock_guard<std::mutex> lk(m_cbMutex);
        m_cb = Callbacks();
        m_detached.store(true);
    }

    void close() override {
        m_connected.store(false);
        ++m_closeCalls;
    }

    /* ── provider side ───────────────────────────────────────────────────── */

    /* Finish a MANUAL_OPEN handshake; false if open() has not been called yet. */
    bool openNow() {
        std::lock_guard<std::mutex> lk(m_cbMutex);
        if (m_openCalls.load() == 0) return false;
        m_connected.store(true);
        if (m_cb.onOpen) m_cb.onOpen();
        return true;
    }

    void inject(const std::string &event) {
        std::lock_guard<std::mutex> lk(m_cbMutex);
        if (m_cb.onMessage) m_cb.onMessage(event);
    }

    void drop(int code, const std::string &reason) {
        m_connected.store(false);
        std::lock_guard<std::mutex> lk(m_cbMutex);
        if (m_cb.onClose) m_cb.onClose(code, reason);
    }

    std::vector<std::string> sent() const {
        std::lock_guard<std::mutex> lk(m_sentMutex);
        return m_sent;
    }

    std::vector<jsonPtr> sentOfType(const std::string &type) const {
        std::vector<jsonPtr> out;
        for (const auto &t : sent()) {
            jsonPtr root = jsonParse(t);
            if (root && jsonGetString(root.get(), "type") == type) out.push_back(std::move(root));
        }
        return out;
    }

    std::vector<std::string> sentTypes() const {
        std::vector<std::string> out;
        for (const auto &t : sent()) {
            jsonPtr root = jsonParse(t);
            out.push_back(root ? jsonGetString(root.get(), "type") : std::string("?"));
        }
        return out;
    }

    int openCalls() const  { return m_openCalls.load(); }
    int closeCalls() const { return m_closeCalls.load(); }
    bool detached() const  { return m_detached.load(); }

private:
    Mode                      m_mode;
    std::atomic<bool>         m_connected{false};
    std::atomic<bool>         m_detached{false};
    std::atomic<int>          m_openCalls{0};
    std::atomic<int>          m_closeCalls{0};

    std::mutex                m_cbMutex;    /* held while a callback runs */
    Callbacks                 m_cb;

    mutable std::mutex        m_sentMutex;
    std::vector<std::string>  m_sent;
};

/* Factory handing out one prepared fake. */
inline ProviderTransportFactory fakeFactory(std::shared_ptr<FakeProviderTransport> fake) {
    return [fake](const RelayConfig &, const std::string &) -> std::shared_ptr<ProviderTransport> {
        return fake;
    };
}

/* Poll `pred` every few ms until it holds or `timeout` passes. */
inline bool eventually(const std::function<bool()> &pred, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

inline RelayConfig testConfig() {
    RelayConfig cfg;
    cfg.apiKey = "sk-test";
    cfg.connectTimeoutMs = 500;
    cfg.closeTimeoutMs = 100;
    return cfg;
}

#endif /* RELAY_TESTS_FAKES_H */
