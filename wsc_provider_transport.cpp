#include <utility>

#include <spdlog/spdlog.h>

#include "wsc_provider_transport.h"

std::shared_ptr<WscProviderTransport> WscProviderTransport::create(const RelayConfig &cfg,
                                                                   const std::string &sessionId)
{
    std::shared_ptr<WscProviderTransport> sp(new WscProviderTransport(cfg, sessionId));
    sp->bindCallbacks(std::weak_ptr<WscProviderTransport>(sp));
    return sp;
}

WscProviderTransport::WscProviderTransport(const RelayConfig &cfg, const std::string &sessionId)
    : m_sessionId(sessionId),
      m_suppressLog(cfg.suppressLog)
{
    WebSocketHeaders hdrs;
    WebSocketTLSOptions tls;

    const std::string bearer = "Bearer " + cfg.apiKey;
    const std::string uri    = cfg.providerUri();
    hdrs.set("Authorization", bearer.c_str());
    hdrs.set("OpenAI-Beta", "realtime=v1");

    client.setUrl(uri.c_str());

    if (!cfg.tlsCaFile.empty())   tls.caFile   = cfg.tlsCaFile;
    if (!cfg.tlsKeyFile.empty())  tls.keyFile  = cfg.tlsKeyFile;
    if (!cfg.tlsCertFile.empty()) tls.certFile = cfg.tlsCertFile;
    tls.disableHostnameValidation = cfg.tlsDisableHostnameValidation;
    client.setTLSOptions(tls);

    if (cfg.heartBeat)  client.setPingInterval(cfg.heartBeat);
    if (cfg.deflate)    client.enableCompression(false);
    client.setHeaders(hdrs);
}

void WscProviderTransport::bindCallbacks(std::weak_ptr<WscProviderTransport> wp) {

    client.setMessageCallback([wp](const std::string &message) {
        auto self = wp.lock();
        if (!self || self->isCleanedUp()) return;
        self->eventCallback(MESSAGE, 0, message);
    });

    /* The provider speaks JSON only; binary frames are unexpected. */
    client.setBinaryCallback([wp](const void *data, size_t len) {
        auto self = wp.lock();
        if (!self || self->isCleanedUp()) return;
        (void)data;
        self->eventCallback(BINARY_AUDIO, 0, std::to_string(len));
    });

    client.setOpenCallback([wp]() {
        auto self = wp.lock();
        if (!self || self->isCleanedUp()) return;
        self->eventCallback(CONNECT_SUCCESS, 0, std::string());
    });

    client.setErrorCallback([wp](int code, const std::string &msg) {
        auto self = wp.lock();
        if (!self || self->isCleanedUp()) return;
        self->eventCallback(CONNECT_ERROR, code, msg);
    });

    client.setCloseCallback([wp](int code, const std::string &reason) {
        auto self = wp.lock();
        if (!self || self->isCleanedUp()) return;
        self->eventCallback(CONNECTION_DROPPED, code, reason);
    });
}

/* ── Central event dispatcher ────────────────────────────────────────────── */
void WscProviderTransport::eventCallback(notifyEvent_t event, int code, const std::string &message) {
    std::lock_guard<std::mutex> lk(m_cbMutex);
    if (isCleanedUp()) return;

    switch (event) {

        case CONNECT_SUCCESS:
            spdlog::debug("({}) provider socket open", m_sessionId);
            if (m_cb.onOpen) m_cb.onOpen();
            break;

        case CONNECTION_DROPPED:
            spdlog::info("({}) provider connection closed ({}) {}", m_sessionId, code, message);
            if (m_cb.onClose) m_cb.onClose(code, message);
            break;

        case CONNECT_ERROR:
            spdlog::info("({}) provider connection error ({}) {}", m_sessionId, code, message);
            if (m_cb.onError) m_cb.onError(code, message);
            break;

        case MESSAGE:
            if (!m_suppressLog) {
                spdlog::trace("({}) provider frame: {}", m_sessionId, message);
            }
            if (m_cb.onMessage) m_cb.onMessage(message);
            break;

        case BINARY_AUDIO:
            spdlog::warn("({}) ProtocolError: unexpected {} byte binary frame from provider",
                m_sessionId, message);
            break;
    }
}

void WscProviderTransport::open(const Callbacks &cb) {
    {
        std::lock_guard<std::mutex> lk(m_cbMutex);
        m_cb = cb;
    }
    client.connect();
}

bool WscProviderTransport::isConnected() const {
    return client.isConnected();
}

bool WscProviderTransport::sendText(const std::string &text) {
    if (!isConnected()) return false;
    client.sendMessage(text.c_str(), text.size());
    return true;
}

/* Detach all WS callbacks so no events fire after this point. */
void WscProviderTransport::detach() {
    m_cleanedUp.store(true, std::memory_order_release);
    client.setMessageCallback({});
    client.setBinaryCallback({});
    client.setOpenCallback({});
    client.setErrorCallback({});
    client.setCloseCallback({});

    /* waits out a callback already in flight */
    std::lock_guard<std::mutex> lk(m_cbMutex);
    m_cb = Callbacks();
}

void WscProviderTransport::close() {
    spdlog::debug("({}) provider socket disconnecting", m_sessionId);
    client.disconnect();
}

bool WscProviderTransport::isCleanedUp() const {
    return m_cleanedUp.load(std::memory_order_acquire);
}

ProviderTransportFactory wscTransportFactory() {
    return [](const RelayConfig &cfg, const std::string &sessionId)
        -> std::shared_ptr<ProviderTransport> {
        return WscProviderTransport::create(cfg, sessionId);
    };
}
