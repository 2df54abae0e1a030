#ifndef WSC_PROVIDER_TRANSPORT_H
#define WSC_PROVIDER_TRANSPORT_H

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "WebSocketClient.h"

#include "provider_connection.h"
#include "realtime_relay.h"
#include "relay_config.h"

/*
 * Provider socket over libwsc.  libwsc delivers events on its own thread;
 * every callback holds only a weak reference and is dropped once the
 * transport has been detached.
 */
class WscProviderTransport : public ProviderTransport {
public:
    static std::shared_ptr<WscProviderTransport> create(const RelayConfig &cfg,
                                                        const std::string &sessionId);

    ~WscProviderTransport() override = default;

    void open(const Callbacks &cb) override;
    bool isConnected() const override;
    bool sendText(const std::string &text) override;
    void detach() override;
    void close() override;

private:
    WscProviderTransport(const RelayConfig &cfg, const std::string &sessionId);

    void bindCallbacks(std::weak_ptr<WscProviderTransport> wp);
    void eventCallback(notifyEvent_t event, int code, const std::string &message);
    bool isCleanedUp() const;

    std::string              m_sessionId;
    bool                     m_suppressLog;
    mutable WebSocketClient  client;

    std::mutex               m_cbMutex;     /* held while a callback runs */
    Callbacks                m_cb;
    std::atomic<bool>        m_cleanedUp{false};
};

/* Factory handed to sessions in production. */
ProviderTransportFactory wscTransportFactory();

#endif /* WSC_PROVIDER_TRANSPORT_H */
