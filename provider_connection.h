#ifndef PROVIDER_CONNECTION_H
#define PROVIDER_CONNECTION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "envelope.h"
#include "json_util.h"
#include "message_router.h"
#include "relay_config.h"

class ToolRegistry;

/*
 * Upstream socket to the provider.  WscProviderTransport implements it
 * over libwsc; tests substitute a scripted fake.
 */
class ProviderTransport {
public:
    struct Callbacks {
        std::function<void()>                               onOpen;
        std::function<void(const std::string &)>            onMessage;
        std::function<void(int, const std::string &)>       onError;
        std::function<void(int, const std::string &)>       onClose;
    };

    virtual ~ProviderTransport() = default;

    /* Start connecting; completion is reported through the callbacks. */
    virtual void open(const Callbacks &cb) = 0;
    virtual bool isConnected() const = 0;
    virtual bool sendText(const std::string &text) = 0;

    /* Drop the callbacks.  No callback is running once this returns. */
    virtual void detach() = 0;
    virtual void close() = 0;
};

typedef std::function<std::shared_ptr<ProviderTransport>(
    const RelayConfig &cfg, const std::string &sessionId)> ProviderTransportFactory;

/*
 * Provider Connection Manager: owns the upstream socket of one session,
 * maps envelopes to provider events and normalises provider events into
 * envelopes dispatched through the provider-side router.
 */
class ProviderConnection {
public:
    typedef std::function<void(const std::string &reason)> DisconnectHandler;

    ProviderConnection(const RelayConfig &cfg,
                       std::shared_ptr<ProviderTransport> transport,
                       MessageRouter &router,
                       const std::string &sessionId);
    ~ProviderConnection();

    ProviderConnection(const ProviderConnection &) = delete;
    ProviderConnection &operator=(const ProviderConnection &) = delete;

    /* Called at most once, when the socket is lost after a successful connect. */
    void setDisconnectHandler(DisconnectHandler handler);

    /*
     * Open the socket and wait for the handshake.  Throws
     * RelayError(HANDSHAKE_ERROR) on failure, timeout or abort().
     */
    void connect(std::chrono::milliseconds timeout);

    /* Wake a pending connect(); it fails with `reason`. */
    void abort(const std::string &reason);

    bool configureSession(const ToolRegistry &tools);
    bool requestWelcome();

    /* Map one envelope to provider events; false when closed or unsupported. */
    bool send(const Envelope &env);
    bool sendFunctionOutput(const std::string &callId, const std::string &output,
                            const std::string &instructions = std::string());

    /* Normalise one provider event; called on the transport thread. */
    void handleMessage(const std::string &text);

    void close();
    bool isConnected() const;
    bool isClosed() const { return m_closed.load(); }

    std::string currentResponseId() const;

private:
    enum ConnectPhase { PHASE_PENDING, PHASE_OPEN, PHASE_FAILED, PHASE_ABORTED };

    bool sendEvent(const cJSON *event, LogCategory category);
    bool sendUserMessage(const Envelope &env);

    void onTransportOpen();
    void onTransportLost(const char *what, int code, const std::string &reason);
    void reportDisconnect(const std::string &reason);

    /* event handlers, one per provider event family */
    void handleItemCreated(const cJSON *event);
    void handleTranscription(const std::string &type, const cJSON *event);
    void handleResponseEvent(const std::string &type, const cJSON *event);
    void handleAudioBufferEvent(const std::string &type, const cJSON *event);
    void handleFunctionCall(const cJSON *event);
    void handleOutputItemAdded(const cJSON *event);
    void handleError(const cJSON *event);

    bool isCurrentResponse(const std::string &responseId);
    void emit(const Envelope &env);
    std::string nextItemId();

    const RelayConfig                  &m_cfg;
    std::shared_ptr<ProviderTransport>  m_transport;
    MessageRouter                      &m_router;
    std::string                         m_sessionId;

    std::mutex                          m_sendMutex;

    std::mutex                          m_connectMutex;
    std::condition_variable             m_connectCv;
    ConnectPhase                        m_phase;
    std::string                         m_failReason;

    std::mutex                          m_disconnectMutex;
    DisconnectHandler                   m_onDisconnect;
    std::atomic<bool>                   m_disconnectReported{false};
    std::atomic<bool>                   m_closed{false};

    /* conversation state, guarded by m_stateMutex */
    mutable std::mutex                  m_stateMutex;
    std::string                         m_currentResponseId;
    std::string                         m_transcript;
    std::string                         m_lastItemId;
    std::map<std::string, std::string>  m_callNames;   /* call_id -> tool name */
    unsigned                            m_itemCounter = 0;
};

#endif /* PROVIDER_CONNECTION_H */
