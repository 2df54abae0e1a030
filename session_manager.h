#ifndef SESSION_MANAGER_H
#define SESSION_MANAGER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "audio_pipeline.h"
#include "frontend_gateway.h"
#include "message_router.h"
#include "provider_connection.h"
#include "realtime_relay.h"
#include "relay_config.h"
#include "tool_registry.h"

/*
 * Cooperative cancellation shared by the frontend reader, the provider
 * event thread and the session worker.  The first cancel() wins and its
 * reason is kept.
 */
class CancellationSignal {
public:
    bool cancel(const std::string &reason);
    bool isCancelled() const;
    std::string reason() const;

    /* Sleep up to `d`; returns true as soon as the signal is cancelled. */
    bool waitFor(std::chrono::milliseconds d) const;

private:
    mutable std::mutex               m_mutex;
    mutable std::condition_variable  m_cv;
    bool                             m_cancelled = false;
    std::string                      m_reason;
};

/*
 * One relay session: a frontend gateway, a provider connection and an
 * audio pipeline bound together through two message routers.
 *
 *   CREATED -> CONNECTING -> ACTIVE -> CLOSING -> CLOSED
 *
 * Callbacks from either socket never tear the session down themselves;
 * they cancel the signal and the worker running run() calls stop().
 *
 * The frontend is read from CONNECTING onward so a client that leaves
 * mid-handshake aborts the connect.  Its frames are held until ACTIVE and
 * then relayed in arrival order.
 */
class SessionManager {
public:
    SessionManager(const RelayConfig &cfg,
                   ProviderTransportFactory transportFactory,
                   const ToolRegistry &tools,
                   const std::string &sessionId = "");
    ~SessionManager();

    SessionManager(const SessionManager &) = delete;
    SessionManager &operator=(const SessionManager &) = delete;

    /*
     * Greet the frontend, connect the provider and wire both routers.
     * Returns true once ACTIVE, false after a terminal error (the frontend
     * has then received one error envelope and the session is closed).
     */
    bool start(std::shared_ptr<FrontendTransport> frontend);

    /* Tear down from any state.  Idempotent; concurrent callers wait for CLOSED. */
    void stop();

    /* Worker body: start, pace playback until cancelled, stop. */
    void run(std::shared_ptr<FrontendTransport> frontend);

    void cancel(const std::string &reason);

    /* One playback tick; returns frames sent. */
    size_t pumpPlayback(AudioPipeline::Clock::time_point now);

    SessionState state() const;
    bool waitForState(SessionState s, std::chrono::milliseconds timeout) const;

    const std::string &id() const { return m_id; }
    std::chrono::system_clock::time_point createdAt() const { return m_createdAt; }
    const CancellationSignal &signal() const { return m_signal; }

    MessageRouter &frontendRouter() { return m_frontendRouter; }
    MessageRouter &providerRouter() { return m_providerRouter; }
    size_t pendingPlayback() const;

    static std::string generateId();

private:
    bool isClosing() const;
    void wireFrontendHandlers();
    void wireProviderHandlers();
    bool deferUntilActive(const Envelope &env);
    void relayDeferred();
    void teardown(SessionState from);

    void sendToFrontend(const Envelope &env);
    void reportError(const std::string &content);

    /* frontend -> provider */
    void onFrontendUserMessage(const Envelope &env);
    void onFrontendAudio(const Envelope &env);
    void onFrontendControl(const Envelope &env);
    void onFrontendClosed(const std::string &reason);
    void relayUserMessage(const Envelope &env);
    void relayAudio(const Envelope &env);
    void relayControl(const Envelope &env);

    /* provider -> frontend */
    void onProviderForward(const Envelope &env);
    void onProviderUserMessage(const Envelope &env);
    void onProviderControl(const Envelope &env);
    void onProviderAudio(const Envelope &env);
    void onProviderFunctionCall(const Envelope &env);
    void onProviderLost(const std::string &reason);

    const RelayConfig          &m_cfg;
    ProviderTransportFactory    m_transportFactory;
    const ToolRegistry         &m_tools;
    std::string                 m_id;
    std::chrono::system_clock::time_point m_createdAt;

    mutable std::mutex               m_stateMutex;
    mutable std::condition_variable  m_stateCv;
    SessionState                     m_state;

    CancellationSignal          m_signal;
    MessageRouter               m_frontendRouter;
    MessageRouter               m_providerRouter;

    /* created once by start(), never reset before destruction */
    mutable std::mutex                   m_componentMutex;
    std::unique_ptr<FrontendGateway>     m_gateway;
    std::unique_ptr<AudioPipeline>       m_audio;
    std::unique_ptr<ProviderConnection>  m_provider;

    std::atomic<bool>           m_errorSent{false};

    std::mutex                  m_deferMutex;     /* held while deferred frames are relayed */
    bool                        m_deferring = true;
    std::deque<Envelope>        m_deferred;

    std::mutex                  m_idMutex;
    std::set<std::string>       m_submittedIds;   /* client user_message ids */
    std::set<std::string>       m_echoedIds;      /* user_message echoes sent */
};

#endif /* SESSION_MANAGER_H */
