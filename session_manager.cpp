/*
 * session_manager.cpp
 *
 * One relay session: a browser socket on one side, a provider connection on
 * the other, and the state machine that ties their lifetimes together.
 *
 * Key capabilities
 * ─────────────────
 * • States advance CREATED -> CONNECTING -> ACTIVE -> CLOSING -> CLOSED and
 *   never go back; every path out of a live state runs the same teardown.
 * • The browser is watched from CONNECTING on.  A close or a disconnect
 *   control during the provider handshake aborts the connect quietly.
 * • Frames that arrive before ACTIVE are held (bounded) and relayed in
 *   arrival order once the provider session is configured.
 * • Provider audio is paced back to the browser in 20 ms frames; barge-in
 *   drops whatever is still queued.
 * • Function calls are answered from the tool registry on the provider's
 *   own thread, with tool failures returned to the model as error output.
 */

#include <cstdio>
#include <random>
#include <utility>

#include <spdlog/spdlog.h>

#include "relay_errors.h"
#include "session_manager.h"

const char *sessionStateName(SessionState state) {
    switch (state) {
        case SESSION_CREATED:    return "CREATED";
        case SESSION_CONNECTING: return "CONNECTING";
        case SESSION_ACTIVE:     return "ACTIVE";
        case SESSION_CLOSING:    return "CLOSING";
        case SESSION_CLOSED:     return "CLOSED";
    }
    return "UNKNOWN";
}

/* ═══════════════════════════════════════════════════════════════════════════
 * CancellationSignal
 * ═══════════════════════════════════════════════════════════════════════════ */

bool CancellationSignal::cancel(const std::string &reason) {
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        if (m_cancelled) return false;
        m_cancelled = true;
        m_reason = reason;
    }
    m_cv.notify_all();
    return true;
}

bool CancellationSignal::isCancelled() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_cancelled;
}

std::string CancellationSignal::reason() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_reason;
}

bool CancellationSignal::waitFor(std::chrono::milliseconds d) const {
    std::unique_lock<std::mutex> lk(m_mutex);
    return m_cv.wait_for(lk, d, [this]() { return m_cancelled; });
}

/* ═══════════════════════════════════════════════════════════════════════════
 * SessionManager
 * ═══════════════════════════════════════════════════════════════════════════ */

std::string SessionManager::generateId() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    char buf[MAX_SESSION_ID];
    std::snprintf(buf, sizeof(buf), "sess_%016llx",
        static_cast<unsigned long long>(rng()));
    return buf;
}

SessionManager::SessionManager(const RelayConfig &cfg,
                               ProviderTransportFactory transportFactory,
                               const ToolRegistry &tools,
                               const std::string &sessionId)
    : m_cfg(cfg),
      m_transportFactory(std::move(transportFactory)),
      m_tools(tools),
      m_id(sessionId.empty() ? generateId() : sessionId),
      m_createdAt(std::chrono::system_clock::now()),
      m_state(SESSION_CREATED),
      m_frontendRouter("frontend"),
      m_providerRouter("provider")
{
}

SessionManager::~SessionManager() {
    stop();
}

SessionState SessionManager::state() const {
    std::lock_guard<std::mutex> lk(m_stateMutex);
    return m_state;
}

bool SessionManager::waitForState(SessionState s, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(m_stateMutex);
    return m_stateCv.wait_for(lk, timeout, [this, s]() { return m_state == s; });
}

bool SessionManager::isClosing() const {
    std::lock_guard<std::mutex> lk(m_stateMutex);
    return m_state >= SESSION_CLOSING;
}

size_t SessionManager::pendingPlayback() const {
    std::lock_guard<std::mutex> lk(m_componentMutex);
    return m_audio ? m_audio->pendingSamples() : 0;
}

void SessionManager::cancel(const std::string &reason) {
    if (!m_signal.cancel(reason)) return;

    spdlog::debug("({}) cancelled: {}", m_id, reason);
    std::lock_guard<std::mutex> lk(m_componentMutex);
    if (m_provider) m_provider->abort(reason);
}

/* ── Lifecycle ───────────────────────────────────────────────────────────── */

bool SessionManager::start(std::shared_ptr<FrontendTransport> frontend) {
    {
        std::lock_guard<std::mutex> lk(m_stateMutex);
        if (m_state != SESSION_CREATED) {
            spdlog::warn("({}) start() in state {} ignored", m_id, sessionStateName(m_state));
            return false;
        }
        m_state = SESSION_CONNECTING;
    }
    m_stateCv.notify_all();

    if (m_cfg.log.shouldLogEvent(LOG_CONNECTION_EVENTS)) {
        spdlog::info("({}) session starting for {}", m_id, frontend->remoteAddress());
    }

    ProviderConnection *provider = nullptr;
    {
        std::lock_guard<std::mutex> lk(m_componentMutex);
        m_gateway.reset(new FrontendGateway(frontend, m_frontendRouter, m_id, m_cfg.log));
        m_audio.reset(new AudioPipeline(m_id, m_cfg.log,
            std::chrono::milliseconds(m_cfg.playbackLeadMs)));
        m_provider.reset(new ProviderConnection(m_cfg,
            m_transportFactory(m_cfg, m_id), m_providerRouter, m_id));
        m_provider->setDisconnectHandler(
            [this](const std::string &reason) { onProviderLost(reason); });
        provider = m_provider.get();

        /* a cancel that raced ahead of the provider never saw it */
        if (m_signal.isCancelled()) provider->abort(m_signal.reason());
    }

    Envelope greeting = Envelope::control(ACTION_CONNECTED);
    greeting.set("greeting", "Connected to realtime server");
    sendToFrontend(greeting);

    /* watch the client during the handshake; its frames wait for ACTIVE */
    wireFrontendHandlers();
    m_gateway->startReading([this](const std::string &reason) { onFrontendClosed(reason); });

    try {
        provider->connect(std::chrono::milliseconds(m_cfg.connectTimeoutMs));
    } catch (const RelayError &e) {
        spdlog::error("({}) {}: {}", m_id, relayErrorKindName(e.kind()), e.what());
        if (!m_signal.isCancelled())
            reportError("Could not connect to the AI provider");
        cancel(e.what());
        stop();
        return false;
    }

    /* handlers go in before the first outbound event so no reply is missed */
    wireProviderHandlers();

    if (!provider->configureSession(m_tools))
        spdlog::warn("({}) session.update was not sent", m_id);
    if (!m_cfg.welcomeInstructions.empty() && !provider->requestWelcome())
        spdlog::warn("({}) welcome response was not requested", m_id);

    {
        std::lock_guard<std::mutex> lk(m_stateMutex);
        if (m_state != SESSION_CONNECTING) return false;
        m_state = SESSION_ACTIVE;
    }
    m_stateCv.notify_all();

    relayDeferred();

    if (m_cfg.log.shouldLogEvent(LOG_CONNECTION_EVENTS)) {
        spdlog::info("({}) session active", m_id);
    }
    return true;
}

void SessionManager::stop() {
    SessionState from;
    {
        std::unique_lock<std::mutex> lk(m_stateMutex);
        if (m_state == SESSION_CLOSED) return;
        if (m_state == SESSION_CLOSING) {
            m_stateCv.wait(lk, [this]() { return m_state == SESSION_CLOSED; });
            return;
        }
        from = m_state;
        m_state = SESSION_CLOSING;
    }
    m_stateCv.notify_all();

    cancel("session stopping");
    teardown(from);

    {
        std::lock_guard<std::mutex> lk(m_stateMutex);
        m_state = SESSION_CLOSED;
    }
    m_stateCv.notify_all();
}

void SessionManager::teardown(SessionState from) {
    spdlog::debug("({}) teardown from {}: {}", m_id, sessionStateName(from), m_signal.reason());

    /* late frames from either side now fall on the floor */
    m_frontendRouter.unregisterAll();
    m_providerRouter.unregisterAll();

    FrontendGateway    *gateway  = nullptr;
    AudioPipeline      *audio    = nullptr;
    ProviderConnection *provider = nullptr;
    {
        std::lock_guard<std::mutex> lk(m_componentMutex);
        gateway  = m_gateway.get();
        audio    = m_audio.get();
        provider = m_provider.get();
    }

    if (provider) provider->close();

    if (audio) {
        size_t released = audio->release();
        if (from == SESSION_ACTIVE) {
            spdlog::debug("({}) released {} queued samples", m_id, released);
            sendToFrontend(Envelope::control(ACTION_CLEAR));
        }
    }

    if (gateway) {
        Envelope bye = Envelope::control(ACTION_DISCONNECTED);
        bye.set("message", "Disconnected from server");
        sendToFrontend(bye);

        if (!gateway->close(std::chrono::milliseconds(m_cfg.closeTimeoutMs)))
            spdlog::debug("({}) frontend close handshake timed out, forced", m_id);
    }

    m_frontendRouter.clear();
    m_providerRouter.clear();

    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lk(m_deferMutex);
        m_deferring = false;
        dropped = m_deferred.size();
        m_deferred.clear();
    }
    if (dropped)
        spdlog::debug("({}) {} frames from the handshake never relayed", m_id, dropped);

    if (m_cfg.log.shouldLogEvent(LOG_CONNECTION_EVENTS)) {
        spdlog::info("({}) session closed ({}), {} frames in, {} rejected", m_id,
            m_signal.reason(),
            audio ? audio->framesForwarded() : 0,
            audio ? audio->framesRejected() : 0);
    }
}

void SessionManager::run(std::shared_ptr<FrontendTransport> frontend) {
    if (start(std::move(frontend))) {
        const std::chrono::milliseconds tick(PLAYBACK_FRAME_MS);
        while (!m_signal.waitFor(tick)) {
            pumpPlayback(AudioPipeline::Clock::now());
        }
        spdlog::info("({}) session ending: {}", m_id, m_signal.reason());
    }
    stop();
}

size_t SessionManager::pumpPlayback(AudioPipeline::Clock::time_point now) {
    if (state() != SESSION_ACTIVE) return 0;

    AudioPipeline *audio = nullptr;
    {
        std::lock_guard<std::mutex> lk(m_componentMutex);
        audio = m_audio.get();
    }
    if (!audio) return 0;

    return audio->pumpPlayback(now, [this, audio](std::vector<uint8_t> &&frame) {
        Envelope env = Envelope::audio(std::move(frame));
        sendToFrontend(env);
        audio->recycle(env.releasePcm());
    });
}

/* ── Cross-wiring ────────────────────────────────────────────────────────── */

void SessionManager::wireFrontendHandlers() {
    m_frontendRouter.registerHandler(KIND_USER_MESSAGE,
        [this](const Envelope &env) { onFrontendUserMessage(env); });
    m_frontendRouter.registerHandler(KIND_AUDIO,
        [this](const Envelope &env) { onFrontendAudio(env); });
    m_frontendRouter.registerHandler(KIND_CONTROL,
        [this](const Envelope &env) { onFrontendControl(env); });
}

void SessionManager::wireProviderHandlers() {
    MessageRouter::Handler forward = [this](const Envelope &env) { onProviderForward(env); };
    m_providerRouter.registerHandler(KIND_TEXT_DELTA, forward);
    m_providerRouter.registerHandler(KIND_TRANSCRIPTION, forward);
    m_providerRouter.registerHandler(KIND_ASSISTANT_MESSAGE, forward);
    m_providerRouter.registerHandler(KIND_ERROR, forward);
    m_providerRouter.registerHandler(KIND_USER_MESSAGE,
        [this](const Envelope &env) { onProviderUserMessage(env); });
    m_providerRouter.registerHandler(KIND_CONTROL,
        [this](const Envelope &env) { onProviderControl(env); });
    m_providerRouter.registerHandler(KIND_AUDIO,
        [this](const Envelope &env) { onProviderAudio(env); });
    m_providerRouter.registerHandler(KIND_FUNCTION_CALL,
        [this](const Envelope &env) { onProviderFunctionCall(env); });
}

void SessionManager::sendToFrontend(const Envelope &env) {
    FrontendGateway *gateway = nullptr;
    {
        std::lock_guard<std::mutex> lk(m_componentMutex);
        gateway = m_gateway.get();
    }
    if (!gateway) return;

    try {
        gateway->send(env);
    } catch (const ConnectionClosed &e) {
        spdlog::debug("({}) {} not delivered: {}", m_id, envelopeKindName(env.kind()), e.what());
        cancel("frontend closed");
    }
}

void SessionManager::reportError(const std::string &content) {
    if (m_errorSent.exchange(true)) return;
    sendToFrontend(Envelope::error(content));
}

/* Queue a frame that arrived before ACTIVE; false once frames flow directly. */
bool SessionManager::deferUntilActive(const Envelope &env) {
    std::lock_guard<std::mutex> lk(m_deferMutex);
    if (!m_deferring) return false;
    if (m_deferred.size() >= MAX_DEFERRED_FRAMES) {
        spdlog::warn("({}) {} dropped: provider handshake still in progress",
            m_id, envelopeKindName(env.kind()));
        return true;
    }
    m_deferred.push_back(env);
    return true;
}

/* Readers block in deferUntilActive() until the backlog has gone out. */
void SessionManager::relayDeferred() {
    std::lock_guard<std::mutex> lk(m_deferMutex);
    if (!m_deferred.empty())
        spdlog::debug("({}) relaying {} frames held during the handshake", m_id, m_deferred.size());

    while (!m_deferred.empty() && !isClosing()) {
        Envelope env = std::move(m_deferred.front());
        m_deferred.pop_front();
        switch (env.kind()) {
            case KIND_USER_MESSAGE: relayUserMessage(env); break;
            case KIND_AUDIO:        relayAudio(env);       break;
            case KIND_CONTROL:      relayControl(env);     break;
            default: break;
        }
    }
    m_deferred.clear();
    m_deferring = false;
}

void SessionManager::onFrontendUserMessage(const Envelope &env) {
    if (isClosing() || deferUntilActive(env)) return;
    relayUserMessage(env);
}

void SessionManager::onFrontendAudio(const Envelope &env) {
    if (isClosing() || deferUntilActive(env)) return;
    relayAudio(env);
}

void SessionManager::onFrontendControl(const Envelope &env) {
    if (isClosing()) return;

    if (env.action() == ACTION_DISCONNECT) {
        spdlog::info("({}) client requested disconnect", m_id);
        cancel("client requested disconnect");
        return;
    }
    if (deferUntilActive(env)) return;
    relayControl(env);
}

void SessionManager::relayUserMessage(const Envelope &env) {
    const std::string id = env.id();
    if (!id.empty()) {
        std::lock_guard<std::mutex> lk(m_idMutex);
        if (!m_submittedIds.insert(id).second) {
            spdlog::info("({}) user_message {} already submitted - retransmission dropped", m_id, id);
            return;
        }
    }
    if (!m_provider->send(env))
        spdlog::warn("({}) user_message not delivered to provider", m_id);
}

void SessionManager::relayAudio(const Envelope &env) {
    const auto &pcm = env.pcm();
    m_audio->forwardInbound(pcm.data(), pcm.size(), [this](const Envelope &frame) {
        if (!m_provider->send(frame))
            spdlog::debug("({}) audio frame not delivered to provider", m_id);
    });
}

void SessionManager::relayControl(const Envelope &env) {
    const std::string action = env.action();
    if (action == ACTION_COMMIT || action == ACTION_CANCEL_RESPONSE) {
        if (!m_provider->send(env))
            spdlog::warn("({}) {} not delivered to provider", m_id, action);
    } else {
        spdlog::warn("({}) unhandled client message '{}'", m_id, action);
    }
}

void SessionManager::onFrontendClosed(const std::string &reason) {
    if (m_cfg.log.shouldLogEvent(LOG_CONNECTION_EVENTS)) {
        spdlog::info("({}) frontend disconnected: {}", m_id, reason);
    }
    cancel("frontend closed: " + reason);
}

void SessionManager::onProviderForward(const Envelope &env) {
    if (isClosing()) return;

    sendToFrontend(env);
    if (env.kind() == KIND_ASSISTANT_MESSAGE && env.flag("final"))
        m_providerRouter.forget(env.id());
}

void SessionManager::onProviderUserMessage(const Envelope &env) {
    if (isClosing()) return;

    {
        std::lock_guard<std::mutex> lk(m_idMutex);
        if (!m_echoedIds.insert(env.id()).second) {
            spdlog::debug("({}) user_message {} already echoed", m_id, env.id());
            return;
        }
    }
    sendToFrontend(env);
}

void SessionManager::onProviderControl(const Envelope &env) {
    if (isClosing()) return;

    const std::string action = env.action();
    if (action == ACTION_SPEECH_STARTED) {
        m_audio->bargeIn();
    } else if (action == ACTION_RESPONSE_STARTED) {
        m_audio->resetDrain();
        return;
    }
    sendToFrontend(env);
}

void SessionManager::onProviderAudio(const Envelope &env) {
    if (isClosing()) return;
    m_audio->enqueuePlayback(env);
}

void SessionManager::onProviderFunctionCall(const Envelope &env) {
    if (isClosing()) return;

    const std::string name   = env.get("name");
    const std::string callId = env.get("call_id");
    std::string output = m_tools.invoke(name, env.get("arguments"));

    if (m_cfg.log.shouldLogData(LOG_API_FUNCTION_CALLS))
        spdlog::info("({}) tool {} returned {}", m_id, name, output);

    if (!m_provider->sendFunctionOutput(callId, output, m_tools.responseInstructions(name)))
        spdlog::warn("({}) output of {} not delivered to provider", m_id, name);
}

void SessionManager::onProviderLost(const std::string &reason) {
    if (isClosing()) return;

    reportError("Connection to the AI provider was lost");
    cancel("provider disconnected: " + reason);
}
