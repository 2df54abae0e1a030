/*
 * provider_connection.cpp
 *
 * The provider side of a session: connect, configure, and translate between
 * relay envelopes and the realtime API's JSON events.
 *
 * Key capabilities
 * ─────────────────
 * • connect() blocks with a deadline and can be aborted from any thread,
 *   including before the transport has been opened.
 * • Session configuration carries voice, audio formats, server VAD, input
 *   transcription and the registered tool schemas.
 * • Client audio goes out as base64 input_audio_buffer.append events;
 *   response.audio.delta comes back as raw PCM envelopes.
 * • The response in flight is tracked by id; deltas from any other
 *   response are dropped.
 * • Function call arguments are surfaced to the session once complete;
 *   outputs are sent back with any per-tool response instructions.
 * • Per-category event logging, with payload logging switched separately.
 */

#include <cstring>
#include <initializer_list>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "base64.h"
#include "provider_connection.h"
#include "realtime_relay.h"
#include "relay_errors.h"
#include "tool_registry.h"

namespace {

    bool startsWith(const std::string &s, const char *prefix) {
        return s.compare(0, std::strlen(prefix), prefix) == 0;
    }

    cJSON *stringArray(std::initializer_list<const char *> items) {
        cJSON *arr = cJSON_CreateArray();
        for (const char *s : items) cJSON_AddItemToArray(arr, cJSON_CreateString(s));
        return arr;
    }

    const cJSON *objectItem(const cJSON *obj, const char *name) {
        const cJSON *item = cJSON_GetObjectItemCaseSensitive(obj, name);
        return cJSON_IsObject(item) ? item : nullptr;
    }

} /* anonymous namespace */

ProviderConnection::ProviderConnection(const RelayConfig &cfg,
                                       std::shared_ptr<ProviderTransport> transport,
                                       MessageRouter &router,
                                       const std::string &sessionId)
    : m_cfg(cfg),
      m_transport(std::move(transport)),
      m_router(router),
      m_sessionId(sessionId),
      m_phase(PHASE_PENDING)
{
}

ProviderConnection::~ProviderConnection() {
    close();
}

void ProviderConnection::setDisconnectHandler(DisconnectHandler handler) {
    std::lock_guard<std::mutex> lk(m_disconnectMutex);
    m_onDisconnect = std::move(handler);
}

/* ── Connect / close ─────────────────────────────────────────────────────── */

void ProviderConnection::connect(std::chrono::milliseconds timeout) {
    if (m_closed.load())
        throw RelayError(HANDSHAKE_ERROR, "provider connection already closed");

    ProviderTransport::Callbacks cb;
    cb.onOpen    = [this]() { onTransportOpen(); };
    cb.onMessage = [this](const std::string &text) { handleMessage(text); };
    cb.onError   = [this](int code, const std::string &msg) { onTransportLost("error", code, msg); };
    cb.onClose   = [this](int code, const std::string &msg) { onTransportLost("close", code, msg); };

    if (m_cfg.log.shouldLogEvent(LOG_CONNECTION_EVENTS)) {
        spdlog::info("({}) connecting to provider {}", m_sessionId, m_cfg.providerUri());
    }

    try {
        m_transport->open(cb);
    } catch (const std::exception &e) {
        throw RelayError(HANDSHAKE_ERROR, std::string("provider connect failed: ") + e.what());
    }

    std::unique_lock<std::mutex> lk(m_connectMutex);
    bool settled = m_connectCv.wait_for(lk, timeout,
        [this]() { return m_phase != PHASE_PENDING; });

    if (!settled) {
        m_phase = PHASE_FAILED;
        m_failReason = "timed out after " + std::to_string(timeout.count()) + " ms";
    }
    switch (m_phase) {
        case PHASE_OPEN:
            if (m_cfg.log.shouldLogEvent(LOG_CONNECTION_EVENTS)) {
                spdlog::info("({}) connected to provider, model {}", m_sessionId, m_cfg.model);
            }
            return;
        case PHASE_ABORTED:
            throw RelayError(HANDSHAKE_ERROR, "provider connect aborted: " + m_failReason);
        default:
            throw RelayError(HANDSHAKE_ERROR, "provider connect failed: " + m_failReason);
    }
}

void ProviderConnection::abort(const std::string &reason) {
    std::lock_guard<std::mutex> lk(m_connectMutex);
    if (m_phase != PHASE_PENDING) return;
    m_phase = PHASE_ABORTED;
    m_failReason = reason;
    m_connectCv.notify_all();
}

void ProviderConnection::onTransportOpen() {
    std::lock_guard<std::mutex> lk(m_connectMutex);
    if (m_phase != PHASE_PENDING) return;
    m_phase = PHASE_OPEN;
    m_connectCv.notify_all();
}

void ProviderConnection::onTransportLost(const char *what, int code, const std::string &reason) {
    std::string desc = std::string("provider ") + what + " (" + std::to_string(code) + ")";
    if (!reason.empty()) desc += ": " + reason;

    {
        std::lock_guard<std::mutex> lk(m_connectMutex);
        if (m_phase == PHASE_PENDING) {
            m_phase = PHASE_FAILED;
            m_failReason = desc;
            m_connectCv.notify_all();
            return;
        }
        if (m_phase != PHASE_OPEN) return;
    }
    reportDisconnect(desc);
}

void ProviderConnection::reportDisconnect(const std::string &reason) {
    if (m_closed.load() || m_disconnectReported.exchange(true)) return;

    spdlog::warn("({}) UpstreamDisconnect: {}", m_sessionId, reason);
    DisconnectHandler handler;
    {
        std::lock_guard<std::mutex> lk(m_disconnectMutex);
        handler = m_onDisconnect;
    }
    if (handler) handler(reason);
}

void ProviderConnection::close() {
    if (m_closed.exchange(true)) return;

    abort("connection closed");
    m_transport->detach();
    m_transport->close();

    if (m_cfg.log.shouldLogEvent(LOG_CONNECTION_EVENTS)) {
        spdlog::info("({}) provider connection closed", m_sessionId);
    }
}

bool ProviderConnection::isConnected() const {
    return !m_closed.load() && m_transport->isConnected();
}

std::string ProviderConnection::currentResponseId() const {
    std::lock_guard<std::mutex> lk(m_stateMutex);
    return m_currentResponseId;
}

/* ── Outbound ────────────────────────────────────────────────────────────── */

bool ProviderConnection::sendEvent(const cJSON *event, LogCategory category) {
    std::string text = jsonPrint(event);
    if (text.empty()) {
        spdlog::error("({}) failed to serialise provider event", m_sessionId);
        return false;
    }
    if (m_closed.load() || !m_transport->isConnected()) return false;

    if (m_cfg.log.shouldLogEvent(category)) {
        const char *type = jsonGetCstr(event, "type");
        if (m_cfg.log.shouldLogData(category))
            spdlog::debug("({}) -> provider: {}", m_sessionId, text);
        else
            spdlog::debug("({}) -> provider: {}", m_sessionId, type ? type : "?");
    }
    return m_transport->sendText(text);
}

bool ProviderConnection::configureSession(const ToolRegistry &tools) {
    jsonPtr root = jsonObject();
    cJSON_AddStringToObject(root.get(), "type", "session.update");

    cJSON *session = cJSON_AddObjectToObject(root.get(), "session");
    cJSON_AddItemToObject(session, "modalities", stringArray({"text", "audio"}));
    cJSON_AddStringToObject(session, "instructions", m_cfg.instructions.c_str());
    cJSON_AddStringToObject(session, "voice", m_cfg.voice.c_str());
    cJSON_AddStringToObject(session, "input_audio_format", "pcm16");
    cJSON_AddStringToObject(session, "output_audio_format", "pcm16");

    cJSON *transcription = cJSON_AddObjectToObject(session, "input_audio_transcription");
    cJSON_AddStringToObject(transcription, "model", "whisper-1");

    cJSON *vad = cJSON_AddObjectToObject(session, "turn_detection");
    cJSON_AddStringToObject(vad, "type", "server_vad");
    cJSON_AddNumberToObject(vad, "threshold", 0.5);
    cJSON_AddNumberToObject(vad, "prefix_padding_ms", 300);
    cJSON_AddNumberToObject(vad, "silence_duration_ms", 500);
    cJSON_AddBoolToObject(vad, "create_response", 1);

    cJSON_AddItemToObject(session, "tools", tools.definitions().release());
    cJSON_AddStringToObject(session, "tool_choice", "auto");
    cJSON_AddNumberToObject(session, "temperature", m_cfg.temperature);
    cJSON_AddNumberToObject(session, "max_response_output_tokens", m_cfg.maxOutputTokens);

    std::lock_guard<std::mutex> lk(m_sendMutex);
    return sendEvent(root.get(), LOG_API_MESSAGES);
}

bool ProviderConnection::requestWelcome() {
    if (m_cfg.welcomeInstructions.empty()) return false;

    jsonPtr root = jsonObject();
    cJSON_AddStringToObject(root.get(), "type", "response.create");
    cJSON *response = cJSON_AddObjectToObject(root.get(), "response");
    cJSON_AddItemToObject(response, "modalities", stringArray({"text", "audio"}));
    cJSON_AddStringToObject(response, "instructions", m_cfg.welcomeInstructions.c_str());

    std::lock_guard<std::mutex> lk(m_sendMutex);
    return sendEvent(root.get(), LOG_API_MESSAGES);
}

std::string ProviderConnection::nextItemId() {
    /* provider item ids are at most 32 characters */
    std::string tail = m_sessionId.size() > 12
        ? m_sessionId.substr(m_sessionId.size() - 12) : m_sessionId;
    std::lock_guard<std::mutex> lk(m_stateMutex);
    std::string id = "msg_" + tail + "_" + std::to_string(++m_itemCounter);
    return id.substr(0, MAX_ITEM_ID);
}

bool ProviderConnection::sendUserMessage(const Envelope &env) {
    std::string itemId = env.id();
    if (itemId.empty() || itemId.size() > MAX_ITEM_ID) itemId = nextItemId();

    std::string previous;
    {
        std::lock_guard<std::mutex> lk(m_stateMutex);
        previous = m_lastItemId;
    }

    jsonPtr create = jsonObject();
    cJSON_AddStringToObject(create.get(), "type", "conversation.item.create");
    if (!previous.empty())
        cJSON_AddStringToObject(create.get(), "previous_item_id", previous.c_str());
    cJSON *item = cJSON_AddObjectToObject(create.get(), "item");
    cJSON_AddStringToObject(item, "id", itemId.c_str());
    cJSON_AddStringToObject(item, "type", "message");
    cJSON_AddStringToObject(item, "role", "user");
    cJSON *content = cJSON_AddArrayToObject(item, "content");
    cJSON *part = cJSON_CreateObject();
    cJSON_AddStringToObject(part, "type", "input_text");
    cJSON_AddStringToObject(part, "text", env.get("text").c_str());
    cJSON_AddItemToArray(content, part);

    /* text input gets a text-only response */
    jsonPtr respond = jsonObject();
    cJSON_AddStringToObject(respond.get(), "type", "response.create");
    cJSON *response = cJSON_AddObjectToObject(respond.get(), "response");
    cJSON_AddItemToObject(response, "modalities", stringArray({"text"}));
    cJSON_AddStringToObject(response, "instructions", m_cfg.instructions.c_str());
    cJSON_AddNumberToObject(response, "temperature", m_cfg.temperature);
    cJSON_AddNumberToObject(response, "max_output_tokens", m_cfg.maxOutputTokens);

    std::lock_guard<std::mutex> lk(m_sendMutex);
    if (!sendEvent(create.get(), LOG_API_MESSAGES)) return false;
    return sendEvent(respond.get(), LOG_API_MESSAGES);
}

bool ProviderConnection::send(const Envelope &env) {
    if (m_closed.load()) return false;

    switch (env.kind()) {
        case KIND_USER_MESSAGE:
            return sendUserMessage(env);

        case KIND_AUDIO: {
            const auto &pcm = env.pcm();
            if (pcm.empty()) return false;
            std::string b64 = base64_encode(pcm.data(), pcm.size());
            jsonPtr root = jsonObject();
            cJSON_AddStringToObject(root.get(), "type", "input_audio_buffer.append");
            cJSON_AddStringToObject(root.get(), "audio", b64.c_str());
            std::lock_guard<std::mutex> lk(m_sendMutex);
            return sendEvent(root.get(), LOG_API_AUDIO);
        }

        case KIND_CONTROL: {
            const std::string action = env.action();
            const char *type = nullptr;
            if (action == ACTION_COMMIT)               type = "input_audio_buffer.commit";
            else if (action == ACTION_CANCEL_RESPONSE) type = "response.cancel";
            if (!type) break;
            jsonPtr root = jsonObject();
            cJSON_AddStringToObject(root.get(), "type", type);
            std::lock_guard<std::mutex> lk(m_sendMutex);
            return sendEvent(root.get(), LOG_API_MESSAGES);
        }

        default:
            break;
    }

    spdlog::warn("({}) provider cannot accept '{}' envelope{}", m_sessionId,
        envelopeKindName(env.kind()),
        env.kind() == KIND_CONTROL ? " with action " + env.action() : std::string());
    return false;
}

bool ProviderConnection::sendFunctionOutput(const std::string &callId, const std::string &output,
                                            const std::string &instructions)
{
    jsonPtr create = jsonObject();
    cJSON_AddStringToObject(create.get(), "type", "conversation.item.create");
    cJSON *item = cJSON_AddObjectToObject(create.get(), "item");
    cJSON_AddStringToObject(item, "type", "function_call_output");
    cJSON_AddStringToObject(item, "call_id", callId.c_str());
    cJSON_AddStringToObject(item, "output", output.c_str());

    jsonPtr respond = jsonObject();
    cJSON_AddStringToObject(respond.get(), "type", "response.create");
    cJSON *response = cJSON_AddObjectToObject(respond.get(), "response");
    cJSON_AddItemToObject(response, "modalities", stringArray({"text", "audio"}));
    if (!instructions.empty())
        cJSON_AddStringToObject(response, "instructions", instructions.c_str());

    std::lock_guard<std::mutex> lk(m_sendMutex);
    if (!sendEvent(create.get(), LOG_API_FUNCTION_CALLS)) return false;
    return sendEvent(respond.get(), LOG_API_FUNCTION_CALLS);
}

/* ── Inbound normalisation ───────────────────────────────────────────────── */

void ProviderConnection::emit(const Envelope &env) {
    if (m_closed.load()) return;
    m_router.dispatch(env);
}

bool ProviderConnection::isCurrentResponse(const std::string &responseId) {
    std::lock_guard<std::mutex> lk(m_stateMutex);
    return !m_currentResponseId.empty() && responseId == m_currentResponseId;
}

void ProviderConnection::handleMessage(const std::string &text) {
    if (m_closed.load()) return;

    jsonPtr root = jsonParse(text);
    if (!root || !cJSON_IsObject(root.get())) {
        spdlog::warn("({}) ProtocolError: invalid JSON from provider", m_sessionId);
        return;
    }
    const char *ctype = jsonGetCstr(root.get(), "type");
    if (!ctype) {
        spdlog::warn("({}) ProtocolError: provider event without 'type'", m_sessionId);
        return;
    }
    const std::string type(ctype);
    const cJSON *event = root.get();

    if (type == "response.audio.delta") {
        if (m_cfg.log.shouldLogEvent(LOG_API_AUDIO))
            spdlog::debug("({}) <- provider: {}", m_sessionId, type);
    } else if (cJSON_HasObjectItem(event, "delta")) {
        if (m_cfg.log.shouldLogEvent(LOG_API_TEXT_DELTA)) {
            if (m_cfg.log.shouldLogData(LOG_API_TEXT_DELTA))
                spdlog::debug("({}) <- provider: {}, delta: {}", m_sessionId, type,
                    jsonGetString(event, "delta"));
            else
                spdlog::debug("({}) <- provider: {}", m_sessionId, type);
        }
    } else if (m_cfg.log.shouldLogEvent(LOG_API_MESSAGES)) {
        if (m_cfg.log.shouldLogData(LOG_API_MESSAGES))
            spdlog::info("({}) <- provider: {}, data: {}", m_sessionId, type, text);
        else
            spdlog::info("({}) <- provider: {}", m_sessionId, type);
    }

    if (type == "conversation.item.created") {
        handleItemCreated(event);
    } else if (startsWith(type, "conversation.item.input_audio_transcription.")) {
        handleTranscription(type, event);
    } else if (type == "response.function_call_arguments.done") {
        handleFunctionCall(event);
    } else if (type == "response.output_item.added") {
        handleOutputItemAdded(event);
    } else if (startsWith(type, "response.")) {
        handleResponseEvent(type, event);
    } else if (startsWith(type, "input_audio_buffer.")) {
        handleAudioBufferEvent(type, event);
    } else if (type == "error") {
        handleError(event);
    } else if (type == "session.created" || type == "session.updated" ||
               type == "rate_limits.updated" || startsWith(type, "conversation.")) {
        spdlog::debug("({}) provider event {}", m_sessionId, type);
    } else {
        spdlog::debug("({}) unhandled provider event {} - dropped", m_sessionId, type);
    }
}

void ProviderConnection::handleItemCreated(const cJSON *event) {
    const cJSON *item = objectItem(event, "item");
    if (!item) return;

    const std::string id   = jsonGetString(item, "id");
    const std::string role = jsonGetString(item, "role");
    if (!id.empty()) {
        std::lock_guard<std::mutex> lk(m_stateMutex);
        m_lastItemId = id;
    }
    if (id.empty() || role.empty()) return;

    const cJSON *content = cJSON_GetObjectItemCaseSensitive(item, "content");
    const cJSON *first = cJSON_IsArray(content) ? cJSON_GetArrayItem(content, 0) : nullptr;

    if (role == "user") {
        if (!first) {
            spdlog::debug("({}) empty user item {}", m_sessionId, id);
            return;
        }
        if (jsonGetString(first, "type") == "input_audio") {
            Envelope env = Envelope::userMessage(id, "...");
            env.setFlag("has_audio", true).setFlag("is_transcribing", true);
            emit(env);
        } else {
            emit(Envelope::userMessage(id, jsonGetString(first, "text")));
        }
    } else if (role == "assistant") {
        if (first) {
            emit(Envelope::assistantMessage(id, jsonGetString(first, "text")));
        } else {
            Envelope env = Envelope::assistantMessage(id, "");
            env.setFlag("in_progress", true);
            emit(env);
        }
    }
}

void ProviderConnection::handleTranscription(const std::string &type, const cJSON *event) {
    const std::string itemId = jsonGetString(event, "item_id");
    if (itemId.empty()) {
        spdlog::warn("({}) ProtocolError: {} without item_id", m_sessionId, type);
        return;
    }

    if (type == "conversation.item.input_audio_transcription.completed") {
        emit(Envelope::transcription(itemId, jsonGetString(event, "transcript")));
    } else if (type == "conversation.item.input_audio_transcription.failed") {
        std::string reason = "Transcription failed";
        if (const cJSON *err = objectItem(event, "error"))
            reason = jsonGetString(err, "message", reason);
        spdlog::warn("({}) transcription of {} failed: {}", m_sessionId, itemId, reason);

        Envelope env = Envelope::transcription(itemId, "Could not transcribe audio");
        env.set("error", reason);
        emit(env);
    }
}

void ProviderConnection::handleResponseEvent(const std::string &type, const cJSON *event) {
    const std::string responseId = jsonGetString(event, "response_id");
    const std::string itemId     = jsonGetString(event, "item_id");

    if (type == "response.created") {
        std::string id;
        if (const cJSON *response = objectItem(event, "response"))
            id = jsonGetString(response, "id");
        {
            std::lock_guard<std::mutex> lk(m_stateMutex);
            m_currentResponseId = id;
            m_transcript.clear();
        }
        spdlog::info("({}) response {} created", m_sessionId, id);
        emit(Envelope::control(ACTION_RESPONSE_STARTED, id));
        return;
    }

    if (type == "response.done") {
        std::string id;
        if (const cJSON *response = objectItem(event, "response")) {
            id = jsonGetString(response, "id");
            const cJSON *usage = cJSON_GetObjectItemCaseSensitive(response, "usage");
            if (cJSON_IsObject(usage))
                spdlog::info("({}) response {} complete, usage {}", m_sessionId, id, jsonPrint(usage));
        }
        {
            std::lock_guard<std::mutex> lk(m_stateMutex);
            m_currentResponseId.clear();
            m_transcript.clear();
            m_callNames.clear();
        }
        emit(Envelope::control(ACTION_RESPONSE_COMPLETE, id));
        return;
    }

    const bool isDelta = type == "response.text.delta" ||
                         type == "response.audio_transcript.delta" ||
                         type == "response.audio.delta" ||
                         type == "response.text.done" ||
                         type == "response.audio_transcript.done";
    if (!isDelta) {
        spdlog::debug("({}) provider event {}", m_sessionId, type);
        return;
    }
    if (!isCurrentResponse(responseId)) {
        spdlog::warn("({}) {} for unknown response {} - dropped", m_sessionId, type, responseId);
        return;
    }

    if (type == "response.audio.delta") {
        const char *b64 = jsonGetCstr(event, "delta");
        if (!b64) {
            spdlog::warn("({}) AudioFormatError: audio delta without payload", m_sessionId);
            return;
        }
        std::string decoded;
        try {
            decoded = base64_decode(std::string(b64));
        } catch (const std::exception &e) {
            spdlog::warn("({}) AudioFormatError: base64 decode error: {}", m_sessionId, e.what());
            return;
        }
        if (decoded.empty()) return;
        emit(Envelope::audio(reinterpret_cast<const uint8_t *>(decoded.data()), decoded.size()));
        return;
    }

    if (itemId.empty()) {
        spdlog::warn("({}) ProtocolError: {} without item_id", m_sessionId, type);
        return;
    }

    if (type == "response.text.delta") {
        Envelope env = Envelope::textDelta(itemId, jsonGetString(event, "delta"));
        env.set("response_id", responseId);
        emit(env);
    } else if (type == "response.audio_transcript.delta") {
        const std::string delta = jsonGetString(event, "delta");
        {
            std::lock_guard<std::mutex> lk(m_stateMutex);
            m_transcript += delta;
        }
        Envelope env = Envelope::textDelta(itemId, delta);
        env.set("response_id", responseId).setFlag("is_audio_transcript", true);
        emit(env);
    } else if (type == "response.text.done") {
        Envelope env = Envelope::assistantMessage(itemId, jsonGetString(event, "text"));
        env.setFlag("final", true);
        emit(env);
    } else {
        std::string transcript;
        {
            std::lock_guard<std::mutex> lk(m_stateMutex);
            transcript.swap(m_transcript);
        }
        transcript = jsonGetString(event, "transcript", transcript);
        Envelope env = Envelope::assistantMessage(itemId, transcript);
        env.setFlag("is_audio_transcript", true).setFlag("final", true);
        emit(env);
    }
}

void ProviderConnection::handleAudioBufferEvent(const std::string &type, const cJSON *event) {
    const std::string itemId = jsonGetString(event, "item_id");

    if (type == "input_audio_buffer.speech_started") {
        emit(Envelope::control(ACTION_SPEECH_STARTED, itemId));
    } else if (type == "input_audio_buffer.speech_stopped") {
        emit(Envelope::control(ACTION_SPEECH_STOPPED, itemId));
    } else if (type == "input_audio_buffer.committed") {
        emit(Envelope::control(ACTION_PROCESSING_SPEECH, itemId));
    } else if (type == "input_audio_buffer.cleared") {
        emit(Envelope::control(ACTION_AUDIO_CLEARED));
    } else {
        spdlog::debug("({}) provider event {}", m_sessionId, type);
    }
}

void ProviderConnection::handleOutputItemAdded(const cJSON *event) {
    const cJSON *item = objectItem(event, "item");
    if (!item || jsonGetString(item, "type") != "function_call") return;

    const std::string callId = jsonGetString(item, "call_id");
    const std::string name   = jsonGetString(item, "name");
    if (callId.empty() || name.empty()) return;

    std::lock_guard<std::mutex> lk(m_stateMutex);
    m_callNames[callId] = name;
}

void ProviderConnection::handleFunctionCall(const cJSON *event) {
    const std::string responseId = jsonGetString(event, "response_id");
    if (!isCurrentResponse(responseId)) {
        spdlog::warn("({}) function call for unknown response {} - dropped", m_sessionId, responseId);
        return;
    }

    const std::string callId = jsonGetString(event, "call_id");
    std::string name = jsonGetString(event, "name");
    if (name.empty()) {
        std::lock_guard<std::mutex> lk(m_stateMutex);
        auto it = m_callNames.find(callId);
        if (it != m_callNames.end()) name = it->second;
    }
    if (callId.empty() || name.empty()) {
        spdlog::warn("({}) ProtocolError: function call without call_id or name", m_sessionId);
        return;
    }

    const std::string arguments = jsonGetString(event, "arguments", "{}");
    if (m_cfg.log.shouldLogEvent(LOG_API_FUNCTION_CALLS)) {
        if (m_cfg.log.shouldLogData(LOG_API_FUNCTION_CALLS))
            spdlog::info("({}) function call {} ({}) args {}", m_sessionId, name, callId, arguments);
        else
            spdlog::info("({}) function call {} ({})", m_sessionId, name, callId);
    }

    Envelope env(KIND_FUNCTION_CALL);
    env.set("name", name).set("call_id", callId).set("arguments", arguments);
    emit(env);
}

void ProviderConnection::handleError(const cJSON *event) {
    std::string message = "provider error";
    if (const cJSON *err = objectItem(event, "error")) {
        message = jsonGetString(err, "message", message);
        const std::string code = jsonGetString(err, "code");
        spdlog::error("({}) provider error {}: {}", m_sessionId, code.empty() ? "-" : code, message);
    } else {
        spdlog::error("({}) provider error: {}", m_sessionId, message);
    }
    emit(Envelope::error(message));
}
