#include <utility>

#include <spdlog/spdlog.h>

#include "frontend_gateway.h"
#include "json_util.h"
#include "realtime_relay.h"
#include "relay_errors.h"

FrontendGateway::FrontendGateway(std::shared_ptr<FrontendTransport> transport,
                                 MessageRouter &router,
                                 const std::string &sessionId,
                                 const LogConfig &log)
    : m_transport(std::move(transport)),
      m_router(router),
      m_sessionId(sessionId),
      m_log(log)
{
}

void FrontendGateway::send(const Envelope &env) {
    if (env.kind() == KIND_FUNCTION_CALL) return;

    if (!m_transport->isOpen())
        throw ConnectionClosed("frontend socket is not open");

    if (env.isAudio()) {
        if (m_log.shouldLogEvent(LOG_FRONTEND_AUDIO)) {
            spdlog::debug("({}) -> client audio, {} bytes", m_sessionId, env.pcm().size());
        }
        m_transport->sendBinary(env.pcm());
        return;
    }

    std::string text = envelopeToJson(env);
    if (m_log.shouldLogEvent(LOG_FRONTEND_MESSAGES)) {
        if (m_log.shouldLogData(LOG_FRONTEND_MESSAGES))
            spdlog::debug("({}) -> client: {}", m_sessionId, text);
        else
            spdlog::debug("({}) -> client: {}", m_sessionId, envelopeKindName(env.kind()));
    }
    m_transport->sendText(text);
}

ParseResult FrontendGateway::parseText(const std::string &text) {
    ParseResult out;

    jsonPtr root = jsonParse(text);
    if (!root) {
        out.error = "invalid JSON";
        return out;
    }
    if (!cJSON_IsObject(root.get())) {
        out.error = "frame is not a JSON object";
        return out;
    }

    const char *type = jsonGetCstr(root.get(), "type");
    if (!type || !*type) {
        out.error = "missing 'type'";
        return out;
    }
    const std::string kind(type);

    if (kind == "disconnect") {
        out.envelope = Envelope::control(ACTION_DISCONNECT);
        out.ok = true;
        return out;
    }

    if (kind == "user_message") {
        std::string body = jsonGetString(root.get(), "text");
        if (body.empty()) {
            out.error = "empty user_message";
            return out;
        }
        Envelope env(KIND_USER_MESSAGE);
        env.set("text", body);
        std::string id = jsonGetString(root.get(), "id");
        if (!id.empty()) env.set("id", id);
        out.envelope = env;
        out.ok = true;
        return out;
    }

    if (kind == "control") {
        std::string action = jsonGetString(root.get(), "action");
        if (action.empty()) {
            out.error = "control frame without 'action'";
            return out;
        }
        out.envelope = Envelope::control(action, jsonGetString(root.get(), "id"));
        out.ok = true;
        return out;
    }

    /* anything else travels as a control-shaped envelope named after its type */
    Envelope env(KIND_CONTROL);
    for (const cJSON *it = root->child; it; it = it->next) {
        if (!it->string) continue;
        const std::string name(it->string);
        if (name == "type") continue;
        if (cJSON_IsString(it) && it->valuestring) env.set(name, it->valuestring);
        else if (cJSON_IsBool(it)) env.setFlag(name, cJSON_IsTrue(it) != 0);
    }
    env.set("action", kind);
    out.envelope = env;
    out.ok = true;
    return out;
}

bool FrontendGateway::onFrame(const std::string &payload, bool binary) {
    if (binary) {
        if (m_log.shouldLogEvent(LOG_FRONTEND_AUDIO)) {
            spdlog::debug("({}) <- client audio, {} bytes", m_sessionId, payload.size());
        }
        return m_router.dispatch(Envelope::audio(
            reinterpret_cast<const uint8_t *>(payload.data()), payload.size()));
    }

    ParseResult pr = parseText(payload);
    if (!pr.ok) {
        spdlog::warn("({}) ProtocolError: dropping client frame: {}", m_sessionId, pr.error);
        return false;
    }

    if (m_log.shouldLogEvent(LOG_FRONTEND_MESSAGES)) {
        if (m_log.shouldLogData(LOG_FRONTEND_MESSAGES))
            spdlog::info("({}) <- client: {}", m_sessionId, payload);
        else
            spdlog::info("({}) <- client: {}", m_sessionId, envelopeKindName(pr.envelope.kind()));
    }
    return m_router.dispatch(pr.envelope);
}

void FrontendGateway::startReading(FrontendTransport::CloseHandler onClose) {
    m_transport->startReading(
        [this](const std::string &payload, bool binary) { onFrame(payload, binary); },
        std::move(onClose));
}

bool FrontendGateway::isOpen() const {
    return m_transport->isOpen();
}

bool FrontendGateway::close(std::chrono::milliseconds grace) {
    return m_transport->close(1000, "session closed", grace);
}
