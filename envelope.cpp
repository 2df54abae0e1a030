#include <cstring>
#include <stdexcept>
#include <utility>

#include "envelope.h"
#include "json_util.h"

namespace {

    struct KindName {
        EnvelopeKind kind;
        const char  *name;
    };

    const KindName kKindNames[] = {
        { KIND_CONTROL,           "control" },
        { KIND_USER_MESSAGE,      "user_message" },
        { KIND_ASSISTANT_MESSAGE, "assistant_message" },
        { KIND_TEXT_DELTA,        "text_delta" },
        { KIND_TRANSCRIPTION,     "transcription" },
        { KIND_ERROR,             "error" },
        { KIND_AUDIO,             "audio" },
        { KIND_FUNCTION_CALL,     "function_call" },
    };

} /* anonymous namespace */

const char *envelopeKindName(EnvelopeKind kind) {
    for (const auto &k : kKindNames) {
        if (k.kind == kind) return k.name;
    }
    return "unknown";
}

bool envelopeKindFromName(const std::string &name, EnvelopeKind &out) {
    for (const auto &k : kKindNames) {
        if (name == k.name) {
            out = k.kind;
            return true;
        }
    }
    return false;
}

/* ── Factories ─────────────────────────────────────────────────────────── */

Envelope Envelope::control(const std::string &action, const std::string &id) {
    Envelope env(KIND_CONTROL);
    env.set("action", action);
    if (!id.empty()) env.set("id", id);
    return env;
}

Envelope Envelope::error(const std::string &content) {
    Envelope env(KIND_ERROR);
    env.set("content", content);
    return env;
}

Envelope Envelope::userMessage(const std::string &id, const std::string &text) {
    Envelope env(KIND_USER_MESSAGE);
    env.set("id", id).set("text", text);
    return env;
}

Envelope Envelope::assistantMessage(const std::string &id, const std::string &text) {
    Envelope env(KIND_ASSISTANT_MESSAGE);
    env.set("id", id).set("text", text);
    return env;
}

Envelope Envelope::textDelta(const std::string &id, const std::string &delta) {
    if (id.empty()) throw std::invalid_argument("text_delta requires an id");
    Envelope env(KIND_TEXT_DELTA);
    env.set("id", id).set("delta", delta);
    return env;
}

Envelope Envelope::transcription(const std::string &id, const std::string &text) {
    if (id.empty()) throw std::invalid_argument("transcription requires an id");
    Envelope env(KIND_TRANSCRIPTION);
    env.set("id", id).set("text", text);
    return env;
}

Envelope Envelope::audio(std::vector<uint8_t> pcm) {
    Envelope env(KIND_AUDIO);
    env.m_pcm = std::move(pcm);
    return env;
}

Envelope Envelope::audio(const uint8_t *data, size_t len) {
    std::vector<uint8_t> pcm;
    if (data && len) pcm.assign(data, data + len);
    return audio(std::move(pcm));
}

/* ── Fields ────────────────────────────────────────────────────────────── */

Envelope &Envelope::set(const std::string &name, const std::string &value) {
    if (isAudio())
        throw std::logic_error("audio envelopes carry no text fields (" + name + ")");
    m_fields[name] = value;
    return *this;
}

Envelope &Envelope::setFlag(const std::string &name, bool value) {
    if (isAudio())
        throw std::logic_error("audio envelopes carry no flags (" + name + ")");
    m_flags[name] = value;
    return *this;
}

bool Envelope::has(const std::string &name) const {
    return m_fields.find(name) != m_fields.end();
}

std::string Envelope::get(const std::string &name) const {
    auto it = m_fields.find(name);
    return it == m_fields.end() ? std::string() : it->second;
}

bool Envelope::flag(const std::string &name) const {
    auto it = m_flags.find(name);
    return it != m_flags.end() && it->second;
}

/* ── Client-protocol JSON ──────────────────────────────────────────────── */

std::string envelopeToJson(const Envelope &env) {
    if (env.isAudio()) return std::string();

    jsonPtr root = jsonObject();
    cJSON_AddStringToObject(root.get(), "type", envelopeKindName(env.kind()));
    for (const auto &f : env.fields()) {
        if (f.first == "type") continue;
        cJSON_AddStringToObject(root.get(), f.first.c_str(), f.second.c_str());
    }
    for (const auto &f : env.flags()) {
        cJSON_AddBoolToObject(root.get(), f.first.c_str(), f.second ? 1 : 0);
    }
    return jsonPrint(root.get());
}
