#ifndef ENVELOPE_H
#define ENVELOPE_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

enum EnvelopeKind {
    KIND_CONTROL,
    KIND_USER_MESSAGE,
    KIND_ASSISTANT_MESSAGE,
    KIND_TEXT_DELTA,
    KIND_TRANSCRIPTION,
    KIND_ERROR,
    KIND_AUDIO,
    KIND_FUNCTION_CALL    /* internal: provider tool call, never sent to the frontend */
};

const char *envelopeKindName(EnvelopeKind kind);
bool        envelopeKindFromName(const std::string &name, EnvelopeKind &out);

/*
 * Normalised message unit exchanged between the two legs of a session.
 *
 * Non-audio kinds carry named string fields (id, text, delta, action,
 * content, ...) and named boolean flags.  Audio carries raw little-endian
 * int16 PCM and nothing else; setting a field on an audio envelope, or
 * attaching PCM to a non-audio one, throws std::logic_error.
 */
class Envelope {
public:
    typedef std::map<std::string, std::string> Fields;
    typedef std::map<std::string, bool>        Flags;

    Envelope() : m_kind(KIND_CONTROL) {}
    explicit Envelope(EnvelopeKind kind) : m_kind(kind) {}

    /* ── Factories ───────────────────────────────────────────────────────── */
    static Envelope control(const std::string &action, const std::string &id = "");
    static Envelope error(const std::string &content);
    static Envelope userMessage(const std::string &id, const std::string &text);
    static Envelope assistantMessage(const std::string &id, const std::string &text);
    static Envelope textDelta(const std::string &id, const std::string &delta);
    static Envelope transcription(const std::string &id, const std::string &text);
    static Envelope audio(std::vector<uint8_t> pcm);
    static Envelope audio(const uint8_t *data, size_t len);

    EnvelopeKind kind() const { return m_kind; }
    bool isAudio() const { return m_kind == KIND_AUDIO; }

    /* ── Named fields (non-audio only) ───────────────────────────────────── */
    Envelope &set(const std::string &name, const std::string &value);
    Envelope &setFlag(const std::string &name, bool value);

    bool        has(const std::string &name) const;
    std::string get(const std::string &name) const;   /* "" when absent */
    bool        flag(const std::string &name) const;  /* false when absent */

    std::string id() const     { return get("id"); }
    std::string action() const { return get("action"); }

    const Fields &fields() const { return m_fields; }
    const Flags  &flags() const  { return m_flags; }

    /* ── Audio payload (audio only) ──────────────────────────────────────── */
    const std::vector<uint8_t> &pcm() const { return m_pcm; }
    size_t sampleCount() const { return m_pcm.size() / 2; }

    /* Hand the PCM storage back to the caller (e.g. to a buffer pool). */
    std::vector<uint8_t> releasePcm() {
        std::vector<uint8_t> out;
        out.swap(m_pcm);
        return out;
    }

private:
    EnvelopeKind          m_kind;
    Fields                m_fields;
    Flags                 m_flags;
    std::vector<uint8_t>  m_pcm;
};

/*
 * Serialise a non-audio envelope as a client-protocol JSON object:
 * {"type": <kind>, <fields...>, <flags...>}.  Returns "" for audio.
 */
std::string envelopeToJson(const Envelope &env);

#endif /* ENVELOPE_H */
