#ifndef MESSAGE_ROUTER_H
#define MESSAGE_ROUTER_H

#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "envelope.h"

/*
 * Kind-keyed handler table.  One instance per side of a session; the
 * Session Manager fills both so neither leg knows the other's type.
 *
 * Handlers run on the dispatching thread, outside the registry lock, so a
 * handler may register, unregister or dispatch again.
 */
class MessageRouter {
public:
    typedef std::function<void(const Envelope &)> Handler;

    explicit MessageRouter(const std::string &name, size_t maxStreams = 64);

    /* Install the handler for a kind; the last registration wins. */
    void registerHandler(EnvelopeKind kind, Handler handler);
    void unregisterHandler(EnvelopeKind kind);
    void unregisterAll();
    bool hasHandler(EnvelopeKind kind) const;

    /*
     * Invoke the handler for env.kind().  Returns false when no handler is
     * registered (a debug-logged no-op).  text_delta envelopes are folded
     * into the coalesced stream for their id before the handler runs.
     */
    bool dispatch(const Envelope &env);

    /* ── Coalesced text_delta streams ────────────────────────────────────── */
    std::string coalescedText(const std::string &id) const;
    bool        hasStream(const std::string &id) const;
    void        forget(const std::string &id);
    void        clear();
    size_t      streamCount() const;

    const std::string &name() const { return m_name; }

private:
    void appendDelta(const std::string &id, const std::string &delta);

    std::string   m_name;
    size_t        m_maxStreams;

    mutable std::mutex                            m_mutex;
    std::map<EnvelopeKind, Handler>               m_handlers;
    std::unordered_map<std::string, std::string>  m_streams;
    std::deque<std::string>                       m_streamOrder;  /* oldest first */
};

#endif /* MESSAGE_ROUTER_H */
