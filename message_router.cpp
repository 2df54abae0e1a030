#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "message_router.h"

MessageRouter::MessageRouter(const std::string &name, size_t maxStreams)
    : m_name(name),
      m_maxStreams(maxStreams ? maxStreams : 1)
{
}

void MessageRouter::registerHandler(EnvelopeKind kind, Handler handler) {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (handler) {
        m_handlers[kind] = std::move(handler);
    } else {
        m_handlers.erase(kind);
    }
}

void MessageRouter::unregisterHandler(EnvelopeKind kind) {
    std::lock_guard<std::mutex> lk(m_mutex);
    m_handlers.erase(kind);
}

void MessageRouter::unregisterAll() {
    std::lock_guard<std::mutex> lk(m_mutex);
    m_handlers.clear();
}

bool MessageRouter::hasHandler(EnvelopeKind kind) const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_handlers.find(kind) != m_handlers.end();
}

bool MessageRouter::dispatch(const Envelope &env) {
    Handler handler;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        if (env.kind() == KIND_TEXT_DELTA)
            appendDelta(env.id(), env.get("delta"));

        auto it = m_handlers.find(env.kind());
        if (it != m_handlers.end()) handler = it->second;
    }

    if (!handler) {
        spdlog::debug("[{}] no handler for '{}' - dropped",
            m_name, envelopeKindName(env.kind()));
        return false;
    }
    handler(env);
    return true;
}

/* caller holds m_mutex */
void MessageRouter::appendDelta(const std::string &id, const std::string &delta) {
    if (id.empty()) return;

    auto it = m_streams.find(id);
    if (it != m_streams.end()) {
        it->second += delta;
        return;
    }

    while (m_streams.size() >= m_maxStreams && !m_streamOrder.empty()) {
        m_streams.erase(m_streamOrder.front());
        m_streamOrder.pop_front();
    }
    m_streams.emplace(id, delta);
    m_streamOrder.push_back(id);
}

std::string MessageRouter::coalescedText(const std::string &id) const {
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = m_streams.find(id);
    return it == m_streams.end() ? std::string() : it->second;
}

bool MessageRouter::hasStream(const std::string &id) const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_streams.find(id) != m_streams.end();
}

void MessageRouter::forget(const std::string &id) {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_streams.erase(id) == 0) return;
    m_streamOrder.erase(
        std::remove(m_streamOrder.begin(), m_streamOrder.end(), id),
        m_streamOrder.end());
}

void MessageRouter::clear() {
    std::lock_guard<std::mutex> lk(m_mutex);
    m_streams.clear();
    m_streamOrder.clear();
}

size_t MessageRouter::streamCount() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_streams.size();
}
