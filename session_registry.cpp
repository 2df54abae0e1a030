#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "session_registry.h"

SessionRegistry::SessionRegistry(const RelayConfig &cfg,
                                 ProviderTransportFactory transportFactory,
                                 const ToolRegistry &tools,
                                 Poster post)
    : m_cfg(cfg),
      m_transportFactory(std::move(transportFactory)),
      m_tools(tools),
      m_post(std::move(post))
{
}

SessionRegistry::~SessionRegistry() {
    shutdown("registry destroyed");
}

std::shared_ptr<SessionManager> SessionRegistry::open(std::shared_ptr<FrontendTransport> frontend) {
    if (!frontend) return nullptr;
    reap();

    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_shuttingDown) {
        spdlog::warn("rejecting connection from {}: shutting down", frontend->remoteAddress());
        return nullptr;
    }
    if (!frontend->isOpen()) {
        spdlog::warn("connection from {} is already closed", frontend->remoteAddress());
        return nullptr;
    }
    if (m_sessions.find(frontend.get()) != m_sessions.end()) {
        spdlog::warn("connection from {} already has a session", frontend->remoteAddress());
        return nullptr;
    }

    Entry entry;
    entry.session = std::make_shared<SessionManager>(m_cfg, m_transportFactory, m_tools);
    entry.done    = std::make_shared<std::atomic<bool>>(false);

    std::shared_ptr<SessionManager>    session = entry.session;
    std::shared_ptr<std::atomic<bool>> done    = entry.done;
    entry.worker = std::thread([this, session, done, frontend]() {
        session->run(frontend);
        done->store(true);
        /* a thread cannot join itself; the reap runs elsewhere */
        if (m_post) m_post([this]() { reap(); });
    });

    spdlog::info("({}) session created for {}, {} live", session->id(),
        frontend->remoteAddress(), m_sessions.size() + 1);
    m_sessions.emplace(frontend.get(), std::move(entry));
    return session;
}

bool SessionRegistry::hasSessionFor(const FrontendTransport *frontend) const {
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = m_sessions.find(frontend);
    return it != m_sessions.end() && !it->second.done->load();
}

size_t SessionRegistry::size() {
    reap();
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_sessions.size();
}

size_t SessionRegistry::entryCount() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_sessions.size();
}

size_t SessionRegistry::reap() {
    std::vector<Entry> finished;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        for (auto it = m_sessions.begin(); it != m_sessions.end(); ) {
            if (it->second.done->load()) {
                finished.push_back(std::move(it->second));
                it = m_sessions.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto &e : finished) {
        if (e.worker.joinable()) e.worker.join();
        spdlog::debug("({}) session reaped", e.session->id());
    }
    return finished.size();
}

void SessionRegistry::shutdown(const std::string &reason) {
    std::vector<Entry> all;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_shuttingDown = true;
        for (auto &kv : m_sessions) all.push_back(std::move(kv.second));
        m_sessions.clear();
    }
    if (all.empty()) return;

    spdlog::info("shutting down {} session(s): {}", all.size(), reason);
    for (auto &e : all) e.session->cancel(reason);
    for (auto &e : all) {
        if (e.worker.joinable()) e.worker.join();
    }
}
