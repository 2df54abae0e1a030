#ifndef SESSION_REGISTRY_H
#define SESSION_REGISTRY_H

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "frontend_gateway.h"
#include "provider_connection.h"
#include "relay_config.h"
#include "session_manager.h"
#include "tool_registry.h"

/*
 * Live sessions of this process, keyed by their frontend socket.  Each
 * session runs on its own worker thread.  A finished worker hands a reap
 * task to the poster, so its session is freed without waiting for the
 * next open(); without a poster reaping happens on open() and size().
 * shutdown() joins everything.
 */
class SessionRegistry {
public:
    /*
     * Runs a task on some other thread, never inline.  Tasks must not run
     * after the registry is destroyed.
     */
    typedef std::function<void(std::function<void()>)> Poster;

    SessionRegistry(const RelayConfig &cfg,
                    ProviderTransportFactory transportFactory,
                    const ToolRegistry &tools,
                    Poster post = Poster());
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry &) = delete;
    SessionRegistry &operator=(const SessionRegistry &) = delete;

    /*
     * Start a session for an accepted socket.  Returns nullptr if the
     * socket already has a session or the registry is shutting down.
     */
    std::shared_ptr<SessionManager> open(std::shared_ptr<FrontendTransport> frontend);

    bool   hasSessionFor(const FrontendTransport *frontend) const;
    size_t size();

    /* Entries held, including finished ones not yet reaped. */
    size_t entryCount() const;

    /* Join workers whose session has finished; returns how many. */
    size_t reap();

    /* Cancel every session and join every worker. */
    void shutdown(const std::string &reason);

private:
    struct Entry {
        std::shared_ptr<SessionManager>     session;
        std::thread                         worker;
        std::shared_ptr<std::atomic<bool>>  done;
    };

    const RelayConfig          &m_cfg;
    ProviderTransportFactory    m_transportFactory;
    const ToolRegistry         &m_tools;
    Poster                      m_post;

    mutable std::mutex                             m_mutex;
    std::map<const FrontendTransport *, Entry>     m_sessions;
    bool                                           m_shuttingDown = false;
};

#endif /* SESSION_REGISTRY_H */
