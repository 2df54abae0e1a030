#ifndef HTTPS_CLIENT_H
#define HTTPS_CLIENT_H

#include <chrono>
#include <string>

#include "tool_registry.h"

struct HttpsOptions {
    std::chrono::milliseconds timeout{5000};   /* per step: resolve, connect, TLS, request */
    std::string               caFile;          /* empty: system trust store */
};

/*
 * Blocking HTTPS GET of https://<host><target>.  Runs its own io_context,
 * so it may be called from any thread, including a provider callback.
 * Returns the body of a 200 response; throws std::runtime_error for
 * anything else (network failure, certificate mismatch, other status).
 */
std::string httpsGet(const std::string &host, const std::string &target,
                     const HttpsOptions &opts);

/* httpsGet bound to `opts`, as a tool's fetch function. */
ToolRegistry::HttpGetter httpsGetter(const HttpsOptions &opts);

#endif /* HTTPS_CLIENT_H */
