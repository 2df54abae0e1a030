#ifndef RELAY_CONFIG_H
#define RELAY_CONFIG_H

#include <functional>
#include <string>

/* Per-category log verbosity */
enum LogCategory {
    LOG_CONNECTION_EVENTS,
    LOG_FRONTEND_MESSAGES,
    LOG_FRONTEND_AUDIO,
    LOG_API_MESSAGES,
    LOG_API_AUDIO,
    LOG_API_TEXT_DELTA,
    LOG_API_FUNCTION_CALLS,
    LOG_CATEGORY_COUNT
};

enum LogDetail {
    LOG_DETAIL_NONE,        /* don't log this kind of event          */
    LOG_DETAIL_EVENT_ONLY,  /* log that it happened                  */
    LOG_DETAIL_FULL         /* log the event and its payload         */
};

struct LogConfig {
    LogDetail detail[LOG_CATEGORY_COUNT];

    LogConfig();

    bool shouldLogEvent(LogCategory c) const { return detail[c] != LOG_DETAIL_NONE; }
    bool shouldLogData(LogCategory c)  const { return detail[c] == LOG_DETAIL_FULL; }
};

const char *logCategoryName(LogCategory c);

/*
 * Immutable process configuration.  Built once at startup and shared
 * read-only by every session.
 */
struct RelayConfig {
    /* frontend listener */
    std::string bindAddress  = "0.0.0.0";
    int         port         = 8080;
    std::string path         = "/realtime";
    int         threads      = 2;

    /* provider */
    std::string providerUrl  = "wss://api.openai.com/v1/realtime";
    std::string model        = "gpt-4o-mini-realtime-preview-2024-12-17";
    std::string apiKey;
    std::string voice        = "alloy";
    std::string instructions;
    std::string welcomeInstructions;
    double      temperature      = 0.8;
    int         maxOutputTokens  = 400;
    int         sampleRate       = 24000;

    /* upstream socket options */
    int         heartBeat        = 0;       /* ping interval, seconds */
    bool        deflate          = false;
    std::string tlsCaFile;
    std::string tlsKeyFile;
    std::string tlsCertFile;
    bool        tlsDisableHostnameValidation = false;

    /* timing */
    int         connectTimeoutMs = 10000;
    int         closeTimeoutMs   = 100;
    int         playbackLeadMs   = 200;

    /* function-call tools */
    bool        weatherTool      = true;
    int         toolTimeoutMs    = 5000;    /* per HTTPS step of a tool fetch */

    /* logging */
    bool        suppressLog      = false;
    std::string logLevel         = "info";
    std::string logFile;
    LogConfig   log;

    RelayConfig();

    /* Full upstream URI including the model query parameter. */
    std::string providerUri() const;
};

typedef std::function<const char *(const char *)> EnvLookup;

/*
 * Build a RelayConfig from RELAY_* / OPENAI_API_KEY variables.  Bad
 * numeric values fall back to the default with a warning; a missing API
 * key or an unsupported sample rate throws RelayError(CONFIG_ERROR).
 */
RelayConfig loadRelayConfig(const EnvLookup &lookup);
RelayConfig loadRelayConfigFromEnvironment();

bool isSupportedVoice(const std::string &voice);

#endif /* RELAY_CONFIG_H */
