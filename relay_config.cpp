#include <cctype>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <string>
#include <strings.h>

#include <spdlog/spdlog.h>

#include "realtime_relay.h"
#include "relay_config.h"
#include "relay_errors.h"

namespace {

    const char *const kDefaultInstructions =
        "Talk quickly and succinctly. Be concise. Time is of the essence.";

    const char *const kWelcomeInstructions =
        "Greet the user and ask them what you can assist them with. "
        "Talk quickly and succinctly.";

    const char *const kVoices[] = {
        "alloy", "ash", "ballad", "coral", "echo", "sage", "shimmer", "verse"
    };

    const char *const kCategoryNames[LOG_CATEGORY_COUNT] = {
        "connection_events",
        "frontend_messages",
        "frontend_audio",
        "api_messages",
        "api_audio",
        "api_text_delta",
        "api_function_calls"
    };

    bool varTrue(const EnvLookup &lookup, const char *name) {
        const char *v = lookup(name);
        if (!v) return false;
        return strcasecmp(v, "true") == 0 || strcasecmp(v, "yes") == 0 ||
               strcasecmp(v, "on") == 0   || std::strcmp(v, "1") == 0;
    }

    void varString(const EnvLookup &lookup, const char *name, std::string &out) {
        if (const char *v = lookup(name)) out = v;
    }

    void varInt(const EnvLookup &lookup, const char *name,
                int minValue, int maxValue, int &out)
    {
        const char *v = lookup(name);
        if (!v) return;
        char *endptr = nullptr;
        long value = std::strtol(v, &endptr, 10);
        if (*v == '\0' || *endptr != '\0' || value < minValue || value > maxValue) {
            spdlog::warn("{}={} is not an integer in [{}, {}] - using default {}",
                name, v, minValue, maxValue, out);
            return;
        }
        out = static_cast<int>(value);
    }

    void varDouble(const EnvLookup &lookup, const char *name,
                   double minValue, double maxValue, double &out)
    {
        const char *v = lookup(name);
        if (!v) return;
        char *endptr = nullptr;
        double value = std::strtod(v, &endptr);
        if (*v == '\0' || *endptr != '\0' || value < minValue || value > maxValue) {
            spdlog::warn("{}={} is not a number in [{}, {}] - using default {}",
                name, v, minValue, maxValue, out);
            return;
        }
        out = value;
    }

    bool parseLogDetail(const char *v, LogDetail &out) {
        if (strcasecmp(v, "none") == 0)       { out = LOG_DETAIL_NONE;       return true; }
        if (strcasecmp(v, "event_only") == 0) { out = LOG_DETAIL_EVENT_ONLY; return true; }
        if (strcasecmp(v, "full") == 0)       { out = LOG_DETAIL_FULL;       return true; }
        return false;
    }

} /* anonymous namespace */

LogConfig::LogConfig() {
    detail[LOG_CONNECTION_EVENTS]  = LOG_DETAIL_FULL;
    detail[LOG_FRONTEND_MESSAGES]  = LOG_DETAIL_EVENT_ONLY;
    detail[LOG_FRONTEND_AUDIO]     = LOG_DETAIL_NONE;   /* very noisy */
    detail[LOG_API_MESSAGES]       = LOG_DETAIL_EVENT_ONLY;
    detail[LOG_API_AUDIO]          = LOG_DETAIL_NONE;
    detail[LOG_API_TEXT_DELTA]     = LOG_DETAIL_EVENT_ONLY;
    detail[LOG_API_FUNCTION_CALLS] = LOG_DETAIL_FULL;
}

const char *logCategoryName(LogCategory c) {
    if (c < 0 || c >= LOG_CATEGORY_COUNT) return "unknown";
    return kCategoryNames[c];
}

RelayConfig::RelayConfig()
    : instructions(kDefaultInstructions),
      welcomeInstructions(kWelcomeInstructions)
{
}

std::string RelayConfig::providerUri() const {
    std::string uri = providerUrl;
    uri += (uri.find('?') == std::string::npos) ? "?model=" : "&model=";
    uri += model;
    return uri;
}

bool isSupportedVoice(const std::string &voice) {
    for (const char *v : kVoices) {
        if (voice == v) return true;
    }
    return false;
}

RelayConfig loadRelayConfig(const EnvLookup &lookup) {
    RelayConfig cfg;

    varString(lookup, "OPENAI_API_KEY", cfg.apiKey);
    if (cfg.apiKey.empty())
        throw RelayError(CONFIG_ERROR,
            "OPENAI_API_KEY environment variable is required");

    varString(lookup, "RELAY_BIND_ADDRESS", cfg.bindAddress);
    varInt(lookup, "RELAY_PORT", 1, 65535, cfg.port);
    varString(lookup, "RELAY_PATH", cfg.path);
    if (cfg.path.empty() || cfg.path[0] != '/') {
        spdlog::warn("RELAY_PATH={} must start with '/' - using /realtime", cfg.path);
        cfg.path = "/realtime";
    }
    varInt(lookup, "RELAY_THREADS", 1, 64, cfg.threads);

    varString(lookup, "RELAY_PROVIDER_URL", cfg.providerUrl);
    if (cfg.providerUrl.compare(0, 5, "ws://") != 0 &&
        cfg.providerUrl.compare(0, 6, "wss://") != 0)
        throw RelayError(CONFIG_ERROR,
            "RELAY_PROVIDER_URL must be a ws:// or wss:// URL: " + cfg.providerUrl);

    varString(lookup, "RELAY_MODEL", cfg.model);

    std::string voice = cfg.voice;
    varString(lookup, "RELAY_VOICE", voice);
    if (isSupportedVoice(voice)) {
        cfg.voice = voice;
    } else {
        spdlog::warn("RELAY_VOICE={} is not a provider voice - using {}",
            voice, cfg.voice);
    }

    varString(lookup, "RELAY_INSTRUCTIONS", cfg.instructions);
    varString(lookup, "RELAY_WELCOME_INSTRUCTIONS", cfg.welcomeInstructions);
    varDouble(lookup, "RELAY_TEMPERATURE", 0.6, 1.2, cfg.temperature);
    varInt(lookup, "RELAY_MAX_OUTPUT_TOKENS", 1, 4096, cfg.maxOutputTokens);

    varInt(lookup, "RELAY_SAMPLE_RATE", 1, INT_MAX, cfg.sampleRate);
    if (cfg.sampleRate != RELAY_SAMPLE_RATE)
        throw RelayError(CONFIG_ERROR,
            "RELAY_SAMPLE_RATE " + std::to_string(cfg.sampleRate) +
            " is not supported (only " + std::to_string(RELAY_SAMPLE_RATE) + ")");

    varInt(lookup, "RELAY_HEART_BEAT", 0, INT_MAX, cfg.heartBeat);
    cfg.deflate = varTrue(lookup, "RELAY_MESSAGE_DEFLATE");
    varString(lookup, "RELAY_TLS_CA_FILE",   cfg.tlsCaFile);
    varString(lookup, "RELAY_TLS_KEY_FILE",  cfg.tlsKeyFile);
    varString(lookup, "RELAY_TLS_CERT_FILE", cfg.tlsCertFile);
    cfg.tlsDisableHostnameValidation =
        varTrue(lookup, "RELAY_TLS_DISABLE_HOSTNAME_VALIDATION");

    varInt(lookup, "RELAY_CONNECT_TIMEOUT_MS", 100, 120000, cfg.connectTimeoutMs);
    varInt(lookup, "RELAY_CLOSE_TIMEOUT_MS", 10, 10000, cfg.closeTimeoutMs);
    varInt(lookup, "RELAY_PLAYBACK_LEAD_MS", PLAYBACK_FRAME_MS, 5000, cfg.playbackLeadMs);

    cfg.weatherTool = !varTrue(lookup, "RELAY_DISABLE_WEATHER_TOOL");
    varInt(lookup, "RELAY_TOOL_TIMEOUT_MS", 100, 60000, cfg.toolTimeoutMs);

    /* no payloads in the log; per-category variables below still win */
    cfg.suppressLog = varTrue(lookup, "RELAY_SUPPRESS_LOG");
    if (cfg.suppressLog) {
        for (int i = 0; i < LOG_CATEGORY_COUNT; ++i) {
            if (cfg.log.detail[i] == LOG_DETAIL_FULL)
                cfg.log.detail[i] = LOG_DETAIL_EVENT_ONLY;
        }
    }
    varString(lookup, "RELAY_LOG_LEVEL", cfg.logLevel);
    varString(lookup, "RELAY_LOG_FILE", cfg.logFile);

    for (int i = 0; i < LOG_CATEGORY_COUNT; ++i) {
        std::string name = "RELAY_LOG_";
        for (const char *p = kCategoryNames[i]; *p; ++p)
            name += static_cast<char>(std::toupper(static_cast<unsigned char>(*p)));
        const char *v = lookup(name.c_str());
        if (!v) continue;
        if (!parseLogDetail(v, cfg.log.detail[i])) {
            spdlog::warn("{}={} must be none, event_only or full - keeping default",
                name, v);
        }
    }

    return cfg;
}

RelayConfig loadRelayConfigFromEnvironment() {
    return loadRelayConfig([](const char *name) -> const char * {
        return std::getenv(name);
    });
}
