#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "tool_registry.h"

namespace {

    std::string errorOutput(const std::string &message) {
        jsonPtr root = jsonObject();
        cJSON_AddStringToObject(root.get(), "error", message.c_str());
        return jsonPrint(root.get());
    }

    const char *kCurrentTimeSchema =
        "{\"type\":\"object\",\"properties\":{"
          "\"utc_offset_minutes\":{\"type\":\"integer\","
            "\"description\":\"Offset from UTC in minutes, e.g. -300 for New York winter time. Defaults to 0.\"}"
        "},\"required\":[]}";

    const char *kWeatherSchema =
        "{\"type\":\"object\",\"properties\":{"
          "\"location_name\":{\"type\":\"string\","
            "\"description\":\"City or place name, e.g. 'Berlin'. Preferred over coordinates.\"},"
          "\"lat\":{\"type\":\"number\",\"description\":\"Latitude in degrees\"},"
          "\"lon\":{\"type\":\"number\",\"description\":\"Longitude in degrees\"}"
        "},\"required\":[]}";

    const char *kWeatherInstructions =
        "Describe the weather in a conversational way for someone going for a walk. "
        "Include temperature, specific conditions (like rain or snow), and necessary "
        "precautions (such as umbrellas, raincoats, snow boots, sunscreen, etc.).";

    std::string urlEncode(const std::string &in) {
        static const char hex[] = "0123456789ABCDEF";
        std::string out;
        out.reserve(in.size() * 3);
        for (unsigned char c : in) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                out += static_cast<char>(c);
            } else {
                out += '%';
                out += hex[c >> 4];
                out += hex[c & 0x0f];
            }
        }
        return out;
    }

    /* Number or numeric string; false when absent or null. */
    bool coordinate(const cJSON *args, const char *key, double &out) {
        const cJSON *item = cJSON_GetObjectItemCaseSensitive(args, key);
        if (!item || cJSON_IsNull(item)) return false;
        if (cJSON_IsNumber(item)) {
            out = item->valuedouble;
            return true;
        }
        if (cJSON_IsString(item) && item->valuestring[0]) {
            char *end = nullptr;
            out = std::strtod(item->valuestring, &end);
            if (*end == '\0') return true;
        }
        throw std::invalid_argument(std::string(key) + " must be a number");
    }

} /* anonymous namespace */

const char *const WEATHER_GEOCODING_HOST = "geocoding-api.open-meteo.com";
const char *const WEATHER_FORECAST_HOST  = "api.open-meteo.com";

std::string weatherTool(const ToolRegistry::HttpGetter &fetch, const std::string &arguments) {
    jsonPtr args = arguments.empty() ? jsonObject() : jsonParse(arguments);
    if (!args || !cJSON_IsObject(args.get()))
        throw std::invalid_argument("arguments are not a JSON object");

    std::string name = jsonGetString(args.get(), "location_name");
    double lat = 0, lon = 0;
    bool haveLat = coordinate(args.get(), "lat", lat);
    bool haveLon = coordinate(args.get(), "lon", lon);

    if (!name.empty()) {
        jsonPtr geo = jsonParse(fetch(WEATHER_GEOCODING_HOST,
            "/v1/search?name=" + urlEncode(name) + "&count=1"));
        if (!geo) throw std::runtime_error("geocoding response is not JSON");

        const cJSON *results = cJSON_GetObjectItemCaseSensitive(geo.get(), "results");
        const cJSON *first   = cJSON_IsArray(results) ? cJSON_GetArrayItem(results, 0) : nullptr;
        if (!first) throw std::invalid_argument("Location '" + name + "' not found");

        /* the geocoded place wins over any coordinates given */
        haveLat = coordinate(first, "latitude", lat);
        haveLon = coordinate(first, "longitude", lon);
        std::string resolved = jsonGetString(first, "name");
        if (!resolved.empty()) name = resolved;
    }

    if (!haveLat || !haveLon)
        throw std::invalid_argument("Both latitude and longitude are required");
    if (std::fabs(lat) > 90.0 || std::fabs(lon) > 180.0)
        throw std::invalid_argument("coordinates out of range");

    char target[192];
    std::snprintf(target, sizeof(target),
        "/v1/forecast?latitude=%.4f&longitude=%.4f"
        "&current_weather=true&temperature_unit=celsius&timezone=auto", lat, lon);

    jsonPtr forecast = jsonParse(fetch(WEATHER_FORECAST_HOST, target));
    if (!forecast || !cJSON_IsObject(forecast.get()))
        throw std::runtime_error("forecast response is not a JSON object");

    if (!name.empty()) {
        cJSON_DeleteItemFromObjectCaseSensitive(forecast.get(), "location_name");
        cJSON_AddStringToObject(forecast.get(), "location_name", name.c_str());
    }
    return jsonPrint(forecast.get());
}

std::string currentTimeTool(const std::string &arguments) {
    long offsetMinutes = 0;

    if (!arguments.empty()) {
        jsonPtr args = jsonParse(arguments);
        if (!args || !cJSON_IsObject(args.get()))
            throw std::invalid_argument("arguments are not a JSON object");

        const cJSON *off = cJSON_GetObjectItemCaseSensitive(args.get(), "utc_offset_minutes");
        if (off && !cJSON_IsNull(off)) {
            if (!cJSON_IsNumber(off) || std::floor(off->valuedouble) != off->valuedouble)
                throw std::invalid_argument("utc_offset_minutes must be an integer");
            if (off->valuedouble < -14 * 60 || off->valuedouble > 14 * 60)
                throw std::invalid_argument("utc_offset_minutes out of range");
            offsetMinutes = static_cast<long>(off->valuedouble);
        }
    }

    std::time_t now = std::time(nullptr) + offsetMinutes * 60;
    std::tm tm;
    gmtime_r(&now, &tm);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &tm);

    char zone[8];
    const long absMin = offsetMinutes < 0 ? -offsetMinutes : offsetMinutes;
    std::snprintf(zone, sizeof(zone), "%c%02ld:%02ld",
        offsetMinutes < 0 ? '-' : '+', absMin / 60, absMin % 60);

    char weekday[16];
    std::strftime(weekday, sizeof(weekday), "%A", &tm);

    jsonPtr root = jsonObject();
    cJSON_AddStringToObject(root.get(), "time", (std::string(stamp) + zone).c_str());
    cJSON_AddStringToObject(root.get(), "weekday", weekday);
    cJSON_AddNumberToObject(root.get(), "utc_offset_minutes", offsetMinutes);
    return jsonPrint(root.get());
}

ToolRegistry ToolRegistry::withBuiltins(HttpGetter fetch) {
    ToolRegistry reg;
    Tool t;
    t.description = "Get the current date and time, optionally at a fixed offset from UTC.";
    t.parameters  = kCurrentTimeSchema;
    t.handler     = currentTimeTool;
    reg.add("get_current_time", t);

    if (fetch) {
        Tool w;
        w.description = "Get the current weather for a place, by name or by latitude and longitude.";
        w.parameters  = kWeatherSchema;
        w.responseInstructions = kWeatherInstructions;
        w.handler = [fetch](const std::string &arguments) { return weatherTool(fetch, arguments); };
        reg.add("get_weather", w);
    }
    return reg;
}

void ToolRegistry::add(const std::string &name, const Tool &tool) {
    m_tools[name] = tool;
}

bool ToolRegistry::has(const std::string &name) const {
    return m_tools.find(name) != m_tools.end();
}

std::string ToolRegistry::responseInstructions(const std::string &name) const {
    auto it = m_tools.find(name);
    return it == m_tools.end() ? std::string() : it->second.responseInstructions;
}

jsonPtr ToolRegistry::definitions() const {
    jsonPtr arr(cJSON_CreateArray(), &cJSON_Delete);
    for (const auto &kv : m_tools) {
        cJSON *def = cJSON_CreateObject();
        cJSON_AddStringToObject(def, "type", "function");
        cJSON_AddStringToObject(def, "name", kv.first.c_str());
        cJSON_AddStringToObject(def, "description", kv.second.description.c_str());
        cJSON *params = cJSON_Parse(kv.second.parameters.c_str());
        if (!params) {
            spdlog::error("tool {}: parameter schema is not valid JSON", kv.first);
            params = cJSON_CreateObject();
        }
        cJSON_AddItemToObject(def, "parameters", params);
        cJSON_AddItemToArray(arr.get(), def);
    }
    return arr;
}

std::string ToolRegistry::invoke(const std::string &name, const std::string &arguments) const {
    auto it = m_tools.find(name);
    if (it == m_tools.end() || !it->second.handler)
        return errorOutput("unknown tool: " + name);

    try {
        return it->second.handler(arguments);
    } catch (const std::exception &e) {
        spdlog::warn("tool {} failed: {}", name, e.what());
        return errorOutput(e.what());
    }
}
