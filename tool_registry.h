#ifndef TOOL_REGISTRY_H
#define TOOL_REGISTRY_H

#include <functional>
#include <map>
#include <string>

#include "json_util.h"

/*
 * Function-call tools offered to the provider.  Definitions are advertised
 * in session.update; a completed function call is looked up by name and
 * its output is returned to the provider as a JSON string.
 */
class ToolRegistry {
public:
    typedef std::function<std::string(const std::string &arguments)> Handler;

    /* GET https://<host><target>, returning the body; throws on failure. */
    typedef std::function<std::string(const std::string &host,
                                      const std::string &target)> HttpGetter;

    struct Tool {
        std::string description;
        std::string parameters;             /* JSON schema text */
        std::string responseInstructions;   /* for the follow-up response; may be empty */
        Handler     handler;
    };

    /*
     * Registry holding the built-in tools.  get_weather is only offered
     * when a fetch function is given.
     */
    static ToolRegistry withBuiltins(HttpGetter fetch = HttpGetter());

    void add(const std::string &name, const Tool &tool);
    bool has(const std::string &name) const;
    size_t size() const { return m_tools.size(); }

    /* Instructions for the response that follows `name`'s output. */
    std::string responseInstructions(const std::string &name) const;

    /* Tool definitions as the provider's "tools" array. */
    jsonPtr definitions() const;

    /*
     * Run a tool.  Never throws: an unknown tool, bad arguments or a
     * failing handler yield {"error": "..."}.
     */
    std::string invoke(const std::string &name, const std::string &arguments) const;

private:
    std::map<std::string, Tool> m_tools;
};

/* get_current_time: UTC or fixed-offset wall clock, no network needed. */
std::string currentTimeTool(const std::string &arguments);

/*
 * get_weather: Open-Meteo current weather.  A location_name is geocoded
 * first and overrides lat/lon; otherwise both coordinates are required.
 * Returns the forecast JSON with location_name added.
 */
std::string weatherTool(const ToolRegistry::HttpGetter &fetch, const std::string &arguments);

extern const char *const WEATHER_GEOCODING_HOST;
extern const char *const WEATHER_FORECAST_HOST;

#endif /* TOOL_REGISTRY_H */
