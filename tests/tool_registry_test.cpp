#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "json_util.h"
#include "tool_registry.h"

TEST(ToolRegistry, BuiltinsIncludeCurrentTime) {
    ToolRegistry tools = ToolRegistry::withBuiltins();
    EXPECT_TRUE(tools.has("get_current_time"));
    EXPECT_EQ(1u, tools.size());

    jsonPtr defs = tools.definitions();
    ASSERT_EQ(1, cJSON_GetArraySize(defs.get()));
    const cJSON *def = cJSON_GetArrayItem(defs.get(), 0);
    EXPECT_EQ("function", jsonGetString(def, "type"));
    EXPECT_EQ("get_current_time", jsonGetString(def, "name"));
    EXPECT_TRUE(cJSON_IsObject(cJSON_GetObjectItemCaseSensitive(def, "parameters")));
}

TEST(ToolRegistry, InvokesRegisteredHandler) {
    ToolRegistry tools;
    ToolRegistry::Tool echo;
    echo.description = "echo";
    echo.parameters  = "{\"type\":\"object\"}";
    echo.handler     = [](const std::string &args) { return args; };
    tools.add("echo", echo);

    EXPECT_EQ("{\"x\":1}", tools.invoke("echo", "{\"x\":1}"));
}

TEST(ToolRegistry, UnknownToolYieldsErrorOutput) {
    ToolRegistry tools;
    jsonPtr out = jsonParse(tools.invoke("weather", "{}"));
    ASSERT_TRUE(out);
    EXPECT_EQ("unknown tool: weather", jsonGetString(out.get(), "error"));
}

TEST(ToolRegistry, FailingHandlerYieldsErrorOutput) {
    ToolRegistry tools;
    ToolRegistry::Tool bad;
    bad.parameters = "{}";
    bad.handler = [](const std::string &) -> std::string {
        throw std::runtime_error("backend down");
    };
    tools.add("bad", bad);

    jsonPtr out = jsonParse(tools.invoke("bad", "{}"));
    ASSERT_TRUE(out);
    EXPECT_EQ("backend down", jsonGetString(out.get(), "error"));
}

TEST(ToolRegistry, InvalidSchemaStillAdvertised) {
    ToolRegistry tools;
    ToolRegistry::Tool t;
    t.parameters = "{broken";
    t.handler = [](const std::string &) { return std::string("{}"); };
    tools.add("t", t);

    jsonPtr defs = tools.definitions();
    const cJSON *params = cJSON_GetObjectItemCaseSensitive(cJSON_GetArrayItem(defs.get(), 0), "parameters");
    EXPECT_TRUE(cJSON_IsObject(params));
}

TEST(CurrentTimeTool, DefaultsToUtc) {
    jsonPtr out = jsonParse(currentTimeTool("{}"));
    ASSERT_TRUE(out);
    std::string time = jsonGetString(out.get(), "time");
    ASSERT_EQ(25u, time.size());   /* YYYY-MM-DDTHH:MM:SS+00:00 */
    EXPECT_EQ("+00:00", time.substr(19));
    EXPECT_FALSE(jsonGetString(out.get(), "weekday").empty());
}

TEST(CurrentTimeTool, AppliesOffset) {
    jsonPtr out = jsonParse(currentTimeTool("{\"utc_offset_minutes\":-330}"));
    ASSERT_TRUE(out);
    EXPECT_EQ("-05:30", jsonGetString(out.get(), "time").substr(19));
    EXPECT_EQ(-330, cJSON_GetObjectItemCaseSensitive(out.get(), "utc_offset_minutes")->valueint);
}

TEST(CurrentTimeTool, EmptyArgumentsAllowed) {
    EXPECT_NO_THROW(currentTimeTool(""));
}

TEST(CurrentTimeTool, RejectsBadArguments) {
    EXPECT_THROW(currentTimeTool("nope"), std::invalid_argument);
    EXPECT_THROW(currentTimeTool("{\"utc_offset_minutes\":\"x\"}"), std::invalid_argument);
    EXPECT_THROW(currentTimeTool("{\"utc_offset_minutes\":1.5}"), std::invalid_argument);
    EXPECT_THROW(currentTimeTool("{\"utc_offset_minutes\":900}"), std::invalid_argument);
}

/* ── get_weather ───────────────────────────────────────────────────────── */

namespace {

    /* Canned Open-Meteo: records each request, answers by host. */
    struct FakeOpenMeteo {
        std::vector<std::pair<std::string, std::string>> requests;
        std::string geocoding = "{\"results\":[{\"name\":\"Berlin\",\"latitude\":52.52,\"longitude\":13.41}]}";
        std::string forecast  = "{\"current_weather\":{\"temperature\":7.5,\"weathercode\":61}}";

        ToolRegistry::HttpGetter getter() {
            return [this](const std::string &host, const std::string &target) {
                requests.emplace_back(host, target);
                return host == WEATHER_GEOCODING_HOST ? geocoding : forecast;
            };
        }
    };

} /* anonymous namespace */

TEST(WeatherTool, OfferedOnlyWithAFetcher) {
    FakeOpenMeteo api;
    ToolRegistry tools = ToolRegistry::withBuiltins(api.getter());
    EXPECT_TRUE(tools.has("get_weather"));
    EXPECT_EQ(2u, tools.size());
    EXPECT_FALSE(tools.responseInstructions("get_weather").empty());
    EXPECT_TRUE(tools.responseInstructions("get_current_time").empty());

    EXPECT_FALSE(ToolRegistry::withBuiltins().has("get_weather"));
}

TEST(WeatherTool, GeocodesNameThenFetchesForecast) {
    FakeOpenMeteo api;
    jsonPtr out = jsonParse(weatherTool(api.getter(), "{\"location_name\":\"new york\",\"lat\":1,\"lon\":2}"));
    ASSERT_TRUE(out);

    ASSERT_EQ(2u, api.requests.size());
    EXPECT_EQ(WEATHER_GEOCODING_HOST, api.requests[0].first);
    EXPECT_EQ("/v1/search?name=new%20york&count=1", api.requests[0].second);
    EXPECT_EQ(WEATHER_FORECAST_HOST, api.requests[1].first);
    EXPECT_NE(std::string::npos, api.requests[1].second.find("latitude=52.5200&longitude=13.4100"));
    EXPECT_NE(std::string::npos, api.requests[1].second.find("current_weather=true"));

    EXPECT_EQ("Berlin", jsonGetString(out.get(), "location_name"));
    const cJSON *current = cJSON_GetObjectItemCaseSensitive(out.get(), "current_weather");
    ASSERT_TRUE(cJSON_IsObject(current));
    EXPECT_DOUBLE_EQ(7.5, cJSON_GetObjectItemCaseSensitive(current, "temperature")->valuedouble);
}

TEST(WeatherTool, CoordinatesSkipGeocoding) {
    FakeOpenMeteo api;
    jsonPtr out = jsonParse(weatherTool(api.getter(), "{\"lat\":-33.87,\"lon\":\"151.21\"}"));
    ASSERT_TRUE(out);
    ASSERT_EQ(1u, api.requests.size());
    EXPECT_EQ(WEATHER_FORECAST_HOST, api.requests[0].first);
    EXPECT_NE(std::string::npos, api.requests[0].second.find("latitude=-33.8700&longitude=151.2100"));
    EXPECT_EQ(nullptr, cJSON_GetObjectItemCaseSensitive(out.get(), "location_name"));
}

TEST(WeatherTool, UnknownPlaceIsReportedAsToolError) {
    FakeOpenMeteo api;
    api.geocoding = "{\"generationtime_ms\":0.4}";
    ToolRegistry tools = ToolRegistry::withBuiltins(api.getter());

    jsonPtr out = jsonParse(tools.invoke("get_weather", "{\"location_name\":\"Atlantis\"}"));
    ASSERT_TRUE(out);
    EXPECT_EQ("Location 'Atlantis' not found", jsonGetString(out.get(), "error"));
    EXPECT_EQ(1u, api.requests.size());
}

TEST(WeatherTool, MissingCoordinatesRejected) {
    FakeOpenMeteo api;
    EXPECT_THROW(weatherTool(api.getter(), "{\"lat\":10}"), std::invalid_argument);
    EXPECT_THROW(weatherTool(api.getter(), "{\"lat\":\"north\",\"lon\":3}"), std::invalid_argument);
    EXPECT_THROW(weatherTool(api.getter(), "{\"lat\":95,\"lon\":3}"), std::invalid_argument);
    EXPECT_TRUE(api.requests.empty());
}

TEST(WeatherTool, FetchFailureBecomesErrorOutput) {
    ToolRegistry tools = ToolRegistry::withBuiltins(
        [](const std::string &host, const std::string &) -> std::string {
            throw std::runtime_error("connect " + host + ": Connection refused");
        });

    jsonPtr out = jsonParse(tools.invoke("get_weather", "{\"lat\":1,\"lon\":2}"));
    ASSERT_TRUE(out);
    EXPECT_EQ("connect api.open-meteo.com: Connection refused", jsonGetString(out.get(), "error"));
}
