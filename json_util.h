#ifndef JSON_UTIL_H
#define JSON_UTIL_H

#include <cstdlib>
#include <memory>
#include <string>

#include <cjson/cJSON.h>

typedef std::unique_ptr<cJSON, decltype(&cJSON_Delete)> jsonPtr;

inline jsonPtr jsonParse(const std::string &text) {
    return jsonPtr(cJSON_Parse(text.c_str()), &cJSON_Delete);
}

inline jsonPtr jsonObject() {
    return jsonPtr(cJSON_CreateObject(), &cJSON_Delete);
}

/* String member of an object, or nullptr when absent / not a string. */
inline const char *jsonGetCstr(const cJSON *obj, const char *name) {
    if (!obj) return nullptr;
    const cJSON *item = cJSON_GetObjectItemCaseSensitive(obj, name);
    if (!cJSON_IsString(item) || !item->valuestring) return nullptr;
    return item->valuestring;
}

inline std::string jsonGetString(const cJSON *obj, const char *name,
                                 const std::string &fallback = "")
{
    const char *v = jsonGetCstr(obj, name);
    return v ? std::string(v) : fallback;
}

/* Unformatted text of a node; "" if printing fails. */
inline std::string jsonPrint(const cJSON *node) {
    char *text = cJSON_PrintUnformatted(node);
    if (!text) return std::string();
    std::string out(text);
    cJSON_free(text);
    return out;
}

#endif /* JSON_UTIL_H */
