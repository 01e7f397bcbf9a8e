#pragma once

#include <cstdint>
#include <json/json.h>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace MST {

/**
 * @brief Shared jsoncpp helpers for configuration loading and debug serialization
 */
class JsonUtils {
public:
    /**
     * @brief Parse a JSON document
     * @param jsonString Input JSON text
     * @param errorOut Optional parse error output
     * @return Parsed value or nullopt on failure
     */
    static std::optional<Json::Value> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    static std::string toCompactString(const Json::Value &value);
    static std::string toPrettyString(const Json::Value &value);

    /**
     * @brief Typed lookups returning the default when the key is absent or has another type
     */
    static std::string getString(const Json::Value &object, const std::string &key,
                                 const std::string &defaultValue = "");
    static double getDouble(const Json::Value &object, const std::string &key, double defaultValue = 0.0);
    static bool getBool(const Json::Value &object, const std::string &key, bool defaultValue = false);
    static uint64_t getUInt64(const Json::Value &object, const std::string &key, uint64_t defaultValue = 0);

    /**
     * @brief Check if JSON object has key and it's not null
     */
    static bool hasKey(const Json::Value &object, const std::string &key);

    /**
     * @brief Build a JSON array from ids; std::set keeps the output sorted and stable
     */
    static Json::Value toArray(const std::set<std::string> &values);
    static Json::Value toArray(const std::vector<std::string> &values);

private:
    static Json::StreamWriterBuilder createWriterBuilder(const std::string &indentation);
};

}  // namespace MST
