#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <sstream>

namespace MST {

std::optional<Json::Value> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    if (jsonString.empty()) {
        if (errorOut) {
            *errorOut = "Empty JSON string";
        }
        return std::nullopt;
    }

    Json::Value root;
    Json::CharReaderBuilder readerBuilder;
    std::string parseErrors;
    std::istringstream jsonStream(jsonString);

    if (!Json::parseFromStream(readerBuilder, jsonStream, &root, &parseErrors)) {
        if (errorOut) {
            *errorOut = parseErrors;
        }
        LOG_DEBUG("Failed to parse JSON: {}", parseErrors);
        return std::nullopt;
    }

    return root;
}

std::string JsonUtils::toCompactString(const Json::Value &value) {
    return Json::writeString(createWriterBuilder(""), value);
}

std::string JsonUtils::toPrettyString(const Json::Value &value) {
    return Json::writeString(createWriterBuilder("  "), value);
}

std::string JsonUtils::getString(const Json::Value &object, const std::string &key, const std::string &defaultValue) {
    if (!object.isObject() || !object.isMember(key) || !object[key].isString()) {
        return defaultValue;
    }
    return object[key].asString();
}

double JsonUtils::getDouble(const Json::Value &object, const std::string &key, double defaultValue) {
    if (!object.isObject() || !object.isMember(key) || !object[key].isNumeric()) {
        return defaultValue;
    }
    return object[key].asDouble();
}

bool JsonUtils::getBool(const Json::Value &object, const std::string &key, bool defaultValue) {
    if (!object.isObject() || !object.isMember(key) || !object[key].isBool()) {
        return defaultValue;
    }
    return object[key].asBool();
}

uint64_t JsonUtils::getUInt64(const Json::Value &object, const std::string &key, uint64_t defaultValue) {
    if (!object.isObject() || !object.isMember(key) || !object[key].isUInt64()) {
        return defaultValue;
    }
    return object[key].asUInt64();
}

bool JsonUtils::hasKey(const Json::Value &object, const std::string &key) {
    return object.isObject() && object.isMember(key) && !object[key].isNull();
}

Json::Value JsonUtils::toArray(const std::set<std::string> &values) {
    Json::Value array(Json::arrayValue);
    for (const auto &value : values) {
        array.append(value);
    }
    return array;
}

Json::Value JsonUtils::toArray(const std::vector<std::string> &values) {
    Json::Value array(Json::arrayValue);
    for (const auto &value : values) {
        array.append(value);
    }
    return array;
}

Json::StreamWriterBuilder JsonUtils::createWriterBuilder(const std::string &indentation) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = indentation;
    return builder;
}

}  // namespace MST
