#pragma once

#include <json/json.h>
#include <string>

namespace MST {

/**
 * @brief Atomic named unit composing a State (button, image, region, ...)
 *
 * Identity is the id; name, type and metadata are descriptive only.
 */
class Element {
public:
    /**
     * @param id Unique element identifier (must not be empty)
     * @param name Human-readable name, defaults to the id
     * @param type Type tag, "generic" when not specified
     */
    explicit Element(const std::string &id, const std::string &name = "", const std::string &type = "generic");

    const std::string &getId() const {
        return id_;
    }

    const std::string &getName() const {
        return name_;
    }

    const std::string &getType() const {
        return type_;
    }

    Json::Value &getMetadata() {
        return metadata_;
    }

    const Json::Value &getMetadata() const {
        return metadata_;
    }

    Json::Value toJson() const;

    bool operator==(const Element &other) const {
        return id_ == other.id_;
    }

    bool operator<(const Element &other) const {
        return id_ < other.id_;
    }

private:
    std::string id_;
    std::string name_;
    std::string type_;
    Json::Value metadata_{Json::objectValue};
};

}  // namespace MST
