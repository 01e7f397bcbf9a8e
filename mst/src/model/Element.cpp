#include "model/Element.h"
#include <stdexcept>

namespace MST {

Element::Element(const std::string &id, const std::string &name, const std::string &type)
    : id_(id), name_(name.empty() ? id : name), type_(type.empty() ? "generic" : type) {
    if (id_.empty()) {
        throw std::invalid_argument("Element id cannot be empty");
    }
}

Json::Value Element::toJson() const {
    Json::Value json(Json::objectValue);
    json["id"] = id_;
    json["name"] = name_;
    json["type"] = type_;
    json["metadata"] = metadata_;
    return json;
}

}  // namespace MST
