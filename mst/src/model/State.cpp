#include "model/State.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <cmath>
#include <stdexcept>

namespace MST {

State::State(const std::string &id, const std::string &name) : id_(id), name_(name.empty() ? id : name) {
    if (id_.empty()) {
        throw std::invalid_argument("State id cannot be empty");
    }
}

void State::addElement(const Element &element) {
    auto [it, inserted] = elements_.emplace(element.getId(), element);
    if (!inserted) {
        LOG_DEBUG("State {}: replacing element {}", id_, element.getId());
        it->second = element;
    }
}

void State::removeElement(const std::string &elementId) {
    elements_.erase(elementId);
}

bool State::hasElement(const std::string &elementId) const {
    return elements_.find(elementId) != elements_.end();
}

void State::setInitialWeight(double weight) {
    if (!std::isfinite(weight) || weight < 0.0) {
        throw std::invalid_argument("State " + id_ + ": initial weight must be a finite non-negative number");
    }
    initialWeight_ = weight;
}

void State::setSearchCost(double cost) {
    if (!std::isfinite(cost) || cost < 0.0) {
        throw std::invalid_argument("State " + id_ + ": search cost must be a finite non-negative number");
    }
    searchCost_ = cost;
}

Json::Value State::toJson() const {
    Json::Value json(Json::objectValue);
    json["id"] = id_;
    json["name"] = name_;

    Json::Value elements(Json::arrayValue);
    for (const auto &[elementId, element] : elements_) {
        elements.append(elementId);
    }
    json["elements"] = elements;

    json["group"] = group_.empty() ? Json::Value(Json::nullValue) : Json::Value(group_);
    json["initial_weight"] = initialWeight_;
    json["search_cost"] = searchCost_;
    json["blocking"] = blocking_;
    json["blocks"] = JsonUtils::toArray(blocks_);
    json["metadata"] = metadata_;
    return json;
}

}  // namespace MST
