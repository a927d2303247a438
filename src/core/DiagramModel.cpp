#include "sankeyedit/core/DiagramModel.h"
#include "sankeyedit/common/Logger.h"

#include <cmath>
#include <set>

namespace sankeyedit {

EditStatus DiagramModel::addFlow(const std::string& source, const std::string& target, double value) {
    if (source.empty() || target.empty()) {
        LOG_WARN("Invalid source or target node");
        return EditStatus::fail("source and target must be non-empty");
    }
    if (source == target) {
        LOG_WARN("Cannot create self-loop flow on '{}'", source);
        return EditStatus::fail("self-loop flows are not allowed");
    }
    if (!std::isfinite(value)) {
        LOG_WARN("Non-finite value for flow {} -> {}", source, target);
        return EditStatus::fail("flow value must be finite");
    }

    flows_[{source, target}] = value;
    return EditStatus::ok();
}

bool DiagramModel::removeFlow(const std::string& source, const std::string& target) {
    return flows_.erase({source, target}) > 0;
}

std::optional<Flow> DiagramModel::findFlow(const std::string& source, const std::string& target) const {
    auto it = flows_.find({source, target});
    if (it == flows_.end()) {
        return std::nullopt;
    }
    return Flow{source, target, it->second};
}

bool DiagramModel::hasFlow(const std::string& source, const std::string& target) const {
    return flows_.find({source, target}) != flows_.end();
}

std::vector<Flow> DiagramModel::removeNode(const std::string& name) {
    std::vector<Flow> removed = flowsOf(name);
    for (const auto& flow : removed) {
        flows_.erase({flow.source, flow.target});
    }
    return removed;
}

void DiagramModel::insertFlows(const std::vector<Flow>& flows) {
    for (const auto& flow : flows) {
        flows_[{flow.source, flow.target}] = flow.value;
    }
}

bool DiagramModel::hasNode(const std::string& name) const {
    for (const auto& [key, value] : flows_) {
        if (key.first == name || key.second == name) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> DiagramModel::nodes() const {
    std::set<std::string> names;
    for (const auto& [key, value] : flows_) {
        names.insert(key.first);
        names.insert(key.second);
    }
    return {names.begin(), names.end()};
}

std::vector<Flow> DiagramModel::flows() const {
    std::vector<Flow> result;
    result.reserve(flows_.size());
    for (const auto& [key, value] : flows_) {
        result.push_back({key.first, key.second, value});
    }
    return result;
}

std::vector<Flow> DiagramModel::flowsOf(const std::string& name) const {
    std::vector<Flow> result;
    for (const auto& [key, value] : flows_) {
        if (key.first == name || key.second == name) {
            result.push_back({key.first, key.second, value});
        }
    }
    return result;
}

void DiagramModel::setProperty(const std::string& elementType, const std::string& elementId,
                               const std::string& property, const std::optional<PropertyValue>& value) {
    PropertyKey key{elementType, elementId};
    if (value) {
        properties_[key][property] = *value;
        return;
    }

    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return;
    }
    it->second.erase(property);
    if (it->second.empty()) {
        properties_.erase(it);
    }
}

std::optional<PropertyValue> DiagramModel::getProperty(const std::string& elementType,
                                                       const std::string& elementId,
                                                       const std::string& property) const {
    auto it = properties_.find({elementType, elementId});
    if (it == properties_.end()) {
        return std::nullopt;
    }
    auto propIt = it->second.find(property);
    if (propIt == it->second.end()) {
        return std::nullopt;
    }
    return propIt->second;
}

size_t DiagramModel::propertyCount() const {
    size_t count = 0;
    for (const auto& [key, props] : properties_) {
        count += props.size();
    }
    return count;
}

void DiagramModel::clear() {
    flows_.clear();
    properties_.clear();
}

}  // namespace sankeyedit
