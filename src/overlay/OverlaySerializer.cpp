#include "sankeyedit/overlay/OverlaySerializer.h"
#include "sankeyedit/overlay/OverlayStore.h"
#include "sankeyedit/common/Logger.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace sankeyedit {

namespace {

constexpr int FORMAT_VERSION = 1;

/// Each entry is a two-element [id, value] array with a non-empty string id
bool isPairEntry(const json& entry) {
    return entry.is_array() && entry.size() == 2 &&
           entry[0].is_string() && !entry[0].get<std::string>().empty() &&
           entry[1].is_object();
}

bool hasNumbers(const json& value, const char* a, const char* b) {
    return value.contains(a) && value[a].is_number() &&
           value.contains(b) && value[b].is_number();
}

/// Parse one [id, {a, b}] array; bad entries are skipped with a debug line
template <typename T, typename Make>
void parsePairs(const json& doc, const char* section, const char* a, const char* b,
                std::map<std::string, T>& out, Make make) {
    if (!doc.contains(section)) {
        return;
    }
    const json& entries = doc[section];
    if (!entries.is_array()) {
        LOG_DEBUG("Section '{}' is not an array, skipped", section);
        return;
    }

    for (const auto& entry : entries) {
        if (!isPairEntry(entry) || !hasNumbers(entry[1], a, b)) {
            LOG_DEBUG("Skipping malformed '{}' entry: {}", section, entry.dump());
            continue;
        }
        float first = entry[1][a].get<float>();
        float second = entry[1][b].get<float>();
        if (!isFinite(first) || !isFinite(second)) {
            LOG_DEBUG("Skipping non-finite '{}' entry: {}", section, entry.dump());
            continue;
        }
        out[entry[0].get<std::string>()] = make(first, second);
    }
}

}  // namespace

std::string OverlaySerializer::toJson(const OverlayState& state) {
    json j;
    j["version"] = FORMAT_VERSION;

    json nodePositions = json::array();
    for (const auto& [id, offset] : state.nodeOffsets) {
        nodePositions.push_back({id, {{"dx", offset.dx}, {"dy", offset.dy}}});
    }
    j["nodePositions"] = nodePositions;

    json labelPositions = json::array();
    for (const auto& [id, pos] : state.labelPositions) {
        labelPositions.push_back({id, {{"x", pos.x}, {"y", pos.y}}});
    }
    j["labelPositions"] = labelPositions;

    json labelDimensions = json::array();
    for (const auto& [id, size] : state.labelDimensions) {
        labelDimensions.push_back({id, {{"width", size.width}, {"height", size.height}}});
    }
    j["labelDimensions"] = labelDimensions;

    return j.dump();
}

bool OverlaySerializer::fromJson(const std::string& jsonStr, OverlayState& out) {
    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            LOG_ERROR("Failed to parse overlay JSON: document is not an object");
            return false;
        }

        OverlayState parsed;
        parsePairs(j, "nodePositions", "dx", "dy", parsed.nodeOffsets,
                   [](float dx, float dy) { return Offset{dx, dy}; });
        parsePairs(j, "labelPositions", "x", "y", parsed.labelPositions,
                   [](float x, float y) { return Point{x, y}; });
        parsePairs(j, "labelDimensions", "width", "height", parsed.labelDimensions,
                   [](float w, float h) { return Size{w, h}; });

        out = std::move(parsed);
        return true;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse overlay JSON: {}", e.what());
        return false;
    }
}

bool OverlaySerializer::saveToFile(const OverlayStore& store, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open '{}' for writing", path);
        return false;
    }
    file << toJson(store.state());
    return file.good();
}

bool OverlaySerializer::loadFromFile(OverlayStore& store, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open '{}' for reading", path);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return store.deserialize(buffer.str());
}

}  // namespace sankeyedit
