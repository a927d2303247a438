#include "sankeyedit/editor/EditorConfig.h"
#include "sankeyedit/common/Logger.h"

#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace sankeyedit {

std::string EditorConfigSerializer::toJson(const EditorConfig& config) {
    json j;
    j["maxUndoStack"] = config.maxUndoStack;
    j["verifyTolerance"] = config.verifyTolerance;
    j["dragThreshold"] = config.dragThreshold;
    j["defaultFlowValue"] = config.defaultFlowValue;
    j["logDirectory"] = config.logDirectory;
    j["logToFile"] = config.logToFile;
    return j.dump(2);
}

EditorConfig EditorConfigSerializer::fromJson(const std::string& jsonStr) {
    EditorConfig config;

    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            LOG_WARN("Editor config is not a JSON object, using defaults");
            return config;
        }

        if (j.contains("maxUndoStack")) {
            const auto& v = j["maxUndoStack"];
            if (v.is_number_integer() && v.get<long long>() > 0) {
                config.maxUndoStack = v.get<size_t>();
            } else {
                LOG_WARN("maxUndoStack must be a positive integer, keeping {}", config.maxUndoStack);
            }
        }

        if (j.contains("verifyTolerance")) {
            const auto& v = j["verifyTolerance"];
            if (v.is_number() && v.get<float>() >= 0.0f) {
                config.verifyTolerance = v.get<float>();
            } else {
                LOG_WARN("verifyTolerance must be a non-negative number, keeping {}", config.verifyTolerance);
            }
        }

        if (j.contains("dragThreshold")) {
            const auto& v = j["dragThreshold"];
            if (v.is_number() && v.get<float>() >= 0.0f) {
                config.dragThreshold = v.get<float>();
            } else {
                LOG_WARN("dragThreshold must be a non-negative number, keeping {}", config.dragThreshold);
            }
        }

        if (j.contains("defaultFlowValue")) {
            const auto& v = j["defaultFlowValue"];
            if (v.is_number() && std::isfinite(v.get<double>())) {
                config.defaultFlowValue = v.get<double>();
            } else {
                LOG_WARN("defaultFlowValue must be a number, keeping {}", config.defaultFlowValue);
            }
        }

        if (j.contains("logDirectory")) {
            if (j["logDirectory"].is_string()) {
                config.logDirectory = j["logDirectory"].get<std::string>();
            } else {
                LOG_WARN("logDirectory must be a string, ignored");
            }
        }

        if (j.contains("logToFile")) {
            if (j["logToFile"].is_boolean()) {
                config.logToFile = j["logToFile"].get<bool>();
            } else {
                LOG_WARN("logToFile must be a boolean, ignored");
            }
        }
    } catch (const json::exception& e) {
        LOG_WARN("Failed to parse editor config: {}", e.what());
        return EditorConfig{};
    }

    return config;
}

EditorConfig EditorConfigSerializer::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open editor config '{}', using defaults", path);
        return EditorConfig{};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

}  // namespace sankeyedit
