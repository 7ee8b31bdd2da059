/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace voicetasks::infrastructure {

namespace {

std::optional<std::string> ReadString(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    if (!j[key].is_string()) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected a string." << std::endl;
        return std::nullopt;
    }
    std::string value = j[key].get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

AppConfig ConfigLoader::Defaults() {
    AppConfig config;
    config.tasksFile = PathUtils::GetDefaultTasksFile().string();
    return config;
}

AppConfig ConfigLoader::Load(const std::string& settingsPath) {
    AppConfig config = Defaults();

    std::error_code ec;
    if (!std::filesystem::exists(settingsPath, ec)) {
        return config;
    }

    nlohmann::json j;
    try {
        std::ifstream f(settingsPath);
        if (!f.is_open()) {
            std::cerr << "[ConfigLoader] Cannot open " << settingsPath << ", using defaults." << std::endl;
            return config;
        }
        f >> j;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << settingsPath << ": " << e.what() << std::endl;
        return config;
    }

    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] " << settingsPath << " is not a JSON object, using defaults." << std::endl;
        return config;
    }

    if (auto tasksFile = ReadString(j, "tasks_file")) {
        config.tasksFile = *tasksFile;
    }
    config.listenCommand = ReadString(j, "listen_command");
    config.speakCommand = ReadString(j, "speak_command");

    if (j.contains("reset_corrupt_store")) {
        if (j["reset_corrupt_store"].is_boolean()) {
            config.resetCorruptStore = j["reset_corrupt_store"].get<bool>();
        } else {
            std::cerr << "[ConfigLoader] Ignoring 'reset_corrupt_store': expected a boolean." << std::endl;
        }
    }

    return config;
}

} // namespace voicetasks::infrastructure
