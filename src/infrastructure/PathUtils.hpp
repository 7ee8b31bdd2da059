// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace voicetasks::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief Default task file: <data home>/VoiceTasks/tasks.json */
    static std::filesystem::path GetDefaultTasksFile();

    /** @brief Default settings file: <config home>/VoiceTasks/settings.json */
    static std::filesystem::path GetDefaultSettingsFile();
};

} // namespace voicetasks::infrastructure
