#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace voicetasks::infrastructure {

namespace fs = std::filesystem;

namespace {

const char* kAppDirName = "VoiceTasks";

// $<envVar> if set and non-empty, else $HOME/<homeRelative>, else the working directory.
fs::path ResolveXdgDir(const char* envVar, const fs::path& homeRelative) {
    if (const char* value = std::getenv(envVar); value && *value) {
        return fs::path(value);
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path();
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return ResolveXdgDir("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    return ResolveXdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetDefaultTasksFile() {
    // The directory is created by PersistenceService on first save.
    return GetDataHome() / kAppDirName / "tasks.json";
}

fs::path PathUtils::GetDefaultSettingsFile() {
    return GetConfigHome() / kAppDirName / "settings.json";
}

} // namespace voicetasks::infrastructure
