/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Provides a unified way to access configuration like the task file location
 * or the speech commands without scattering JSON parsing logic throughout
 * the codebase.
 */

#pragma once

#include <optional>
#include <string>

namespace voicetasks::infrastructure {

/**
 * @struct AppConfig
 * @brief Effective settings. Every field has a usable default.
 */
struct AppConfig {
    std::string tasksFile; ///< Task file path.
    std::optional<std::string> listenCommand; ///< Prints one recognized utterance per run.
    std::optional<std::string> speakCommand; ///< Speaks the text it reads on stdin.
    bool resetCorruptStore = false; ///< Move a corrupt task file aside instead of aborting.
};

class ConfigLoader {
public:
    /** @brief Settings used when no settings.json exists. */
    static AppConfig Defaults();

    /**
     * @brief Reads settings from @p settingsPath on top of Defaults().
     *
     * A missing file yields the defaults. An unreadable file, malformed JSON
     * or a key of the wrong type is reported on stderr and the affected
     * values keep their defaults.
     */
    static AppConfig Load(const std::string& settingsPath);
};

} // namespace voicetasks::infrastructure
