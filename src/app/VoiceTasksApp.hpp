/**
 * @file VoiceTasksApp.hpp
 * @brief Main application class for VoiceTasks.
 */

#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace voicetasks::app {

/**
 * @struct CommandLine
 * @brief Parsed process arguments.
 */
struct CommandLine {
    std::optional<std::string> configPath; ///< --config <file>
    std::optional<std::string> dataPath;   ///< --data <file>
    bool listen = false;                   ///< --listen
    bool resetCorrupt = false;             ///< --reset-corrupt
    bool help = false;                     ///< --help / -h
    std::vector<std::string> words;        ///< Command words, e.g. {"add", "buy", "milk"}.
    std::string error;                     ///< Set when the arguments could not be parsed.

    /** @brief Options first; the first non-option word (or "--") starts the command. */
    static CommandLine Parse(int argc, char** argv);
};

/**
 * @class VoiceTasksApp
 * @brief Orchestrates the application lifecycle: initialization, command handling and shutdown.
 *
 * With command words the app runs that one command and exits (status 0 for
 * every command outcome, 1 for storage failures). Without them it reads
 * typed commands from stdin while the optional listening path runs on its
 * own thread.
 */
class VoiceTasksApp {
public:
    /**
     * @brief Runs the application.
     * @return Process exit code.
     */
    int Run(int argc, char** argv);

private:
    /**
     * @brief Loads configuration and the task store and wires the services.
     * @return False if the task store could not be opened.
     */
    bool Init(const CommandLine& cmd);

    int RunOnce(const std::string& command);
    int RunInteractive(std::istream& in, bool listen);

    /** @brief Stops the listener and the coordinator. */
    void Shutdown();

    infrastructure::AppConfig m_config;
    application::AppServices m_services;
};

} // namespace voicetasks::app
