/**
 * @file VoiceTasksApp.cpp
 * @brief Implementation of the VoiceTasksApp class.
 */
#include "app/VoiceTasksApp.hpp"

#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include "domain/TaskErrors.hpp"
#include "infrastructure/ConsoleFeedback.hpp"
#include "infrastructure/JsonTaskRepository.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ScriptSpeechOutput.hpp"
#include "infrastructure/ScriptSpeechRecognizer.hpp"

namespace voicetasks::app {

namespace {

void PrintUsage(std::ostream& out) {
    out << "Usage:\n"
        << "  voicetasks [options] add <text>\n"
        << "  voicetasks [options] complete <id|text>\n"
        << "  voicetasks [options] delete <id|text>\n"
        << "  voicetasks [options] list\n"
        << "  voicetasks [options]                 (interactive; type 'quit' to leave)\n"
        << "\n"
        << "Options:\n"
        << "  --data <file>     task file (default: " << infrastructure::PathUtils::GetDefaultTasksFile().string() << ")\n"
        << "  --config <file>   settings file (default: " << infrastructure::PathUtils::GetDefaultSettingsFile().string() << ")\n"
        << "  --listen          also take voice commands via 'listen_command' (interactive only)\n"
        << "  --reset-corrupt   move an unreadable task file aside and start empty\n"
        << "  -h, --help        show this help\n";
}

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace

CommandLine CommandLine::Parse(int argc, char** argv) {
    CommandLine cmd;
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--") {
            ++i;
            break;
        }
        if (arg.rfind("-", 0) != 0) {
            break;
        }

        if (arg == "-h" || arg == "--help") {
            cmd.help = true;
        } else if (arg == "--listen") {
            cmd.listen = true;
        } else if (arg == "--reset-corrupt") {
            cmd.resetCorrupt = true;
        } else if (arg == "--data" || arg == "--config") {
            if (i + 1 >= argc) {
                cmd.error = arg + " requires a file argument";
                return cmd;
            }
            (arg == "--data" ? cmd.dataPath : cmd.configPath) = std::string(argv[++i]);
        } else {
            cmd.error = "unknown option " + arg;
            return cmd;
        }
    }

    for (; i < argc; ++i) {
        cmd.words.emplace_back(argv[i]);
    }
    return cmd;
}

int VoiceTasksApp::Run(int argc, char** argv) {
    CommandLine cmd = CommandLine::Parse(argc, argv);
    if (!cmd.error.empty()) {
        std::cerr << "voicetasks: " << cmd.error << "\n\n";
        PrintUsage(std::cerr);
        return 2;
    }
    if (cmd.help) {
        PrintUsage(std::cout);
        return 0;
    }

    // A speech command that exits early must not kill us on the next write.
    std::signal(SIGPIPE, SIG_IGN);

    if (!Init(cmd)) {
        return 1;
    }

    int exitCode = 0;
    if (!cmd.words.empty()) {
        std::ostringstream command;
        for (size_t i = 0; i < cmd.words.size(); ++i) {
            if (i > 0) command << ' ';
            command << cmd.words[i];
        }
        exitCode = RunOnce(command.str());
    } else {
        exitCode = RunInteractive(std::cin, cmd.listen);
    }

    Shutdown();
    return exitCode;
}

bool VoiceTasksApp::Init(const CommandLine& cmd) {
    std::string settingsPath = cmd.configPath.value_or(infrastructure::PathUtils::GetDefaultSettingsFile().string());
    m_config = infrastructure::ConfigLoader::Load(settingsPath);
    if (cmd.dataPath) m_config.tasksFile = *cmd.dataPath;
    if (cmd.resetCorrupt) m_config.resetCorruptStore = true;

    // Dependency Injection / Composition Root
    m_services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
    auto repo = std::make_unique<infrastructure::JsonTaskRepository>(m_config.tasksFile, m_services.persistenceService);
    auto store = std::make_unique<application::TaskStore>(std::move(repo));

    try {
        store->load();
    } catch (const domain::StorageCorruptError& e) {
        std::cerr << "[VoiceTasksApp] Task file is corrupt: " << e.what() << std::endl;
        if (!m_config.resetCorruptStore) {
            std::cerr << "[VoiceTasksApp] Fix the file or rerun with --reset-corrupt to start over." << std::endl;
            return false;
        }
        try {
            std::string moved = m_services.persistenceService->quarantine(m_config.tasksFile);
            std::cerr << "[VoiceTasksApp] Moved corrupt task file to " << moved << "; starting empty." << std::endl;
            store->load();
        } catch (const std::exception& inner) {
            std::cerr << "[VoiceTasksApp] Could not reset task file: " << inner.what() << std::endl;
            return false;
        }
    }

    m_services.coordinator = std::make_unique<application::SessionCoordinator>(std::move(store));

    auto console = std::make_shared<infrastructure::ConsoleFeedback>(std::cout);
    m_services.typedFeedback = console;
    if (m_config.speakCommand) {
        m_services.voiceFeedback = std::make_shared<infrastructure::ScriptSpeechOutput>(*m_config.speakCommand, console);
    } else {
        m_services.voiceFeedback = console;
    }
    return true;
}

int VoiceTasksApp::RunOnce(const std::string& command) {
    try {
        auto result = m_services.coordinator->submit(command);
        m_services.typedFeedback->deliver(result);
        return 0;
    } catch (const domain::PersistFailedError& e) {
        std::cerr << "[VoiceTasksApp] Could not save tasks: " << e.what() << std::endl;
        return 1;
    }
}

int VoiceTasksApp::RunInteractive(std::istream& in, bool listen) {
    if (listen) {
        if (m_config.listenCommand) {
            auto recognizer = std::make_shared<infrastructure::ScriptSpeechRecognizer>(*m_config.listenCommand);
            m_services.listener = std::make_unique<application::VoiceCommandListener>(
                *m_services.coordinator, recognizer, m_services.voiceFeedback);
            m_services.listener->start();
        } else {
            std::cerr << "[VoiceTasksApp] --listen ignored: no 'listen_command' in settings." << std::endl;
        }
    }

    m_services.typedFeedback->notice("Type a command (add, complete, delete, list) or 'quit'.");

    std::string line;
    while (std::getline(in, line)) {
        line = Trim(line);
        if (line.empty()) continue;
        if (line == "quit" || line == "exit") break;

        try {
            m_services.typedFeedback->deliver(m_services.coordinator->submit(line));
        } catch (const domain::PersistFailedError& e) {
            std::cerr << "[VoiceTasksApp] Could not save tasks: " << e.what() << std::endl;
            return 1;
        }
    }
    return 0;
}

void VoiceTasksApp::Shutdown() {
    if (m_services.coordinator) {
        m_services.coordinator->shutdown();
    }
    if (m_services.listener) {
        m_services.listener->stop();
    }
}

} // namespace voicetasks::app
