#include "infrastructure/ScriptSpeechRecognizer.hpp"

#include <array>
#include <cstdio>
#include <iostream>
#include <sys/wait.h>

namespace voicetasks::infrastructure {

ScriptSpeechRecognizer::ScriptSpeechRecognizer(const std::string& command)
    : m_command(command)
{}

std::optional<std::string> ScriptSpeechRecognizer::listen() {
    FILE* pipe = popen(m_command.c_str(), "r");
    if (!pipe) {
        std::cerr << "[ScriptSpeechRecognizer] Failed to start: " << m_command << std::endl;
        return std::nullopt;
    }

    std::string output;
    std::array<char, 256> buffer;
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        output += buffer.data();
    }

    int status = pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        std::cerr << "[ScriptSpeechRecognizer] Recognition command failed with status " << status << std::endl;
        return std::nullopt;
    }

    // Trim
    const char* ws = " \t\r\n";
    size_t first = output.find_first_not_of(ws);
    if (first == std::string::npos) {
        return std::nullopt;
    }
    size_t last = output.find_last_not_of(ws);
    return output.substr(first, last - first + 1);
}

} // namespace voicetasks::infrastructure
