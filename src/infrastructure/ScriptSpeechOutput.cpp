#include "infrastructure/ScriptSpeechOutput.hpp"

#include <cstdio>
#include <iostream>
#include <sys/wait.h>

namespace voicetasks::infrastructure {

ScriptSpeechOutput::ScriptSpeechOutput(const std::string& command, std::shared_ptr<domain::FeedbackSink> echo)
    : m_command(command)
    , m_echo(std::move(echo))
{}

void ScriptSpeechOutput::deliver(const domain::CommandResult& result) {
    if (m_echo) m_echo->deliver(result);
    speak(result.message);
}

void ScriptSpeechOutput::notice(const std::string& message) {
    if (m_echo) m_echo->notice(message);
    speak(message);
}

void ScriptSpeechOutput::speak(const std::string& text) {
    std::lock_guard<std::mutex> lock(m_mutex);

    FILE* pipe = popen(m_command.c_str(), "w");
    if (!pipe) {
        std::cerr << "[ScriptSpeechOutput] Failed to start: " << m_command << std::endl;
        return;
    }
    std::fputs(text.c_str(), pipe);
    std::fputc('\n', pipe);

    int status = pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        std::cerr << "[ScriptSpeechOutput] Speech command failed with status " << status << std::endl;
    }
}

} // namespace voicetasks::infrastructure
