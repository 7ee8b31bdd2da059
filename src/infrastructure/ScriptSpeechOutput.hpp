#pragma once

#include "domain/FeedbackSink.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace voicetasks::infrastructure {

/**
 * @brief Speaks feedback by piping each message to an external command (e.g. "espeak").
 *
 * Every message is also forwarded to @p echo when one is given, so the
 * user can read what was said.
 */
class ScriptSpeechOutput : public domain::FeedbackSink {
public:
    ScriptSpeechOutput(const std::string& command, std::shared_ptr<domain::FeedbackSink> echo = nullptr);
    ~ScriptSpeechOutput() override = default;

    void deliver(const domain::CommandResult& result) override;
    void notice(const std::string& message) override;

private:
    void speak(const std::string& text);

    std::string m_command;
    std::shared_ptr<domain::FeedbackSink> m_echo;
    std::mutex m_mutex; // one utterance at a time
};

} // namespace voicetasks::infrastructure
