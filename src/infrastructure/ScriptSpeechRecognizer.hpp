#pragma once

#include "domain/SpeechRecognizer.hpp"
#include <string>

namespace voicetasks::infrastructure {

/**
 * @brief Obtains one utterance by running an external recognition command.
 *
 * The command records and transcribes a single utterance and prints the
 * text on stdout (e.g. a whisper.cpp or Vosk wrapper script). A non-zero
 * exit status or empty output means nothing was recognized.
 */
class ScriptSpeechRecognizer : public domain::SpeechRecognizer {
public:
    explicit ScriptSpeechRecognizer(const std::string& command);
    ~ScriptSpeechRecognizer() override = default;

    std::optional<std::string> listen() override;

private:
    std::string m_command;
};

} // namespace voicetasks::infrastructure
