/**
 * @file SpeechRecognizer.hpp
 * @brief Interface for the voice input collaborator.
 */

#pragma once

#include <optional>
#include <string>

namespace voicetasks::domain {

/**
 * @class SpeechRecognizer
 * @brief Produces one recognized utterance per call as plain text.
 *
 * Implementations own everything audio related. The task engine only sees
 * the resulting text.
 */
class SpeechRecognizer {
public:
    virtual ~SpeechRecognizer() = default;

    /**
     * @brief Blocks until one utterance has been captured and recognized.
     * @return The recognized text, or std::nullopt when nothing usable was heard.
     */
    virtual std::optional<std::string> listen() = 0;
};

} // namespace voicetasks::domain
