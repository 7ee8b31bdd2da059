/**
 * @file FeedbackSink.hpp
 * @brief Interface for the output collaborator (display or speech).
 */

#pragma once

#include <string>
#include "CommandResult.hpp"

namespace voicetasks::domain {

/**
 * @class FeedbackSink
 * @brief Receives command results and short notices and presents them to the user.
 */
class FeedbackSink {
public:
    virtual ~FeedbackSink() = default;

    /** @brief Presents the outcome of a submitted command. */
    virtual void deliver(const CommandResult& result) = 0;

    /** @brief Presents a message that is not tied to a command (e.g. "Listening..."). */
    virtual void notice(const std::string& message) = 0;
};

} // namespace voicetasks::domain
