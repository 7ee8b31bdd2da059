/**
 * @file CommandResult.hpp
 * @brief Outcome of executing one command against the task store.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "Task.hpp"

namespace voicetasks::domain {

/**
 * @struct CommandResult
 * @brief What a command did, phrased for a person, plus structured data for a display.
 *
 * Business conditions (not found, ambiguous, invalid) are reported here and
 * never as exceptions.
 */
struct CommandResult {
    /**
     * @enum Outcome
     * @brief Status of the command.
     */
    enum class Outcome {
        Success,      ///< The command was applied.
        NotFound,     ///< No task matched the selector.
        Ambiguous,    ///< Several tasks matched a description; nothing changed.
        Invalid,      ///< The command was understood but its argument was rejected.
        Unrecognized  ///< The text did not form a known command.
    };

    Outcome outcome = Outcome::Success;
    std::string message; ///< Human-readable outcome, suitable for display or speech.

    /** @brief Snapshot of the list, set only for ListTasks. */
    std::optional<std::vector<Task>> tasks;

    /** @brief Task added, completed or deleted by a successful command. */
    std::optional<Task> affected;

    /** @brief All matching tasks when the outcome is Ambiguous. */
    std::vector<Task> candidates;

    bool ok() const { return outcome == Outcome::Success; }
};

/** @brief Stable lowercase name of an outcome ("success", "not-found", ...). */
inline const char* OutcomeToString(CommandResult::Outcome outcome) {
    switch (outcome) {
        case CommandResult::Outcome::Success: return "success";
        case CommandResult::Outcome::NotFound: return "not-found";
        case CommandResult::Outcome::Ambiguous: return "ambiguous";
        case CommandResult::Outcome::Invalid: return "invalid";
        case CommandResult::Outcome::Unrecognized: return "unrecognized";
    }
    return "unknown";
}

} // namespace voicetasks::domain
