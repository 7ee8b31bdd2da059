/**
 * @file CommandInterpreter.hpp
 * @brief Turns free-form command text into a typed Intent.
 */

#pragma once

#include <string>
#include "domain/Intent.hpp"

namespace voicetasks::application {

/**
 * @class CommandInterpreter
 * @brief Stateless parser from spoken or typed text to domain::Intent.
 *
 * Recognized verb phrases (matched on whole words, longest first):
 * - "add", "create" followed by a description.
 * - "complete", "mark done" followed by a selector.
 * - "delete", "remove" followed by a selector.
 * - "list tasks", "show tasks", "list", "show" with nothing after them.
 *
 * A selector that is entirely a non-negative integer selects by id; any other text selects by description. Whether a task
 * actually matches is decided when the intent is executed, never here.
 * Text that fits none of the shapes yields Unrecognized carrying the
 * text exactly as received.
 */
class CommandInterpreter {
public:
    /** @brief Parses @p rawText. Never throws on malformed commands. */
    domain::Intent interpret(const std::string& rawText) const;

    /**
     * @brief Trims, lowercases, collapses runs of whitespace and drops
     * trailing sentence punctuation added by speech recognizers.
     */
    static std::string Normalize(const std::string& text);

    /** @brief Reads a selector from an already-normalized, non-empty remainder. */
    static domain::TaskSelector ParseSelector(const std::string& remainder);
};

} // namespace voicetasks::application
