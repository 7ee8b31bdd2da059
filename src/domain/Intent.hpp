/**
 * @file Intent.hpp
 * @brief Typed representation of a parsed user command.
 */

#pragma once

#include <string>
#include <type_traits>
#include <variant>
#include "Task.hpp"

namespace voicetasks::domain {

// Selectors

struct ById {
    TaskId id = 0;
};

struct ByDescription {
    std::string text; ///< Search text, matched case-insensitively at execution time.
};

using TaskSelector = std::variant<ById, ByDescription>;

// Intents

struct AddTask {
    static constexpr const char* Type = "AddTask";
    std::string description;
};

struct CompleteTask {
    static constexpr const char* Type = "CompleteTask";
    TaskSelector selector;
};

struct DeleteTask {
    static constexpr const char* Type = "DeleteTask";
    TaskSelector selector;
};

struct ListTasks {
    static constexpr const char* Type = "ListTasks";
};

struct Unrecognized {
    static constexpr const char* Type = "Unrecognized";
    std::string rawText; ///< The text exactly as it was received.
};

// variant for generic handling
using Intent = std::variant<
    AddTask,
    CompleteTask,
    DeleteTask,
    ListTasks,
    Unrecognized
>;

/** @brief Returns the Type tag of the alternative held by @p intent. */
inline const char* IntentTypeName(const Intent& intent) {
    return std::visit([](const auto& i) -> const char* {
        return std::decay_t<decltype(i)>::Type;
    }, intent);
}

} // namespace voicetasks::domain
