/**
 * @file Task.hpp
 * @brief Domain entity representing a single tracked task.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace voicetasks::domain {

/** @brief Identifier of a task. Positive, assigned once, never reused. */
using TaskId = std::uint64_t;

/**
 * @struct Task
 * @brief A task in the user's list.
 *
 * Only @ref completed changes after creation.
 */
struct Task {
    TaskId id = 0; ///< Unique id within the store.
    std::string description; ///< Non-empty text as given by the user.
    bool completed = false; ///< True once the task has been marked done.
    std::chrono::system_clock::time_point createdAt; ///< Creation time, second precision.

    Task() = default;

    /**
     * @brief Constructor for Task.
     * @param taskId Assigned id.
     * @param desc Task description.
     * @param created Creation timestamp.
     * @param done Initial completed status.
     */
    Task(TaskId taskId, const std::string& desc, std::chrono::system_clock::time_point created, bool done = false)
        : id(taskId), description(desc), completed(done), createdAt(created) {}

    bool operator==(const Task& other) const {
        return id == other.id &&
               description == other.description &&
               completed == other.completed &&
               createdAt == other.createdAt;
    }

    bool operator!=(const Task& other) const { return !(*this == other); }
};

} // namespace voicetasks::domain
