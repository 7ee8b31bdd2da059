/**
 * @file TaskRepository.hpp
 * @brief Interface for durable storage of the task list.
 */

#pragma once
#include <optional>
#include <vector>
#include "Task.hpp"

namespace voicetasks::domain {

/**
 * @struct TaskSnapshot
 * @brief Complete persisted state: the ordered tasks and the next id to assign.
 */
struct TaskSnapshot {
    TaskId nextId = 1;
    std::vector<Task> tasks; ///< Store order.
};

/**
 * @class TaskRepository
 * @brief Abstract interface for persistent storage of a TaskSnapshot.
 */
class TaskRepository {
public:
    virtual ~TaskRepository() = default;

    /**
     * @brief Reads the persisted state.
     * @return The snapshot, or std::nullopt if nothing has been persisted yet.
     * @throws StorageCorruptError if persisted data exists but cannot be parsed.
     */
    virtual std::optional<TaskSnapshot> load() = 0;

    /**
     * @brief Replaces the persisted state with @p snapshot.
     * @throws PersistFailedError if the write did not reach durable storage.
     */
    virtual void save(const TaskSnapshot& snapshot) = 0;
};

} // namespace voicetasks::domain
