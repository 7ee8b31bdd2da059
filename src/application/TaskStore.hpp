/**
 * @file TaskStore.hpp
 * @brief Owner of the authoritative task list.
 */

#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "domain/Task.hpp"
#include "domain/TaskRepository.hpp"

namespace voicetasks::application {

/**
 * @class TaskStore
 * @brief In-memory task list kept in step with a TaskRepository.
 *
 * Every mutation follows validate, mutate, persist, return. When the persist
 * step throws, the in-memory state is restored before the error leaves the
 * call, so a reported success always matches durable storage.
 */
class TaskStore {
public:
    explicit TaskStore(std::unique_ptr<domain::TaskRepository> repository);

    /**
     * @brief Replaces the in-memory state with the persisted one.
     *
     * Starts empty with nextId 1 when nothing has been persisted.
     * @throws domain::StorageCorruptError if persisted data cannot be parsed.
     */
    void load();

    /**
     * @brief Appends a new task.
     * @throws domain::InvalidTaskError if @p description is empty or whitespace only,
     *         or if every id has been used.
     * @throws domain::PersistFailedError if the save failed (state rolled back).
     */
    domain::Task add(const std::string& description);

    /**
     * @brief Marks a task completed. Completing a completed task is a no-op success.
     * @throws domain::TaskNotFoundError if no task has @p id.
     * @throws domain::PersistFailedError if the save failed (state rolled back).
     */
    domain::Task complete(domain::TaskId id);

    /**
     * @brief Removes a task. Its id is never handed out again.
     * @return The removed task.
     * @throws domain::TaskNotFoundError if no task has @p id.
     * @throws domain::PersistFailedError if the save failed (state rolled back).
     */
    domain::Task remove(domain::TaskId id);

    /** @brief Case-insensitive substring search over descriptions, in store order. */
    std::vector<domain::Task> findByDescription(const std::string& text) const;

    /** @brief Snapshot copy of all tasks in store order. */
    std::vector<domain::Task> list() const;

    std::optional<domain::Task> find(domain::TaskId id) const;

    domain::TaskId nextId() const;

private:
    /** @brief Saves the current state; restores @p previous and rethrows on failure. Caller holds m_mutex. */
    void persistOrRollback(domain::TaskSnapshot previous);

    std::vector<domain::Task>::iterator findLocked(domain::TaskId id);

    std::unique_ptr<domain::TaskRepository> m_repository;
    domain::TaskSnapshot m_state;
    mutable std::mutex m_mutex;
};

} // namespace voicetasks::application
