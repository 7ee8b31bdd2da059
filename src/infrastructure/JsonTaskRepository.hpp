/**
 * @file JsonTaskRepository.hpp
 * @brief JSON file implementation of the TaskRepository.
 */

#pragma once
#include "domain/TaskRepository.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <memory>
#include <string>

namespace voicetasks::infrastructure {

/**
 * @class JsonTaskRepository
 * @brief Stores the task list as one JSON document on the local filesystem.
 *
 * Layout: { "nextId": n, "tasks": [ { "id", "description", "completed", "createdAt" } ] }.
 * A bare array of { "id", "description", "completed" } records written by
 * older releases is read as well and rewritten in the current layout on the
 * next save.
 */
class JsonTaskRepository : public domain::TaskRepository {
public:
    /**
     * @brief Constructor for JsonTaskRepository.
     * @param filePath Path of the task file.
     * @param persistence Writer used for atomic saves.
     */
    JsonTaskRepository(const std::string& filePath, std::shared_ptr<PersistenceService> persistence);

    /** @brief Reads and validates the task file. @see domain::TaskRepository::load */
    std::optional<domain::TaskSnapshot> load() override;

    /** @brief Serializes and atomically replaces the task file. @see domain::TaskRepository::save */
    void save(const domain::TaskSnapshot& snapshot) override;

    const std::string& filePath() const { return m_filePath; }

    /** @brief Serializes a snapshot to the on-disk JSON text. */
    static std::string Serialize(const domain::TaskSnapshot& snapshot);

    /**
     * @brief Parses on-disk JSON text into a snapshot.
     * @throws domain::StorageCorruptError on any schema violation.
     */
    static domain::TaskSnapshot Deserialize(const std::string& text);

private:
    std::string m_filePath; ///< Path to the task file.
    std::shared_ptr<PersistenceService> m_persistence; ///< Atomic writer.
};

} // namespace voicetasks::infrastructure
