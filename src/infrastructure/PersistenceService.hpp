/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized, atomic file I/O operations.
 */

#pragma once
#include <mutex>
#include <string>

namespace voicetasks::infrastructure {

/**
 * @class PersistenceService
 * @brief Performs atomic file writes (temp file, then rename) one at a time.
 *
 * All writes pass through a single mutex, so two writers never interleave
 * on the same target. A reader of the target sees either the old content or
 * the new content, never a partial file.
 */
class PersistenceService {
public:
    PersistenceService() = default;

    /**
     * @brief Writes @p content to @p filename and returns once it is in place.
     * @param filename Path of the target file. Missing parent directories are created.
     * @param content The string content to write.
     * @throws domain::PersistFailedError if any step fails; the target is left untouched.
     */
    void saveText(const std::string& filename, const std::string& content);

    /**
     * @brief Moves @p filename aside to "<filename>.corrupt-<timestamp>".
     * @return The path it was moved to.
     * @throws domain::PersistFailedError if the rename fails.
     */
    std::string quarantine(const std::string& filename);

private:
    std::mutex m_mutex;
};

} // namespace voicetasks::infrastructure
