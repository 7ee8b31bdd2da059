/**
 * @file TaskErrors.hpp
 * @brief Error types raised by the task engine.
 *
 * TaskNotFoundError and InvalidTaskError are business conditions; the
 * command executor turns them into CommandResult outcomes. The remaining
 * types are infrastructure failures and reach the caller of a submission.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace voicetasks::domain {

class TaskNotFoundError : public std::runtime_error {
public:
    explicit TaskNotFoundError(const std::string& msg) : std::runtime_error(msg) {}
};

class InvalidTaskError : public std::invalid_argument {
public:
    explicit InvalidTaskError(const std::string& msg) : std::invalid_argument(msg) {}
};

/** @brief Persisted state exists but does not match the task file schema. */
class StorageCorruptError : public std::runtime_error {
public:
    explicit StorageCorruptError(const std::string& msg) : std::runtime_error(msg) {}
};

/** @brief Durable storage rejected a write. The store has been rolled back. */
class PersistFailedError : public std::runtime_error {
public:
    explicit PersistFailedError(const std::string& msg) : std::runtime_error(msg) {}
};

/** @brief A queued submission was discarded because the session shut down. */
class SubmissionCancelledError : public std::runtime_error {
public:
    explicit SubmissionCancelledError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace voicetasks::domain
