/**
 * @file SessionCoordinator.hpp
 * @brief Serializes command submissions from every input path into the executor.
 */

#pragma once
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>
#include "application/CommandExecutor.hpp"
#include "application/CommandInterpreter.hpp"
#include "application/TaskStore.hpp"
#include "domain/CommandResult.hpp"

namespace voicetasks::application {

/**
 * @class SessionCoordinator
 * @brief Owns the TaskStore and runs one command at a time, in arrival order.
 *
 * Submissions go into a FIFO queue drained by a single worker thread, so the
 * store is never touched by two commands at once regardless of how many
 * threads (listening path, typed path) submit concurrently.
 *
 * On shutdown the command being executed finishes normally; submissions
 * still waiting in the queue fail with domain::SubmissionCancelledError.
 */
class SessionCoordinator {
public:
    enum class State {
        Idle, ///< No command is executing.
        Busy  ///< A command is executing against the store.
    };

    explicit SessionCoordinator(std::unique_ptr<TaskStore> store);
    ~SessionCoordinator();

    SessionCoordinator(const SessionCoordinator&) = delete;
    SessionCoordinator& operator=(const SessionCoordinator&) = delete;

    /**
     * @brief Interprets and executes @p rawText, blocking until its turn has run.
     * @throws domain::PersistFailedError if the command's save failed.
     * @throws domain::SubmissionCancelledError if the session shut down before the command started.
     */
    domain::CommandResult submit(const std::string& rawText);

    /**
     * @brief Queues @p rawText and returns immediately.
     *
     * For callers that must not block (e.g. a UI event thread). The future
     * carries the same result or exception submit() would.
     */
    std::future<domain::CommandResult> submitAsync(const std::string& rawText);

    /** @brief Cancels queued submissions and waits for the in-flight one. Idempotent. */
    void shutdown();

    State state() const;

    /** @brief Submissions waiting behind the one in flight. */
    size_t pendingCount() const;

    /** @brief Copy of the current task list, for display refreshes. */
    std::vector<domain::Task> snapshot() const;

private:
    struct Submission {
        std::string rawText;
        std::promise<domain::CommandResult> promise;
    };

    void workerLoop();

    std::unique_ptr<TaskStore> m_store;
    CommandInterpreter m_interpreter;
    CommandExecutor m_executor;

    // Thread Safety
    std::queue<Submission> m_queue;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    State m_state = State::Idle;

    // Worker Control
    std::thread m_worker;
    std::mutex m_joinMutex;
    bool m_running = true;
};

} // namespace voicetasks::application
