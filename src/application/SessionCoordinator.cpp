/**
 * @file SessionCoordinator.cpp
 * @brief Implementation of SessionCoordinator.
 */

#include "application/SessionCoordinator.hpp"
#include "domain/TaskErrors.hpp"
#include <exception>
#include <iostream>

namespace voicetasks::application {

SessionCoordinator::SessionCoordinator(std::unique_ptr<TaskStore> store)
    : m_store(std::move(store)) {
    m_worker = std::thread(&SessionCoordinator::workerLoop, this);
}

SessionCoordinator::~SessionCoordinator() {
    shutdown();
}

domain::CommandResult SessionCoordinator::submit(const std::string& rawText) {
    return submitAsync(rawText).get();
}

std::future<domain::CommandResult> SessionCoordinator::submitAsync(const std::string& rawText) {
    Submission submission;
    submission.rawText = rawText;
    auto future = submission.promise.get_future();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running) {
            m_queue.push(std::move(submission));
            m_cv.notify_one();
            return future;
        }
    }

    submission.promise.set_exception(std::make_exception_ptr(
        domain::SubmissionCancelledError("session is shut down")));
    return future;
}

void SessionCoordinator::shutdown() {
    std::queue<Submission> cancelled;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running = false;
        std::swap(cancelled, m_queue);
    }
    m_cv.notify_all();

    if (!cancelled.empty()) {
        std::cerr << "[SessionCoordinator] Discarding " << cancelled.size() << " queued submission(s)." << std::endl;
    }
    while (!cancelled.empty()) {
        cancelled.front().promise.set_exception(std::make_exception_ptr(
            domain::SubmissionCancelledError("cancelled by shutdown: " + cancelled.front().rawText)));
        cancelled.pop();
    }

    std::lock_guard<std::mutex> joinLock(m_joinMutex);
    if (m_worker.joinable() && m_worker.get_id() != std::this_thread::get_id()) {
        m_worker.join();
    }
}

SessionCoordinator::State SessionCoordinator::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

size_t SessionCoordinator::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

std::vector<domain::Task> SessionCoordinator::snapshot() const {
    return m_store->list();
}

void SessionCoordinator::workerLoop() {
    while (true) {
        Submission submission;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running) {
                return; // Queue was handed to shutdown()
            }

            submission = std::move(m_queue.front());
            m_queue.pop();
            m_state = State::Busy;
        }

        // Execute outside the queue lock so new submissions can arrive
        try {
            domain::Intent intent = m_interpreter.interpret(submission.rawText);
            submission.promise.set_value(m_executor.execute(intent, *m_store));
        } catch (const std::exception& e) {
            std::cerr << "[SessionCoordinator] Command failed: " << e.what() << std::endl;
            submission.promise.set_exception(std::current_exception());
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_state = State::Idle;
        }
    }
}

} // namespace voicetasks::application
