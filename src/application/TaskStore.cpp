/**
 * @file TaskStore.cpp
 * @brief Implementation of the TaskStore class.
 */
#include "application/TaskStore.hpp"
#include "domain/TaskErrors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <limits>

namespace voicetasks::application {

namespace {

std::string ToLower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

bool IsBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

TaskStore::TaskStore(std::unique_ptr<domain::TaskRepository> repository)
    : m_repository(std::move(repository)) {}

void TaskStore::load() {
    auto loaded = m_repository->load();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (loaded) {
        m_state = std::move(*loaded);
    } else {
        m_state = domain::TaskSnapshot{};
    }
}

domain::Task TaskStore::add(const std::string& description) {
    if (IsBlank(description)) {
        throw domain::InvalidTaskError("task description must not be empty");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state.nextId == std::numeric_limits<domain::TaskId>::max()) {
        throw domain::InvalidTaskError("no task ids left to assign");
    }
    domain::TaskSnapshot previous = m_state;

    auto now = std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
    domain::Task task(m_state.nextId, description, now);
    m_state.tasks.push_back(task);
    ++m_state.nextId;

    persistOrRollback(std::move(previous));
    return task;
}

domain::Task TaskStore::complete(domain::TaskId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = findLocked(id);
    if (it == m_state.tasks.end()) {
        throw domain::TaskNotFoundError("no task with id " + std::to_string(id));
    }

    domain::TaskSnapshot previous = m_state;
    it->completed = true;
    domain::Task task = *it;

    persistOrRollback(std::move(previous));
    return task;
}

domain::Task TaskStore::remove(domain::TaskId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = findLocked(id);
    if (it == m_state.tasks.end()) {
        throw domain::TaskNotFoundError("no task with id " + std::to_string(id));
    }

    domain::TaskSnapshot previous = m_state;
    domain::Task task = *it;
    m_state.tasks.erase(it);

    persistOrRollback(std::move(previous));
    return task;
}

std::vector<domain::Task> TaskStore::findByDescription(const std::string& text) const {
    std::string needle = ToLower(text);
    std::vector<domain::Task> matches;

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& task : m_state.tasks) {
        if (ToLower(task.description).find(needle) != std::string::npos) {
            matches.push_back(task);
        }
    }
    return matches;
}

std::vector<domain::Task> TaskStore::list() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.tasks;
}

std::optional<domain::Task> TaskStore::find(domain::TaskId id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& task : m_state.tasks) {
        if (task.id == id) {
            return task;
        }
    }
    return std::nullopt;
}

domain::TaskId TaskStore::nextId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.nextId;
}

void TaskStore::persistOrRollback(domain::TaskSnapshot previous) {
    try {
        m_repository->save(m_state);
    } catch (const domain::PersistFailedError& e) {
        m_state = std::move(previous);
        std::cerr << "[TaskStore] Persist failed, rolled back: " << e.what() << std::endl;
        throw;
    } catch (const std::exception& e) {
        m_state = std::move(previous);
        std::cerr << "[TaskStore] Persist failed, rolled back: " << e.what() << std::endl;
        throw domain::PersistFailedError(e.what());
    }
}

std::vector<domain::Task>::iterator TaskStore::findLocked(domain::TaskId id) {
    return std::find_if(m_state.tasks.begin(), m_state.tasks.end(),
        [id](const domain::Task& t) { return t.id == id; });
}

} // namespace voicetasks::application
