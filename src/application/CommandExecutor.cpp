/**
 * @file CommandExecutor.cpp
 * @brief Implementation of the CommandExecutor class.
 */
#include "application/CommandExecutor.hpp"
#include "domain/TaskErrors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <type_traits>

namespace voicetasks::application {

using Outcome = domain::CommandResult::Outcome;

namespace {

domain::CommandResult MakeResult(Outcome outcome, const std::string& message) {
    domain::CommandResult result;
    result.outcome = outcome;
    result.message = message;
    return result;
}

bool IsBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string DescribeTask(const std::string& pastTense, const domain::Task& task) {
    return pastTense + " task " + std::to_string(task.id) + ": " + task.description;
}

} // namespace

domain::CommandResult CommandExecutor::execute(const domain::Intent& intent, TaskStore& store) const {
    return std::visit([&](const auto& i) -> domain::CommandResult {
        using T = std::decay_t<decltype(i)>;

        if constexpr (std::is_same_v<T, domain::AddTask>) {
            return addTask(i, store);
        }
        else if constexpr (std::is_same_v<T, domain::ListTasks>) {
            return listTasks(store);
        }
        else if constexpr (std::is_same_v<T, domain::CompleteTask>) {
            return applyToSelected(i.selector, store,
                [](TaskStore& s, domain::TaskId id) { return s.complete(id); }, "Completed");
        }
        else if constexpr (std::is_same_v<T, domain::DeleteTask>) {
            return applyToSelected(i.selector, store,
                [](TaskStore& s, domain::TaskId id) { return s.remove(id); }, "Deleted");
        }
        else {
            static_assert(std::is_same_v<T, domain::Unrecognized>, "unhandled intent");
            return MakeResult(Outcome::Unrecognized, "Command not recognized: " + i.rawText);
        }
    }, intent);
}

domain::CommandResult CommandExecutor::addTask(const domain::AddTask& intent, TaskStore& store) const {
    try {
        domain::Task task = store.add(intent.description);
        auto result = MakeResult(Outcome::Success, DescribeTask("Added", task));
        result.affected = task;
        return result;
    } catch (const domain::InvalidTaskError& e) {
        if (IsBlank(intent.description)) {
            return MakeResult(Outcome::Invalid, "Please specify a task to add.");
        }
        return MakeResult(Outcome::Invalid, std::string("Cannot add task: ") + e.what());
    }
}

domain::CommandResult CommandExecutor::listTasks(TaskStore& store) const {
    auto tasks = store.list();
    auto result = MakeResult(Outcome::Success, DescribeTasks(tasks));
    result.tasks = std::move(tasks);
    return result;
}

domain::CommandResult CommandExecutor::applyToSelected(const domain::TaskSelector& selector, TaskStore& store,
                                                       const Mutation& mutation, const std::string& pastTense) const {
    domain::TaskId target = 0;

    if (const auto* byId = std::get_if<domain::ById>(&selector)) {
        target = byId->id;
    } else {
        const auto& text = std::get<domain::ByDescription>(selector).text;
        auto matches = store.findByDescription(text);

        if (matches.empty()) {
            return MakeResult(Outcome::NotFound, "No task matching '" + text + "'");
        }
        if (matches.size() > 1) {
            std::ostringstream msg;
            msg << "Multiple tasks match '" << text << "': ";
            for (size_t i = 0; i < matches.size(); ++i) {
                if (i > 0) msg << ", ";
                msg << "task " << matches[i].id << " (" << matches[i].description << ")";
            }
            msg << ". Please be more specific.";

            auto result = MakeResult(Outcome::Ambiguous, msg.str());
            result.candidates = std::move(matches);
            return result;
        }
        target = matches.front().id;
    }

    try {
        domain::Task task = mutation(store, target);
        auto result = MakeResult(Outcome::Success, DescribeTask(pastTense, task));
        result.affected = task;
        return result;
    } catch (const domain::TaskNotFoundError&) {
        return MakeResult(Outcome::NotFound, "No task with id " + std::to_string(target));
    }
}

std::string CommandExecutor::DescribeTasks(const std::vector<domain::Task>& tasks) {
    if (tasks.empty()) {
        return "Your task list is empty.";
    }

    std::ostringstream out;
    out << "Here are your tasks:";
    for (const auto& task : tasks) {
        out << " Task " << task.id << ", " << task.description << ", "
            << (task.completed ? "completed" : "pending") << ".";
    }
    return out.str();
}

} // namespace voicetasks::application
