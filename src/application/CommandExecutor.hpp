/**
 * @file CommandExecutor.hpp
 * @brief Applies an Intent to the TaskStore.
 */

#pragma once

#include <functional>
#include <string>
#include "application/TaskStore.hpp"
#include "domain/CommandResult.hpp"
#include "domain/Intent.hpp"

namespace voicetasks::application {

/**
 * @class CommandExecutor
 * @brief Owns the policy for resolving selectors and reporting outcomes.
 *
 * Not-found, ambiguous and invalid commands come back as CommandResult
 * outcomes. Only infrastructure failures (domain::PersistFailedError) are
 * thrown. A description that matches several tasks never mutates anything.
 */
class CommandExecutor {
public:
    domain::CommandResult execute(const domain::Intent& intent, TaskStore& store) const;

    /** @brief Speakable rendering of a task list ("Here are your tasks: ..."). */
    static std::string DescribeTasks(const std::vector<domain::Task>& tasks);

private:
    using Mutation = std::function<domain::Task(TaskStore&, domain::TaskId)>;

    domain::CommandResult addTask(const domain::AddTask& intent, TaskStore& store) const;
    domain::CommandResult listTasks(TaskStore& store) const;

    /**
     * @brief Resolves @p selector and applies @p mutation to the single match.
     * @param pastTense Verb used in the success message ("Completed", "Deleted").
     */
    domain::CommandResult applyToSelected(const domain::TaskSelector& selector, TaskStore& store,
                                          const Mutation& mutation, const std::string& pastTense) const;
};

} // namespace voicetasks::application
