#include <cassert>
#include <iostream>
#include <limits>
#include <memory>
#include "application/CommandExecutor.hpp"
#include "application/CommandInterpreter.hpp"
#include "domain/TaskErrors.hpp"
#include "test/TestDoubles.hpp"

using namespace voicetasks;
using Outcome = domain::CommandResult::Outcome;

namespace {

struct Fixture {
    std::shared_ptr<test::MemoryBackend> backend = std::make_shared<test::MemoryBackend>();
    application::TaskStore store{std::make_unique<test::MemoryTaskRepository>(backend)};
    application::CommandInterpreter interpreter;
    application::CommandExecutor executor;

    Fixture() { store.load(); }

    domain::CommandResult run(const std::string& text) {
        return executor.execute(interpreter.interpret(text), store);
    }
};

void TestBasicCommandFlow() {
    Fixture f;

    auto added = f.run("add buy groceries");
    assert(added.outcome == Outcome::Success);
    assert(added.message == "Added task 1: buy groceries");
    assert(added.affected && added.affected->id == 1);

    auto completed = f.run("complete 1");
    assert(completed.outcome == Outcome::Success);
    assert(completed.message == "Completed task 1: buy groceries");

    Fixture empty;
    auto missing = empty.run("delete finish report");
    assert(missing.outcome == Outcome::NotFound);
    assert(missing.message == "No task matching 'finish report'");

    f.run("add call mom");
    auto listed = f.run("list tasks");
    assert(listed.outcome == Outcome::Success);
    assert(listed.tasks && listed.tasks->size() == 2);
    assert((*listed.tasks)[0].id == 1 && (*listed.tasks)[1].id == 2);

    auto unknown = f.run("frobnicate");
    assert(unknown.outcome == Outcome::Unrecognized);
    assert(unknown.message.find("frobnicate") != std::string::npos);
    std::cout << "[PASS] Add, complete, delete, list and unknown commands report the expected results." << std::endl;
}

void TestAmbiguityDoesNotMutate() {
    Fixture f;
    f.run("add buy milk");
    f.run("add buy bread");
    int savesBefore = f.backend->saveCount;

    auto result = f.run("complete buy");
    assert(result.outcome == Outcome::Ambiguous);
    assert(result.candidates.size() == 2);
    assert(result.candidates[0].id == 1 && result.candidates[1].id == 2);
    assert(result.message.find("task 1 (buy milk)") != std::string::npos);
    assert(result.message.find("task 2 (buy bread)") != std::string::npos);
    for (const auto& task : f.store.list()) {
        assert(!task.completed);
    }

    auto del = f.run("delete buy");
    assert(del.outcome == Outcome::Ambiguous);
    assert(f.store.list().size() == 2);
    assert(f.backend->saveCount == savesBefore);
    std::cout << "[PASS] Ambiguous descriptions name every match and change nothing." << std::endl;
}

void TestDescriptionResolution() {
    Fixture f;
    f.run("add buy milk");
    f.run("add finish report");

    auto done = f.run("mark done REPORT");
    assert(done.outcome == Outcome::Success);
    assert(done.message == "Completed task 2: finish report");
    assert(f.store.find(2)->completed);

    auto deleted = f.run("remove milk");
    assert(deleted.outcome == Outcome::Success);
    assert(deleted.message == "Deleted task 1: buy milk");
    assert(!f.store.find(1));
    std::cout << "[PASS] A single description match is applied." << std::endl;
}

void TestIdNotFound() {
    Fixture f;
    f.run("add something");

    auto complete = f.run("complete 9");
    assert(complete.outcome == Outcome::NotFound);
    assert(complete.message == "No task with id 9");

    auto del = f.run("delete 0");
    assert(del.outcome == Outcome::NotFound);
    assert(del.message == "No task with id 0");
    assert(f.store.list().size() == 1);
    std::cout << "[PASS] Unknown ids give a not-found result." << std::endl;
}

void TestTaskWordIsDescriptionText() {
    Fixture f;
    f.run("add buy milk");
    f.run("add review task 1 notes");

    auto result = f.run("complete task 1");
    assert(result.outcome == Outcome::Success);
    assert(result.message == "Completed task 2: review task 1 notes");
    assert(!f.store.find(1)->completed);
    assert(f.store.find(2)->completed);

    auto missing = f.run("delete task 7");
    assert(missing.outcome == Outcome::NotFound);
    assert(missing.message == "No task matching 'task 7'");
    assert(f.store.list().size() == 2);
    std::cout << "[PASS] \"task <n>\" is matched as description text, not as an id." << std::endl;
}

void TestCompleteTwiceIsSuccess() {
    Fixture f;
    f.run("add stretch");
    auto first = f.run("complete 1");
    auto second = f.run("complete stretch");
    assert(first.ok() && second.ok());
    assert(f.store.find(1)->completed);
    std::cout << "[PASS] Completing a completed task succeeds." << std::endl;
}

void TestEmptyListIsSuccess() {
    Fixture f;
    auto result = f.run("show tasks");
    assert(result.outcome == Outcome::Success);
    assert(result.tasks && result.tasks->empty());
    assert(result.message == "Your task list is empty.");

    f.run("add a");
    f.run("add b");
    f.run("complete 2");
    assert(f.run("list").message == "Here are your tasks: Task 1, a, pending. Task 2, b, completed.");
    std::cout << "[PASS] Listing an empty store is a successful empty result." << std::endl;
}

void TestInvalidAddDirectIntent() {
    Fixture f;
    auto result = f.executor.execute(domain::AddTask{"   "}, f.store);
    assert(result.outcome == Outcome::Invalid);
    assert(f.store.list().empty());
    assert(result.message == "Please specify a task to add.");

    Fixture exhausted;
    domain::TaskSnapshot full;
    full.nextId = std::numeric_limits<domain::TaskId>::max();
    exhausted.backend->persisted = full;
    exhausted.store.load();
    auto refused = exhausted.run("add one more");
    assert(refused.outcome == Outcome::Invalid);
    assert(refused.message.rfind("Cannot add task:", 0) == 0);
    assert(exhausted.store.list().empty());
    std::cout << "[PASS] Rejected adds are reported as invalid." << std::endl;
}

void TestPersistFailurePropagates() {
    Fixture f;
    f.run("add keep");
    f.backend->failSaves = true;

    bool threw = false;
    try {
        f.run("add lost");
    } catch (const domain::PersistFailedError&) {
        threw = true;
    }
    assert(threw);
    assert(f.store.list().size() == 1);

    // Business outcomes still work without touching storage.
    assert(f.run("complete 42").outcome == Outcome::NotFound);
    assert(f.run("gibberish").outcome == Outcome::Unrecognized);
    std::cout << "[PASS] Storage failures propagate out of execute()." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting CommandExecutor Test..." << std::endl;

    TestBasicCommandFlow();
    TestAmbiguityDoesNotMutate();
    TestDescriptionResolution();
    TestIdNotFound();
    TestTaskWordIsDescriptionText();
    TestCompleteTwiceIsSuccess();
    TestEmptyListIsSuccess();
    TestInvalidAddDirectIntent();
    TestPersistFailurePropagates();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
