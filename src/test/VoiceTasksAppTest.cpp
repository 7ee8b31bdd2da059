#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "app/VoiceTasksApp.hpp"

using namespace voicetasks;
namespace fs = std::filesystem;

namespace {

const fs::path kTestRoot = "test_project_root_app";

// Redirects a standard stream into a buffer for the lifetime of the object.
class StreamRedirect {
public:
    StreamRedirect(std::ios& stream, std::streambuf* target)
        : m_stream(stream), m_previous(stream.rdbuf(target)) {}
    ~StreamRedirect() { m_stream.rdbuf(m_previous); }

private:
    std::ios& m_stream;
    std::streambuf* m_previous;
};

struct RunOutcome {
    int exitCode = -1;
    std::string out;
};

RunOutcome RunApp(std::vector<std::string> args, const std::string& input = "") {
    args.insert(args.begin(), "voicetasks");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::ostringstream captured;
    std::istringstream typed(input);
    RunOutcome outcome;
    {
        StreamRedirect out(std::cout, captured.rdbuf());
        StreamRedirect in(std::cin, typed.rdbuf());
        app::VoiceTasksApp app;
        outcome.exitCode = app.Run(static_cast<int>(args.size()), argv.data());
    }
    outcome.out = captured.str();
    return outcome;
}

// Common options: an isolated settings file and task file.
std::vector<std::string> WithData(const fs::path& dataFile, std::vector<std::string> rest) {
    std::vector<std::string> args = {"--config", (kTestRoot / "no-settings.json").string(),
                                     "--data", dataFile.string()};
    args.insert(args.end(), rest.begin(), rest.end());
    return args;
}

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::vector<std::string> Argv(std::vector<std::string> args) {
    args.insert(args.begin(), "voicetasks");
    return args;
}

app::CommandLine Parse(std::vector<std::string> args) {
    auto full = Argv(std::move(args));
    std::vector<char*> argv;
    for (auto& arg : full) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return app::CommandLine::Parse(static_cast<int>(full.size()), argv.data());
}

void TestCommandLineParsing() {
    auto plain = Parse({"add", "buy", "milk"});
    assert(plain.error.empty());
    assert((plain.words == std::vector<std::string>{"add", "buy", "milk"}));

    auto separated = Parse({"--data", "tasks.json", "--", "--listen", "now"});
    assert(separated.error.empty());
    assert(separated.dataPath && *separated.dataPath == "tasks.json");
    assert(!separated.listen);
    assert((separated.words == std::vector<std::string>{"--listen", "now"}));

    // Options are only read before the first command word.
    auto late = Parse({"--listen", "add", "--data"});
    assert(late.error.empty());
    assert(late.listen);
    assert(!late.dataPath);
    assert((late.words == std::vector<std::string>{"add", "--data"}));

    assert(!Parse({"--data"}).error.empty());
    assert(!Parse({"--config"}).error.empty());
    assert(!Parse({"--verbose", "list"}).error.empty());
    assert(Parse({"-h"}).help);
    std::cout << "[PASS] CommandLine::Parse handles options, \"--\" and missing values." << std::endl;
}

void TestUsageAndHelp() {
    assert(RunApp({"--bogus"}).exitCode == 2);
    assert(RunApp({"--data"}).exitCode == 2);

    auto help = RunApp({"--help"});
    assert(help.exitCode == 0);
    assert(Contains(help.out, "Usage:"));
    std::cout << "[PASS] Usage errors exit 2; --help exits 0." << std::endl;
}

void TestOneShotCommands() {
    fs::path data = kTestRoot / "oneshot" / "tasks.json";

    auto added = RunApp(WithData(data, {"add", "buy", "milk"}));
    assert(added.exitCode == 0);
    assert(added.out == "Added task 1: buy milk\n");
    assert(RunApp(WithData(data, {"add", "buy bread"})).exitCode == 0);

    auto ambiguous = RunApp(WithData(data, {"complete", "buy"}));
    assert(ambiguous.exitCode == 0);
    assert(Contains(ambiguous.out, "Multiple tasks match 'buy'"));

    auto notFound = RunApp(WithData(data, {"delete", "99"}));
    assert(notFound.exitCode == 0);
    assert(notFound.out == "No task with id 99\n");

    auto unknown = RunApp(WithData(data, {"frobnicate"}));
    assert(unknown.exitCode == 0);
    assert(Contains(unknown.out, "frobnicate"));

    assert(RunApp(WithData(data, {"complete", "2"})).exitCode == 0);
    auto listed = RunApp(WithData(data, {"list"}));
    assert(listed.exitCode == 0);
    assert(listed.out == "Here are your tasks: Task 1, buy milk, pending. Task 2, buy bread, completed.\n");
    std::cout << "[PASS] One-shot commands persist across runs and exit 0 for every outcome." << std::endl;
}

void TestSettingsFileChoosesTaskFile() {
    fs::path data = kTestRoot / "from-settings" / "tasks.json";
    fs::path settings = kTestRoot / "settings.json";
    {
        std::ofstream out(settings);
        out << "{ \"tasks_file\": \"" << data.string() << "\" }";
    }

    auto result = RunApp({"--config", settings.string(), "add", "configured"});
    assert(result.exitCode == 0);
    assert(fs::exists(data));
    std::cout << "[PASS] tasks_file from --config is used when --data is absent." << std::endl;
}

void TestCorruptFile() {
    fs::path dir = kTestRoot / "corrupt";
    fs::path data = dir / "tasks.json";
    fs::create_directories(dir);
    {
        std::ofstream out(data);
        out << "{ this is not json";
    }

    auto refused = RunApp(WithData(data, {"list"}));
    assert(refused.exitCode == 1);
    assert(refused.out.empty());
    assert(fs::exists(data));

    auto reset = RunApp(WithData(data, {"--reset-corrupt", "list"}));
    assert(reset.exitCode == 0);
    assert(reset.out == "Your task list is empty.\n");
    assert(!fs::exists(data));

    bool quarantined = false;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (Contains(entry.path().filename().string(), "tasks.json.corrupt-")) {
            quarantined = true;
        }
    }
    assert(quarantined);

    assert(RunApp(WithData(data, {"add", "fresh start"})).out == "Added task 1: fresh start\n");
    std::cout << "[PASS] A corrupt file exits 1 unless --reset-corrupt moves it aside." << std::endl;
}

void TestPersistFailureExitsOne() {
    // A regular file where the task directory should be makes every save fail.
    fs::path blocker = kTestRoot / "blocker";
    {
        std::ofstream out(blocker);
        out << "occupied";
    }
    fs::path data = blocker / "tasks.json";

    auto oneShot = RunApp(WithData(data, {"add", "unsaved"}));
    assert(oneShot.exitCode == 1);
    assert(!Contains(oneShot.out, "Added task"));

    auto interactive = RunApp(WithData(data, {}), "add unsaved\nlist\n");
    assert(interactive.exitCode == 1);
    assert(!Contains(interactive.out, "Added task"));
    std::cout << "[PASS] Storage failures exit 1." << std::endl;
}

void TestInteractiveSession() {
    fs::path data = kTestRoot / "interactive" / "tasks.json";

    auto session = RunApp(WithData(data, {"--listen"}), "add typed one\n\n   list   \nquit\nadd never\n");
    assert(session.exitCode == 0);
    assert(Contains(session.out, "Added task 1: typed one\n"));
    assert(Contains(session.out, "Here are your tasks: Task 1, typed one, pending."));
    assert(!Contains(session.out, "never"));

    auto reloaded = RunApp(WithData(data, {"list"}));
    assert(reloaded.out == "Here are your tasks: Task 1, typed one, pending.\n");

    auto eof = RunApp(WithData(data, {}), "complete typed one");
    assert(eof.exitCode == 0);
    assert(Contains(eof.out, "Completed task 1: typed one"));
    std::cout << "[PASS] Interactive mode runs typed lines until quit or end of input." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting VoiceTasksApp Test..." << std::endl;
    fs::remove_all(kTestRoot);
    fs::create_directories(kTestRoot);

    TestCommandLineParsing();
    TestUsageAndHelp();
    TestOneShotCommands();
    TestSettingsFileChoosesTaskFile();
    TestCorruptFile();
    TestPersistFailureExitsOne();
    TestInteractiveSession();

    fs::remove_all(kTestRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
