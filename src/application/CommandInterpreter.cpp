/**
 * @file CommandInterpreter.cpp
 * @brief Implementation of the CommandInterpreter class.
 */
#include "application/CommandInterpreter.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <vector>

namespace voicetasks::application {

namespace {

enum class VerbKind {
    Add,
    Complete,
    Delete,
    List
};

struct VerbPhrase {
    const char* phrase;
    VerbKind kind;
};

const std::vector<VerbPhrase>& VerbTable() {
    static const std::vector<VerbPhrase> verbs = {
        {"add", VerbKind::Add},
        {"create", VerbKind::Add},
        {"complete", VerbKind::Complete},
        {"mark done", VerbKind::Complete},
        {"delete", VerbKind::Delete},
        {"remove", VerbKind::Delete},
        {"list tasks", VerbKind::List},
        {"show tasks", VerbKind::List},
        {"list", VerbKind::List},
        {"show", VerbKind::List},
    };
    return verbs;
}

bool IsAllDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

// True when @p text is @p phrase or starts with @p phrase followed by a space.
bool StartsWithWords(const std::string& text, const std::string& phrase) {
    if (text.compare(0, phrase.size(), phrase) != 0) {
        return false;
    }
    return text.size() == phrase.size() || text[phrase.size()] == ' ';
}

} // namespace

std::string CommandInterpreter::Normalize(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }

    while (!out.empty() && (out.back() == '.' || out.back() == '!' || out.back() == '?' || out.back() == ' ')) {
        out.pop_back();
    }
    return out;
}

domain::TaskSelector CommandInterpreter::ParseSelector(const std::string& remainder) {
    if (IsAllDigits(remainder)) {
        domain::TaskId id = 0;
        const char* end = remainder.data() + remainder.size();
        auto [ptr, ec] = std::from_chars(remainder.data(), end, id);
        if (ec == std::errc() && ptr == end) {
            return domain::ById{id};
        }
    }
    // Anything else, including "task 3", is matched against descriptions.
    return domain::ByDescription{remainder};
}

domain::Intent CommandInterpreter::interpret(const std::string& rawText) const {
    std::string normalized = Normalize(rawText);
    if (normalized.empty()) {
        return domain::Unrecognized{rawText};
    }

    const VerbPhrase* best = nullptr;
    size_t bestLength = 0;
    for (const auto& verb : VerbTable()) {
        std::string phrase = verb.phrase;
        if (phrase.size() > bestLength && StartsWithWords(normalized, phrase)) {
            best = &verb;
            bestLength = phrase.size();
        }
    }
    if (!best) {
        return domain::Unrecognized{rawText};
    }

    std::string remainder = normalized.size() > bestLength ? normalized.substr(bestLength + 1) : std::string();

    switch (best->kind) {
        case VerbKind::Add:
            if (remainder.empty()) break;
            return domain::AddTask{remainder};
        case VerbKind::Complete:
            if (remainder.empty()) break;
            return domain::CompleteTask{ParseSelector(remainder)};
        case VerbKind::Delete:
            if (remainder.empty()) break;
            return domain::DeleteTask{ParseSelector(remainder)};
        case VerbKind::List:
            if (!remainder.empty()) break;
            return domain::ListTasks{};
    }
    return domain::Unrecognized{rawText};
}

} // namespace voicetasks::application
