/**
 * @file JsonTaskRepository.cpp
 * @brief Implementation of the JsonTaskRepository class.
 */
#include "infrastructure/JsonTaskRepository.hpp"
#include "domain/TaskErrors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <set>
#include <sstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace voicetasks::infrastructure {

using json = nlohmann::json;

namespace {

constexpr domain::TaskId kMaxTaskId = std::numeric_limits<domain::TaskId>::max();

std::string FormatIso8601(std::chrono::system_clock::time_point tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    gmtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

// Accepts "YYYY-MM-DDTHH:MM:SS" followed by optional fractional seconds and
// an optional "Z" or "+HH:MM" / "-HH:MM" offset.
std::optional<std::chrono::system_clock::time_point> ParseIso8601(const std::string& text) {
    std::tm tm = {};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }

    std::string rest;
    std::getline(in, rest);
    size_t pos = 0;
    if (pos < rest.size() && rest[pos] == '.') {
        ++pos;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) ++pos;
    }

    long offsetSeconds = 0;
    if (pos < rest.size()) {
        if (rest[pos] == 'Z' && pos + 1 == rest.size()) {
            pos = rest.size();
        } else if ((rest[pos] == '+' || rest[pos] == '-') && rest.size() - pos == 6 && rest[pos + 3] == ':') {
            int sign = rest[pos] == '-' ? -1 : 1;
            std::string hh = rest.substr(pos + 1, 2);
            std::string mm = rest.substr(pos + 4, 2);
            auto isDigit = [](unsigned char c) { return std::isdigit(c) != 0; };
            if (!std::all_of(hh.begin(), hh.end(), isDigit) || !std::all_of(mm.begin(), mm.end(), isDigit)) {
                return std::nullopt;
            }
            offsetSeconds = sign * (std::stol(hh) * 3600 + std::stol(mm) * 60);
            pos = rest.size();
        } else {
            return std::nullopt;
        }
    }

    // timegm() normalizes out-of-range fields (Feb 30 becomes Mar 1); reject those.
    std::tm parsed = tm;
    std::time_t utc = timegm(&tm);
    if (utc == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    if (tm.tm_year != parsed.tm_year || tm.tm_mon != parsed.tm_mon || tm.tm_mday != parsed.tm_mday ||
        tm.tm_hour != parsed.tm_hour || tm.tm_min != parsed.tm_min || tm.tm_sec != parsed.tm_sec) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(utc - offsetSeconds);
}

bool IsBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

domain::TaskId ReadId(const json& record, size_t index) {
    if (!record.contains("id") || !record["id"].is_number_unsigned()) {
        throw domain::StorageCorruptError("task #" + std::to_string(index) + ": 'id' must be a positive integer");
    }
    auto id = record["id"].get<domain::TaskId>();
    if (id == 0) {
        throw domain::StorageCorruptError("task #" + std::to_string(index) + ": 'id' must be a positive integer");
    }
    return id;
}

std::string ReadDescription(const json& record, size_t index) {
    if (!record.contains("description") || !record["description"].is_string()) {
        throw domain::StorageCorruptError("task #" + std::to_string(index) + ": 'description' must be a string");
    }
    auto description = record["description"].get<std::string>();
    if (IsBlank(description)) {
        throw domain::StorageCorruptError("task #" + std::to_string(index) + ": 'description' is empty");
    }
    return description;
}

bool ReadCompleted(const json& record, size_t index) {
    if (!record.contains("completed") || !record["completed"].is_boolean()) {
        throw domain::StorageCorruptError("task #" + std::to_string(index) + ": 'completed' must be a boolean");
    }
    return record["completed"].get<bool>();
}

// Pre-"nextId" files: a bare array without timestamps.
domain::TaskSnapshot ReadLegacy(const json& root) {
    domain::TaskSnapshot snapshot;
    auto loadedAt = std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
    domain::TaskId maxId = 0;
    std::set<domain::TaskId> seen;
    size_t index = 0;
    for (const auto& record : root) {
        if (!record.is_object()) {
            throw domain::StorageCorruptError("task #" + std::to_string(index) + " is not an object");
        }
        domain::Task task(ReadId(record, index), ReadDescription(record, index), loadedAt, ReadCompleted(record, index));
        if (!seen.insert(task.id).second) {
            throw domain::StorageCorruptError("duplicate task id " + std::to_string(task.id));
        }
        if (task.id == kMaxTaskId) {
            throw domain::StorageCorruptError("task id " + std::to_string(task.id) + " leaves no id to assign");
        }
        maxId = std::max(maxId, task.id);
        snapshot.tasks.push_back(std::move(task));
        ++index;
    }
    snapshot.nextId = maxId + 1;
    std::cerr << "[JsonTaskRepository] Migrated legacy task list with " << snapshot.tasks.size() << " tasks." << std::endl;
    return snapshot;
}

} // namespace

JsonTaskRepository::JsonTaskRepository(const std::string& filePath, std::shared_ptr<PersistenceService> persistence)
    : m_filePath(filePath), m_persistence(std::move(persistence)) {}

std::string JsonTaskRepository::Serialize(const domain::TaskSnapshot& snapshot) {
    json tasks = json::array();
    for (const auto& task : snapshot.tasks) {
        tasks.push_back({
            {"id", task.id},
            {"description", task.description},
            {"completed", task.completed},
            {"createdAt", FormatIso8601(task.createdAt)}
        });
    }

    json root = {
        {"nextId", snapshot.nextId},
        {"tasks", tasks}
    };
    return root.dump(2) + "\n";
}

domain::TaskSnapshot JsonTaskRepository::Deserialize(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw domain::StorageCorruptError(std::string("not valid JSON: ") + e.what());
    }

    if (root.is_array()) {
        return ReadLegacy(root);
    }
    if (!root.is_object()) {
        throw domain::StorageCorruptError("top level must be an object");
    }
    if (!root.contains("nextId") || !root["nextId"].is_number_unsigned()) {
        throw domain::StorageCorruptError("'nextId' must be an integer >= 1");
    }
    if (!root.contains("tasks") || !root["tasks"].is_array()) {
        throw domain::StorageCorruptError("'tasks' must be an array");
    }

    domain::TaskSnapshot snapshot;
    snapshot.nextId = root["nextId"].get<domain::TaskId>();
    if (snapshot.nextId < 1) {
        throw domain::StorageCorruptError("'nextId' must be an integer >= 1");
    }
    if (snapshot.nextId == kMaxTaskId) {
        throw domain::StorageCorruptError("'nextId' leaves no id to assign");
    }

    std::set<domain::TaskId> seen;
    size_t index = 0;
    for (const auto& record : root["tasks"]) {
        if (!record.is_object()) {
            throw domain::StorageCorruptError("task #" + std::to_string(index) + " is not an object");
        }

        domain::TaskId id = ReadId(record, index);
        if (!seen.insert(id).second) {
            throw domain::StorageCorruptError("duplicate task id " + std::to_string(id));
        }
        if (id >= snapshot.nextId) {
            throw domain::StorageCorruptError("task id " + std::to_string(id) + " is not below 'nextId'");
        }

        if (!record.contains("createdAt") || !record["createdAt"].is_string()) {
            throw domain::StorageCorruptError("task #" + std::to_string(index) + ": 'createdAt' must be a string");
        }
        auto createdAt = ParseIso8601(record["createdAt"].get<std::string>());
        if (!createdAt) {
            throw domain::StorageCorruptError("task #" + std::to_string(index) + ": 'createdAt' is not an ISO-8601 timestamp");
        }

        snapshot.tasks.emplace_back(id, ReadDescription(record, index), *createdAt, ReadCompleted(record, index));
        ++index;
    }
    return snapshot;
}

std::optional<domain::TaskSnapshot> JsonTaskRepository::load() {
    std::error_code ec;
    if (!fs::exists(m_filePath, ec)) {
        if (ec) {
            throw domain::StorageCorruptError("cannot stat " + m_filePath + ": " + ec.message());
        }
        return std::nullopt;
    }

    std::ifstream file(m_filePath);
    if (!file.is_open()) {
        throw domain::StorageCorruptError("cannot open " + m_filePath);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return Deserialize(buffer.str());
    } catch (const domain::StorageCorruptError& e) {
        throw domain::StorageCorruptError(m_filePath + ": " + e.what());
    }
}

void JsonTaskRepository::save(const domain::TaskSnapshot& snapshot) {
    m_persistence->saveText(m_filePath, Serialize(snapshot));
}

} // namespace voicetasks::infrastructure
