/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include "domain/TaskErrors.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace voicetasks::infrastructure {

namespace fs = std::filesystem;

namespace {

void RemoveQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Could not remove temp file " << path << ": " << ec.message() << std::endl;
    }
}

} // namespace

void PersistenceService::saveText(const std::string& filename, const std::string& content) {
    std::lock_guard<std::mutex> lock(m_mutex);

    fs::path finalPath = filename;

    // Unique temp path: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    if (finalPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            throw domain::PersistFailedError("cannot create directory " + finalPath.parent_path().string() + ": " + ec.message());
        }
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::out | std::ios::trunc);
        if (!ofs.is_open()) {
            throw domain::PersistFailedError("cannot open temp file " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            RemoveQuietly(tempPath);
            throw domain::PersistFailedError("write failed for " + tempPath.string());
        }
    }

    // 3. Atomic Rename
    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        RemoveQuietly(tempPath);
        throw domain::PersistFailedError("cannot replace " + finalPath.string() + ": " + ec.message());
    }
}

std::string PersistenceService::quarantine(const std::string& filename) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = {};
    localtime_r(&tt, &tm);
    char dateBuf[32];
    std::strftime(dateBuf, sizeof(dateBuf), "%Y%m%d_%H%M%S", &tm);

    fs::path target = filename + ".corrupt-" + dateBuf;
    std::error_code ec;
    fs::rename(filename, target, ec);
    if (ec) {
        throw domain::PersistFailedError("cannot move " + filename + " aside: " + ec.message());
    }
    return target.string();
}

} // namespace voicetasks::infrastructure
