/*
 * Copyright (C) 2026 Codyard
 *
 * This file is part of KioskControl.
 *
 * KioskControl is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * KioskControl is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with KioskControl. If not, see <https://www.gnu.org/licenses/\>.
 */
#include "support/audit_logger.h"
#include "utils/control_log.h"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace kioskctl {

AuditLogger::AuditLogger(const std::string& logPath)
    : logPath_(logPath), currentDate_(currentUtcDate()) {
    ensureLogDirectory();

    std::string logFilePath = getLogFilePath(currentDate_);
    logFile_.open(logFilePath, std::ios::app);

    if (!logFile_.is_open()) {
        AppendControlLogA("Failed to open audit log: " + logFilePath);
    }
}

AuditLogger::~AuditLogger() {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void AuditLogger::logNavigation(const AuditLogEntry& entry) {
    std::lock_guard<std::mutex> lock(logMutex_);

    rotateLogIfNeeded();

    json logJson;
    logJson["time"] = entry.time;
    logJson["action"] = entry.action;
    logJson["url"] = entry.url;
    logJson["result"] = entry.result;
    logJson["duration_ms"] = entry.duration_ms;

    if (!entry.error.empty()) {
        logJson["error"] = entry.error;
    }
    if (!entry.details.empty()) {
        logJson["details"] = entry.details;
    }

    // URL 来自客户端，可能含非法 UTF-8
    writeLogLine(logJson.dump(-1, ' ', false, json::error_handler_t::replace));
}

void AuditLogger::cleanupOldLogs(int retentionDays) {
    std::lock_guard<std::mutex> lock(logMutex_);

    try {
        fs::path logDir = fs::path(logPath_).parent_path();
        if (logDir.empty()) {
            logDir = ".";
        }
        if (!fs::exists(logDir) || !fs::is_directory(logDir)) {
            return;
        }

        std::string prefix = fs::path(logPath_).stem().string() + "-";
        std::string extension = fs::path(logPath_).extension().string();
        auto cutoff = fs::file_time_type::clock::now() - std::chrono::hours(24 * retentionDays);
        std::string activeFile = fs::path(getLogFilePath(currentDate_)).filename().string();

        for (const auto& entry : fs::directory_iterator(logDir)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            std::string filename = entry.path().filename().string();
            if (filename.rfind(prefix, 0) != 0 || entry.path().extension().string() != extension) {
                continue;
            }
            if (filename == activeFile) {
                continue;
            }
            if (fs::last_write_time(entry.path()) < cutoff) {
                std::error_code ec;
                fs::remove(entry.path(), ec);
                if (ec) {
                    AppendControlLogA("Failed to delete audit log " + filename + ": " + ec.message());
                } else {
                    AppendControlLogA("Deleted old audit log: " + filename);
                }
            }
        }
    } catch (const std::exception& e) {
        AppendControlLogA(std::string("Error during audit log cleanup: ") + e.what());
    }
}

std::string AuditLogger::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_utc;
    gmtime_r(&time_t_now, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

void AuditLogger::writeLogLine(const std::string& line) {
    if (logFile_.is_open()) {
        logFile_ << line << std::endl;
    }
}

void AuditLogger::ensureLogDirectory() {
    try {
        fs::path logDir = fs::path(logPath_).parent_path();
        if (!logDir.empty() && !fs::exists(logDir)) {
            fs::create_directories(logDir);
        }
    } catch (const std::exception& e) {
        AppendControlLogA(std::string("Failed to create audit log directory: ") + e.what());
    }
}

void AuditLogger::rotateLogIfNeeded() {
    std::string newDate = currentUtcDate();
    if (newDate == currentDate_) {
        return;
    }

    if (logFile_.is_open()) {
        logFile_.close();
    }
    currentDate_ = newDate;

    std::string logFilePath = getLogFilePath(currentDate_);
    logFile_.open(logFilePath, std::ios::app);
    if (!logFile_.is_open()) {
        AppendControlLogA("Failed to open rotated audit log: " + logFilePath);
    }
}

std::string AuditLogger::getLogFilePath(const std::string& date) {
    fs::path logPath(logPath_);
    std::string filename = logPath.stem().string() + "-" + date + logPath.extension().string();
    return (logPath.parent_path() / filename).string();
}

std::string AuditLogger::currentUtcDate() {
    auto time_t_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_utc;
    gmtime_r(&time_t_now, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%d");
    return oss.str();
}

} // namespace kioskctl
