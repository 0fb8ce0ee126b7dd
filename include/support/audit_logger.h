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
#ifndef KIOSKCTL_AUDIT_LOGGER_H
#define KIOSKCTL_AUDIT_LOGGER_H

#include <string>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>

namespace kioskctl {

// Audit log entry structure
struct AuditLogEntry {
    std::string time;           // UTC ISO 8601 timestamp
    std::string action;         // "navigate"
    std::string url;            // Requested URL (may be empty when rejected)
    std::string result;         // "ok", "error", "rejected"
    int duration_ms;            // Request duration in milliseconds
    std::string error;          // Error message (optional, empty if no error)
    nlohmann::json details;     // Optional details, e.g. {"window_id": "..."}

    AuditLogEntry()
        : duration_ms(0), details(nlohmann::json::object()) {}
};

// Thread-safe JSON Lines audit log with daily rotation.
// logPath "logs/audit.log" writes to "logs/audit-YYYY-MM-DD.log".
class AuditLogger {
public:
    explicit AuditLogger(const std::string& logPath);
    ~AuditLogger();

    void logNavigation(const AuditLogEntry& entry);

    // Remove audit-*.log files older than retentionDays
    void cleanupOldLogs(int retentionDays);

    static std::string getCurrentTimestamp();

private:
    void writeLogLine(const std::string& line);
    void ensureLogDirectory();
    void rotateLogIfNeeded();
    std::string getLogFilePath(const std::string& date);
    static std::string currentUtcDate();

    std::string logPath_;
    std::mutex logMutex_;
    std::ofstream logFile_;
    std::string currentDate_;
};

} // namespace kioskctl

#endif // KIOSKCTL_AUDIT_LOGGER_H
