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
#include "test_support.h"
#include <iostream>
#include <cassert>
#include <thread>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

using namespace kioskctl;
using namespace testsupport;
using json = nlohmann::json;

// Test helper: read all lines from a file
std::vector<std::string> readAllLines(const std::string& filepath) {
    std::vector<std::string> lines;
    std::ifstream file(filepath);
    std::string line;

    while (std::getline(file, line)) {
        lines.push_back(line);
    }

    return lines;
}

std::string todayLogFile(const std::string& dir) {
    auto time_t_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_utc;
    gmtime_r(&time_t_now, &tm_utc);

    std::ostringstream oss;
    oss << dir << "/audit-" << std::put_time(&tm_utc, "%Y-%m-%d") << ".log";
    return oss.str();
}

// Test 1: Basic logging functionality
void testBasicLogging() {
    std::cout << "Test 1: Basic logging functionality..." << std::endl;

    std::string dir = MakeTempDir("audit-basic");
    {
        AuditLogger logger(dir + "/audit.log");

        AuditLogEntry entry;
        entry.time = "2026-02-03T12:03:01.234Z";
        entry.action = "navigate";
        entry.url = "https://example.com";
        entry.result = "ok";
        entry.duration_ms = 37;
        entry.details["window_id"] = "12345";
        logger.logNavigation(entry);
    }

    std::string logFile = todayLogFile(dir);
    assert(fs::exists(logFile));

    auto lines = readAllLines(logFile);
    assert(lines.size() == 1);

    json logged = json::parse(lines[0]);
    assert(logged["time"] == "2026-02-03T12:03:01.234Z");
    assert(logged["action"] == "navigate");
    assert(logged["url"] == "https://example.com");
    assert(logged["result"] == "ok");
    assert(logged["duration_ms"] == 37);
    assert(logged["details"]["window_id"] == "12345");
    assert(!logged.contains("error"));

    fs::remove_all(dir);
    std::cout << "  PASSED" << std::endl;
}

// Test 2: Error field and empty details
void testErrorEntry() {
    std::cout << "Test 2: Error entry..." << std::endl;

    std::string dir = MakeTempDir("audit-error");
    {
        AuditLogger logger(dir + "/audit.log");

        AuditLogEntry entry;
        entry.time = AuditLogger::getCurrentTimestamp();
        entry.action = "navigate";
        entry.url = "https://example.com";
        entry.result = "error";
        entry.error = "Chrome window not found";
        logger.logNavigation(entry);

        AuditLogEntry rejected;
        rejected.time = AuditLogger::getCurrentTimestamp();
        rejected.action = "navigate";
        rejected.result = "rejected";
        rejected.error = "URL is required";
        logger.logNavigation(rejected);
    }

    auto lines = readAllLines(todayLogFile(dir));
    assert(lines.size() == 2);

    json first = json::parse(lines[0]);
    assert(first["error"] == "Chrome window not found");
    assert(!first.contains("details"));

    json second = json::parse(lines[1]);
    assert(second["result"] == "rejected");
    assert(second["url"] == "");

    fs::remove_all(dir);
    std::cout << "  PASSED" << std::endl;
}

// Test 3: Timestamp format
void testTimestampFormat() {
    std::cout << "Test 3: Timestamp format..." << std::endl;

    std::string ts = AuditLogger::getCurrentTimestamp();
    // 2026-02-03T12:03:01.234Z
    assert(ts.size() == 24);
    assert(ts[4] == '-' && ts[7] == '-');
    assert(ts[10] == 'T');
    assert(ts[19] == '.');
    assert(ts.back() == 'Z');

    std::cout << "  PASSED" << std::endl;
}

// Test 4: Thread safety
void testThreadSafety() {
    std::cout << "Test 4: Thread safety..." << std::endl;

    std::string dir = MakeTempDir("audit-threads");
    const int numThreads = 10;
    const int entriesPerThread = 10;
    {
        AuditLogger logger(dir + "/audit.log");

        std::vector<std::thread> threads;
        for (int t = 0; t < numThreads; ++t) {
            threads.emplace_back([&logger, t]() {
                for (int i = 0; i < entriesPerThread; ++i) {
                    AuditLogEntry entry;
                    entry.time = AuditLogger::getCurrentTimestamp();
                    entry.action = "navigate";
                    entry.url = "https://example.com/" + std::to_string(t) + "/" + std::to_string(i);
                    entry.result = "ok";
                    entry.duration_ms = i;
                    logger.logNavigation(entry);
                }
            });
        }
        for (auto& th : threads) {
            th.join();
        }
    }

    auto lines = readAllLines(todayLogFile(dir));
    assert(lines.size() == numThreads * entriesPerThread);
    for (const auto& line : lines) {
        json logged = json::parse(line);
        assert(logged["action"] == "navigate");
    }

    fs::remove_all(dir);
    std::cout << "  PASSED" << std::endl;
}

// Test 5: Invalid UTF-8 in URL
void testInvalidUtf8() {
    std::cout << "Test 5: Invalid UTF-8 in URL..." << std::endl;

    std::string dir = MakeTempDir("audit-utf8");
    {
        AuditLogger logger(dir + "/audit.log");

        AuditLogEntry entry;
        entry.time = AuditLogger::getCurrentTimestamp();
        entry.action = "navigate";
        entry.url = std::string("https://example.com/\xff\xfe");
        entry.result = "ok";
        logger.logNavigation(entry);
    }

    auto lines = readAllLines(todayLogFile(dir));
    assert(lines.size() == 1);
    json logged = json::parse(lines[0]);
    assert(logged["url"].get<std::string>().rfind("https://example.com/", 0) == 0);

    fs::remove_all(dir);
    std::cout << "  PASSED" << std::endl;
}

// Test 6: Retention cleanup
void testCleanupOldLogs() {
    std::cout << "Test 6: Retention cleanup..." << std::endl;

    std::string dir = MakeTempDir("audit-cleanup");
    std::string oldFile = dir + "/audit-2020-01-01.log";
    std::string unrelated = dir + "/browser-control.log";
    WriteFile(oldFile, "{}\n");
    WriteFile(unrelated, "line\n");
    auto old = fs::file_time_type::clock::now() - std::chrono::hours(24 * 30);
    fs::last_write_time(oldFile, old);
    fs::last_write_time(unrelated, old);

    {
        AuditLogger logger(dir + "/audit.log");

        AuditLogEntry entry;
        entry.time = AuditLogger::getCurrentTimestamp();
        entry.action = "navigate";
        entry.url = "https://example.com";
        entry.result = "ok";
        logger.logNavigation(entry);

        logger.cleanupOldLogs(7);
    }

    assert(!fs::exists(oldFile));
    assert(fs::exists(unrelated));
    assert(fs::exists(todayLogFile(dir)));

    fs::remove_all(dir);
    std::cout << "  PASSED" << std::endl;
}

int main() {
    std::cout << "Running AuditLogger tests..." << std::endl;
    std::cout << "=============================" << std::endl;

    try {
        testBasicLogging();
        testErrorEntry();
        testTimestampFormat();
        testThreadSafety();
        testInvalidUtf8();
        testCleanupOldLogs();

        std::cout << "=============================" << std::endl;
        std::cout << "All tests PASSED!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test FAILED with exception: " << e.what() << std::endl;
        return 1;
    }
}
