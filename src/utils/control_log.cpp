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
#include "utils/control_log.h"
#include "utils/log_path.h"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace kioskctl {

namespace {
std::mutex g_logMutex;

void AppendLineToFile(const char* filename, const std::string& line) {
    if (!EnsureLogDir()) {
        return;
    }
    std::ofstream out(GetLogFilePathA(filename), std::ios::app);
    if (!out.is_open()) {
        return;
    }
    out << "[" << FormatTimestamp() << "] " << line << "\n";
}
}

std::string FormatTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

void AppendControlLogA(const std::string& line) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    std::cerr << KIOSKCTL_LOG_TAG << " " << line << std::endl;
    AppendLineToFile("browser-control.log", line);
}

void AppendExceptionLogA(const std::string& line) {
    AppendControlLogA(line);
    std::lock_guard<std::mutex> lock(g_logMutex);
    AppendLineToFile("exceptions.log", line);
}

} // namespace kioskctl
