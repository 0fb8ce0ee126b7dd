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
#include "utils/log_path.h"
#include <filesystem>
#include <mutex>
#include <system_error>

namespace fs = std::filesystem;

namespace kioskctl {

namespace {
std::mutex g_logDirMutex;
std::string g_logDir;
}

void SetLogDir(const std::string& dir) {
    std::lock_guard<std::mutex> lock(g_logDirMutex);
    g_logDir = dir;
    while (g_logDir.size() > 1 && g_logDir.back() == '/') {
        g_logDir.pop_back();
    }
}

std::string GetLogDir() {
    std::lock_guard<std::mutex> lock(g_logDirMutex);
    return g_logDir;
}

bool EnsureLogDir() {
    std::string dir = GetLogDir();
    if (dir.empty()) return false;
    std::error_code ec;
    fs::create_directories(dir, ec);
    return !ec && fs::is_directory(dir, ec);
}

std::string GetLogFilePathA(const char* filename) {
    std::string dir = GetLogDir();
    if (dir.empty()) return std::string();
    return dir + "/" + filename;
}

} // namespace kioskctl
