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
/**
 * 测试辅助：临时目录与假的外部工具脚本（代替 xdotool / pkill）
 */
#ifndef KIOSKCTL_TEST_SUPPORT_H
#define KIOSKCTL_TEST_SUPPORT_H

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace testsupport {

namespace fs = std::filesystem;

inline std::string MakeTempDir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() /
                   ("kioskctl-" + name + "-" + std::to_string(::getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir.string();
}

// 写一个 /bin/sh 脚本并设为可执行
inline std::string WriteScript(const std::string& dir, const std::string& name, const std::string& body) {
    std::string path = dir + "/" + name;
    {
        std::ofstream out(path, std::ios::trunc);
        out << "#!/bin/sh\n" << body << "\n";
    }
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
    return path;
}

inline std::string ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline void WriteFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

} // namespace testsupport

#endif // KIOSKCTL_TEST_SUPPORT_H
