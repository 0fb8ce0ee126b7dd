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
#ifndef KIOSKCTL_UTILS_LOG_PATH_H
#define KIOSKCTL_UTILS_LOG_PATH_H

#include <string>

namespace kioskctl {

// 设置日志目录（来自配置 log_dir）。空字符串表示只输出到 stderr
void SetLogDir(const std::string& dir);

// 当前日志目录，未配置时为空
std::string GetLogDir();

// 递归创建日志目录，失败时静默返回 false
bool EnsureLogDir();

// 获取指定日志文件的完整路径
// 例如 GetLogFilePathA("exceptions.log") → "<log_dir>/exceptions.log"
// 未配置日志目录时返回空字符串
std::string GetLogFilePathA(const char* filename);

} // namespace kioskctl

#endif // KIOSKCTL_UTILS_LOG_PATH_H
