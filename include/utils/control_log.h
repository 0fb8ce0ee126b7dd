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
#ifndef KIOSKCTL_UTILS_CONTROL_LOG_H
#define KIOSKCTL_UTILS_CONTROL_LOG_H

#include <string>

#define KIOSKCTL_LOG_TAG "[browser-control]"

namespace kioskctl {

// 本地时间 "YYYY-MM-DD HH:MM:SS"
std::string FormatTimestamp();

// 诊断日志：stderr 输出 "[browser-control] <line>"，
// 配置了日志目录时同时追加到 browser-control.log
void AppendControlLogA(const std::string& line);

// 异常日志：追加到 exceptions.log（并同时走 AppendControlLogA）
void AppendExceptionLogA(const std::string& line);

} // namespace kioskctl

#endif // KIOSKCTL_UTILS_CONTROL_LOG_H
