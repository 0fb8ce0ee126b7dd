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
#ifndef KIOSKCTL_PROCESS_SERVICE_H
#define KIOSKCTL_PROCESS_SERVICE_H

#include <string>

namespace kioskctl {

class CommandService;
class ConfigManager;

/**
 * SignalResult - 信号发送结果
 *
 * - timedOut: 信号工具在超时内未返回
 * - exitCode: 信号工具的退出码（仅供日志，调用方不据此判断成败）
 */
struct SignalResult {
    bool timedOut;
    int exitCode;
};

/**
 * ProcessService - 进程信号服务
 *
 * 通过进程信号工具（pkill -<signal> <pattern>）向所有名称匹配的进程发送信号。
 * 按名称广播，不针对具体窗口所属的进程；不等待进程退出。
 */
class ProcessService {
public:
    ProcessService(ConfigManager* configManager, CommandService* commandService);

    /**
     * 向匹配 pattern 的全部进程发送配置的强制终止信号
     * @param pattern 进程名匹配模式
     * @return SignalResult
     */
    SignalResult signalByName(const std::string& pattern);

private:
    ConfigManager* configManager_;
    CommandService* commandService_;
};

} // namespace kioskctl

#endif // KIOSKCTL_PROCESS_SERVICE_H
