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
#ifndef KIOSKCTL_CONFIG_MANAGER_H
#define KIOSKCTL_CONFIG_MANAGER_H

#include <string>
#include <mutex>

namespace kioskctl {

/**
 * ControlConfig - 控制服务配置结构
 *
 * - server_port / listen_address: HTTP 监听端口与地址（默认 6090 / 0.0.0.0）
 * - display: 窗口查询工具使用的 X display（默认 ":99"）
 * - window_class: xdotool search --class 使用的窗口类名
 * - process_pattern / kill_signal: pkill 的进程名匹配与信号
 * - window_query_tool / process_signal_tool: 外部工具可执行文件
 * - tool_timeout_ms: 每次外部工具调用的超时
 * - handoff_path: 交给外部重启循环的 URL 文件
 * - log_dir / log_retention_days: 日志目录（空表示只输出 stderr）与审计日志保留天数
 */
struct ControlConfig {
    int server_port;
    std::string listen_address;
    std::string display;
    std::string window_class;
    std::string process_pattern;
    std::string kill_signal;
    std::string window_query_tool;
    std::string process_signal_tool;
    int tool_timeout_ms;
    std::string handoff_path;
    std::string log_dir;
    int log_retention_days;
};

/**
 * ConfigManager - 配置管理器
 *
 * 负责配置文件的加载、保存和访问。
 *
 * - 路径为空：只使用默认配置，不读写文件
 * - 文件不存在：生成默认配置并保存
 * - 文件格式错误或配置无效：抛出 std::runtime_error
 * - 线程安全的配置访问
 */
class ConfigManager {
public:
    explicit ConfigManager(const std::string& configPath = "");

    void load();

    /**
     * 保存配置到文件（先写 .tmp 再 rename）
     */
    void save();

    /**
     * 当前配置的副本
     */
    ControlConfig snapshot() const;

    int getServerPort() const;
    std::string getListenAddress() const;
    std::string getDisplay() const;
    std::string getWindowClass() const;
    std::string getProcessPattern() const;
    std::string getKillSignal() const;
    std::string getWindowQueryTool() const;
    std::string getProcessSignalTool() const;
    int getToolTimeoutMs() const;
    std::string getHandoffPath() const;
    std::string getLogDir() const;
    int getLogRetentionDays() const;
    const std::string& getConfigPath() const { return configPath_; }

    // 命令行覆盖
    void setServerPort(int port);
    void setListenAddress(const std::string& address);
    void setDisplay(const std::string& display);
    void setHandoffPath(const std::string& path);
    void setWindowQueryTool(const std::string& tool);
    void setProcessSignalTool(const std::string& tool);
    void setToolTimeoutMs(int timeoutMs);
    void setLogDir(const std::string& dir);

    static ControlConfig defaultConfig();

private:
    void writeFile(const ControlConfig& config) const;
    bool validateConfig(const ControlConfig& config, std::string* reason) const;

    ControlConfig config_;
    std::string configPath_;
    mutable std::mutex configMutex_;
};

} // namespace kioskctl

#endif // KIOSKCTL_CONFIG_MANAGER_H
