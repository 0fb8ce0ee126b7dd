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
#include "support/config_manager.h"
#include "utils/control_log.h"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace kioskctl {

namespace {

json ToJson(const ControlConfig& config) {
    json j;
    j["server"] = {
        {"port", config.server_port},
        {"listen_address", config.listen_address}
    };
    j["display"] = config.display;
    j["browser"] = {
        {"window_class", config.window_class},
        {"process_pattern", config.process_pattern},
        {"kill_signal", config.kill_signal}
    };
    j["tools"] = {
        {"window_query", config.window_query_tool},
        {"process_signal", config.process_signal_tool},
        {"timeout_ms", config.tool_timeout_ms}
    };
    j["handoff_path"] = config.handoff_path;
    j["log_dir"] = config.log_dir;
    j["log_retention_days"] = config.log_retention_days;
    return j;
}

} // namespace

// ===== 构造函数 =====

ConfigManager::ConfigManager(const std::string& configPath)
    : config_(defaultConfig()), configPath_(configPath) {
}

// ===== 公共方法 =====

void ConfigManager::load() {
    std::lock_guard<std::mutex> lock(configMutex_);

    if (configPath_.empty()) {
        config_ = defaultConfig();
        return;
    }

    std::ifstream file(configPath_);

    if (!file.is_open()) {
        AppendControlLogA("Config file not found, writing defaults: " + configPath_);
        config_ = defaultConfig();
        writeFile(config_);
        return;
    }

    ControlConfig loaded = defaultConfig();
    try {
        json j;
        file >> j;
        file.close();

        if (!j.is_object()) {
            throw std::runtime_error("Config root must be a JSON object: " + configPath_);
        }

        if (j.contains("server") && j["server"].is_object()) {
            const auto& server = j["server"];
            loaded.server_port = server.value("port", loaded.server_port);
            loaded.listen_address = server.value("listen_address", loaded.listen_address);
        }

        loaded.display = j.value("display", loaded.display);

        if (j.contains("browser") && j["browser"].is_object()) {
            const auto& browser = j["browser"];
            loaded.window_class = browser.value("window_class", loaded.window_class);
            loaded.process_pattern = browser.value("process_pattern", loaded.process_pattern);
            loaded.kill_signal = browser.value("kill_signal", loaded.kill_signal);
        }

        if (j.contains("tools") && j["tools"].is_object()) {
            const auto& tools = j["tools"];
            loaded.window_query_tool = tools.value("window_query", loaded.window_query_tool);
            loaded.process_signal_tool = tools.value("process_signal", loaded.process_signal_tool);
            loaded.tool_timeout_ms = tools.value("timeout_ms", loaded.tool_timeout_ms);
        }

        loaded.handoff_path = j.value("handoff_path", loaded.handoff_path);
        loaded.log_dir = j.value("log_dir", loaded.log_dir);
        loaded.log_retention_days = j.value("log_retention_days", loaded.log_retention_days);
    } catch (const json::exception& e) {
        throw std::runtime_error("Malformed config file " + configPath_ + ": " + e.what());
    }

    std::string reason;
    if (!validateConfig(loaded, &reason)) {
        throw std::runtime_error("Invalid config " + configPath_ + ": " + reason);
    }

    config_ = loaded;
    AppendControlLogA("Config loaded: " + configPath_);
}

void ConfigManager::save() {
    std::lock_guard<std::mutex> lock(configMutex_);

    if (configPath_.empty()) {
        throw std::runtime_error("No config path to save to");
    }

    std::string reason;
    if (!validateConfig(config_, &reason)) {
        throw std::runtime_error("Invalid config: " + reason);
    }

    writeFile(config_);
}

ControlConfig ConfigManager::snapshot() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

// ===== 配置项访问器 =====

int ConfigManager::getServerPort() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.server_port;
}

std::string ConfigManager::getListenAddress() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.listen_address;
}

std::string ConfigManager::getDisplay() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.display;
}

std::string ConfigManager::getWindowClass() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.window_class;
}

std::string ConfigManager::getProcessPattern() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.process_pattern;
}

std::string ConfigManager::getKillSignal() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.kill_signal;
}

std::string ConfigManager::getWindowQueryTool() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.window_query_tool;
}

std::string ConfigManager::getProcessSignalTool() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.process_signal_tool;
}

int ConfigManager::getToolTimeoutMs() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.tool_timeout_ms;
}

std::string ConfigManager::getHandoffPath() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.handoff_path;
}

std::string ConfigManager::getLogDir() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.log_dir;
}

int ConfigManager::getLogRetentionDays() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.log_retention_days;
}

// ===== 配置项修改器 =====

void ConfigManager::setServerPort(int port) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.server_port = port;
}

void ConfigManager::setListenAddress(const std::string& address) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.listen_address = address;
}

void ConfigManager::setDisplay(const std::string& display) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.display = display;
}

void ConfigManager::setHandoffPath(const std::string& path) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.handoff_path = path;
}

void ConfigManager::setWindowQueryTool(const std::string& tool) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.window_query_tool = tool;
}

void ConfigManager::setProcessSignalTool(const std::string& tool) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.process_signal_tool = tool;
}

void ConfigManager::setToolTimeoutMs(int timeoutMs) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.tool_timeout_ms = timeoutMs;
}

void ConfigManager::setLogDir(const std::string& dir) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.log_dir = dir;
}

// ===== 私有方法 =====

ControlConfig ConfigManager::defaultConfig() {
    ControlConfig config;
    config.server_port = 6090;
    config.listen_address = "0.0.0.0";
    config.display = ":99";
    config.window_class = "chromium";
    config.process_pattern = "chrome";
    config.kill_signal = "9";
    config.window_query_tool = "xdotool";
    config.process_signal_tool = "pkill";
    config.tool_timeout_ms = 2000;
    config.handoff_path = "/tmp/chrome-url.txt";
    config.log_dir = "";
    config.log_retention_days = 7;
    return config;
}

void ConfigManager::writeFile(const ControlConfig& config) const {
    std::string tempPath = configPath_ + ".tmp";
    std::ofstream file(tempPath, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file for writing: " + tempPath);
    }
    file << ToJson(config).dump(4) << std::endl;
    file.close();

    if (std::rename(tempPath.c_str(), configPath_.c_str()) != 0) {
        std::remove(tempPath.c_str());
        throw std::runtime_error("Cannot replace config file: " + configPath_);
    }

    AppendControlLogA("Config saved: " + configPath_);
}

bool ConfigManager::validateConfig(const ControlConfig& config, std::string* reason) const {
    if (config.server_port < 0 || config.server_port > 65535) {
        *reason = "server.port out of range (0-65535)";
        return false;
    }
    if (config.tool_timeout_ms <= 0) {
        *reason = "tools.timeout_ms must be positive";
        return false;
    }
    if (config.window_query_tool.empty() || config.process_signal_tool.empty()) {
        *reason = "tool paths must not be empty";
        return false;
    }
    if (config.window_class.empty() || config.process_pattern.empty()) {
        *reason = "browser.window_class and browser.process_pattern must not be empty";
        return false;
    }
    if (config.handoff_path.empty()) {
        *reason = "handoff_path must not be empty";
        return false;
    }
    if (config.log_retention_days <= 0) {
        *reason = "log_retention_days must be positive";
        return false;
    }
    return true;
}

} // namespace kioskctl
