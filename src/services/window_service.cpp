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
#include "services/window_service.h"
#include "services/command_service.h"
#include "support/config_manager.h"
#include <sstream>

namespace kioskctl {

namespace {

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return std::string();
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace

WindowService::WindowService(ConfigManager* configManager, CommandService* commandService)
    : configManager_(configManager), commandService_(commandService) {
}

WindowQueryResult WindowService::findWindows(const std::string& windowClass) {
    std::vector<std::string> argv = {
        configManager_->getWindowQueryTool(), "search", "--class", windowClass
    };
    std::map<std::string, std::string> env = {
        {"DISPLAY", configManager_->getDisplay()}
    };

    CommandResult cmd = commandService_->executeCommand(argv, env, configManager_->getToolTimeoutMs());

    WindowQueryResult result{};
    result.timedOut = cmd.timedOut;
    result.exitCode = cmd.exitCode;
    if (cmd.timedOut || cmd.exitCode != 0) {
        result.found = false;
        return result;
    }
    result.windowIds = parseWindowIds(cmd.stdoutText);
    result.found = !result.windowIds.empty();
    return result;
}

// First id is the first line of the trimmed output; blank lines in between are dropped.
std::vector<std::string> WindowService::parseWindowIds(const std::string& output) {
    std::vector<std::string> ids;
    std::istringstream in(Trim(output));
    std::string line;
    while (std::getline(in, line)) {
        std::string id = Trim(line);
        if (!id.empty()) {
            ids.push_back(id);
        }
    }
    return ids;
}

} // namespace kioskctl
