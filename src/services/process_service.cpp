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
#include "services/process_service.h"
#include "services/command_service.h"
#include "support/config_manager.h"

namespace kioskctl {

ProcessService::ProcessService(ConfigManager* configManager, CommandService* commandService)
    : configManager_(configManager), commandService_(commandService) {
}

SignalResult ProcessService::signalByName(const std::string& pattern) {
    std::vector<std::string> argv = {
        configManager_->getProcessSignalTool(),
        "-" + configManager_->getKillSignal(),
        pattern
    };

    CommandResult cmd = commandService_->executeCommand(argv, {}, configManager_->getToolTimeoutMs());

    SignalResult result{};
    result.timedOut = cmd.timedOut;
    result.exitCode = cmd.exitCode;
    return result;
}

} // namespace kioskctl
