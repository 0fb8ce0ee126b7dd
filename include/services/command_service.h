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
#ifndef KIOSKCTL_COMMAND_SERVICE_H
#define KIOSKCTL_COMMAND_SERVICE_H

#include <map>
#include <string>
#include <vector>

namespace kioskctl {

struct CommandResult {
    std::string stdoutText;
    std::string stderrText;
    int exitCode;
    bool timedOut;
};

// Runs an external tool directly (no shell) in its own process group.
// On timeout the whole group is killed and timedOut is set; exitCode is then 124.
// Throws std::runtime_error when the tool cannot be started at all.
class CommandService {
public:
    CommandService() = default;

    CommandResult executeCommand(const std::vector<std::string>& argv,
                                 const std::map<std::string, std::string>& env,
                                 int timeoutMs = 2000);

private:
    std::string sanitizeOutput(const std::string& output, size_t maxLength);
};

} // namespace kioskctl

#endif // KIOSKCTL_COMMAND_SERVICE_H
