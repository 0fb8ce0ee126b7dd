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
#ifndef KIOSKCTL_WINDOW_SERVICE_H
#define KIOSKCTL_WINDOW_SERVICE_H

#include <string>
#include <vector>

namespace kioskctl {

class CommandService;
class ConfigManager;

struct WindowQueryResult {
    bool found;
    bool timedOut;
    std::vector<std::string> windowIds;
    int exitCode;
};

// Window lookup through the window-query tool (xdotool search --class <cls>).
// The configured display is passed in the tool's environment only.
class WindowService {
public:
    WindowService(ConfigManager* configManager, CommandService* commandService);

    WindowQueryResult findWindows(const std::string& windowClass);

    static std::vector<std::string> parseWindowIds(const std::string& output);

private:
    ConfigManager* configManager_;
    CommandService* commandService_;
};

} // namespace kioskctl

#endif // KIOSKCTL_WINDOW_SERVICE_H
