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
#ifndef KIOSKCTL_BROWSER_SERVICE_H
#define KIOSKCTL_BROWSER_SERVICE_H

#include <string>

namespace kioskctl {

class ConfigManager;
class WindowService;
class ProcessService;
class HandoffChannel;

enum class NavigateStatus {
    Ok,
    WindowNotFound,
    TimedOut
};

struct NavigateResult {
    NavigateStatus status = NavigateStatus::Ok;
    std::string url;
    std::string windowId;
    std::string error;

    bool success() const { return status == NavigateStatus::Ok; }
};

// Restarts the kiosk browser on a new URL: find the browser window, publish the
// URL to the restart loop, then kill the browser by name and return without
// waiting for it to exit or come back.
class BrowserService {
public:
    BrowserService(ConfigManager* configManager,
                   WindowService* windowService,
                   ProcessService* processService,
                   HandoffChannel* handoff);

    // Expected failures come back in the result; I/O and tool launch errors throw.
    NavigateResult navigate(const std::string& url);

private:
    ConfigManager* configManager_;
    WindowService* windowService_;
    ProcessService* processService_;
    HandoffChannel* handoff_;
};

} // namespace kioskctl

#endif // KIOSKCTL_BROWSER_SERVICE_H
