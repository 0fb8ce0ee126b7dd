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
#include "services/browser_service.h"
#include "services/handoff_channel.h"
#include "services/process_service.h"
#include "services/window_service.h"
#include "support/config_manager.h"
#include "utils/control_log.h"

namespace kioskctl {

namespace {
const char* kWindowNotFound = "Chrome window not found";
const char* kTimedOut = "Navigation timed out";
}

BrowserService::BrowserService(ConfigManager* configManager,
                               WindowService* windowService,
                               ProcessService* processService,
                               HandoffChannel* handoff)
    : configManager_(configManager),
      windowService_(windowService),
      processService_(processService),
      handoff_(handoff) {
}

NavigateResult BrowserService::navigate(const std::string& url) {
    NavigateResult result;
    result.url = url;

    AppendControlLogA("Navigating to: " + url);

    WindowQueryResult windows = windowService_->findWindows(configManager_->getWindowClass());
    if (windows.timedOut) {
        AppendControlLogA("Window query timed out");
        result.status = NavigateStatus::TimedOut;
        result.error = kTimedOut;
        return result;
    }
    if (!windows.found) {
        AppendControlLogA(kWindowNotFound);
        result.status = NavigateStatus::WindowNotFound;
        result.error = kWindowNotFound;
        return result;
    }

    // 只用于日志；后面的 kill 按进程名广播，不针对这个窗口
    result.windowId = windows.windowIds.front();
    AppendControlLogA("Found Chrome window: " + result.windowId);

    handoff_->publish(url);

    AppendControlLogA("Killing Chrome to navigate to: " + url);
    SignalResult signal = processService_->signalByName(configManager_->getProcessPattern());
    if (signal.timedOut) {
        AppendControlLogA("Process signal timed out");
        result.status = NavigateStatus::TimedOut;
        result.error = kTimedOut;
        return result;
    }

    AppendControlLogA("Chrome restart initiated for: " + url);
    result.status = NavigateStatus::Ok;
    return result;
}

} // namespace kioskctl
