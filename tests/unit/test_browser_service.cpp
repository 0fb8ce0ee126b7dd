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
/**
 * BrowserService 单元测试
 *
 * xdotool / pkill 由临时目录中的 shell 脚本代替
 */
#include "services/browser_service.h"
#include "services/command_service.h"
#include "services/handoff_channel.h"
#include "services/process_service.h"
#include "services/window_service.h"
#include "support/config_manager.h"
#include "test_support.h"
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace kioskctl;
using namespace testsupport;

// 记录 publish 调用，可配置为失败
class RecordingHandoff : public HandoffChannel {
public:
    void publish(const std::string& url) override {
        if (fail) {
            throw std::runtime_error("Cannot open handoff file test: Permission denied");
        }
        published.push_back(url);
    }
    std::string describe() const override { return "recording"; }

    std::vector<std::string> published;
    bool fail = false;
};

struct Fixture {
    explicit Fixture(const std::string& dir)
        : dir(dir),
          handoffPath(dir + "/chrome-url.txt"),
          pkillMarker(dir + "/pkill-called.txt"),
          windows(&config, &commands),
          processes(&config, &commands),
          handoff(handoffPath),
          browser(&config, &windows, &processes, &handoff) {
        config.load();
        config.setToolTimeoutMs(300);
        config.setHandoffPath(handoffPath);
        setWindows("printf '4194305\\n'");
        setPkill("exit 0");
    }

    void setWindows(const std::string& body) {
        config.setWindowQueryTool(WriteScript(dir, "xdotool", body));
    }

    void setPkill(const std::string& body) {
        config.setProcessSignalTool(WriteScript(dir, "pkill",
            "echo \"$*\" >> '" + pkillMarker + "'\n" + body));
    }

    std::string dir;
    std::string handoffPath;
    std::string pkillMarker;
    ConfigManager config;
    CommandService commands;
    WindowService windows;
    ProcessService processes;
    FileHandoffChannel handoff;
    BrowserService browser;
};

void test_navigate_success() {
    std::cout << "\n[测试 1] 导航成功..." << std::endl;
    std::string dir = MakeTempDir("browser-ok");
    Fixture f(dir);

    NavigateResult result = f.browser.navigate("https://example.com");
    assert(result.success());
    assert(result.status == NavigateStatus::Ok);
    assert(result.url == "https://example.com");
    assert(result.windowId == "4194305");
    assert(result.error.empty());
    assert(ReadFile(f.handoffPath) == "https://example.com");
    assert(ReadFile(f.pkillMarker) == "-9 chrome\n");
    std::cout << "  ✓ handoff 文件已写入，pkill -9 chrome 已调用" << std::endl;

    // 没有匹配进程时 pkill 返回 1，仍然算成功
    f.setPkill("exit 1");
    result = f.browser.navigate("https://b.io");
    assert(result.success());
    assert(ReadFile(f.handoffPath) == "https://b.io");
    std::cout << "  ✓ 忽略 pkill 退出码" << std::endl;

    // 多个窗口时取第一个
    f.setWindows("printf '111\\n222\\n'");
    result = f.browser.navigate("https://c.io");
    assert(result.success());
    assert(result.windowId == "111");
    std::cout << "  ✓ 多个窗口取第一个" << std::endl;

    fs::remove_all(dir);
    std::cout << "[通过] 导航成功测试" << std::endl;
}

void test_window_not_found() {
    std::cout << "\n[测试 2] 未找到窗口..." << std::endl;
    std::string dir = MakeTempDir("browser-missing");
    Fixture f(dir);
    WriteFile(f.handoffPath, "https://previous.example");

    f.setWindows("exit 1");
    NavigateResult result = f.browser.navigate("https://example.com");
    assert(!result.success());
    assert(result.status == NavigateStatus::WindowNotFound);
    assert(result.error == "Chrome window not found");
    assert(ReadFile(f.handoffPath) == "https://previous.example");
    assert(!fs::exists(f.pkillMarker));
    std::cout << "  ✓ 非零退出码：不写文件，不调用 pkill" << std::endl;

    f.setWindows("printf '\\n'");
    result = f.browser.navigate("https://example.com");
    assert(result.status == NavigateStatus::WindowNotFound);
    assert(ReadFile(f.handoffPath) == "https://previous.example");
    assert(!fs::exists(f.pkillMarker));
    std::cout << "  ✓ 空输出：不写文件，不调用 pkill" << std::endl;

    fs::remove_all(dir);
    std::cout << "[通过] 未找到窗口测试" << std::endl;
}

void test_timeouts() {
    std::cout << "\n[测试 3] 超时..." << std::endl;
    std::string dir = MakeTempDir("browser-timeout");
    Fixture f(dir);

    f.setWindows("exec sleep 5");
    NavigateResult result = f.browser.navigate("https://example.com");
    assert(result.status == NavigateStatus::TimedOut);
    assert(result.error == "Navigation timed out");
    assert(!fs::exists(f.handoffPath));
    assert(!fs::exists(f.pkillMarker));
    std::cout << "  ✓ 窗口查询超时" << std::endl;

    f.setWindows("printf '1\\n'");
    f.setPkill("exec sleep 5");
    result = f.browser.navigate("https://example.com/slow");
    assert(result.status == NavigateStatus::TimedOut);
    assert(result.error == "Navigation timed out");
    // 超时发生在写入之后
    assert(ReadFile(f.handoffPath) == "https://example.com/slow");
    std::cout << "  ✓ pkill 超时，handoff 已写入" << std::endl;

    fs::remove_all(dir);
    std::cout << "[通过] 超时测试" << std::endl;
}

void test_handoff_failure() {
    std::cout << "\n[测试 4] handoff 写入失败..." << std::endl;
    std::string dir = MakeTempDir("browser-handoff");
    std::string pkillMarker = dir + "/pkill-called.txt";

    ConfigManager config;
    config.load();
    config.setToolTimeoutMs(300);
    config.setWindowQueryTool(WriteScript(dir, "xdotool", "printf '1\\n'"));
    config.setProcessSignalTool(WriteScript(dir, "pkill", "touch '" + pkillMarker + "'"));
    CommandService commands;
    WindowService windows(&config, &commands);
    ProcessService processes(&config, &commands);
    RecordingHandoff handoff;
    BrowserService browser(&config, &windows, &processes, &handoff);

    NavigateResult result = browser.navigate("https://example.com");
    assert(result.success());
    assert(handoff.published.size() == 1);
    assert(handoff.published[0] == "https://example.com");

    fs::remove(pkillMarker);
    handoff.fail = true;
    bool threw = false;
    try {
        browser.navigate("https://example.com");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(!fs::exists(pkillMarker));
    std::cout << "  ✓ 写入失败时抛出异常，不调用 pkill" << std::endl;

    fs::remove_all(dir);
    std::cout << "[通过] handoff 写入失败测试" << std::endl;
}

int main() {
    std::cout << "\n[BrowserService] 开始测试..." << std::endl;

    test_navigate_success();
    test_window_not_found();
    test_timeouts();
    test_handoff_failure();

    std::cout << "\n[通过] BrowserService 全部测试" << std::endl;
    return 0;
}
