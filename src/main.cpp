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
#include "http_routes.h"
#include "http_server.h"
#include "services/browser_service.h"
#include "services/command_service.h"
#include "services/handoff_channel.h"
#include "services/process_service.h"
#include "services/window_service.h"
#include "support/audit_logger.h"
#include "support/config_manager.h"
#include "utils/control_log.h"
#include "utils/log_path.h"
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#ifndef KIOSKCTL_VERSION
#define KIOSKCTL_VERSION "1.0.0"
#endif

using namespace kioskctl;

namespace {

kioskctl::HttpServer* g_server = nullptr;

void HandleStopSignal(int) {
    if (g_server) {
        g_server->stop();
    }
}

void PrintUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "\n"
              << "Restarts the kiosk browser on a new URL over HTTP.\n"
              << "  POST /navigate {\"url\": \"...\"}\n"
              << "  GET  /health\n"
              << "\n"
              << "Options:\n"
              << "  --config <path>    JSON config file (created with defaults if missing)\n"
              << "  --port <n>         listen port (default 6090)\n"
              << "  --display <value>  X display for the window query (default :99)\n"
              << "  --handoff <path>   URL handoff file (default /tmp/chrome-url.txt)\n"
              << "  --log-dir <path>   write logs and the audit trail to this directory\n"
              << "  --version          print version and exit\n"
              << "  --help             show this help\n";
}

int ParsePort(const std::string& value) {
    char* end = nullptr;
    long port = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || !end || *end || port < 0 || port > 65535) {
        throw std::runtime_error("Invalid port: " + value);
    }
    return static_cast<int>(port);
}

struct CommandLine {
    std::string configPath;
    std::string port;
    std::string display;
    std::string handoff;
    std::string logDir;
    bool help = false;
    bool version = false;
};

CommandLine ParseCommandLine(int argc, char** argv) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for " + arg);
            }
            return argv[++i];
        };
        if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        } else if (arg == "--version") {
            cmd.version = true;
        } else if (arg == "--config") {
            cmd.configPath = next();
        } else if (arg == "--port") {
            cmd.port = next();
        } else if (arg == "--display") {
            cmd.display = next();
        } else if (arg == "--handoff") {
            cmd.handoff = next();
        } else if (arg == "--log-dir") {
            cmd.logDir = next();
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }
    return cmd;
}

} // namespace

int main(int argc, char** argv) {
    CommandLine cmd;
    try {
        cmd = ParseCommandLine(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        PrintUsage(argv[0]);
        return 2;
    }
    if (cmd.help) {
        PrintUsage(argv[0]);
        return 0;
    }
    if (cmd.version) {
        std::cout << "kiosk-control " << KIOSKCTL_VERSION << std::endl;
        return 0;
    }

    ConfigManager config(cmd.configPath);
    try {
        config.load();
        if (!cmd.port.empty()) config.setServerPort(ParsePort(cmd.port));
        if (!cmd.display.empty()) config.setDisplay(cmd.display);
        if (!cmd.handoff.empty()) config.setHandoffPath(cmd.handoff);
        if (!cmd.logDir.empty()) config.setLogDir(cmd.logDir);
    } catch (const std::exception& e) {
        AppendControlLogA(std::string("FATAL: ") + e.what());
        return 1;
    }

    ControlConfig settings = config.snapshot();
    SetLogDir(settings.log_dir);
    AppendControlLogA(std::string("kiosk-control ") + KIOSKCTL_VERSION + " starting, display=" +
                      settings.display + " window_class=" + settings.window_class +
                      " process_pattern=" + settings.process_pattern +
                      " timeout_ms=" + std::to_string(settings.tool_timeout_ms));

    CommandService commandService;
    WindowService windowService(&config, &commandService);
    ProcessService processService(&config, &commandService);
    FileHandoffChannel handoff(settings.handoff_path);
    BrowserService browserService(&config, &windowService, &processService, &handoff);
    AppendControlLogA("URL handoff: " + handoff.describe());

    std::unique_ptr<AuditLogger> auditLogger;
    std::string auditPath = GetLogFilePathA("audit.log");
    if (!auditPath.empty()) {
        auditLogger = std::make_unique<AuditLogger>(auditPath);
        auditLogger->cleanupOldLogs(settings.log_retention_days);
    }

    HttpRoutes routes(&browserService, auditLogger.get());
    HttpServer server(&config, &routes);
    if (!server.start()) {
        return 1;
    }

    g_server = &server;
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = HandleStopSignal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    server.run();
    g_server = nullptr;
    return 0;
}
