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
#ifndef KIOSKCTL_HTTP_SERVER_H
#define KIOSKCTL_HTTP_SERVER_H

#include <atomic>
#include <string>

namespace kioskctl {

class ConfigManager;
class HttpRoutes;

// 完整接收 HTTP 请求（处理分片）；超时、超限或连接关闭且无数据时返回空串
std::string RecvFullHttpRequest(int sock);

// 可靠发送：循环处理 partial send，失败返回 false
bool SendAll(int sock, const char* buf, size_t len);
bool SendAll(int sock, const std::string& data);

// Single-threaded accept loop: one connection at a time,
// request -> response -> close.
class HttpServer {
public:
    HttpServer(ConfigManager* configManager, HttpRoutes* routes);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // socket + bind + listen. Returns false (and logs) on failure.
    bool start();

    // Serves until stop() is called. start() must have succeeded.
    void run();

    // Safe to call from another thread or a signal handler.
    void stop() { running_.store(false); }

    // Actual bound port (differs from the configured one when it was 0).
    int port() const { return port_; }

private:
    void serveConnection(int clientSocket);

    ConfigManager* configManager_;
    HttpRoutes* routes_;
    int serverSocket_;
    int port_;
    std::atomic<bool> running_;
};

} // namespace kioskctl

#endif // KIOSKCTL_HTTP_SERVER_H
