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
#include "http_server.h"
#include "http_routes.h"
#include "support/config_manager.h"
#include "utils/control_log.h"
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace kioskctl {

static const size_t kMaxHttpHeaderSize = 16 * 1024;       // 16 KB header 上限
static const size_t kMaxHttpBodySize   = 1024 * 1024;     // 1 MB body 上限
static const int    kRecvTimeoutMs     = 10000;           // 10 秒接收超时
static const int    kSendTimeoutMs     = 10000;
static const int    kAcceptPollMs      = 500;             // 检查 running_ 的间隔

// ── SendAll: 循环处理 partial send ────────────────────────
bool SendAll(int sock, const char* buf, size_t len) {
    size_t totalSent = 0;
    while (totalSent < len) {
        ssize_t sent = ::send(sock, buf + totalSent, len - totalSent, MSG_NOSIGNAL);
        if (sent < 0 && errno == EINTR) {
            continue;
        }
        if (sent <= 0) {
            return false;
        }
        totalSent += static_cast<size_t>(sent);
    }
    return true;
}

bool SendAll(int sock, const std::string& data) {
    return SendAll(sock, data.data(), data.size());
}

std::string RecvFullHttpRequest(int sock) {
    struct timeval tv;
    tv.tv_sec = kRecvTimeoutMs / 1000;
    tv.tv_usec = (kRecvTimeoutMs % 1000) * 1000;
    ::setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    std::string buf;
    buf.reserve(4096);
    char tmp[4096];

    // 阶段 1：读取至少到 header 结束（\r\n\r\n）
    size_t headerEnd = std::string::npos;
    while (headerEnd == std::string::npos) {
        ssize_t n = ::recv(sock, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            // 连接关闭、超时或出错
            return buf;
        }
        buf.append(tmp, static_cast<size_t>(n));
        headerEnd = buf.find("\r\n\r\n");
        if (buf.size() > kMaxHttpHeaderSize && headerEnd == std::string::npos) {
            AppendControlLogA("[RecvFullHttpRequest] header too large, dropping");
            return std::string();
        }
    }

    // 阶段 2：解析 Content-Length，继续读取 body
    size_t bodyOffset = headerEnd + 4;
    std::string lengthStr = GetHeaderValue(buf.substr(0, bodyOffset), "content-length");
    size_t contentLength = 0;
    if (!lengthStr.empty()) {
        contentLength = static_cast<size_t>(std::strtoull(lengthStr.c_str(), nullptr, 10));
    }

    if (contentLength > kMaxHttpBodySize) {
        AppendControlLogA("[RecvFullHttpRequest] body too large: " + std::to_string(contentLength));
        return std::string();
    }

    size_t totalNeeded = bodyOffset + contentLength;
    while (buf.size() < totalNeeded) {
        ssize_t n = ::recv(sock, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break; // 连接关闭，返回已有数据
        }
        buf.append(tmp, static_cast<size_t>(n));
    }

    return buf;
}

HttpServer::HttpServer(ConfigManager* configManager, HttpRoutes* routes)
    : configManager_(configManager),
      routes_(routes),
      serverSocket_(-1),
      port_(0),
      running_(false) {
}

HttpServer::~HttpServer() {
    if (serverSocket_ >= 0) {
        ::close(serverSocket_);
    }
}

bool HttpServer::start() {
    int port = configManager_->getServerPort();
    std::string listenAddr = configManager_->getListenAddress();

    serverSocket_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (serverSocket_ < 0) {
        AppendControlLogA(std::string("[HttpServer] ERROR: socket() failed: ") + std::strerror(errno));
        return false;
    }

    // 重启后可立即复用处于 TIME_WAIT 的端口
    int opt = 1;
    if (::setsockopt(serverSocket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != 0) {
        AppendControlLogA(std::string("[HttpServer] WARN: setsockopt(SO_REUSEADDR) failed: ") +
                          std::strerror(errno));
    }

    sockaddr_in serverAddr{};
    serverAddr.sin_family = AF_INET;
    serverAddr.sin_port = htons(static_cast<uint16_t>(port));

    if (listenAddr.empty() || listenAddr == "0.0.0.0") {
        serverAddr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (::inet_pton(AF_INET, listenAddr.c_str(), &serverAddr.sin_addr) != 1) {
        AppendControlLogA("[HttpServer] WARN: invalid listen_address='" + listenAddr +
                          "', fallback to 0.0.0.0");
        serverAddr.sin_addr.s_addr = htonl(INADDR_ANY);
    }

    if (::bind(serverSocket_, reinterpret_cast<sockaddr*>(&serverAddr), sizeof(serverAddr)) != 0) {
        AppendControlLogA("[HttpServer] ERROR: bind() failed listen=" + listenAddr +
                          " port=" + std::to_string(port) + ": " + std::strerror(errno));
        ::close(serverSocket_);
        serverSocket_ = -1;
        return false;
    }

    // 用 getsockname 获取实际绑定的端口（port=0 时由系统分配）
    sockaddr_in boundAddr{};
    socklen_t boundLen = sizeof(boundAddr);
    if (::getsockname(serverSocket_, reinterpret_cast<sockaddr*>(&boundAddr), &boundLen) == 0) {
        port = ntohs(boundAddr.sin_port);
    }
    port_ = port;

    if (::listen(serverSocket_, SOMAXCONN) != 0) {
        AppendControlLogA(std::string("[HttpServer] ERROR: listen() failed: ") + std::strerror(errno));
        ::close(serverSocket_);
        serverSocket_ = -1;
        return false;
    }

    running_.store(true);
    AppendControlLogA("Browser control server listening on port " + std::to_string(port_));
    return true;
}

void HttpServer::run() {
    while (running_.load()) {
        struct pollfd pfd = {serverSocket_, POLLIN, 0};
        int ready = ::poll(&pfd, 1, kAcceptPollMs);
        if (ready <= 0) {
            continue;
        }

        sockaddr_in clientAddr{};
        socklen_t clientAddrLen = sizeof(clientAddr);
        // 外部工具 fork/exec 时不能继承监听与客户端 socket
        int clientSocket = ::accept4(serverSocket_, reinterpret_cast<sockaddr*>(&clientAddr),
                                     &clientAddrLen, SOCK_CLOEXEC);
        if (clientSocket < 0) {
            continue;
        }

        // 设发送超时，防止 SendAll 在对端不读时卡住 accept 循环
        struct timeval tv;
        tv.tv_sec = kSendTimeoutMs / 1000;
        tv.tv_usec = 0;
        ::setsockopt(clientSocket, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        serveConnection(clientSocket);
        ::close(clientSocket);
    }

    AppendControlLogA("[HttpServer] Exiting normally");
}

void HttpServer::serveConnection(int clientSocket) {
    std::string request = RecvFullHttpRequest(clientSocket);
    if (request.empty()) {
        return;
    }

    std::string response;
    try {
        response = routes_->handle(request);
    } catch (const std::exception& e) {
        AppendExceptionLogA(std::string("[HttpServer] std::exception: ") + e.what());
        response = MakeHttpResponse(500, "application/json", "{\"error\":\"internal_error\"}");
    }

    if (!SendAll(clientSocket, response)) {
        AppendControlLogA("[HttpServer] SendAll failed for HTTP response");
    }
}

} // namespace kioskctl
