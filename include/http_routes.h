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
#ifndef KIOSKCTL_HTTP_ROUTES_H
#define KIOSKCTL_HTTP_ROUTES_H

#include <string>

namespace kioskctl {

class BrowserService;
class AuditLogger;

struct ParsedRequestLine {
    std::string method;
    std::string path;       // 不含 query string，如 "/navigate"
    std::string query;      // query string 部分
    std::string fullLine;   // 原始请求行
};

ParsedRequestLine ParseRequestLine(const std::string& requestLine);

// headerNameLower 需为小写，如 "content-length"
std::string GetHeaderValue(const std::string& request, const std::string& headerNameLower);

// Content-Length 指定长度的 body；没有 Content-Length 时为空
std::string GetRequestBody(const std::string& request);

std::string MakeHttpResponse(int status,
                             const std::string& contentType,
                             const std::string& body);

// Route table of the control endpoint:
//   POST /navigate  restart the browser on a new URL
//   GET  /health    liveness
//   anything else   404
class HttpRoutes {
public:
    // auditLogger may be null
    HttpRoutes(BrowserService* browserService, AuditLogger* auditLogger);

    // Raw HTTP request in, raw HTTP response out. Never throws for
    // failures inside a route; those become HTTP 500.
    std::string handle(const std::string& request);

private:
    std::string handleNavigate(const std::string& body);
    std::string handleHealth();

    BrowserService* browserService_;
    AuditLogger* auditLogger_;
};

} // namespace kioskctl

#endif // KIOSKCTL_HTTP_ROUTES_H
