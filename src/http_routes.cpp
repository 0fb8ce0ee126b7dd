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
#include "services/browser_service.h"
#include "support/audit_logger.h"
#include "utils/control_log.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace kioskctl {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const char* StatusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
    }
}

std::string JsonResponse(int status, const json& body) {
    return MakeHttpResponse(status, "application/json",
                            body.dump(-1, ' ', false, json::error_handler_t::replace));
}

std::string NavigateFailure(const std::string& error) {
    return JsonResponse(500, json{{"success", false}, {"error", error}});
}

// null / false / 0 / "" / [] / {} 都按缺少 url 处理
bool IsEmptyValue(const json& value) {
    switch (value.type()) {
        case json::value_t::null:            return true;
        case json::value_t::boolean:         return !value.get<bool>();
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:    return value.get<double>() == 0.0;
        case json::value_t::string:
        case json::value_t::array:
        case json::value_t::object:          return value.empty();
        default:                             return false;
    }
}

} // namespace

ParsedRequestLine ParseRequestLine(const std::string& requestLine) {
    ParsedRequestLine parsed;
    parsed.fullLine = requestLine;

    size_t sp1 = requestLine.find(' ');
    if (sp1 == std::string::npos) return parsed;
    parsed.method = requestLine.substr(0, sp1);

    size_t pathStart = sp1 + 1;
    size_t sp2 = requestLine.find(' ', pathStart);
    std::string uri = (sp2 != std::string::npos)
        ? requestLine.substr(pathStart, sp2 - pathStart)
        : requestLine.substr(pathStart);

    size_t qmark = uri.find('?');
    if (qmark != std::string::npos) {
        parsed.path  = uri.substr(0, qmark);
        parsed.query = uri.substr(qmark + 1);
    } else {
        parsed.path = uri;
    }

    return parsed;
}

std::string GetHeaderValue(const std::string& request, const std::string& headerNameLower) {
    size_t pos = request.find("\r\n");
    if (pos == std::string::npos) {
        return "";
    }
    pos += 2; // skip request line

    const std::string prefix = headerNameLower + ":";
    while (true) {
        size_t lineEnd = request.find("\r\n", pos);
        if (lineEnd == std::string::npos || lineEnd == pos) {
            break; // end of headers
        }

        std::string line = request.substr(pos, lineEnd - pos);
        if (ToLower(line).rfind(prefix, 0) == 0) {
            std::string value = line.substr(prefix.size());
            size_t start = value.find_first_not_of(" \t");
            if (start == std::string::npos) {
                return "";
            }
            size_t end = value.find_last_not_of(" \t");
            return value.substr(start, end - start + 1);
        }

        pos = lineEnd + 2;
    }

    return "";
}

std::string GetRequestBody(const std::string& request) {
    size_t headerEnd = request.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        return "";
    }
    std::string lengthStr = GetHeaderValue(request, "content-length");
    if (lengthStr.empty()) {
        return "";
    }
    size_t contentLength = static_cast<size_t>(std::strtoull(lengthStr.c_str(), nullptr, 10));
    size_t bodyOffset = headerEnd + 4;
    if (bodyOffset >= request.size()) {
        return "";
    }
    return request.substr(bodyOffset, contentLength);
}

std::string MakeHttpResponse(int status,
                             const std::string& contentType,
                             const std::string& body) {
    return "HTTP/1.1 " + std::to_string(status) + " " + StatusText(status) + "\r\n"
           "Content-Type: " + contentType + "\r\n"
           "Content-Length: " + std::to_string(body.size()) + "\r\n"
           "Connection: close\r\n"
           "\r\n" + body;
}

HttpRoutes::HttpRoutes(BrowserService* browserService, AuditLogger* auditLogger)
    : browserService_(browserService), auditLogger_(auditLogger) {
}

std::string HttpRoutes::handle(const std::string& request) {
    size_t firstLine = request.find("\r\n");
    if (firstLine == std::string::npos) {
        return MakeHttpResponse(400, "text/plain", "Bad Request");
    }

    ParsedRequestLine parsed = ParseRequestLine(request.substr(0, firstLine));
    AppendControlLogA(parsed.method + " " + parsed.path);

    if (parsed.method == "POST" && parsed.path == "/navigate") {
        return handleNavigate(GetRequestBody(request));
    }
    if (parsed.method == "GET" && parsed.path == "/health") {
        return handleHealth();
    }

    return MakeHttpResponse(404, "text/plain", "Not Found");
}

std::string HttpRoutes::handleNavigate(const std::string& body) {
    auto start = std::chrono::steady_clock::now();
    AuditLogEntry entry;
    entry.time = AuditLogger::getCurrentTimestamp();
    entry.action = "navigate";

    std::string response;
    try {
        json data = json::parse(body);
        if (!data.is_object()) {
            throw std::runtime_error("Request body must be a JSON object");
        }

        auto it = data.find("url");
        std::string url;
        if (it != data.end() && !IsEmptyValue(*it)) {
            url = it->get<std::string>();
        }

        if (url.empty()) {
            AppendControlLogA("URL is required");
            entry.result = "rejected";
            entry.error = "URL is required";
            response = MakeHttpResponse(400, "text/plain", "URL is required");
        } else {
            entry.url = url;
            NavigateResult result = browserService_->navigate(url);
            if (!result.windowId.empty()) {
                entry.details["window_id"] = result.windowId;
            }
            if (result.success()) {
                entry.result = "ok";
                response = JsonResponse(200, json{{"success", true}, {"url", result.url}});
            } else {
                entry.result = "error";
                entry.error = result.error;
                response = NavigateFailure(result.error);
            }
        }
    } catch (const std::exception& e) {
        AppendExceptionLogA(std::string("Error: ") + e.what());
        entry.result = "error";
        entry.error = e.what();
        response = NavigateFailure(e.what());
    }

    entry.duration_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
    if (auditLogger_) {
        auditLogger_->logNavigation(entry);
    }
    return response;
}

std::string HttpRoutes::handleHealth() {
    return JsonResponse(200, json{{"status", "ok"}});
}

} // namespace kioskctl
