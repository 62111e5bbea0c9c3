#include "http_handlers.hpp"
#include <chrono>
#include <cstdio>
#include <optional>
#include <sstream>
#include <utility>

static std::string jsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Empty on a truncated or non-hex escape.
static std::optional<std::string> percentDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '%') {
            out += s[i];
            continue;
        }
        if (i + 2 >= s.size()) return std::nullopt;
        int hi = hexValue(s[i + 1]);
        int lo = hexValue(s[i + 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out += static_cast<char>(hi * 16 + lo);
        i += 2;
    }
    return out;
}

static http::response<http::string_body>
textResponse(const http::request<http::string_body>& req, http::status status, std::string body,
             const char* contentType = "text/plain; charset=utf-8") {
    http::response<http::string_body> res{status, req.version()};
    res.set(http::field::content_type, contentType);
    res.body() = std::move(body);
    res.prepare_payload();
    res.keep_alive(req.keep_alive());
    return res;
}

http::response<http::string_body>
handleGetLock(const http::request<http::string_body>& req, const std::string& key, RecordStore& store) {
    auto info = store.lockInfo(key);
    if (!info) {
        http::response<http::string_body> res{http::status::not_found, req.version()};
        res.keep_alive(req.keep_alive());
        res.content_length(0);
        return res;
    }

    std::ostringstream os;
    os << "{\"key\":\"" << jsonEscape(key) << "\",\"holder\":\"" << jsonEscape(info->holder)
       << "\",\"expires_in_ms\":";
    if (info->holdDeadline) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*info->holdDeadline - Clock::now());
        os << (left.count() < 0 ? 0 : left.count());
    } else {
        os << "null";
    }
    os << "}";

    auto res = textResponse(req, http::status::ok, os.str(), "application/json");
    res.set(http::field::cache_control, "no-cache");
    return res;
}

http::response<http::string_body>
handleRequest(const http::request<http::string_body>& req, RecordStore& store) {
    auto& metrics = store.metrics();
    metrics.incHttpTotal();

    std::string target = std::string(req.target());
    if (auto q = target.find('?'); q != std::string::npos) target.erase(q);

    if (req.method() != http::verb::get) {
        metrics.incHttpRouteOther();
        return textResponse(req, http::status::method_not_allowed, "");
    }
    if (target == "/" || target == "/health") {
        metrics.incHttpRouteHealth();
        return textResponse(req, http::status::ok, "record-store-service");
    }
    if (target == "/metrics") {
        metrics.incHttpRouteMetrics();
        return textResponse(req, http::status::ok, metrics.renderPrometheus(),
                            "text/plain; version=0.0.4");
    }
    if (target.rfind("/locks/", 0) == 0 && target.size() > 7) {
        metrics.incHttpRouteLocks();
        auto key = percentDecode(target.substr(7));
        if (!key) return textResponse(req, http::status::bad_request, "malformed key escape");
        return handleGetLock(req, *key, store);
    }

    metrics.incHttpRouteOther();
    http::response<http::string_body> res{http::status::not_found, req.version()};
    res.keep_alive(req.keep_alive());
    res.content_length(0);
    return res;
}
