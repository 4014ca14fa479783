#include "http_handler.h"
#include "core/logger.h"
#include <algorithm>
#include <cctype>
#include <sstream>

using asio::awaitable;

namespace pushhub::transport {

    namespace {
        constexpr const char *CORS_ALLOW_ORIGIN = "Access-Control-Allow-Origin: *\r\n";
        constexpr const char *NOT_FOUND_BODY = R"({"error":"Not Found"})";
        constexpr const char *METHOD_NOT_ALLOWED_BODY = R"({"error":"Method Not Allowed"})";
        constexpr const char *INTERNAL_ERROR_BODY = R"({"error":"Internal Server Error"})";

        std::string trim(const std::string &s) {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos) {
                return "";
            }
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }
    }// namespace

    HttpHandler::HttpHandler(Endpoints endpoints)
        : endpoints_(std::move(endpoints)) {
    }

    bool HttpHandler::iequals(const std::string &a, const std::string &b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                   return std::tolower(x) == std::tolower(y);
               });
    }

    std::string HttpHandler::get_header_value(
            const std::unordered_map<std::string, std::string> &headers,
            const std::string &key) {
        for (const auto &[name, value]: headers) {
            if (iequals(name, key)) {
                return value;
            }
        }
        return "";
    }

    std::string HttpHandler::get_header_value(
            const std::string &headers_str,
            const std::string &key) {
        std::istringstream hss(headers_str);
        std::string line;
        while (std::getline(hss, line)) {
            auto pos = line.find(':');
            if (pos != std::string::npos && iequals(trim(line.substr(0, pos)), key)) {
                return trim(line.substr(pos + 1));
            }
        }
        return "";
    }

    std::optional<HttpRequest> HttpHandler::parse_request(const std::string &raw_request) {
        HttpRequest req;
        auto header_end = raw_request.find("\r\n\r\n");
        if (header_end == std::string::npos) {
            return std::nullopt;
        }
        std::istringstream iss(raw_request.substr(0, header_end + 2));
        std::string line;

        // Request line (method, target, version)
        if (!std::getline(iss, line)) {
            return std::nullopt;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::istringstream request_line(line);
        request_line >> req.method >> req.target >> req.version;
        if (request_line.fail() || req.version.rfind("HTTP/", 0) != 0) {
            return std::nullopt;
        }
        if (auto query = req.target.find('?'); query != std::string::npos) {
            req.target.erase(query);
        }

        while (std::getline(iss, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) {
                break;
            }
            size_t colon_pos = line.find(':');
            if (colon_pos == std::string::npos) {
                return std::nullopt;
            }
            req.headers[trim(line.substr(0, colon_pos))] = trim(line.substr(colon_pos + 1));
        }

        // Body: whatever follows the header block, bounded by Content-Length
        std::string length_str = get_header_value(req.headers, "Content-Length");
        size_t content_len = 0;
        if (!length_str.empty()) {
            try {
                size_t consumed = 0;
                content_len = std::stoull(length_str, &consumed);
                if (consumed != length_str.size()) {
                    return std::nullopt;
                }
            } catch (const std::exception &) {
                return std::nullopt;
            }
        }
        req.body = raw_request.substr(header_end + 4, content_len);
        if (req.body.size() != content_len) {
            return std::nullopt;
        }
        return req;
    }

    const char *HttpHandler::status_text(int status_code) {
        switch (status_code) {
            case 200:
                return "OK";
            case 202:
                return "Accepted";
            case 204:
                return "No Content";
            case 400:
                return "Bad Request";
            case 404:
                return "Not Found";
            case 405:
                return "Method Not Allowed";
            case 500:
                return "Internal Server Error";
            case 503:
                return "Service Unavailable";
            default:
                return "Unknown";
        }
    }

    asio::awaitable<void> HttpHandler::send_http_response(
            std::shared_ptr<Session> session,
            const std::string &body,
            int status_code) {
        std::ostringstream oss;
        oss << "HTTP/1.1 " << status_code << " " << status_text(status_code) << "\r\n";
        oss << "Content-Type: application/json\r\n";
        oss << "Content-Length: " << body.size() << "\r\n";
        oss << CORS_ALLOW_ORIGIN;

        // Keep-alive unless the client asked to close
        std::string client_connection = get_header_value(session->get_headers(), "Connection");
        bool keep_alive = !iequals(client_connection, "close");
        oss << (keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n");
        oss << "\r\n";
        oss << body;

        co_await session->write(oss.str());
        PUSHHUB_DEBUG("Sent HTTP {} response (Session: {})", status_code, session->get_session_id());

        if (!keep_alive) {
            session->close();
        }
        co_return;
    }

    awaitable<void> HttpHandler::handle_request(
            std::shared_ptr<Session> session,
            const std::string &raw_request) {
        if (session->is_streaming()) {
            PUSHHUB_WARN("Ignoring request on streaming session {}", session->get_session_id());
            co_return;
        }

        auto req_opt = parse_request(raw_request);
        if (!req_opt) {
            PUSHHUB_WARN("Malformed HTTP request (Session: {})", session->get_session_id());
            co_await send_http_response(session, R"({"error":"Invalid HTTP request"})", 400);
            co_return;
        }
        const HttpRequest &req = *req_opt;
        session->set_headers(req.headers);
        PUSHHUB_DEBUG("Request method: {}, target: {} (Session: {})", req.method, req.target, session->get_session_id());

        if (req.method == "OPTIONS") {
            std::ostringstream oss;
            oss << "HTTP/1.1 200 OK\r\n"
                << CORS_ALLOW_ORIGIN
                << "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
                << "Access-Control-Allow-Headers: Content-Type, Authorization, Accept\r\n"
                << "Access-Control-Max-Age: 86400\r\n"
                << "Content-Length: 0\r\n"
                << "\r\n";
            co_await session->write(oss.str());
            co_return;
        }

        bool is_get = req.method == "GET";
        bool is_post = req.method == "POST";
        HttpReply reply;
        try {
            if (req.target == "/sse") {
                if (!is_get) {
                    reply = {405, METHOD_NOT_ALLOWED_BODY};
                } else if (endpoints_.on_stream) {
                    // The stream owns the session from here on
                    session->set_streaming(true);
                    endpoints_.on_stream(session);
                    co_return;
                } else {
                    reply = {404, NOT_FOUND_BODY};
                }
            } else if (req.target == "/messages" || req.target == "/") {
                if (!is_post) {
                    reply = {405, METHOD_NOT_ALLOWED_BODY};
                } else {
                    reply = endpoints_.on_message ? endpoints_.on_message(req.body) : HttpReply{404, NOT_FOUND_BODY};
                }
            } else if (req.target == "/health" && endpoints_.on_health) {
                reply = is_get ? endpoints_.on_health() : HttpReply{405, METHOD_NOT_ALLOWED_BODY};
            } else if (req.target == "/debug/tools" && endpoints_.on_debug) {
                reply = is_get ? endpoints_.on_debug() : HttpReply{405, METHOD_NOT_ALLOWED_BODY};
            } else {
                reply = {404, NOT_FOUND_BODY};
            }
        } catch (const std::exception &e) {
            PUSHHUB_ERROR("Error handling {} {}: {}", req.method, req.target, e.what());
            reply = {500, INTERNAL_ERROR_BODY};
        }

        co_await send_http_response(session, reply.body, reply.status_code);
        co_return;
    }

}// namespace pushhub::transport
