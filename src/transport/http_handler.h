#pragma once

#include "session.h"
#include "transport_types.h"
#include <asio.hpp>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace pushhub::transport {

    /**
     * @brief HTTP request structure for parsing incoming requests.
     */
    struct HttpRequest {
        std::string method;                                  ///< HTTP method (GET, POST, etc.)
        std::string target;                                  ///< Request target, query string removed
        std::string version;                                 ///< HTTP version
        std::unordered_map<std::string, std::string> headers;///< HTTP headers
        std::string body;                                    ///< Request body
    };

    /**
     * @brief Routes HTTP requests to the application endpoints.
     *
     * | route                  | endpoint  |
     * |------------------------|-----------|
     * | GET /sse               | on_stream |
     * | POST /messages, POST / | on_message|
     * | GET /health            | on_health |
     * | GET /debug/tools       | on_debug  |
     * | OPTIONS *              | CORS preflight |
     */
    class HttpHandler {
    public:
        explicit HttpHandler(Endpoints endpoints);

        /**
         * @brief Process one complete HTTP request read from a session.
         * @param session Active session
         * @param raw_request Raw HTTP request string (headers and body)
         */
        asio::awaitable<void> handle_request(std::shared_ptr<Session> session, const std::string &raw_request);

        /**
         * @brief Send a JSON reply with CORS headers.
         * @param session Active session
         * @param body Response body
         * @param status_code HTTP status code
         */
        asio::awaitable<void> send_http_response(std::shared_ptr<Session> session, const std::string &body, int status_code = 200);

        /**
         * @brief Parse raw HTTP request into structured data.
         * @param raw_request Raw HTTP request string
         * @return Optional HttpRequest structure
         */
        static std::optional<HttpRequest> parse_request(const std::string &raw_request);

        /**
         * @brief Get header value from headers map (case-insensitive).
         * @param headers Headers map
         * @param key Header key to find
         * @return Header value or empty string
         */
        static std::string get_header_value(const std::unordered_map<std::string, std::string> &headers, const std::string &key);

        /**
         * @brief Get header value from raw headers string (case-insensitive).
         * @param headers_str Raw headers string
         * @param key Header key to find
         * @return Header value or empty string
         */
        static std::string get_header_value(const std::string &headers_str, const std::string &key);

        static const char *status_text(int status_code);

    private:
        static bool iequals(const std::string &a, const std::string &b);

        Endpoints endpoints_;
    };

}// namespace pushhub::transport
