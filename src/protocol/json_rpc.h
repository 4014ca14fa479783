#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace pushhub::protocol {

    constexpr const char *JSONRPC_VERSION = "2.0";

    // JSON-RPC 2.0 error codes
    namespace error_code {
        constexpr int PARSE_ERROR = -32700;     // Invalid JSON was received by the server
        constexpr int INVALID_REQUEST = -32600; // The JSON sent is not a valid Request object
        constexpr int METHOD_NOT_FOUND = -32601;// The method does not exist / is not available
        constexpr int INVALID_PARAMS = -32602;  // Invalid method parameter(s)
        constexpr int INTERNAL_ERROR = -32603;  // Internal JSON-RPC error
    }// namespace error_code

    // JSON-RPC 2.0 Error Object
    // https://www.jsonrpc.org/specification#error_object
    struct Error {
        int code;                          // A Number that indicates the error type
        std::string message;               // A String providing a short description of the error
        std::optional<nlohmann::json> data;// Optional: Additional error information

        Error(int code, std::string message) : code(code), message(std::move(message)) {}
        Error(int code, std::string message, std::optional<nlohmann::json> data)
            : code(code), message(std::move(message)), data(std::move(data)) {}
    };

    // A message without correlation id; no reply is correlated to it.
    struct Notification {
        std::string method;
        nlohmann::json params = nlohmann::json::object();
    };

    // A message carrying a correlation id; exactly one Response answers it.
    struct Request {
        std::string method;
        nlohmann::json params = nlohmann::json::object();
        nlohmann::json id;
    };

    // JSON-RPC 2.0 Response Object
    // https://www.jsonrpc.org/specification#response_object
    // result and error are mutually exclusive. An absent id is serialized
    // without an "id" member (reply to a notification-shaped message).
    struct Response {
        std::optional<nlohmann::json> id;
        nlohmann::json result = nlohmann::json(nullptr);
        std::optional<Error> error;

        static Response success(std::optional<nlohmann::json> id, nlohmann::json result) {
            Response resp;
            resp.id = std::move(id);
            resp.result = std::move(result);
            return resp;
        }

        static Response failure(std::optional<nlohmann::json> id, Error error) {
            Response resp;
            resp.id = std::move(id);
            resp.error = std::move(error);
            return resp;
        }

        // Overloads for a known id; spares callers the json -> optional conversion.
        static Response success(const nlohmann::json &id, nlohmann::json result) {
            return success(std::optional<nlohmann::json>(id), std::move(result));
        }

        static Response failure(const nlohmann::json &id, Error error) {
            return failure(std::optional<nlohmann::json>(id), std::move(error));
        }

        bool is_error() const { return error.has_value(); }
    };

    using Message = std::variant<Notification, Request, Response>;

    /**
     * @brief Decodes one JSON-RPC message from text.
     * A message with a method and a non-null id is a Request; a method without
     * id (or with a null id) is a Notification; result/error without method is
     * a Response.
     * @return Pair containing:
     *         - std::optional<Message>: the decoded message if decoding succeeded
     *         - std::optional<Error>: why decoding failed (nullopt otherwise)
     */
    std::pair<std::optional<Message>, std::optional<Error>> decode_message(const std::string &text);

    /**
     * @brief Converts a message into its JSON-RPC 2.0 wire object.
     */
    nlohmann::json to_json(const Message &message);

    /**
     * @brief Serializes a message into a compact JSON-RPC 2.0 string.
     */
    std::string encode(const Message &message);

    // Accessors shared by every message flavour. Response has no method.
    const std::string &method_of(const Message &message);
    const nlohmann::json &params_of(const Message &message);
    std::optional<nlohmann::json> correlation_id(const Message &message);

    Notification make_notification(std::string method, nlohmann::json params = nlohmann::json::object());

    /**
     * @brief Error envelope used at the transport boundary when the inbound
     * body cannot be decoded: code -32603 and a null id.
     */
    std::string make_internal_error(const std::string &detail);

}// namespace pushhub::protocol
