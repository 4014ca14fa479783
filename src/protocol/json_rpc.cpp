#include "json_rpc.h"
#include <string>

namespace pushhub::protocol {

    // ==================== Helper Functions ====================
    namespace {
        nlohmann::json error_to_json(const Error &err) {
            nlohmann::json error_obj{{"code", err.code}, {"message", err.message}};
            if (err.data.has_value()) {
                error_obj["data"] = err.data.value();
            }
            return error_obj;
        }

        // nullopt unless j is {"code": integer, "message"?: string, "data"?: any}
        std::optional<Error> error_from_json(const nlohmann::json &j) {
            if (!j.is_object() || !j.contains("code") || !j["code"].is_number_integer()) {
                return std::nullopt;
            }
            if (j.contains("message") && !j["message"].is_string()) {
                return std::nullopt;
            }
            Error err{j["code"].get<int>(), j.contains("message") ? j["message"].get<std::string>() : std::string{}};
            if (j.contains("data")) {
                err.data = j["data"];
            }
            return err;
        }

        const nlohmann::json &empty_params() {
            static const nlohmann::json empty = nlohmann::json::object();
            return empty;
        }
    }// namespace

    // ==================== decode_message implementation ====================
    std::pair<std::optional<Message>, std::optional<Error>> decode_message(const std::string &text) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error &e) {
            return {std::nullopt,
                    Error{error_code::PARSE_ERROR,
                          "Parse error: " + std::string(e.what()),
                          nlohmann::json{{"byte", e.byte}}}};
        }

        if (!j.is_object()) {
            return {std::nullopt, Error{error_code::INVALID_REQUEST, "Message must be a JSON object"}};
        }

        std::optional<nlohmann::json> id;
        if (j.contains("id") && !j["id"].is_null()) {
            const auto &raw_id = j["id"];
            if (!raw_id.is_number() && !raw_id.is_string()) {
                return {std::nullopt,
                        Error{error_code::INVALID_REQUEST,
                              "'id' must be number, string, or null",
                              nlohmann::json{{"received_type", raw_id.type_name()}}}};
            }
            id = raw_id;
        }

        if (!j.contains("method")) {
            bool has_result = j.contains("result");
            bool has_error = j.contains("error");
            if (has_result == has_error) {
                return {std::nullopt,
                        Error{error_code::INVALID_REQUEST, "Message has neither 'method' nor exactly one of 'result'/'error'"}};
            }
            Response resp;
            resp.id = id;
            if (has_result) {
                resp.result = j["result"];
            } else {
                resp.error = error_from_json(j["error"]);
                if (!resp.error.has_value()) {
                    return {std::nullopt,
                            Error{error_code::INVALID_REQUEST, "'error' must be an object with an integer 'code' and a string 'message'"}};
                }
            }
            return {Message{std::move(resp)}, std::nullopt};
        }

        if (!j["method"].is_string()) {
            return {std::nullopt, Error{error_code::INVALID_REQUEST, "'method' must be a string"}};
        }

        nlohmann::json params = j.value("params", nlohmann::json::object());
        if (params.is_null()) {
            params = nlohmann::json::object();
        }
        if (!params.is_object() && !params.is_array()) {
            return {std::nullopt, Error{error_code::INVALID_REQUEST, "'params' must be an object or an array"}};
        }

        std::string method = j["method"].get<std::string>();
        if (id.has_value()) {
            return {Message{Request{std::move(method), std::move(params), std::move(*id)}}, std::nullopt};
        }
        return {Message{Notification{std::move(method), std::move(params)}}, std::nullopt};
    }

    // ==================== encoding ====================
    nlohmann::json to_json(const Message &message) {
        nlohmann::json j;
        j["jsonrpc"] = JSONRPC_VERSION;

        if (const auto *note = std::get_if<Notification>(&message)) {
            j["method"] = note->method;
            if (!note->params.is_null() && !note->params.empty()) {
                j["params"] = note->params;
            }
        } else if (const auto *req = std::get_if<Request>(&message)) {
            j["id"] = req->id;
            j["method"] = req->method;
            if (!req->params.is_null() && !req->params.empty()) {
                j["params"] = req->params;
            }
        } else {
            const auto &resp = std::get<Response>(message);
            if (resp.id.has_value()) {
                j["id"] = resp.id.value();
            }
            if (resp.error.has_value()) {
                j["error"] = error_to_json(resp.error.value());
            } else {
                j["result"] = resp.result.is_null() ? nlohmann::json::object() : resp.result;
            }
        }
        return j;
    }

    std::string encode(const Message &message) {
        return to_json(message).dump();
    }

    // ==================== accessors ====================
    const std::string &method_of(const Message &message) {
        static const std::string no_method;
        if (const auto *note = std::get_if<Notification>(&message)) {
            return note->method;
        }
        if (const auto *req = std::get_if<Request>(&message)) {
            return req->method;
        }
        return no_method;
    }

    const nlohmann::json &params_of(const Message &message) {
        if (const auto *note = std::get_if<Notification>(&message)) {
            return note->params;
        }
        if (const auto *req = std::get_if<Request>(&message)) {
            return req->params;
        }
        return empty_params();
    }

    std::optional<nlohmann::json> correlation_id(const Message &message) {
        if (const auto *req = std::get_if<Request>(&message)) {
            return req->id;
        }
        if (const auto *resp = std::get_if<Response>(&message)) {
            return resp->id;
        }
        return std::nullopt;
    }

    Notification make_notification(std::string method, nlohmann::json params) {
        return Notification{std::move(method), std::move(params)};
    }

    std::string make_internal_error(const std::string &detail) {
        nlohmann::json j;
        j["jsonrpc"] = JSONRPC_VERSION;
        j["error"] = error_to_json(Error{error_code::INTERNAL_ERROR, "Internal error: " + detail});
        j["id"] = nullptr;
        return j.dump();
    }

}// namespace pushhub::protocol
