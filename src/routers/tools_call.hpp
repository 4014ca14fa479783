#pragma once
#include "business/rpc_router.h"
#include "core/logger.h"
#include "protocol/json_rpc.h"
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace pushhub::routers {

    /**
     * @brief Render a command result as the text of a tool reply.
     * Integral numbers print without a fractional part; strings print bare.
     */
    inline std::string format_result_text(const nlohmann::json &value) {
        if (value.is_number_float()) {
            double d = value.get<double>();
            if (std::isfinite(d) && std::trunc(d) == d && std::fabs(d) < 1e15) {
                return fmt::format("{}", static_cast<long long>(d));
            }
            return fmt::format("{}", d);
        }
        if (value.is_string()) {
            return value.get<std::string>();
        }
        return value.dump();
    }

    inline nlohmann::json make_tool_reply(const std::string &text, bool is_error) {
        return nlohmann::json{
                {"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})},
                {"isError", is_error}};
    }

    /**
     * @brief Handle tool call request
     * Command failures are not protocol errors, whether reported or thrown
     * by the handler: they come back as a successful response whose result
     * has isError set.
     */
    inline protocol::Response handle_tools_call(
            const protocol::Message &msg,
            business::DispatchContext &context) {
        const auto &params = protocol::params_of(msg);

        if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
            return protocol::Response::success(std::nullopt, make_tool_reply("Error: Missing tool name", true));
        }
        std::string tool_name = params["name"].get<std::string>();
        nlohmann::json arguments = params.value("arguments", nlohmann::json::object());
        if (arguments.is_null()) {
            arguments = nlohmann::json::object();
        }

        PUSHHUB_INFO("Calling tool {} with arguments {}", tool_name, arguments.dump());
        business::InvokeResult outcome;
        try {
            outcome = context.commands->invoke(tool_name, arguments);
        } catch (const std::exception &e) {
            outcome = business::InvokeResult::failure(e.what());
        }
        if (!outcome.ok()) {
            PUSHHUB_WARN("Tool {} failed: {}", tool_name, *outcome.error);
            return protocol::Response::success(std::nullopt, make_tool_reply("Error: " + *outcome.error, true));
        }
        return protocol::Response::success(std::nullopt, make_tool_reply(format_result_text(outcome.value), false));
    }
}// namespace pushhub::routers
