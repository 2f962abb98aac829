#include "mcpc/protocol/json_rpc.hpp"

#include <charconv>
#include <format>

namespace mcpc {

MessageType classify_message(const Json& message) {
    if (message.is_object() == false) {
        return MessageType::Invalid;
    }

    const bool has_method = message.contains("method") && message["method"].is_string();
    const bool has_id = message.contains("id") && (message["id"].is_null() == false);

    if (has_method) {
        return has_id ? MessageType::Request : MessageType::Notification;
    }
    if (has_id && (message.contains("result") || message.contains("error"))) {
        return MessageType::Response;
    }
    // Error responses to unparseable requests carry "id": null.
    if (message.contains("error") && message.contains("id")) {
        return MessageType::Response;
    }
    return MessageType::Invalid;
}

Json make_request(std::int64_t id, std::string_view method, std::optional<Json> params) {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id;
    payload["method"] = method;
    if (params.has_value()) {
        payload["params"] = std::move(*params);
    }
    return payload;
}

Json make_notification(std::string_view method, std::optional<Json> params) {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method;
    if (params.has_value()) {
        payload["params"] = std::move(*params);
    }
    return payload;
}

Json make_error_response(const Json& id, int code, std::string_view message) {
    return Json{
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

std::optional<std::int64_t> message_id(const Json& message) {
    if (message.is_object() == false || message.contains("id") == false) {
        return std::nullopt;
    }
    const auto& id = message["id"];
    if (id.is_number_integer()) {
        return id.get<std::int64_t>();
    }
    if (id.is_string()) {
        const auto& text = id.get_ref<const std::string&>();
        std::int64_t value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{} && ptr == text.data() + text.size()) {
            return value;
        }
    }
    return std::nullopt;
}

Result<Json> extract_result(const Json& response) {
    if (response.contains("error")) {
        const auto& err = response["error"];
        if (err.is_object() == false) {
            return tl::unexpected(Error::protocol("Malformed error member in response")
                                      .with_evidence(excerpt(response.dump())));
        }
        const int code = err.value("code", rpc_code::kInternalError);
        const std::string text = err.value("message", std::string{"Unknown server error"});
        auto error = Error::rpc(code, std::format("Server returned error {}: {}", code, text));
        if (err.contains("data")) {
            error.evidence = excerpt(err["data"].dump());
        }
        return tl::unexpected(std::move(error));
    }
    if (response.contains("result") == false) {
        return tl::unexpected(Error::protocol("Response has neither result nor error")
                                  .with_evidence(excerpt(response.dump())));
    }
    return response["result"];
}

std::string_view message_method(const Json& message) {
    if (message.is_object() && message.contains("method") && message["method"].is_string()) {
        return message["method"].get_ref<const std::string&>();
    }
    return {};
}

}  // namespace mcpc
