#include "devflow/protocol/json_rpc.hpp"

#include <limits>

namespace devflow {
namespace {

JsonResult<void> check_version(const Json& payload) {
    const bool has_version_field = payload.contains("jsonrpc");
    if (has_version_field == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing jsonrpc version field"});
    }
    const Json& version_node = payload.at("jsonrpc");
    if ((version_node.is_string() == false)
        || (version_node.get_ref<const std::string&>() != kJsonRpcVersion)) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidVersion,
            "jsonrpc must equal \"2.0\""});
    }
    return {};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcId JsonRpcId::integer(std::int64_t value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::string(std::string value) {
    return JsonRpcId{std::move(value)};
}

Json JsonRpcId::to_json() const {
    return std::visit([](const auto& id_value) { return Json(id_value); }, value);
}

JsonResult<JsonRpcId> JsonRpcId::from_json(const Json& node) {
    if (node.is_number_unsigned() == true
        && node.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidId,
            "id is out of range"});
    }
    if (node.is_number_integer() == true) {
        return JsonRpcId::integer(node.get<std::int64_t>());
    }
    if (node.is_string() == true) {
        return JsonRpcId::string(node.get<std::string>());
    }
    return tl::unexpected(JsonError{
        JsonError::Code::InvalidId,
        "id must be an integer or string"});
}

std::string JsonRpcId::to_string() const {
    if (const auto* number = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*number);
    }
    return "\"" + std::get<std::string>(value) + "\"";
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcError
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcError::to_json() const {
    Json payload;
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

JsonResult<JsonRpcError> JsonRpcError::from_json(const Json& node) {
    if (node.is_object() == false) {
        return tl::unexpected(JsonError{JsonError::Code::NotAnObject, "error must be an object"});
    }
    const auto code_it = node.find("code");
    const auto message_it = node.find("message");
    if (code_it == node.end() || code_it->is_number_integer() == false) {
        return tl::unexpected(JsonError{JsonError::Code::InvalidShape, "error.code must be an integer"});
    }
    if (message_it == node.end() || message_it->is_string() == false) {
        return tl::unexpected(JsonError{JsonError::Code::InvalidShape, "error.message must be a string"});
    }

    JsonRpcError error{code_it->get<std::int64_t>(), message_it->get<std::string>(), std::nullopt};
    if (const auto data_it = node.find("data"); data_it != node.end()) {
        error.data = *data_it;
    }
    return error;
}

JsonRpcError JsonRpcError::parse_error(std::string detail) {
    return {rpc_error::kParseError, detail.empty() ? "Parse error" : "Parse error: " + detail, std::nullopt};
}

JsonRpcError JsonRpcError::invalid_request(std::string detail) {
    return {rpc_error::kInvalidRequest, "Invalid Request: " + detail, std::nullopt};
}

JsonRpcError JsonRpcError::method_not_found(std::string_view method) {
    return {rpc_error::kMethodNotFound, "Method not found: " + std::string(method), std::nullopt};
}

JsonRpcError JsonRpcError::invalid_params(std::string detail) {
    return {rpc_error::kInvalidParams, "Invalid params: " + detail, std::nullopt};
}

JsonRpcError JsonRpcError::internal_error(std::string detail) {
    return {rpc_error::kInternalError, "Internal error: " + detail, std::nullopt};
}

JsonRpcError JsonRpcError::handler_error(std::string message, std::optional<Json> data) {
    return {rpc_error::kHandlerError, std::move(message), std::move(data)};
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest::JsonRpcRequest(std::string method,
                               std::int64_t id,
                               std::optional<Json> params)
    : JsonRpcRequest(std::move(method), JsonRpcId::integer(id), std::move(params)) {}

JsonRpcRequest::JsonRpcRequest(std::string method,
                               std::string id,
                               std::optional<Json> params)
    : JsonRpcRequest(std::move(method), JsonRpcId::string(std::move(id)), std::move(params)) {}

JsonRpcRequest::JsonRpcRequest(std::string method,
                               JsonRpcId id,
                               std::optional<Json> params)
    : method_(std::move(method)),
      id_(std::move(id)),
      params_(std::move(params)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const JsonRpcId& JsonRpcRequest::id() const noexcept {
    return id_;
}

const std::optional<Json>& JsonRpcRequest::params() const noexcept {
    return params_;
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_.to_json();
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

JsonResult<JsonRpcRequest> JsonRpcRequest::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::NotAnObject,
            "request must be a JSON object"});
    }

    if (auto version = check_version(payload); !version) {
        return tl::unexpected(version.error());
    }

    const auto method_it = payload.find("method");
    if (method_it == payload.end()) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing method field"});
    }
    if (method_it->is_string() == false || method_it->get_ref<const std::string&>().empty()) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidMethod,
            "method must be a non-empty string"});
    }

    const auto id_it = payload.find("id");
    if (id_it == payload.end()) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing id field"});
    }
    auto parsed_id = JsonRpcId::from_json(*id_it);
    if (parsed_id.has_value() == false) {
        return tl::unexpected(parsed_id.error());
    }

    std::optional<Json> parsed_params;
    if (const auto params_it = payload.find("params"); params_it != payload.end()) {
        const bool params_are_valid = params_it->is_object() || params_it->is_array();
        if (params_it->is_null() == false) {
            if (params_are_valid == false) {
                return tl::unexpected(JsonError{
                    JsonError::Code::InvalidParams,
                    "params must be an object or array"});
            }
            parsed_params = *params_it;
        }
    }

    return JsonRpcRequest(
        method_it->get<std::string>(),
        std::move(*parsed_id),
        std::move(parsed_params));
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcResponse
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcResponse::JsonRpcResponse(std::optional<JsonRpcId> id, Json result, std::optional<JsonRpcError> error)
    : id_(std::move(id)),
      result_(std::move(result)),
      error_(std::move(error)) {}

JsonRpcResponse JsonRpcResponse::success(std::optional<JsonRpcId> id, Json result) {
    return JsonRpcResponse(std::move(id), std::move(result), std::nullopt);
}

JsonRpcResponse JsonRpcResponse::failure(std::optional<JsonRpcId> id, JsonRpcError error) {
    return JsonRpcResponse(std::move(id), Json{}, std::move(error));
}

Json JsonRpcResponse::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_.has_value() ? id_->to_json() : Json(nullptr);
    if (error_.has_value()) {
        payload["error"] = error_->to_json();
    } else {
        payload["result"] = result_;
    }
    return payload;
}

JsonResult<JsonRpcResponse> JsonRpcResponse::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::NotAnObject,
            "response must be a JSON object"});
    }
    if (auto version = check_version(payload); !version) {
        return tl::unexpected(version.error());
    }

    const auto id_it = payload.find("id");
    if (id_it == payload.end()) {
        return tl::unexpected(JsonError{JsonError::Code::MissingField, "missing id field"});
    }
    std::optional<JsonRpcId> id;
    if (id_it->is_null() == false) {
        auto parsed_id = JsonRpcId::from_json(*id_it);
        if (!parsed_id) {
            return tl::unexpected(parsed_id.error());
        }
        id = std::move(*parsed_id);
    }

    const bool has_result = payload.contains("result");
    const bool has_error = payload.contains("error");
    if (has_result == has_error) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidShape,
            "response must carry exactly one of result or error"});
    }

    if (has_error) {
        auto error = JsonRpcError::from_json(payload.at("error"));
        if (!error) {
            return tl::unexpected(error.error());
        }
        return failure(std::move(id), std::move(*error));
    }
    return success(std::move(id), payload.at("result"));
}

}  // namespace devflow
