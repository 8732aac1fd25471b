#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <tl/expected.hpp>

namespace devflow {

using Json = nlohmann::json;

inline constexpr std::string_view kJsonRpcVersion{"2.0"};

// ─────────────────────────────────────────────────────────────────────────────
// Error codes
// ─────────────────────────────────────────────────────────────────────────────

namespace rpc_error {
inline constexpr std::int64_t kParseError     = -32700;
inline constexpr std::int64_t kInvalidRequest = -32600;
inline constexpr std::int64_t kMethodNotFound = -32601;
inline constexpr std::int64_t kInvalidParams  = -32602;
inline constexpr std::int64_t kInternalError  = -32603;
inline constexpr std::int64_t kHandlerError   = -32000;
}  // namespace rpc_error

struct JsonError {
    enum class Code {
        NotAnObject,
        InvalidVersion,
        MissingField,
        InvalidId,
        InvalidMethod,
        InvalidParams,
        InvalidShape
    };

    Code code{Code::InvalidShape};
    std::string message;
};

template <typename T>
using JsonResult = tl::expected<T, JsonError>;

// ─────────────────────────────────────────────────────────────────────────────
// Request id
// ─────────────────────────────────────────────────────────────────────────────

struct JsonRpcId {
    std::variant<std::int64_t, std::string> value;

    static JsonRpcId integer(std::int64_t v);
    static JsonRpcId string(std::string v);

    [[nodiscard]] Json to_json() const;
    [[nodiscard]] static JsonResult<JsonRpcId> from_json(const Json& node);

    [[nodiscard]] std::string to_string() const;

    bool operator==(const JsonRpcId&) const = default;
};

// ─────────────────────────────────────────────────────────────────────────────
// Error object
// ─────────────────────────────────────────────────────────────────────────────

struct JsonRpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
    [[nodiscard]] static JsonResult<JsonRpcError> from_json(const Json& node);

    [[nodiscard]] static JsonRpcError parse_error(std::string detail = {});
    [[nodiscard]] static JsonRpcError invalid_request(std::string detail);
    [[nodiscard]] static JsonRpcError method_not_found(std::string_view method);
    [[nodiscard]] static JsonRpcError invalid_params(std::string detail);
    [[nodiscard]] static JsonRpcError internal_error(std::string detail);
    [[nodiscard]] static JsonRpcError handler_error(std::string message, std::optional<Json> data = std::nullopt);
};

// ─────────────────────────────────────────────────────────────────────────────
// Request
// ─────────────────────────────────────────────────────────────────────────────

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, std::int64_t id, std::optional<Json> params = std::nullopt);
    JsonRpcRequest(std::string method, std::string id, std::optional<Json> params = std::nullopt);
    JsonRpcRequest(std::string method, JsonRpcId id, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const JsonRpcId& id() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;

    /// Validates the envelope: object, "jsonrpc" == "2.0", string "method",
    /// integer or string "id", and "params" absent, null, object or array.
    /// A null "params" is treated as absent.
    static JsonResult<JsonRpcRequest> from_json(const Json& payload);

private:
    std::string method_;
    JsonRpcId id_;
    std::optional<Json> params_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Response
// ─────────────────────────────────────────────────────────────────────────────

class JsonRpcResponse {
public:
    /// `id` is empty only when the request id could not be read (parse errors).
    [[nodiscard]] static JsonRpcResponse success(std::optional<JsonRpcId> id, Json result);
    [[nodiscard]] static JsonRpcResponse failure(std::optional<JsonRpcId> id, JsonRpcError error);

    [[nodiscard]] const std::optional<JsonRpcId>& id() const noexcept { return id_; }
    [[nodiscard]] bool is_error() const noexcept { return error_.has_value(); }
    [[nodiscard]] const Json& result() const noexcept { return result_; }
    [[nodiscard]] const std::optional<JsonRpcError>& error() const noexcept { return error_; }

    [[nodiscard]] Json to_json() const;

    /// Requires exactly one of "result" / "error".
    static JsonResult<JsonRpcResponse> from_json(const Json& payload);

private:
    JsonRpcResponse(std::optional<JsonRpcId> id, Json result, std::optional<JsonRpcError> error);

    std::optional<JsonRpcId> id_;
    Json result_;
    std::optional<JsonRpcError> error_;
};

}  // namespace devflow
