#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Handler Registry
// ═══════════════════════════════════════════════════════════════════════════
// Method name -> handler. Filled before the server starts, then frozen; after
// that it is only read, so dispatch threads share it without locking.
//
// A handler returns its result or a JsonRpcError. It may also throw:
//   InvalidParamsError  -> -32602
//   HandlerError        -> its own code (default -32000) and optional data
//   std::exception      -> -32000 with what() as the message

#include "devflow/protocol/json_rpc.hpp"

#include <tl/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace devflow {

using HandlerResult = tl::expected<Json, JsonRpcError>;
using MethodHandler = std::function<HandlerResult(const Json& params)>;

class HandlerError : public std::runtime_error {
public:
    explicit HandlerError(const std::string& message,
                          std::int64_t code = rpc_error::kHandlerError,
                          std::optional<Json> data = std::nullopt)
        : std::runtime_error(message)
        , code_(code)
        , data_(std::move(data))
    {}

    [[nodiscard]] std::int64_t code() const noexcept { return code_; }
    [[nodiscard]] const std::optional<Json>& data() const noexcept { return data_; }

private:
    std::int64_t code_;
    std::optional<Json> data_;
};

class InvalidParamsError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// ─────────────────────────────────────────────────────────────────────────────
// Server errors
// ─────────────────────────────────────────────────────────────────────────────

struct ServerError {
    enum class Code {
        DuplicateMethod,
        InvalidMethodName,
        RegistryFrozen,
        AlreadyRunning,
        BindFailed,
        UnsupportedTransport,
        Stopped
    };

    Code code;
    std::string message;

    [[nodiscard]] static ServerError duplicate_method(std::string_view name) {
        return {Code::DuplicateMethod, "Method already registered: " + std::string(name)};
    }

    [[nodiscard]] static ServerError invalid_method_name(std::string_view name) {
        return {Code::InvalidMethodName, "Invalid method name: '" + std::string(name) + "'"};
    }

    [[nodiscard]] static ServerError registry_frozen(std::string_view name) {
        return {Code::RegistryFrozen, "Cannot register '" + std::string(name) + "' after the server started"};
    }

    [[nodiscard]] static ServerError already_running() {
        return {Code::AlreadyRunning, "Server is already running"};
    }

    [[nodiscard]] static ServerError bind_failed(std::string msg) {
        return {Code::BindFailed, std::move(msg)};
    }

    [[nodiscard]] static ServerError unsupported_transport(std::string msg) {
        return {Code::UnsupportedTransport, std::move(msg)};
    }

    [[nodiscard]] static ServerError stopped() {
        return {Code::Stopped, "Server was stopped and cannot be restarted"};
    }
};

template <typename T>
using ServerResult = tl::expected<T, ServerError>;

// ─────────────────────────────────────────────────────────────────────────────
// HandlerRegistry
// ─────────────────────────────────────────────────────────────────────────────

class HandlerRegistry {
public:
    using Entry = std::pair<std::string, MethodHandler>;

    /// Rejects empty names, null handlers, duplicates, and any change once frozen.
    ServerResult<void> add(std::string name, MethodHandler handler);

    /// Registers "prefix.name" for each entry. Nothing is registered if any
    /// entry would be rejected.
    ServerResult<void> add_group(std::string_view prefix, std::vector<Entry> methods);

    [[nodiscard]] const MethodHandler* find(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] std::size_t size() const noexcept { return handlers_.size(); }

    /// Registered names in sorted order.
    [[nodiscard]] std::vector<std::string> names() const;

    void freeze() noexcept { frozen_ = true; }
    [[nodiscard]] bool frozen() const noexcept { return frozen_; }

private:
    [[nodiscard]] ServerResult<void> check(std::string_view name, const MethodHandler& handler) const;

    std::map<std::string, MethodHandler, std::less<>> handlers_;
    bool frozen_{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// Parameter helpers for handlers
// ─────────────────────────────────────────────────────────────────────────────

/// Named parameter `key` converted to T. Throws InvalidParamsError when the
/// parameter is missing or has the wrong type.
template <typename T>
[[nodiscard]] T require_param(const Json& params, std::string_view key) {
    if (params.is_object() == false) {
        throw InvalidParamsError("params must be an object");
    }
    const auto it = params.find(std::string(key));
    if (it == params.end()) {
        throw InvalidParamsError("missing parameter '" + std::string(key) + "'");
    }
    try {
        return it->template get<T>();
    } catch (const nlohmann::json::exception&) {
        throw InvalidParamsError("parameter '" + std::string(key) + "' has the wrong type");
    }
}

template <typename T>
[[nodiscard]] T optional_param(const Json& params, std::string_view key, T fallback) {
    if (params.is_object() == false) {
        return fallback;
    }
    const auto it = params.find(std::string(key));
    if (it == params.end() || it->is_null()) {
        return fallback;
    }
    return require_param<T>(params, key);
}

}  // namespace devflow
