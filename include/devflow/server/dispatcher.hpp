#pragma once

#include "devflow/protocol/json_rpc.hpp"
#include "devflow/server/handler_registry.hpp"
#include "devflow/transport.hpp"

#include <string>
#include <variant>

namespace devflow {

/// A validated request bound to its handler, ready to run.
struct PreparedCall {
    JsonRpcId id;
    std::string method;
    Json params;
    const MethodHandler* handler{nullptr};
};

// ─────────────────────────────────────────────────────────────────────────────
// Dispatcher
// ─────────────────────────────────────────────────────────────────────────────
// Turns one decoded frame into a response. Split in two so the server can
// answer protocol errors immediately and run handlers elsewhere:
//
//   auto step = dispatcher.prepare(frame);
//   if (auto* ready = std::get_if<JsonRpcResponse>(&step)) send(*ready);
//   else send(Dispatcher::invoke(std::get<PreparedCall>(step)));

class Dispatcher {
public:
    explicit Dispatcher(const HandlerRegistry& registry) noexcept
        : registry_(registry)
    {}

    /// Envelope validation and method lookup. Missing or null params become {}.
    [[nodiscard]] std::variant<JsonRpcResponse, PreparedCall> prepare(const Json& frame) const;

    /// Run the handler, converting thrown exceptions to error responses.
    [[nodiscard]] static JsonRpcResponse invoke(const PreparedCall& call);

    /// prepare() + invoke() on the calling thread.
    [[nodiscard]] JsonRpcResponse dispatch(const Json& frame) const;

    /// Response for a frame that could not be decoded.
    [[nodiscard]] static JsonRpcResponse parse_failure(const TransportError& error);

private:
    const HandlerRegistry& registry_;
};

}  // namespace devflow
