#include "devflow/server/dispatcher.hpp"
#include "devflow/log/logger.hpp"

namespace devflow {

namespace {

// Best effort: the id of a request that failed validation, so the caller can
// still correlate the error.
std::optional<JsonRpcId> salvage_id(const Json& frame) {
    if (frame.is_object() == false) {
        return std::nullopt;
    }
    const auto it = frame.find("id");
    if (it == frame.end()) {
        return std::nullopt;
    }
    auto id = JsonRpcId::from_json(*it);
    if (!id) {
        return std::nullopt;
    }
    return std::move(*id);
}

// nlohmann messages start with "[json.exception.type_error.302] ".
std::string strip_json_exception_prefix(const std::string& what) {
    if (what.starts_with("[json.exception.")) {
        const auto end = what.find("] ");
        if (end != std::string::npos) {
            return what.substr(end + 2);
        }
    }
    return what;
}

}  // namespace

std::variant<JsonRpcResponse, PreparedCall> Dispatcher::prepare(const Json& frame) const {
    if (frame.is_array()) {
        return JsonRpcResponse::failure(std::nullopt,
                                        JsonRpcError::invalid_request("batch requests are not supported"));
    }

    auto request = JsonRpcRequest::from_json(frame);
    if (!request) {
        return JsonRpcResponse::failure(salvage_id(frame),
                                        JsonRpcError::invalid_request(request.error().message));
    }

    const MethodHandler* handler = registry_.find(request->method());
    if (handler == nullptr) {
        DEVFLOW_LOG_DEBUG("Unknown method {} (id {})", request->method(), request->id().to_string());
        return JsonRpcResponse::failure(request->id(), JsonRpcError::method_not_found(request->method()));
    }

    return PreparedCall{
        request->id(),
        request->method(),
        request->params().value_or(Json::object()),
        handler
    };
}

JsonRpcResponse Dispatcher::invoke(const PreparedCall& call) {
    try {
        HandlerResult outcome = (*call.handler)(call.params);
        if (outcome) {
            return JsonRpcResponse::success(call.id, std::move(*outcome));
        }
        return JsonRpcResponse::failure(call.id, std::move(outcome.error()));
    } catch (const InvalidParamsError& e) {
        return JsonRpcResponse::failure(call.id, JsonRpcError::invalid_params(e.what()));
    } catch (const HandlerError& e) {
        DEVFLOW_LOG_WARN("Handler {} failed: {}", call.method, e.what());
        return JsonRpcResponse::failure(call.id, JsonRpcError{e.code(), e.what(), e.data()});
    } catch (const std::exception& e) {
        // Includes JSON errors raised by the handler's own data; parameter
        // problems arrive as InvalidParamsError above.
        DEVFLOW_LOG_ERROR("Handler {} threw: {}", call.method, e.what());
        return JsonRpcResponse::failure(call.id, JsonRpcError::handler_error(strip_json_exception_prefix(e.what())));
    } catch (...) {
        DEVFLOW_LOG_ERROR("Handler {} threw a non-standard exception", call.method);
        return JsonRpcResponse::failure(call.id, JsonRpcError::handler_error("Handler failed"));
    }
}

JsonRpcResponse Dispatcher::dispatch(const Json& frame) const {
    auto step = prepare(frame);
    if (auto* ready = std::get_if<JsonRpcResponse>(&step)) {
        return std::move(*ready);
    }
    return invoke(std::get<PreparedCall>(step));
}

JsonRpcResponse Dispatcher::parse_failure(const TransportError& error) {
    return JsonRpcResponse::failure(std::nullopt, JsonRpcError::parse_error(error.message));
}

}  // namespace devflow
