#include "devflow/server/handler_registry.hpp"
#include "devflow/log/logger.hpp"

#include <set>

namespace devflow {

ServerResult<void> HandlerRegistry::check(std::string_view name, const MethodHandler& handler) const {
    if (frozen_) {
        return tl::unexpected(ServerError::registry_frozen(name));
    }
    if (name.empty() || name.front() == '.' || name.back() == '.') {
        return tl::unexpected(ServerError::invalid_method_name(name));
    }
    if (!handler) {
        return tl::unexpected(ServerError{ServerError::Code::InvalidMethodName,
                                          "Handler for '" + std::string(name) + "' is empty"});
    }
    if (handlers_.find(name) != handlers_.end()) {
        return tl::unexpected(ServerError::duplicate_method(name));
    }
    return {};
}

ServerResult<void> HandlerRegistry::add(std::string name, MethodHandler handler) {
    if (auto ok = check(name, handler); !ok) {
        DEVFLOW_LOG_WARN("Rejected handler registration: {}", ok.error().message);
        return ok;
    }
    DEVFLOW_LOG_DEBUG("Registered handler: {}", name);
    handlers_.emplace(std::move(name), std::move(handler));
    return {};
}

ServerResult<void> HandlerRegistry::add_group(std::string_view prefix, std::vector<Entry> methods) {
    std::set<std::string, std::less<>> seen;
    for (auto& [name, handler] : methods) {
        name = prefix.empty() ? name : std::string(prefix) + "." + name;
        if (auto ok = check(name, handler); !ok) {
            return ok;
        }
        if (seen.insert(name).second == false) {
            return tl::unexpected(ServerError::duplicate_method(name));
        }
    }
    for (auto& [name, handler] : methods) {
        DEVFLOW_LOG_DEBUG("Registered handler: {}", name);
        handlers_.emplace(std::move(name), std::move(handler));
    }
    return {};
}

const MethodHandler* HandlerRegistry::find(std::string_view name) const {
    const auto it = handlers_.find(name);
    return (it == handlers_.end()) ? nullptr : &it->second;
}

bool HandlerRegistry::contains(std::string_view name) const {
    return handlers_.find(name) != handlers_.end();
}

std::vector<std::string> HandlerRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) {
        out.push_back(name);
    }
    return out;
}

}  // namespace devflow
