#include "action_registry.hpp"

#include <stdexcept>

namespace fsagent::actions {

void ActionRegistry::add(std::unique_ptr<ActionHandler> handler) {
    if (!handler) {
        return;
    }
    std::string method = handler->name();
    if (!handlers_.emplace(method, std::move(handler)).second) {
        throw std::logic_error("duplicate action handler: " + method);
    }
}

ActionHandler* ActionRegistry::find(const std::string& method) const {
    auto it = handlers_.find(method);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return it->second.get();
}

} // namespace fsagent::actions
