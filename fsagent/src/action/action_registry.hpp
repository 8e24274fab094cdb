#pragma once

#include "action_base.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace fsagent::actions {

class ActionRegistry {
public:
    /// Throws std::logic_error if a handler with the same name is present.
    void add(std::unique_ptr<ActionHandler> handler);
    ActionHandler* find(const std::string& method) const;
    std::size_t size() const { return handlers_.size(); }

private:
    std::unordered_map<std::string, std::unique_ptr<ActionHandler>> handlers_;
};

void register_file_actions(ActionRegistry& registry);
void register_process_actions(ActionRegistry& registry);

} // namespace fsagent::actions
