#pragma once

#include "../core_context.hpp"

#include <string>

namespace fsagent::actions {

/// Decodes one request line, runs its handler and reports any failure as the
/// terminal error for the request. Never throws for a bad request.
void handle_line(const std::string& line, AgentContext& context);

/// Number of methods in the catalogue.
std::size_t method_count();

} // namespace fsagent::actions
