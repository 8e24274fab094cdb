#pragma once

#include "../core_context.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace fsagent::actions {

struct ActionContext {
	int64_t id;
	const std::string& method;
	AgentContext& context;
	const nlohmann::json& params;
};

/**
 * One protocol method.
 *
 * handle() sends its own data messages and its terminal result through
 * ctx.context.writer. Failures are thrown; the dispatcher turns them into
 * the terminal error for ctx.id. A handler that starts background work (exec)
 * may return without a terminal message; the background task sends it.
 */
class ActionHandler {
public:
	virtual ~ActionHandler() = default;
	virtual const char* name() const = 0;
	virtual void handle(ActionContext& ctx) = 0;

protected:
	/// Resolves the path parameter `key` through the agent's PathResolver.
	std::filesystem::path resolve_path(const ActionContext& ctx, const std::string& key) const;
	void send_result(const ActionContext& ctx, const nlohmann::json& result) const;
	void send_data(const ActionContext& ctx, const nlohmann::json& data) const;
};

} // namespace fsagent::actions
