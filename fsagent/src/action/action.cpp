#include "action.hpp"

#include "action_base.hpp"
#include "action_registry.hpp"

#include "../agent_error.hpp"
#include "../json_codec.hpp"
#include "../logger.hpp"

#include <filesystem>
#include <system_error>

#include <log4cplus/loggingmacros.h>

namespace fsagent::actions {

namespace {

const ActionRegistry& get_registry() {
	static const ActionRegistry registry = [] {
		ActionRegistry reg;
		register_file_actions(reg);
		register_process_actions(reg);
		return reg;
	}();

	return registry;
}

// Distinct prefixes let the peer tell causes apart without error codes.
std::string describe_os_error(const std::error_code& ec, const std::string& detail) {
	if (ec == std::errc::no_such_file_or_directory) {
		return "not found: " + detail;
	}
	if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
		return "permission denied: " + detail;
	}
	if (ec == std::errc::is_a_directory) {
		return "is a directory: " + detail;
	}
	if (ec == std::errc::not_a_directory) {
		return "not a directory: " + detail;
	}
	return "os error: " + detail;
}

std::string describe_filesystem_error(const std::filesystem::filesystem_error& exc) {
	std::string detail = exc.code().message();
	if (!exc.path1().empty()) {
		detail += ": " + exc.path1().string();
	}
	if (!exc.path2().empty()) {
		detail += " -> " + exc.path2().string();
	}
	return describe_os_error(exc.code(), detail);
}

void run_handler(ActionHandler& handler, ActionContext& ctx) {
	try {
		handler.handle(ctx);
	} catch (const ValidationError& exc) {
		LOG4CPLUS_WARN(agent_logger(), ctx.method << " id=" << ctx.id << ": " << exc.what());
		ctx.context.writer.send_error(ctx.id, std::string("invalid request: ") + exc.what());
	} catch (const AgentError& exc) {
		LOG4CPLUS_WARN(agent_logger(), ctx.method << " id=" << ctx.id << ": " << exc.what());
		ctx.context.writer.send_error(ctx.id, exc.what());
	} catch (const std::filesystem::filesystem_error& exc) {
		LOG4CPLUS_WARN(agent_logger(), ctx.method << " id=" << ctx.id << ": " << exc.what());
		ctx.context.writer.send_error(ctx.id, describe_filesystem_error(exc));
	} catch (const std::system_error& exc) {
		LOG4CPLUS_WARN(agent_logger(), ctx.method << " id=" << ctx.id << ": " << exc.what());
		ctx.context.writer.send_error(ctx.id, describe_os_error(exc.code(), exc.what()));
	} catch (const std::exception& exc) {
		LOG4CPLUS_ERROR(agent_logger(), ctx.method << " id=" << ctx.id << " failed: " << exc.what());
		ctx.context.writer.send_error(ctx.id, exc.what());
	}
}

} // namespace

std::filesystem::path ActionHandler::resolve_path(const ActionContext& ctx, const std::string& key) const {
	return ctx.context.resolver.resolve(codec::require_string(ctx.params, key));
}

void ActionHandler::send_result(const ActionContext& ctx, const nlohmann::json& result) const {
	ctx.context.writer.send_result(ctx.id, result);
}

void ActionHandler::send_data(const ActionContext& ctx, const nlohmann::json& data) const {
	ctx.context.writer.send_data(ctx.id, data);
}

void handle_line(const std::string& line, AgentContext& context) {
	std::string decode_error;
	auto request = codec::decode_request(line, decode_error);
	if (!request) {
		LOG4CPLUS_ERROR(agent_logger(), "Decode error: " << decode_error);
		context.writer.send_error(0, "parse error: " + decode_error);
		return;
	}

	LOG4CPLUS_DEBUG(agent_logger(), "Request: " << request->method << " id=" << request->id);

	ActionHandler* handler = get_registry().find(request->method);
	if (!handler) {
		LOG4CPLUS_WARN(agent_logger(), "Unknown method: " << request->method);
		context.writer.send_error(request->id, "unknown method: " + request->method);
		return;
	}

	if (!request->params.is_object()) {
		context.writer.send_error(request->id, "invalid request: params must be an object");
		return;
	}

	ActionContext ctx{request->id, request->method, context, request->params};
	run_handler(*handler, ctx);
}

std::size_t method_count() {
	return get_registry().size();
}

} // namespace fsagent::actions
