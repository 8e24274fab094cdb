#include "action_base.hpp"
#include "action_registry.hpp"

#include "../agent_error.hpp"
#include "../child_process.hpp"
#include "../json_codec.hpp"
#include "../logger.hpp"

#include <filesystem>
#include <system_error>

#include <log4cplus/loggingmacros.h>

namespace fsagent::actions {

namespace {

// Returns right after the spawn: the terminal result for this id is sent
// later by the supervisor's streaming thread.
class ExecAction final : public ActionHandler {
public:
    const char* name() const override { return "exec"; }

    void handle(ActionContext& ctx) override {
        std::string cmd = codec::require_string(ctx.params, "cmd");
        if (cmd.empty()) {
            throw ValidationError("empty command");
        }

        SpawnOptions options;
        options.argv.push_back(cmd);
        for (auto& arg : codec::optional_string_list(ctx.params, "args")) {
            options.argv.push_back(std::move(arg));
        }
        options.cwd = ctx.context.resolver.cwd();
        if (auto cwd = codec::optional_string(ctx.params, "cwd"); cwd && !cwd->empty()) {
            options.cwd = ctx.context.resolver.resolve(*cwd);
        }

        if (ctx.context.processes.is_tracked(ctx.id)) {
            throw AgentError("request id already in use: " + std::to_string(ctx.id));
        }

        std::unique_ptr<ChildProcess> child;
        try {
            child = ChildProcess::spawn(options);
        } catch (const std::filesystem::filesystem_error&) {
            throw;
        } catch (const std::system_error& exc) {
            if (exc.code() == std::errc::no_such_file_or_directory) {
                LOG4CPLUS_WARN(process_logger(), "exec id=" << ctx.id << ": command not found: " << cmd);
                ctx.context.writer.send_error(ctx.id, "command not found: " + cmd);
                return;
            }
            if (exc.code() == std::errc::permission_denied) {
                LOG4CPLUS_WARN(process_logger(), "exec id=" << ctx.id << ": permission denied: " << cmd);
                ctx.context.writer.send_error(ctx.id, "permission denied: " + cmd);
                return;
            }
            throw;
        }

        ctx.context.processes.start(ctx.id, std::move(child));
    }
};

class KillAction final : public ActionHandler {
public:
    const char* name() const override { return "kill"; }

    void handle(ActionContext& ctx) override {
        int64_t target = codec::require_int64(ctx.params, "id");
        if (!ctx.context.processes.kill(target)) {
            throw ProcessNotFound();
        }
        send_result(ctx, nlohmann::json::object());
    }
};

// Idempotent: succeeds whether or not anything is running under the id.
class CancelAction final : public ActionHandler {
public:
    const char* name() const override { return "cancel"; }

    void handle(ActionContext& ctx) override {
        int64_t target = codec::require_int64(ctx.params, "id");
        ctx.context.processes.cancel(target);
        send_result(ctx, nlohmann::json::object());
    }
};

} // namespace

void register_process_actions(ActionRegistry& registry) {
    registry.add(std::make_unique<ExecAction>());
    registry.add(std::make_unique<KillAction>());
    registry.add(std::make_unique<CancelAction>());
}

} // namespace fsagent::actions
