#include "core_context.hpp"

namespace fsagent {

namespace {

SupervisorOptions supervisor_options(const AgentConfig& config) {
    SupervisorOptions options;
    options.poll_interval = config.poll_interval;
    options.kill_grace = config.kill_grace;
    options.drain_timeout = config.drain_timeout;
    return options;
}

} // namespace

AgentContext::AgentContext(AgentConfig agent_config, MessageWriter& message_writer)
    : config(std::move(agent_config)),
      resolver(config.home, config.cwd),
      writer(message_writer),
      processes(message_writer, supervisor_options(config)) {}

} // namespace fsagent
