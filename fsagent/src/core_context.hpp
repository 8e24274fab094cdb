#pragma once

#include "agent_config.hpp"
#include "message_writer.hpp"
#include "path_resolver.hpp"
#include "process_supervisor.hpp"

namespace fsagent {

/**
 * State shared by every action handler for the lifetime of the agent.
 * Built once at startup; handlers receive it by reference.
 */
struct AgentContext {
    AgentContext(AgentConfig config, MessageWriter& writer);

    const AgentConfig config;
    const PathResolver resolver;
    MessageWriter& writer;
    ProcessSupervisor processes;
};

} // namespace fsagent
