#pragma once

#include <cstddef>
#include <istream>

namespace fsagent {

struct AgentContext;

/**
 * The agent's read loop: sends the ready banner, then dispatches one request
 * per input line until the input ends. Process streaming threads keep
 * writing concurrently through the shared MessageWriter.
 */
class StdioServer {
public:
    StdioServer(std::istream& in, AgentContext& context);

    /// Returns 0 at end of input and 1 when the input stream fails. Running
    /// processes are stopped before returning.
    int run();

    std::size_t requests_handled() const { return requests_handled_; }

private:
    std::istream& in_;
    AgentContext& context_;
    std::size_t requests_handled_ = 0;
};

} // namespace fsagent
