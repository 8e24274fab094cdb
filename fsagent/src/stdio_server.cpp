#include "stdio_server.hpp"

#include "action/action.hpp"
#include "core_context.hpp"
#include "json_codec.hpp"
#include "logger.hpp"

#include <string>

#include <log4cplus/loggingmacros.h>

namespace fsagent {

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

StdioServer::StdioServer(std::istream& in, AgentContext& context) : in_(in), context_(context) {}

int StdioServer::run() {
    context_.writer.send_ready(codec::kProtocolVersion);

    std::string line;
    while (std::getline(in_, line)) {
        if (is_blank(line)) {
            continue;
        }
        ++requests_handled_;
        actions::handle_line(line, context_);
    }

    const bool failed = in_.bad();
    if (failed) {
        LOG4CPLUS_ERROR(agent_logger(), "Input stream failed after " << requests_handled_ << " request(s)");
    } else {
        LOG4CPLUS_INFO(agent_logger(), "End of input after " << requests_handled_ << " request(s)");
    }

    context_.processes.shutdown();
    return failed ? 1 : 0;
}

} // namespace fsagent
