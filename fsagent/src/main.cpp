#include "agent_config.hpp"
#include "core_context.hpp"
#include "json_codec.hpp"
#include "logger.hpp"
#include "message_writer.hpp"
#include "stdio_server.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <csignal>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include <sys/prctl.h>
#include <unistd.h>

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);
    log4cplus::Initializer log_initializer;

    fsagent::AgentConfig config;
    try {
        config = fsagent::parse_command_line(argc, argv);
    } catch (const std::invalid_argument& exc) {
        std::cerr << "fsagent: " << exc.what() << std::endl;
        std::cerr << "Usage: fsagent [--config <log4cplus.ini>] [--cwd <dir>] [--helper <prog>] "
                     "[--poll-ms <n>] [--kill-grace-ms <n>] [--drain-ms <n>] [--pdeathsig] [--version]"
                  << std::endl;
        return 2;
    }

    if (config.show_version) {
        std::cout << "Version: " << FSAGENT_VERSION_STRING << std::endl;
        std::cout << "Protocol: " << fsagent::codec::kProtocolVersion << std::endl;
        std::cout << "Commit: " << FSAGENT_GIT_VERSION_STRING << std::endl;
        std::cout << "Build Time: " << FSAGENT_BUILD_TIMESTAMP << std::endl;
        return 0;
    }

#ifdef __linux__
    // Die with the transport that launched us.
    if (config.pdeathsig) {
        prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (getppid() == 1) {
            return 1;
        }
    }
#endif

    // Writes to a dead pipe must fail with EPIPE, not kill the agent.
    std::signal(SIGPIPE, SIG_IGN);

    fsagent::init_logging(config.log_config);

    try {
        fsagent::resolve_directories(config);
    } catch (const std::exception& exc) {
        LOG4CPLUS_FATAL(fsagent::agent_logger(), "Failed to resolve working directories: " << exc.what());
        return 1;
    }

    LOG4CPLUS_INFO(fsagent::agent_logger(), "fsagent starting");
    LOG4CPLUS_INFO(fsagent::agent_logger(),
                   "Version: " << FSAGENT_VERSION_STRING << ", Commit: " << FSAGENT_GIT_VERSION_STRING);
    LOG4CPLUS_INFO(fsagent::agent_logger(), "Home: " << config.home.string() << ", cwd: " << config.cwd.string());
    LOG4CPLUS_INFO(fsagent::agent_logger(), "Poll interval: " << config.poll_interval.count()
                                                              << "ms, kill grace: " << config.kill_grace.count()
                                                              << "ms, helper: " << config.helper);

    fsagent::StreamMessageWriter writer(std::cout);
    fsagent::AgentContext context(config, writer);
    fsagent::StdioServer server(std::cin, context);
    return server.run();
}
