#pragma once

#include <string>
#include <log4cplus/logger.h>

namespace fsagent {

log4cplus::Logger& agent_logger();
log4cplus::Logger& fs_logger();
log4cplus::Logger& process_logger();
void init_logging(const std::string& config_path);

} // namespace fsagent
