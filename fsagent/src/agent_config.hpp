#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace fsagent {

struct AgentConfig {
    std::filesystem::path home;
    std::filesystem::path cwd;

    std::string log_config = "log4cplus.ini";

    // Elevated-privilege helper used by sudo_write: "<helper> tee <path>".
    std::string helper = "sudo";

    // A streaming loop observes a cancel marker within one poll interval;
    // terminate waits escalate to SIGKILL after kill_grace.
    std::chrono::milliseconds poll_interval{50};
    std::chrono::milliseconds kill_grace{2000};
    std::chrono::milliseconds drain_timeout{5000};

    bool pdeathsig = false;
    bool show_version = false;
};

/// Parses `--flag value` and `--flag=value` options. Throws
/// std::invalid_argument on unknown flags or malformed values.
AgentConfig parse_command_line(int argc, char** argv);

/// Fills in home and cwd when they were not given explicitly and makes
/// both absolute. Called once at startup.
void resolve_directories(AgentConfig& config);

std::filesystem::path default_home_directory();

} // namespace fsagent
