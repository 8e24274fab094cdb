#include "agent_config.hpp"

#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <vector>

#include <pwd.h>
#include <unistd.h>

namespace fsagent {

namespace {

// Matches "--name value" or "--name=value"; advances i past a separate value.
bool take_option(int argc, char** argv, int& i, const char* name, std::string& value) {
    const std::size_t len = std::strlen(name);
    if (std::strcmp(argv[i], name) == 0) {
        if (i + 1 >= argc) {
            throw std::invalid_argument(std::string(name) + " requires a value");
        }
        value = argv[++i];
        return true;
    }
    if (std::strncmp(argv[i], name, len) == 0 && argv[i][len] == '=') {
        value = argv[i] + len + 1;
        return true;
    }
    return false;
}

std::chrono::milliseconds parse_millis(const char* name, const std::string& text) {
    std::size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("invalid ") + name + " value: " + text);
    }
    if (consumed != text.size() || value <= 0) {
        throw std::invalid_argument(std::string("invalid ") + name + " value: " + text);
    }
    return std::chrono::milliseconds(value);
}

} // namespace

AgentConfig parse_command_line(int argc, char** argv) {
    AgentConfig config;
    std::string value;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            config.show_version = true;
            continue;
        }

        if (std::strcmp(argv[i], "--pdeathsig") == 0) {
            config.pdeathsig = true;
            continue;
        }

        if (take_option(argc, argv, i, "--config", value)) {
            config.log_config = value;
            continue;
        }

        if (take_option(argc, argv, i, "--cwd", value)) {
            config.cwd = value;
            continue;
        }

        if (take_option(argc, argv, i, "--helper", value)) {
            if (value.empty()) {
                throw std::invalid_argument("--helper must not be empty");
            }
            config.helper = value;
            continue;
        }

        if (take_option(argc, argv, i, "--poll-ms", value)) {
            config.poll_interval = parse_millis("--poll-ms", value);
            continue;
        }

        if (take_option(argc, argv, i, "--kill-grace-ms", value)) {
            config.kill_grace = parse_millis("--kill-grace-ms", value);
            continue;
        }

        if (take_option(argc, argv, i, "--drain-ms", value)) {
            config.drain_timeout = parse_millis("--drain-ms", value);
            continue;
        }

        throw std::invalid_argument(std::string("unknown option: ") + argv[i]);
    }

    return config;
}

std::filesystem::path default_home_directory() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return home;
    }

    long size_hint = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buffer(size_hint > 0 ? static_cast<std::size_t>(size_hint) : 16384);
    passwd pwd{};
    passwd* result = nullptr;
    if (::getpwuid_r(::getuid(), &pwd, buffer.data(), buffer.size(), &result) == 0 && result &&
        result->pw_dir) {
        return result->pw_dir;
    }
    return "/";
}

void resolve_directories(AgentConfig& config) {
    if (config.home.empty()) {
        config.home = default_home_directory();
    }
    if (config.cwd.empty()) {
        config.cwd = std::filesystem::current_path();
    }
    config.home = std::filesystem::weakly_canonical(std::filesystem::absolute(config.home));
    config.cwd = std::filesystem::canonical(std::filesystem::absolute(config.cwd));
}

} // namespace fsagent
