#pragma once

#include <stdexcept>
#include <string>

namespace fsagent {

/// Failure raised by the agent itself rather than by the OS.
/// The message is sent to the peer unchanged.
class AgentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed request: missing or mistyped parameter, empty path, bad base64.
class ValidationError : public AgentError {
public:
    using AgentError::AgentError;
};

/// The elevated-privilege helper exited non-zero.
class HelperFailure : public AgentError {
public:
    using AgentError::AgentError;
};

class ProcessNotFound : public AgentError {
public:
    ProcessNotFound() : AgentError("process not found") {}
};

} // namespace fsagent
