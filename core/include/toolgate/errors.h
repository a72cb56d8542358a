#pragma once

// Error taxonomy for the connection manager.
//
//   ValidationError  - descriptor rejected before anything touches disk
//   NotFoundError    - executable absent or not executable
//   ConnectionError  - admission, spawn, handshake, timeout, or call failure
//   ConfigError      - configuration file could not be loaded
//
// Every error carries the server label it concerns (may be empty for
// ConfigError raised before a server is identified).

#include <exception>
#include <stdexcept>
#include <string>

namespace toolgate {

class Error : public std::runtime_error {
public:
    Error(const std::string& msg, std::string server)
        : std::runtime_error(msg), server_(std::move(server)) {}

    const std::string& server() const { return server_; }

private:
    std::string server_;
};

class ValidationError : public Error {
public:
    ValidationError(const std::string& msg, std::string server, std::string field)
        : Error(msg, std::move(server)), field_(std::move(field)) {}

    // "command", "args[3]", "label", "env.FOO", ...
    const std::string& field() const { return field_; }

private:
    std::string field_;
};

class NotFoundError : public Error {
public:
    NotFoundError(const std::string& msg, std::string server, std::string command)
        : Error(msg, std::move(server)), command_(std::move(command)) {}

    const std::string& command() const { return command_; }

private:
    std::string command_;
};

class ConnectionError : public Error {
public:
    enum class Kind {
        ALREADY_CONNECTED,
        BUDGET_EXHAUSTED,
        UNSUPPORTED_TRANSPORT,
        SPAWN_FAILED,
        HANDSHAKE_FAILED,
        TIMEOUT,
        CLOSED,
        NOT_CONNECTED,
        CALL_FAILED,
        CLOSE_FAILED,
    };

    ConnectionError(Kind kind,
                    const std::string& msg,
                    std::string server,
                    std::string tool = {},
                    std::exception_ptr cause = nullptr)
        : Error(msg, std::move(server)),
          kind_(kind),
          tool_(std::move(tool)),
          cause_(std::move(cause)) {}

    Kind kind() const { return kind_; }

    // Tool name for call_tool failures, empty otherwise.
    const std::string& tool() const { return tool_; }

    // Original failure, if this error wraps one.
    std::exception_ptr cause() const { return cause_; }
    void rethrow_cause() const {
        if (cause_) std::rethrow_exception(cause_);
    }

private:
    Kind kind_;
    std::string tool_;
    std::exception_ptr cause_;
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& msg, std::string server = {})
        : Error(msg, std::move(server)) {}
};

const char* connection_error_kind_name(ConnectionError::Kind k);

} // namespace toolgate
