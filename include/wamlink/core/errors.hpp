#pragma once

#include <stdexcept>
#include <string>

namespace wamlink {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    // Short machine-readable kind used in viewer error replies.
    virtual const char* kind() const noexcept { return "error"; }
};

class ConnectError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "connect_error"; }
};

class NotConnectedError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "not_connected"; }
};

class TimeoutError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "timeout"; }
};

// Device answered but refused the request (malformed command, unsupported method).
class CommandRejectedError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "command_rejected"; }
};

class AlreadyConnectedError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "already_connected"; }
};

class DeviceNotFoundError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "device_not_found"; }
};

class GroupNotFoundError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "group_not_found"; }
};

class UnknownCommandError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "unknown_command"; }
};

class ConfigError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "config_error"; }
};

}  // namespace wamlink
