#pragma once
#include <stdexcept>
#include <string>

// Bad command line: no method, wrong arity, conflicting parameters
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& what) : std::runtime_error(what) {}
};

class UnknownCommandError : public UsageError {
public:
    explicit UnknownCommandError(const std::string& method)
        : UsageError("Unknown command: " + method), method_(method) {}

    const std::string& method() const { return method_; }

private:
    std::string method_;
};

// Transport or HTTP failure. status is 0 when no response was received.
class ApiError : public std::runtime_error {
public:
    ApiError(int status, const std::string& what)
        : std::runtime_error(what), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};
