#pragma once
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace port_census {

enum class ErrorKind { CommandExecution, Parse, Connection, Authentication, Timeout, NotImplemented };

const char* error_kind_name(ErrorKind k);

class CollectorError : public std::runtime_error {
public:
    CollectorError(ErrorKind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}
    ErrorKind kind() const { return kind_; }
private:
    ErrorKind kind_;
};

// Middleware reported an error for a method call.
class RpcError : public CollectorError {
public:
    explicit RpcError(nlohmann::json error)
        : CollectorError(ErrorKind::Connection, error.is_string() ? error.get<std::string>() : error.dump()), error_(std::move(error)) {}
    const nlohmann::json& error() const { return error_; }
private:
    nlohmann::json error_;
};

}
