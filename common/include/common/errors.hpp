#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace tradar::errors {

inline std::string append_context(std::string message, std::string_view context)
{
    if (!context.empty()) {
        message = std::string(context) + ": " + message;
    }
    return message;
}

class TradarError : public std::runtime_error {
public:
    explicit TradarError(std::string message, std::string context = {})
        : std::runtime_error(append_context(std::move(message), context))
        , context_(std::move(context))
    {
    }

    const std::string& context() const noexcept { return context_; }

private:
    std::string context_{};
};

/// Invalid configuration or an unusable signal database file. Fatal at start.
class ConfigError : public TradarError {
public:
    using TradarError::TradarError;
};

class DatabaseNotFoundError : public ConfigError {
public:
    using ConfigError::ConfigError;
};

class DatabaseParseError : public ConfigError {
public:
    using ConfigError::ConfigError;
};

/// Bus open/send/shutdown or link bring-up failure.
class TransportError : public TradarError {
public:
    using TradarError::TradarError;
};

/// Inbound payload could not be decoded. Always recoverable.
class DecodeError : public TradarError {
public:
    using TradarError::TradarError;
};

/// Outbound message could not be encoded. Always recoverable.
class EncodeError : public TradarError {
public:
    using TradarError::TradarError;
};

} // namespace tradar::errors

