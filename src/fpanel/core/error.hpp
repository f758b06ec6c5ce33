#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace fpanel {

/**
 * @brief Classification of a failed command.
 *
 * Callers only ever see the message; the kind drives logging and tests.
 */
enum class ErrorKind
{
    HostWindowCreation,
    NotFound,
    HostWindowClose,
    HostWindowUpdate,
    InvalidRequest,
    UnknownCommand,
    InvalidArguments
};

inline std::string_view to_string(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::HostWindowCreation:
            return "HostWindowCreationError";
        case ErrorKind::NotFound:
            return "NotFoundError";
        case ErrorKind::HostWindowClose:
            return "HostWindowCloseError";
        case ErrorKind::HostWindowUpdate:
            return "HostWindowUpdateError";
        case ErrorKind::InvalidRequest:
            return "InvalidRequest";
        case ErrorKind::UnknownCommand:
            return "UnknownCommand";
        case ErrorKind::InvalidArguments:
            return "InvalidArguments";
    }
    return "Unknown";
}

/// Failure of a command. what() is the message returned to the caller verbatim.
class CommandError : public std::runtime_error
{
public:
    CommandError(ErrorKind kind, std::string const& message)
        : std::runtime_error(message)
        , kind_(kind)
    {
    }

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/// Failure reported by a WindowHost implementation.
class HostError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace fpanel
