#pragma once

#include "protocol.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace fpanel {

class FloatingWindowService;

/**
 * @brief Routes control channel requests to named handlers.
 *
 * A handler returns the response body or throws CommandError. invoke() never
 * throws; every failure becomes an error response carrying the message.
 */
class CommandDispatcher
{
public:
    using Handler = std::function<std::string(protocol::Request const&)>;

    void register_command(std::string name, Handler handler);
    bool contains(std::string const& name) const { return handlers_.contains(name); }
    std::vector<std::string> commands() const;

    protocol::Response invoke(protocol::Request const& request) const;

private:
    std::map<std::string, Handler> handlers_;
};

/// Registers greet and the five floating window commands.
void register_shell_commands(CommandDispatcher& dispatcher, FloatingWindowService& floating);

} // namespace fpanel
