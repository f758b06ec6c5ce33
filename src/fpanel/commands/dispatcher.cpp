#include "dispatcher.hpp"
#include "floating_windows.hpp"
#include "fpanel/core/error.hpp"
#include "fpanel/core/log.hpp"
#include <exception>

namespace fpanel {

using protocol::Request;
using protocol::Response;

void CommandDispatcher::register_command(std::string name, Handler handler)
{
    LOG_TRACE("Registering command {}", name);
    handlers_[std::move(name)] = std::move(handler);
}

std::vector<std::string> CommandDispatcher::commands() const
{
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (auto const& [name, handler] : handlers_)
        names.push_back(name);
    return names;
}

Response CommandDispatcher::invoke(Request const& request) const
{
    try
    {
        if (request.command.empty())
        {
            throw CommandError(ErrorKind::InvalidRequest, "Invalid request: missing command");
        }

        auto it = handlers_.find(request.command);
        if (it == handlers_.end())
        {
            throw CommandError(ErrorKind::UnknownCommand, "Unknown command: " + request.command);
        }

        return Response::success(request.id, it->second(request));
    }
    catch (CommandError const& e)
    {
        LOG_WARN("{} {} failed with {}: {}", request.id, request.command, to_string(e.kind()), e.what());
        return Response::failure(request.id, e.what());
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("{} {} failed unexpectedly: {}", request.id, request.command, e.what());
        return Response::failure(request.id, e.what());
    }
}

void register_shell_commands(CommandDispatcher& dispatcher, FloatingWindowService& floating)
{
    dispatcher.register_command("greet", [](Request const& request) { return greet(request.rest); });

    dispatcher.register_command(
        "create_floating_window",
        [&floating](Request const& request)
        {
            protocol::expect_arguments(request, 0);
            return floating.create();
        }
    );

    dispatcher.register_command(
        "close_floating_window",
        [&floating](Request const& request)
        {
            protocol::expect_arguments(request, 1);
            floating.close(request.args[0]);
            return std::string();
        }
    );

    dispatcher.register_command(
        "list_floating_windows",
        [&floating](Request const& request)
        {
            protocol::expect_arguments(request, 0);
            return protocol::join(floating.list());
        }
    );

    dispatcher.register_command(
        "update_window_position",
        [&floating](Request const& request)
        {
            protocol::expect_arguments(request, 3);
            LogicalPosition position{ protocol::parse_number(request.command, request.args[1]),
                                      protocol::parse_number(request.command, request.args[2]) };
            floating.reposition(request.args[0], position);
            return std::string();
        }
    );

    dispatcher.register_command(
        "update_window_size",
        [&floating](Request const& request)
        {
            protocol::expect_arguments(request, 3);
            LogicalSize size{ protocol::parse_number(request.command, request.args[1]),
                              protocol::parse_number(request.command, request.args[2]) };
            floating.resize(request.args[0], size);
            return std::string();
        }
    );
}

} // namespace fpanel
