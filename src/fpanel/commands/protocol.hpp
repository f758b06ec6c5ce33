#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fpanel::protocol {

/**
 * @brief One control channel request: "<id> <command> [arguments...]".
 *
 * args holds the whitespace separated arguments; rest holds everything after
 * the command with surrounding whitespace trimmed, for commands that take a
 * free-form argument.
 */
struct Request
{
    std::string id;
    std::string command;
    std::vector<std::string> args;
    std::string rest;
};

struct Response
{
    std::string id;
    bool ok = true;
    std::string body;

    static Response success(std::string id, std::string body = {});
    static Response failure(std::string id, std::string message);
};

/// Returns nullopt for blank lines. A line with an id but no command yields an empty command.
std::optional<Request> parse_request(std::string_view line);

std::string format_response(Response const& response);

/// Parses a C-locale floating point argument. Throws CommandError(InvalidArguments).
double parse_number(std::string_view command, std::string_view text);

/// Throws CommandError(InvalidArguments) unless the request has exactly count arguments.
void expect_arguments(Request const& request, size_t count);

std::string join(std::vector<std::string> const& items);

std::string_view trim(std::string_view text);

} // namespace fpanel::protocol
