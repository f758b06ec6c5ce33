#include "protocol.hpp"
#include "fpanel/core/error.hpp"
#include <charconv>
#include <cmath>
#include <system_error>

namespace fpanel::protocol {

namespace {

bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

// Splits off the first whitespace delimited token; text is advanced past it
std::string_view next_token(std::string_view& text)
{
    text = trim(text);
    size_t end = 0;
    while (end < text.size() && !is_space(text[end]))
        ++end;
    std::string_view token = text.substr(0, end);
    text.remove_prefix(end);
    return token;
}

} // namespace

Response Response::success(std::string id, std::string body)
{
    return Response{ std::move(id), true, std::move(body) };
}

Response Response::failure(std::string id, std::string message)
{
    return Response{ std::move(id), false, std::move(message) };
}

std::optional<Request> parse_request(std::string_view line)
{
    std::string_view remaining = line;
    std::string_view id = next_token(remaining);
    if (id.empty())
        return std::nullopt;

    Request request;
    request.id = std::string(id);
    request.command = std::string(next_token(remaining));
    request.rest = std::string(trim(remaining));

    while (true)
    {
        std::string_view token = next_token(remaining);
        if (token.empty())
            break;
        request.args.emplace_back(token);
    }

    return request;
}

std::string format_response(Response const& response)
{
    std::string line = response.id;
    line += response.ok ? " ok" : " error";
    if (!response.body.empty())
    {
        line += ' ';
        line += response.body;
    }
    return line;
}

double parse_number(std::string_view command, std::string_view text)
{
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || !std::isfinite(value))
    {
        throw CommandError(
            ErrorKind::InvalidArguments,
            "Invalid arguments for " + std::string(command) + ": `" + std::string(text) + "` is not a number"
        );
    }
    return value;
}

void expect_arguments(Request const& request, size_t count)
{
    if (request.args.size() != count)
    {
        throw CommandError(
            ErrorKind::InvalidArguments,
            "Invalid arguments for " + request.command + ": expected " + std::to_string(count) + ", got "
                + std::to_string(request.args.size())
        );
    }
}

std::string join(std::vector<std::string> const& items)
{
    std::string result;
    for (auto const& item : items)
    {
        if (!result.empty())
            result += ' ';
        result += item;
    }
    return result;
}

std::string_view trim(std::string_view text)
{
    while (!text.empty() && is_space(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && is_space(text.back()))
        text.remove_suffix(1);
    return text;
}

} // namespace fpanel::protocol
