#include "app.hpp"
#include "fpanel/core/error.hpp"
#include "fpanel/core/log.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <poll.h>
#include <stdexcept>
#include <unistd.h>

namespace fpanel {

namespace {

#ifdef NDEBUG
constexpr bool DEBUG_BUILD = false;
#else
constexpr bool DEBUG_BUILD = true;
#endif

constexpr size_t READ_CHUNK = 4096;

volatile std::sig_atomic_t g_stop_requested = 0;

void stop_handler(int /*sig*/)
{
    g_stop_requested = 1;
}

void setup_signal_handlers()
{
    struct sigaction sa = {};
    sa.sa_handler = stop_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

} // namespace

App::App(Config config)
    : config_(std::move(config))
    , conn_()
    , host_(conn_, config_.display.scale_factor)
    , floating_(host_, registry_, ids_, config_.panel)
    , workers_(config_.runtime.worker_threads)
{
    setup_signal_handlers();
    register_shell_commands(dispatcher_, floating_);
    host_.on_window_destroyed([this](std::string const& label) { handle_window_destroyed(label); });
    setup_main_window();
    conn_.flush();
}

App::~App()
{
    workers_.shutdown();
}

void App::setup_main_window()
{
    try
    {
        host_.create_window(main_window_options(config_.main_window));
    }
    catch (HostError const& e)
    {
        throw std::runtime_error(std::string("Failed to create the main window: ") + e.what());
    }

    if (DEBUG_BUILD || config_.debug.open_devtools)
    {
        try
        {
            host_.open_devtools(std::string(MAIN_WINDOW_LABEL));
            LOG_DEBUG("Developer tools requested for the main window");
        }
        catch (HostError const& e)
        {
            LOG_WARN("Failed to open developer tools: {}", e.what());
        }
    }
}

void App::run()
{
    LOG_INFO("fpanel ready, {} worker threads", workers_.size());

    pollfd fds[3] = {};
    fds[0].fd = conn_.file_descriptor();
    fds[0].events = POLLIN;
    fds[1].fd = wake_.file_descriptor();
    fds[1].events = POLLIN;
    fds[2].fd = STDIN_FILENO;
    fds[2].events = POLLIN;

    while (running_ && !g_stop_requested)
    {
        // Requests sent before the X fd is readable may have queued events already
        host_.process_events();
        if (!main_window_alive())
            break;

        nfds_t count = input_open_ ? 3 : 2;
        int poll_result = poll(fds, count, -1);
        if (poll_result < 0)
        {
            if (errno == EINTR)
                continue;
            throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
        }

        if (fds[1].revents & POLLIN)
        {
            wake_.drain();
        }

        if (input_open_ && (fds[2].revents & (POLLIN | POLLHUP | POLLERR)))
        {
            read_input();
        }

        host_.process_events();

        if (conn_.has_error())
        {
            LOG_ERROR("Lost connection to the X server");
            break;
        }
    }

    if (g_stop_requested)
        LOG_INFO("Stop requested by signal");
}

bool App::main_window_alive()
{
    // close() drops the label before its DestroyNotify, so the callback alone misses it
    if (running_ && !host_.has_window(std::string(MAIN_WINDOW_LABEL)))
    {
        LOG_INFO("Main window closed, shutting down");
        running_ = false;
    }
    return running_;
}

void App::handle_window_destroyed(std::string const& label)
{
    if (label == MAIN_WINDOW_LABEL)
    {
        LOG_INFO("Main window destroyed, shutting down");
        running_ = false;
        return;
    }
    floating_.handle_window_destroyed(label);
}

void App::read_input()
{
    char buffer[READ_CHUNK];
    ssize_t n = read(STDIN_FILENO, buffer, sizeof(buffer));
    if (n < 0)
    {
        if (errno == EINTR || errno == EAGAIN)
            return;
        LOG_ERROR("Reading the control channel failed: {}", std::strerror(errno));
        input_open_ = false;
        return;
    }

    if (n == 0)
    {
        if (!input_buffer_.empty())
        {
            submit_line(input_buffer_);
            input_buffer_.clear();
        }
        LOG_INFO("Control channel closed");
        input_open_ = false;
        return;
    }

    input_buffer_.append(buffer, static_cast<size_t>(n));

    size_t start = 0;
    size_t newline = 0;
    while ((newline = input_buffer_.find('\n', start)) != std::string::npos)
    {
        submit_line(std::string_view(input_buffer_).substr(start, newline - start));
        start = newline + 1;
    }
    input_buffer_.erase(0, start);
}

void App::submit_line(std::string_view line)
{
    auto request = protocol::parse_request(line);
    if (!request)
        return;

    LOG_REQUEST(request->id, line);

    std::string id = request->id;
    bool accepted = workers_.submit(
        [this, pending = std::move(*request)]()
        {
            auto response = dispatcher_.invoke(pending);
            write_response(response);
            wake_.notify();
        }
    );
    if (!accepted)
    {
        write_response(protocol::Response::failure(std::move(id), "Shell is shutting down"));
    }
}

void App::write_response(protocol::Response const& response)
{
    std::lock_guard lock(output_mutex_);
    std::cout << protocol::format_response(response) << std::endl;
}

} // namespace fpanel
