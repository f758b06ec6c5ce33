#pragma once

#include "fpanel/commands/dispatcher.hpp"
#include "fpanel/commands/floating_windows.hpp"
#include "fpanel/commands/worker_pool.hpp"
#include "fpanel/config/config.hpp"
#include "fpanel/core/registry.hpp"
#include "fpanel/core/wake_pipe.hpp"
#include "fpanel/core/window_id.hpp"
#include "fpanel/host/connection.hpp"
#include "fpanel/host/x11_host.hpp"
#include <mutex>
#include <string>
#include <string_view>

namespace fpanel {

/**
 * @brief The desktop shell: main window, floating panels and the control channel.
 *
 * The main thread polls the X connection and stdin. Each request line runs on
 * a worker thread; responses are written to stdout one line at a time, and each
 * finished request wakes the main thread to handle X events the worker's
 * replies pulled off the socket. The
 * shell exits when the main window is destroyed, on SIGINT/SIGTERM or when the
 * X connection breaks.
 */
class App
{
public:
    explicit App(Config config);
    ~App();

    App(App const&) = delete;
    App& operator=(App const&) = delete;

    void run();

private:
    Config config_;
    Connection conn_;
    X11WindowHost host_;
    WindowRegistry registry_;
    WindowIdGenerator ids_;
    FloatingWindowService floating_;
    CommandDispatcher dispatcher_;
    std::mutex output_mutex_;
    WakePipe wake_;
    std::string input_buffer_;
    bool input_open_ = true;
    bool running_ = true;

    // Declared last so workers stop before anything they reference is destroyed
    WorkerPool workers_;

    void setup_main_window();
    bool main_window_alive();
    void handle_window_destroyed(std::string const& label);
    void read_input();
    void submit_line(std::string_view line);
    void write_response(protocol::Response const& response);
};

} // namespace fpanel
