#pragma once

#include "connection.hpp"
#include "window_host.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <xcb/xcb.h>

namespace fpanel {

/**
 * @brief WindowHost backed by an X server.
 *
 * Each label maps to one top-level window owned by this process. Window
 * properties follow ICCCM (WM_NAME, WM_CLASS, WM_NORMAL_HINTS, WM_PROTOCOLS)
 * and EWMH (_NET_WM_NAME, _NET_WM_STATE). Events are delivered as UTF8_STRING
 * properties named _FPANEL_EVENT_<EVENT>.
 *
 * Requests that can fail are sent checked, so X errors surface as HostError
 * on the calling thread.
 */
class X11WindowHost : public WindowHost
{
public:
    explicit X11WindowHost(Connection& conn, double scale_factor = 1.0);
    ~X11WindowHost() override;

    X11WindowHost(X11WindowHost const&) = delete;
    X11WindowHost& operator=(X11WindowHost const&) = delete;

    void create_window(WindowOptions const& options) override;
    bool has_window(std::string const& label) const override;
    void close_window(std::string const& label) override;
    void set_position(std::string const& label, LogicalPosition position) override;
    void set_size(std::string const& label, LogicalSize size) override;
    void emit(std::string const& label, std::string_view event, std::string_view payload) override;
    void open_devtools(std::string const& label) override;
    void on_window_destroyed(DestroyedCallback callback) override;

    /// Drains and handles every queued X event. Call from the event loop thread.
    void process_events();

    std::optional<xcb_window_t> window_for(std::string const& label) const;

    static std::string event_property_name(std::string_view event);

private:
    Connection& conn_;
    double scale_factor_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, xcb_window_t> windows_;
    DestroyedCallback destroyed_callback_;

    xcb_atom_t utf8_string_ = XCB_NONE;
    xcb_atom_t wm_protocols_ = XCB_NONE;
    xcb_atom_t wm_delete_window_ = XCB_NONE;
    xcb_atom_t motif_wm_hints_ = XCB_NONE;

    void handle_event(xcb_generic_event_t const& event);
    void handle_client_message(xcb_client_message_event_t const& e);
    void handle_destroy_notify(xcb_destroy_notify_event_t const& e);

    void apply_window_properties(xcb_window_t window, WindowOptions const& options);
    xcb_window_t require_window(std::string const& label) const;
    std::optional<std::string> label_for(xcb_window_t window) const;
    void check(xcb_void_cookie_t cookie, std::string const& what);

    int32_t to_pixel_coordinate(double value) const;
    uint32_t to_pixel_extent(double value) const;
};

} // namespace fpanel
