#pragma once

#include <memory>
#include <string>
#include <xcb/xcb.h>
#include <xcb/xcb_ewmh.h>

namespace fpanel {

/**
 * @brief Owns the xcb connection, the default screen and the EWMH atom table.
 *
 * xcb serializes requests internally, so a Connection may be used from worker
 * threads while the main thread polls for events.
 */
class Connection
{
public:
    explicit Connection(char const* display = nullptr);
    ~Connection();

    Connection(Connection const&) = delete;
    Connection& operator=(Connection const&) = delete;

    xcb_connection_t* get() const { return conn_.get(); }
    xcb_screen_t* screen() const { return screen_; }
    xcb_ewmh_connection_t* ewmh() { return &ewmh_; }

    int file_descriptor() const { return xcb_get_file_descriptor(conn_.get()); }
    bool has_error() const { return xcb_connection_has_error(conn_.get()) != 0; }

    xcb_atom_t intern_atom(std::string const& name) const;

    void flush() { xcb_flush(conn_.get()); }

private:
    std::unique_ptr<xcb_connection_t, decltype(&xcb_disconnect)> conn_;
    xcb_screen_t* screen_;
    xcb_ewmh_connection_t ewmh_ = {};
    bool ewmh_ready_ = false;
};

} // namespace fpanel
