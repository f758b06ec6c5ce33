#include "connection.hpp"
#include <cstdlib>
#include <stdexcept>

namespace fpanel {

Connection::Connection(char const* display)
    : conn_(xcb_connect(display, nullptr), xcb_disconnect)
    , screen_(nullptr)
{
    if (xcb_connection_has_error(conn_.get()))
    {
        throw std::runtime_error("Failed to connect to X server");
    }

    screen_ = xcb_setup_roots_iterator(xcb_get_setup(conn_.get())).data;
    if (!screen_)
    {
        throw std::runtime_error("Failed to get screen");
    }

    xcb_intern_atom_cookie_t* cookies = xcb_ewmh_init_atoms(conn_.get(), &ewmh_);
    if (!xcb_ewmh_init_atoms_replies(&ewmh_, cookies, nullptr))
    {
        throw std::runtime_error("Failed to initialize EWMH atoms");
    }
    ewmh_ready_ = true;
}

Connection::~Connection()
{
    if (ewmh_ready_)
    {
        xcb_ewmh_connection_wipe(&ewmh_);
    }
}

xcb_atom_t Connection::intern_atom(std::string const& name) const
{
    auto cookie = xcb_intern_atom(conn_.get(), 0, static_cast<uint16_t>(name.size()), name.c_str());
    auto* reply = xcb_intern_atom_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return XCB_NONE;

    xcb_atom_t atom = reply->atom;
    free(reply);
    return atom;
}

} // namespace fpanel
