#include "x11_host.hpp"
#include "fpanel/core/error.hpp"
#include "fpanel/core/log.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <memory>
#include <vector>
#include <xcb/xcb_ewmh.h>
#include <xcb/xcb_icccm.h>

namespace fpanel {

namespace {

// _MOTIF_WM_HINTS layout: flags, functions, decorations, input_mode, status
constexpr uint32_t MOTIF_HINTS_DECORATIONS = 1u << 1;
constexpr uint32_t MOTIF_HINTS_ELEMENTS = 5;

std::string describe_error(xcb_generic_error_t const& error)
{
    return "X error " + std::to_string(static_cast<int>(error.error_code)) + " (major opcode "
        + std::to_string(static_cast<int>(error.major_code)) + ", resource "
        + std::to_string(error.resource_id) + ")";
}

} // namespace

X11WindowHost::X11WindowHost(Connection& conn, double scale_factor)
    : conn_(conn)
    , scale_factor_(scale_factor > 0.0 ? scale_factor : 1.0)
{
    utf8_string_ = conn_.intern_atom("UTF8_STRING");
    wm_protocols_ = conn_.intern_atom("WM_PROTOCOLS");
    wm_delete_window_ = conn_.intern_atom("WM_DELETE_WINDOW");
    motif_wm_hints_ = conn_.intern_atom("_MOTIF_WM_HINTS");
}

X11WindowHost::~X11WindowHost()
{
    std::lock_guard lock(mutex_);
    for (auto const& [label, window] : windows_)
    {
        LOG_DEBUG("Destroying window '{}' ({:#x}) on shutdown", label, window);
        xcb_destroy_window(conn_.get(), window);
    }
    windows_.clear();
    conn_.flush();
}

void X11WindowHost::create_window(WindowOptions const& options)
{
    uint32_t width = to_pixel_extent(options.size.width);
    uint32_t height = to_pixel_extent(options.size.height);
    int32_t x = to_pixel_coordinate(options.position.x);
    int32_t y = to_pixel_coordinate(options.position.y);

    xcb_window_t window = xcb_generate_id(conn_.get());
    if (window == std::numeric_limits<uint32_t>::max())
    {
        throw HostError("no X resource ids left");
    }

    // Reserve the label before talking to the server so concurrent creates cannot both claim it
    {
        std::lock_guard lock(mutex_);
        if (windows_.contains(options.label))
        {
            throw HostError("a window with the label `" + options.label + "` already exists");
        }
        windows_.emplace(options.label, window);
    }

    try
    {
        xcb_screen_t* screen = conn_.screen();
        uint32_t mask = XCB_CW_BACK_PIXEL | XCB_CW_EVENT_MASK;
        uint32_t values[] = { screen->white_pixel,
                              XCB_EVENT_MASK_STRUCTURE_NOTIFY | XCB_EVENT_MASK_PROPERTY_CHANGE };

        check(
            xcb_create_window_checked(
                conn_.get(),
                XCB_COPY_FROM_PARENT,
                window,
                screen->root,
                static_cast<int16_t>(x),
                static_cast<int16_t>(y),
                static_cast<uint16_t>(width),
                static_cast<uint16_t>(height),
                0,
                XCB_WINDOW_CLASS_INPUT_OUTPUT,
                screen->root_visual,
                mask,
                values
            ),
            "create window"
        );

        apply_window_properties(window, options);
        check(xcb_map_window_checked(conn_.get(), window), "map window");
    }
    catch (HostError const&)
    {
        xcb_destroy_window(conn_.get(), window);
        conn_.flush();
        std::lock_guard lock(mutex_);
        windows_.erase(options.label);
        throw;
    }

    LOG_DEBUG("Created window '{}' ({:#x}) {}x{}+{}+{}", options.label, window, width, height, x, y);
}

void X11WindowHost::apply_window_properties(xcb_window_t window, WindowOptions const& options)
{
    auto* ewmh = conn_.ewmh();
    std::string const& title = options.title;

    xcb_icccm_set_wm_name(
        conn_.get(),
        window,
        XCB_ATOM_STRING,
        8,
        static_cast<uint32_t>(title.size()),
        title.c_str()
    );
    xcb_ewmh_set_wm_name(ewmh, window, static_cast<uint32_t>(title.size()), title.c_str());

    // WM_CLASS is "instance\0class\0"
    std::string wm_class = options.label;
    wm_class.push_back('\0');
    wm_class += "fpanel";
    wm_class.push_back('\0');
    xcb_icccm_set_wm_class(conn_.get(), window, static_cast<uint32_t>(wm_class.size()), wm_class.c_str());

    uint32_t width = to_pixel_extent(options.size.width);
    uint32_t height = to_pixel_extent(options.size.height);

    xcb_size_hints_t hints = {};
    xcb_icccm_size_hints_set_position(
        &hints,
        0,
        to_pixel_coordinate(options.position.x),
        to_pixel_coordinate(options.position.y)
    );
    xcb_icccm_size_hints_set_size(&hints, 0, static_cast<int32_t>(width), static_cast<int32_t>(height));
    if (!options.resizable)
    {
        xcb_icccm_size_hints_set_min_size(&hints, static_cast<int32_t>(width), static_cast<int32_t>(height));
        xcb_icccm_size_hints_set_max_size(&hints, static_cast<int32_t>(width), static_cast<int32_t>(height));
    }
    else
    {
        if (options.min_size)
        {
            xcb_icccm_size_hints_set_min_size(
                &hints,
                static_cast<int32_t>(to_pixel_extent(options.min_size->width)),
                static_cast<int32_t>(to_pixel_extent(options.min_size->height))
            );
        }
        if (options.max_size)
        {
            xcb_icccm_size_hints_set_max_size(
                &hints,
                static_cast<int32_t>(to_pixel_extent(options.max_size->width)),
                static_cast<int32_t>(to_pixel_extent(options.max_size->height))
            );
        }
    }
    xcb_icccm_set_wm_normal_hints(conn_.get(), window, &hints);

    if (wm_protocols_ != XCB_NONE && wm_delete_window_ != XCB_NONE)
    {
        xcb_atom_t protocols[] = { wm_delete_window_ };
        xcb_icccm_set_wm_protocols(conn_.get(), window, wm_protocols_, 1, protocols);
    }

    if (!options.decorations && motif_wm_hints_ != XCB_NONE)
    {
        uint32_t motif[MOTIF_HINTS_ELEMENTS] = { MOTIF_HINTS_DECORATIONS, 0, 0, 0, 0 };
        xcb_change_property(
            conn_.get(),
            XCB_PROP_MODE_REPLACE,
            window,
            motif_wm_hints_,
            motif_wm_hints_,
            32,
            MOTIF_HINTS_ELEMENTS,
            motif
        );
    }

    // Initial _NET_WM_STATE is set directly; the WM reads it when the window is mapped
    std::vector<xcb_atom_t> state;
    if (options.always_on_top)
        state.push_back(ewmh->_NET_WM_STATE_ABOVE);
    if (options.skip_taskbar)
        state.push_back(ewmh->_NET_WM_STATE_SKIP_TASKBAR);
    if (!state.empty())
    {
        xcb_ewmh_set_wm_state(ewmh, window, static_cast<uint32_t>(state.size()), state.data());
    }
}

bool X11WindowHost::has_window(std::string const& label) const
{
    std::lock_guard lock(mutex_);
    return windows_.contains(label);
}

void X11WindowHost::close_window(std::string const& label)
{
    xcb_window_t window = require_window(label);

    check(xcb_destroy_window_checked(conn_.get(), window), "destroy window");

    // Dropping the label here means the DestroyNotify that follows is not reported as external
    {
        std::lock_guard lock(mutex_);
        auto it = windows_.find(label);
        if (it != windows_.end() && it->second == window)
            windows_.erase(it);
    }

    LOG_DEBUG("Closed window '{}' ({:#x})", label, window);
}

void X11WindowHost::set_position(std::string const& label, LogicalPosition position)
{
    xcb_window_t window = require_window(label);

    int32_t x = to_pixel_coordinate(position.x);
    int32_t y = to_pixel_coordinate(position.y);
    uint32_t values[] = { static_cast<uint32_t>(x), static_cast<uint32_t>(y) };
    check(
        xcb_configure_window_checked(
            conn_.get(),
            window,
            XCB_CONFIG_WINDOW_X | XCB_CONFIG_WINDOW_Y,
            values
        ),
        "move window"
    );

    LOG_TRACE("Moved window '{}' to {},{}", label, x, y);
}

void X11WindowHost::set_size(std::string const& label, LogicalSize size)
{
    xcb_window_t window = require_window(label);

    uint32_t values[] = { to_pixel_extent(size.width), to_pixel_extent(size.height) };
    check(
        xcb_configure_window_checked(
            conn_.get(),
            window,
            XCB_CONFIG_WINDOW_WIDTH | XCB_CONFIG_WINDOW_HEIGHT,
            values
        ),
        "resize window"
    );

    LOG_TRACE("Resized window '{}' to {}x{}", label, values[0], values[1]);
}

void X11WindowHost::emit(std::string const& label, std::string_view event, std::string_view payload)
{
    xcb_window_t window = require_window(label);

    xcb_atom_t property = conn_.intern_atom(event_property_name(event));
    if (property == XCB_NONE)
    {
        throw HostError("failed to intern the property for event `" + std::string(event) + "`");
    }

    check(
        xcb_change_property_checked(
            conn_.get(),
            XCB_PROP_MODE_REPLACE,
            window,
            property,
            utf8_string_,
            8,
            static_cast<uint32_t>(payload.size()),
            payload.data()
        ),
        "emit event"
    );

    LOG_TRACE("Emitted '{}' = '{}' to window '{}'", event, payload, label);
}

void X11WindowHost::open_devtools(std::string const& label)
{
    emit(label, DEVTOOLS_EVENT, "open");
}

void X11WindowHost::on_window_destroyed(DestroyedCallback callback)
{
    std::lock_guard lock(mutex_);
    destroyed_callback_ = std::move(callback);
}

void X11WindowHost::process_events()
{
    while (auto* event = xcb_poll_for_event(conn_.get()))
    {
        std::unique_ptr<xcb_generic_event_t, decltype(&free)> event_ptr(event, free);
        handle_event(*event_ptr);
    }
}

std::optional<xcb_window_t> X11WindowHost::window_for(std::string const& label) const
{
    std::lock_guard lock(mutex_);
    auto it = windows_.find(label);
    if (it == windows_.end())
        return std::nullopt;
    return it->second;
}

std::string X11WindowHost::event_property_name(std::string_view event)
{
    std::string name = "_FPANEL_EVENT_";
    for (char c : event)
    {
        if (c == '-' || c == '.' || c == ' ')
            name.push_back('_');
        else
            name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return name;
}

void X11WindowHost::handle_event(xcb_generic_event_t const& event)
{
    uint8_t type = event.response_type & ~0x80;
    switch (type)
    {
        case 0:
        {
            auto const& error = reinterpret_cast<xcb_generic_error_t const&>(event);
            LOG_DEBUG("Unchecked request failed: {}", describe_error(error));
            break;
        }
        case XCB_CLIENT_MESSAGE:
            handle_client_message(reinterpret_cast<xcb_client_message_event_t const&>(event));
            break;
        case XCB_DESTROY_NOTIFY:
            handle_destroy_notify(reinterpret_cast<xcb_destroy_notify_event_t const&>(event));
            break;
        default:
            LOG_TRACE("Ignoring X event type {}", type);
            break;
    }
}

void X11WindowHost::handle_client_message(xcb_client_message_event_t const& e)
{
    if (e.type != wm_protocols_ || e.data.data32[0] != wm_delete_window_)
        return;

    auto label = label_for(e.window);
    if (!label)
        return;

    // The window manager asked us to close; the DestroyNotify that follows reports it
    LOG_INFO("Window '{}' closed by the user", *label);
    xcb_destroy_window(conn_.get(), e.window);
    conn_.flush();
}

void X11WindowHost::handle_destroy_notify(xcb_destroy_notify_event_t const& e)
{
    DestroyedCallback callback;
    std::string label;
    {
        std::lock_guard lock(mutex_);
        auto it = std::ranges::find_if(windows_, [&](auto const& entry) { return entry.second == e.window; });
        if (it == windows_.end())
            return;
        label = it->first;
        windows_.erase(it);
        callback = destroyed_callback_;
    }

    LOG_DEBUG("Window '{}' ({:#x}) destroyed", label, e.window);
    if (callback)
        callback(label);
}

xcb_window_t X11WindowHost::require_window(std::string const& label) const
{
    auto window = window_for(label);
    if (!window)
    {
        throw HostError("window `" + label + "` does not exist");
    }
    return *window;
}

std::optional<std::string> X11WindowHost::label_for(xcb_window_t window) const
{
    std::lock_guard lock(mutex_);
    auto it = std::ranges::find_if(windows_, [&](auto const& entry) { return entry.second == window; });
    if (it == windows_.end())
        return std::nullopt;
    return it->first;
}

void X11WindowHost::check(xcb_void_cookie_t cookie, std::string const& what)
{
    if (auto* err = xcb_request_check(conn_.get(), cookie))
    {
        std::string message = what + " failed: " + describe_error(*err);
        free(err);
        throw HostError(message);
    }
}

int32_t X11WindowHost::to_pixel_coordinate(double value) const
{
    double scaled = value * scale_factor_;
    if (!std::isfinite(scaled) || scaled < std::numeric_limits<int16_t>::min()
        || scaled > std::numeric_limits<int16_t>::max())
    {
        throw HostError("coordinate " + std::to_string(value) + " is out of range");
    }
    return static_cast<int32_t>(std::lround(scaled));
}

uint32_t X11WindowHost::to_pixel_extent(double value) const
{
    double scaled = value * scale_factor_;
    if (!std::isfinite(scaled) || scaled < 1.0 || scaled > std::numeric_limits<uint16_t>::max())
    {
        throw HostError("size " + std::to_string(value) + " is out of range");
    }
    return static_cast<uint32_t>(std::lround(scaled));
}

} // namespace fpanel
