#pragma once

#include "fpanel/core/types.hpp"
#include <functional>
#include <string>
#include <string_view>

namespace fpanel {

/**
 * @brief Capability interface over the windowing system.
 *
 * Windows are addressed by label. Every operation reports failure by throwing
 * HostError; the message is forwarded to the caller unchanged.
 *
 * Implementations must accept calls from several threads at once.
 */
class WindowHost
{
public:
    using DestroyedCallback = std::function<void(std::string const& label)>;

    virtual ~WindowHost() = default;

    /// Builds, decorates and shows a window. Throws HostError on failure.
    virtual void create_window(WindowOptions const& options) = 0;

    /// Whether a window with this label is currently alive on the host.
    virtual bool has_window(std::string const& label) const = 0;

    virtual void close_window(std::string const& label) = 0;
    virtual void set_position(std::string const& label, LogicalPosition position) = 0;
    virtual void set_size(std::string const& label, LogicalSize size) = 0;

    /// Delivers a one-shot event to the content of the window.
    virtual void emit(std::string const& label, std::string_view event, std::string_view payload) = 0;

    virtual void open_devtools(std::string const& label) = 0;

    /**
     * @brief Registers the callback run when a window disappears without close_window().
     *
     * Invoked from the thread that pumps host events, with no host lock held.
     */
    virtual void on_window_destroyed(DestroyedCallback callback) = 0;
};

} // namespace fpanel
