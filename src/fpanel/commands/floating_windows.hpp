#pragma once

#include "fpanel/config/config.hpp"
#include "fpanel/core/registry.hpp"
#include "fpanel/core/types.hpp"
#include "fpanel/core/window_id.hpp"
#include "fpanel/host/window_host.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace fpanel {

/**
 * @brief Lifecycle of floating panel windows.
 *
 * The host does the real window work; this class keeps the registry in step
 * with it. The registry lock is never held across a host call, so concurrent
 * creates may race on the host while their registry appends still serialize.
 *
 * Every operation throws CommandError on failure and leaves the registry as
 * it was before the call.
 */
class FloatingWindowService
{
public:
    FloatingWindowService(WindowHost& host, WindowRegistry& registry, WindowIdGenerator& ids, PanelConfig panel = {});

    WindowId create();
    void close(WindowId const& id);
    std::vector<WindowId> list() const;
    void reposition(WindowId const& id, LogicalPosition position);
    void resize(WindowId const& id, LogicalSize size);

    /// Drops the id of a window that disappeared without close().
    void handle_window_destroyed(std::string const& label);

private:
    WindowHost& host_;
    WindowRegistry& registry_;
    WindowIdGenerator& ids_;
    PanelConfig panel_;

    void require_live(WindowId const& id) const;
};

std::string greet(std::string_view name);

} // namespace fpanel
