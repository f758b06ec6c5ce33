#include "floating_windows.hpp"
#include "fpanel/core/error.hpp"
#include "fpanel/core/log.hpp"

namespace fpanel {

FloatingWindowService::FloatingWindowService(
    WindowHost& host,
    WindowRegistry& registry,
    WindowIdGenerator& ids,
    PanelConfig panel
)
    : host_(host)
    , registry_(registry)
    , ids_(ids)
    , panel_(std::move(panel))
{
}

WindowId FloatingWindowService::create()
{
    WindowId id = ids_.next();

    try
    {
        host_.create_window(panel_window_options(panel_, id));
    }
    catch (HostError const& e)
    {
        LOG_WARN("Host could not create floating window {}: {}", id, e.what());
        throw CommandError(ErrorKind::HostWindowCreation, std::string("Failed to create window: ") + e.what());
    }

    registry_.add(id);

    // A destroy reported before add() found nothing to remove
    if (!host_.has_window(id))
    {
        registry_.remove(id);
        LOG_WARN("Floating window {} was destroyed right after creation", id);
        return id;
    }

    LOG_INFO("Created floating window {}", id);

    // The window exists at this point; a lost notification does not undo it
    try
    {
        host_.emit(id, WINDOW_TYPE_EVENT, FLOATING_PANEL_ROLE);
    }
    catch (HostError const& e)
    {
        LOG_WARN("Failed to send {} to {}: {}", WINDOW_TYPE_EVENT, id, e.what());
    }

    return id;
}

void FloatingWindowService::close(WindowId const& id)
{
    require_live(id);

    try
    {
        host_.close_window(id);
    }
    catch (HostError const& e)
    {
        LOG_WARN("Host could not close window {}: {}", id, e.what());
        throw CommandError(ErrorKind::HostWindowClose, std::string("Failed to close window: ") + e.what());
    }

    size_t removed = registry_.remove(id);
    LOG_INFO("Closed window {} ({} registry entries removed)", id, removed);
}

std::vector<WindowId> FloatingWindowService::list() const
{
    return registry_.snapshot();
}

void FloatingWindowService::reposition(WindowId const& id, LogicalPosition position)
{
    require_live(id);

    try
    {
        host_.set_position(id, position);
    }
    catch (HostError const& e)
    {
        throw CommandError(ErrorKind::HostWindowUpdate, std::string("Failed to update position: ") + e.what());
    }

    LOG_DEBUG("Moved window {} to ({}, {})", id, position.x, position.y);
}

void FloatingWindowService::resize(WindowId const& id, LogicalSize size)
{
    require_live(id);

    try
    {
        host_.set_size(id, size);
    }
    catch (HostError const& e)
    {
        throw CommandError(ErrorKind::HostWindowUpdate, std::string("Failed to update size: ") + e.what());
    }

    LOG_DEBUG("Resized window {} to {}x{}", id, size.width, size.height);
}

void FloatingWindowService::handle_window_destroyed(std::string const& label)
{
    if (registry_.remove(label) > 0)
    {
        LOG_INFO("Floating window {} was destroyed outside of close, dropped from registry", label);
    }
}

void FloatingWindowService::require_live(WindowId const& id) const
{
    if (!host_.has_window(id))
    {
        throw CommandError(ErrorKind::NotFound, "Window not found");
    }
}

std::string greet(std::string_view name)
{
    return "Hello, " + std::string(name) + "! You've been greeted from fpanel!";
}

} // namespace fpanel
