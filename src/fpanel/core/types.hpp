#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fpanel {

// ─────────────────────────────────────────────────────────────────────────────
// Constants
// ─────────────────────────────────────────────────────────────────────────────

/// Prefix of every floating window id ("floating-<epoch ms>")
constexpr std::string_view FLOATING_ID_PREFIX = "floating-";

/// Label of the window created at startup
constexpr std::string_view MAIN_WINDOW_LABEL = "main";

/// One-shot event sent to a freshly created floating window
constexpr std::string_view WINDOW_TYPE_EVENT = "window-type";
constexpr std::string_view FLOATING_PANEL_ROLE = "floating-panel";

constexpr std::string_view DEVTOOLS_EVENT = "devtools";

/// Host-side identifier of a floating window. Equal to its host label.
using WindowId = std::string;

// ─────────────────────────────────────────────────────────────────────────────
// Logical geometry
//
// Logical units are scaled to pixels by the host (display.scale_factor).
// ─────────────────────────────────────────────────────────────────────────────

struct LogicalPosition
{
    double x = 0.0;
    double y = 0.0;

    bool operator==(LogicalPosition const&) const = default;
};

struct LogicalSize
{
    double width = 0.0;
    double height = 0.0;

    bool operator==(LogicalSize const&) const = default;
};

/**
 * @brief Everything the host needs to build a top-level window.
 *
 * The floating panel defaults are 400x300 at (100,100), resizable, decorated,
 * always on top and listed in the taskbar. See PanelConfig for the
 * configurable version.
 */
struct WindowOptions
{
    std::string label;
    std::string title;
    LogicalSize size{ 400.0, 300.0 };
    LogicalPosition position{ 100.0, 100.0 };
    bool resizable = true;
    bool decorations = true;
    bool always_on_top = true;
    bool skip_taskbar = false;
    std::optional<LogicalSize> min_size;
    std::optional<LogicalSize> max_size;
};

} // namespace fpanel
