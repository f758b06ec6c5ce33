#pragma once

#include "fpanel/core/types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace fpanel {

struct PanelConfig
{
    std::string title = "Floating Panel";
    double width = 400.0;
    double height = 300.0;
    double x = 100.0;
    double y = 100.0;
    bool resizable = true;
    bool decorations = true;
    bool always_on_top = true;
    bool skip_taskbar = false;
    std::optional<double> min_width;
    std::optional<double> min_height;
    std::optional<double> max_width;
    std::optional<double> max_height;
};

struct MainWindowConfig
{
    std::string title = "fpanel";
    double width = 800.0;
    double height = 600.0;
    double x = 100.0;
    double y = 100.0;
};

struct DisplayConfig
{
    double scale_factor = 1.0;
};

struct RuntimeConfig
{
    size_t worker_threads = 4;
};

struct DebugConfig
{
    bool open_devtools = false;
};

struct Config
{
    PanelConfig panel;
    MainWindowConfig main_window;
    DisplayConfig display;
    RuntimeConfig runtime;
    DebugConfig debug;
};

std::optional<Config> load_config(std::string const& path);
std::optional<Config> parse_config(std::string_view text);
Config default_config();

/// Options for a floating panel labelled with id.
WindowOptions panel_window_options(PanelConfig const& panel, WindowId const& id);
WindowOptions main_window_options(MainWindowConfig const& main_window);

} // namespace fpanel
