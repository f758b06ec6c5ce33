#include "config.hpp"
#include "fpanel/core/log.hpp"
#include <toml++/toml.hpp>

namespace fpanel
{

namespace
{

// TOML distinguishes 400 from 400.0; accept both for geometry
std::optional<double> number_value(toml::node_view<toml::node const> node)
{
    if (auto v = node.value<double>())
        return *v;
    if (auto v = node.value<int64_t>())
        return static_cast<double>(*v);
    return std::nullopt;
}

Config config_from_table(toml::table const& tbl)
{
    Config cfg = default_config();

    // Panel
    if (auto panel = tbl["panel"].as_table())
    {
        auto const& p = *panel;
        if (auto v = p["title"].value<std::string>())
            cfg.panel.title = *v;
        if (auto v = number_value(p["width"]))
            cfg.panel.width = *v;
        if (auto v = number_value(p["height"]))
            cfg.panel.height = *v;
        if (auto v = number_value(p["x"]))
            cfg.panel.x = *v;
        if (auto v = number_value(p["y"]))
            cfg.panel.y = *v;
        if (auto v = p["resizable"].value<bool>())
            cfg.panel.resizable = *v;
        if (auto v = p["decorations"].value<bool>())
            cfg.panel.decorations = *v;
        if (auto v = p["always_on_top"].value<bool>())
            cfg.panel.always_on_top = *v;
        if (auto v = p["skip_taskbar"].value<bool>())
            cfg.panel.skip_taskbar = *v;
        cfg.panel.min_width = number_value(p["min_width"]);
        cfg.panel.min_height = number_value(p["min_height"]);
        cfg.panel.max_width = number_value(p["max_width"]);
        cfg.panel.max_height = number_value(p["max_height"]);
    }

    // Main window
    if (auto main_window = tbl["main_window"].as_table())
    {
        auto const& m = *main_window;
        if (auto v = m["title"].value<std::string>())
            cfg.main_window.title = *v;
        if (auto v = number_value(m["width"]))
            cfg.main_window.width = *v;
        if (auto v = number_value(m["height"]))
            cfg.main_window.height = *v;
        if (auto v = number_value(m["x"]))
            cfg.main_window.x = *v;
        if (auto v = number_value(m["y"]))
            cfg.main_window.y = *v;
    }

    // Display
    if (auto display = tbl["display"].as_table())
    {
        if (auto v = number_value((*display)["scale_factor"]))
        {
            if (*v > 0.0)
                cfg.display.scale_factor = *v;
            else
                LOG_WARN("Ignoring non-positive display.scale_factor {}", *v);
        }
    }

    // Runtime
    if (auto runtime = tbl["runtime"].as_table())
    {
        if (auto v = (*runtime)["worker_threads"].value<int64_t>())
        {
            if (*v > 0)
                cfg.runtime.worker_threads = static_cast<size_t>(*v);
            else
                LOG_WARN("Ignoring non-positive runtime.worker_threads {}", *v);
        }
    }

    // Debug
    if (auto debug = tbl["debug"].as_table())
    {
        if (auto v = (*debug)["open_devtools"].value<bool>())
            cfg.debug.open_devtools = *v;
    }

    return cfg;
}

} // namespace

Config default_config()
{
    Config cfg;

    cfg.panel.title = "Floating Panel";
    cfg.panel.width = 400.0;
    cfg.panel.height = 300.0;
    cfg.panel.x = 100.0;
    cfg.panel.y = 100.0;

    cfg.main_window.title = "fpanel";
    cfg.main_window.width = 800.0;
    cfg.main_window.height = 600.0;

    return cfg;
}

std::optional<Config> load_config(std::string const& path)
{
    try
    {
        return config_from_table(toml::parse_file(path));
    }
    catch (toml::parse_error const& err)
    {
        LOG_WARN("Config parse error in {}: {}", path, err.description());
        return std::nullopt;
    }
    catch (std::exception const& e)
    {
        LOG_WARN("Config error in {}: {}", path, e.what());
        return std::nullopt;
    }
}

std::optional<Config> parse_config(std::string_view text)
{
    try
    {
        return config_from_table(toml::parse(text));
    }
    catch (toml::parse_error const& err)
    {
        LOG_WARN("Config parse error: {}", err.description());
        return std::nullopt;
    }
}

WindowOptions panel_window_options(PanelConfig const& panel, WindowId const& id)
{
    WindowOptions options;
    options.label = id;
    options.title = panel.title;
    options.size = { panel.width, panel.height };
    options.position = { panel.x, panel.y };
    options.resizable = panel.resizable;
    options.decorations = panel.decorations;
    options.always_on_top = panel.always_on_top;
    options.skip_taskbar = panel.skip_taskbar;
    if (panel.min_width || panel.min_height)
        options.min_size = LogicalSize{ panel.min_width.value_or(1.0), panel.min_height.value_or(1.0) };
    if (panel.max_width || panel.max_height)
        options.max_size = LogicalSize{ panel.max_width.value_or(65535.0), panel.max_height.value_or(65535.0) };
    return options;
}

WindowOptions main_window_options(MainWindowConfig const& main_window)
{
    WindowOptions options;
    options.label = std::string(MAIN_WINDOW_LABEL);
    options.title = main_window.title;
    options.size = { main_window.width, main_window.height };
    options.position = { main_window.x, main_window.y };
    options.resizable = true;
    options.decorations = true;
    options.always_on_top = false;
    options.skip_taskbar = false;
    return options;
}

} // namespace fpanel
