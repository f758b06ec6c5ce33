#include <cstdlib>
#include <filesystem>
#include <fpanel/app.hpp>
#include <fpanel/config/config.hpp>
#include <fpanel/core/log.hpp>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

std::string get_config_path(int argc, char* argv[])
{
    // Command line argument takes priority
    if (argc > 1)
    {
        return argv[1];
    }

    // Try XDG_CONFIG_HOME
    if (char const* xdg = std::getenv("XDG_CONFIG_HOME"))
    {
        return std::string(xdg) + "/fpanel/config.toml";
    }

    // Fall back to ~/.config
    if (char const* home = std::getenv("HOME"))
    {
        return std::string(home) + "/.config/fpanel/config.toml";
    }

    return "";
}

int main(int argc, char* argv[])
{
    fpanel::log::init();

    try
    {
        LOG_INFO("Starting fpanel");

        std::string config_path = get_config_path(argc, argv);
        fpanel::Config config;

        if (argc > 1 && !fs::exists(config_path))
        {
            throw std::runtime_error("Config file does not exist: " + config_path);
        }

        if (!config_path.empty() && fs::exists(config_path))
        {
            LOG_INFO("Loading config from: {}", config_path);
            auto loaded = fpanel::load_config(config_path);
            if (loaded)
            {
                config = *loaded;
            }
            else
            {
                LOG_WARN("Failed to load config, using defaults");
                config = fpanel::default_config();
            }
        }
        else
        {
            LOG_INFO("No config file found, using defaults");
            config = fpanel::default_config();
        }

        fpanel::App app(std::move(config));
        app.run();
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Error: {}", e.what());
        fpanel::log::shutdown();
        return 1;
    }

    LOG_INFO("fpanel exiting");
    fpanel::log::shutdown();
    return 0;
}
