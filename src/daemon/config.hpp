#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct DBus {
        std::string service = "io.github.plasmadeck.WindowListener";
        std::string path = "/io/github/plasmadeck/WindowListener";
        std::string interface = "io.github.plasmadeck.WindowListener";
    } dbus;

    struct Device {
        std::string serial; // empty: first supported device
        uint32_t brightness = 30;
    } device;

    struct Icons {
        std::vector<std::string> application_dirs = {
            "/usr/share/applications",
            "~/.local/share/applications",
        };
        std::vector<std::string> theme_dirs = {"/usr/share/icons", "/usr/share/pixmaps"};
        std::string theme = "hicolor";
    } icons;

    static Config load(const std::string& path);
    static Config load_default();
};

// Expands a leading "~/" using $HOME.
std::string expand_home(const std::string& path);
