#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("dbus")) {
            auto& d = j["dbus"];
            if (d.contains("service")) cfg.dbus.service = d["service"].get<std::string>();
            if (d.contains("path")) cfg.dbus.path = d["path"].get<std::string>();
            if (d.contains("interface")) cfg.dbus.interface = d["interface"].get<std::string>();
        }

        if (j.contains("device")) {
            auto& d = j["device"];
            if (d.contains("serial")) cfg.device.serial = d["serial"].get<std::string>();
            if (d.contains("brightness")) {
                cfg.device.brightness = std::min<uint32_t>(d["brightness"].get<uint32_t>(), 100);
            }
        }

        if (j.contains("icons")) {
            auto& i = j["icons"];
            if (i.contains("application_dirs"))
                cfg.icons.application_dirs = i["application_dirs"].get<std::vector<std::string>>();
            if (i.contains("theme_dirs"))
                cfg.icons.theme_dirs = i["theme_dirs"].get<std::vector<std::string>>();
            if (i.contains("theme")) cfg.icons.theme = i["theme"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

std::string expand_home(const std::string& path) {
    if (!path.starts_with("~/")) return path;
    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}
