#include "icons/icon_lookup.hpp"

#include "config.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <deque>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>
#include <sstream>

namespace fs = std::filesystem;

namespace {

constexpr const char* FALLBACK_THEME = "hicolor";

constexpr std::array<int, 17> ICON_SIZES = {
    1024, 512, 480, 256, 192, 128, 96, 72, 64, 48, 36, 32, 28, 24, 22, 20, 16,
};

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

bool is_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

} // namespace

std::optional<std::string> parse_desktop_entry_icon(std::istream& in) {
    bool in_entry = false;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line.front() == '[') {
            in_entry = line == "[Desktop Entry]";
            continue;
        }
        if (!in_entry) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        if (trim(line.substr(0, eq)) != "Icon") continue;

        auto value = trim(line.substr(eq + 1));
        if (value.empty()) return std::nullopt;
        return value;
    }
    return std::nullopt;
}

std::optional<std::string> find_desktop_icon(const std::vector<std::string>& application_dirs,
                                             const std::string& resource_class) {
    if (resource_class.empty() || resource_class.find('/') != std::string::npos) {
        return std::nullopt;
    }

    auto lower = resource_class;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& name : {resource_class, lower}) {
        for (const auto& dir : application_dirs) {
            auto path = fs::path(expand_home(dir)) / (name + ".desktop");
            if (!is_file(path)) continue;

            std::ifstream f(path);
            if (!f.is_open()) {
                std::println(stderr, "icons: could not open {}", path.string());
                continue;
            }
            return parse_desktop_entry_icon(f);
        }
    }
    return std::nullopt;
}

std::vector<std::string> parse_theme_inherits(std::istream& in) {
    std::vector<std::string> themes;
    bool in_theme = false;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line.front() == '[') {
            in_theme = line == "[Icon Theme]";
            continue;
        }
        if (!in_theme) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos || trim(line.substr(0, eq)) != "Inherits") continue;

        std::istringstream list(line.substr(eq + 1));
        std::string name;
        while (std::getline(list, name, ',')) {
            name = trim(name);
            if (!name.empty()) themes.push_back(name);
        }
        return themes;
    }
    return themes;
}

std::vector<std::string> theme_chain(const std::vector<std::string>& theme_dirs,
                                     const std::string& theme) {
    std::vector<std::string> chain;
    auto seen = [&chain](const std::string& name) {
        return std::find(chain.begin(), chain.end(), name) != chain.end();
    };

    std::deque<std::string> pending{theme};
    while (!pending.empty()) {
        auto name = pending.front();
        pending.pop_front();
        if (name.empty() || name == FALLBACK_THEME || seen(name)) continue;
        chain.push_back(name);

        // The first index.theme found wins, as with the icon theme search path
        for (const auto& dir : theme_dirs) {
            std::ifstream f(fs::path(expand_home(dir)) / name / "index.theme");
            if (!f.is_open()) continue;
            for (auto& parent : parse_theme_inherits(f)) pending.push_back(std::move(parent));
            break;
        }
    }

    chain.push_back(FALLBACK_THEME);
    return chain;
}

std::optional<std::string> find_icon_file(const std::vector<std::string>& theme_dirs,
                                          const std::string& theme,
                                          const std::string& icon_name) {
    if (icon_name.empty()) return std::nullopt;

    if (icon_name.front() == '/') {
        if (is_file(icon_name)) return icon_name;
        return std::nullopt;
    }

    for (const auto& name : theme_chain(theme_dirs, theme)) {
        for (const auto& dir : theme_dirs) {
            auto base = fs::path(expand_home(dir)) / name;
            for (int size : ICON_SIZES) {
                auto path = base / std::format("{}x{}", size, size) / "apps" / (icon_name + ".png");
                if (is_file(path)) return path.string();
            }
            auto svg = base / "scalable" / "apps" / (icon_name + ".svg");
            if (is_file(svg)) return svg.string();
        }
    }

    // Unthemed fallback, e.g. /usr/share/pixmaps/<name>.png
    for (const auto& dir : theme_dirs) {
        for (const char* ext : {".png", ".svg"}) {
            auto path = fs::path(expand_home(dir)) / (icon_name + ext);
            if (is_file(path)) return path.string();
        }
    }
    return std::nullopt;
}
