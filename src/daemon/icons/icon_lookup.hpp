#pragma once

#include <istream>
#include <optional>
#include <string>
#include <vector>

// Value of the Icon= key in the [Desktop Entry] group.
std::optional<std::string> parse_desktop_entry_icon(std::istream& in);

// Looks up <dir>/<resource_class>.desktop (then the lower-cased class) and
// returns its icon name.
std::optional<std::string> find_desktop_icon(const std::vector<std::string>& application_dirs,
                                             const std::string& resource_class);

// Themes named by Inherits= in the [Icon Theme] group of an index.theme.
std::vector<std::string> parse_theme_inherits(std::istream& in);

// `theme` followed by its inherited themes (breadth first, each once),
// ending with hicolor.
std::vector<std::string> theme_chain(const std::vector<std::string>& theme_dirs,
                                     const std::string& theme);

// Resolves an icon name to an image file. Each theme of the chain is tried
// in turn: sized PNGs (largest first), then the scalable SVG. Unthemed
// <dir>/<name>.png or .svg is the last resort. Absolute names are returned
// unchanged if the file exists.
std::optional<std::string> find_icon_file(const std::vector<std::string>& theme_dirs,
                                          const std::string& theme,
                                          const std::string& icon_name);
