#pragma once

#include <expected>
#include <string>
#include <vector>

struct CliOptions {
    bool foreground = false;
    bool verbose = false;
    bool help = false;
    std::string config_path; // empty: the default config location
};

// Parses the arguments after the program name. The error names the
// offending option.
std::expected<CliOptions, std::string> parse_cli(const std::vector<std::string>& args);

// --help text.
std::string usage_text();
