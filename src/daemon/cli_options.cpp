#include "cli_options.hpp"

std::expected<CliOptions, std::string> parse_cli(const std::vector<std::string>& args) {
    CliOptions opts;
    for (size_t i = 0; i < args.size(); i++) {
        const auto& arg = args[i];
        if (arg == "--foreground" || arg == "-f") {
            opts.foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= args.size() || args[i + 1].empty()) {
                return std::unexpected(arg + " needs a path");
            }
            opts.config_path = args[++i];
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else {
            return std::unexpected("unknown option '" + arg + "' (see --help)");
        }
    }
    return opts;
}

std::string usage_text() {
    return "Usage: plasma-deck [options]\n"
           "Shows the open KWin windows on a Stream Deck; pressing a key activates its window.\n"
           "\n"
           "Options:\n"
           "  -f, --foreground    Stay attached to the terminal and log to stderr\n"
           "  -v, --verbose       Log window, key and KWin script activity\n"
           "  -c, --config PATH   Config file (default: $XDG_CONFIG_HOME/plasma-deck/config.json)\n"
           "  -h, --help          Show this help\n";
}
