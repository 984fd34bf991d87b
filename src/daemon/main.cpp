#include "cli_options.hpp"
#include "config.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "platform/linux/shutdown_signals.hpp"

#include <QCoreApplication>
#include <cerrno>
#include <cstring>
#include <print>
#include <string>
#include <vector>
#include <unistd.h>

static void daemonize() {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0); // parent exits

    setsid();
    if (chdir("/") < 0) _exit(1);

    // Fork again to prevent reacquiring a controlling terminal
    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    // Redirect stdio to /dev/null
    freopen("/dev/null", "r", stdin);
    freopen("/dev/null", "w", stdout);
    freopen("/dev/null", "w", stderr);
}

int main(int argc, char* argv[]) {
    auto opts = parse_cli(std::vector<std::string>(argv + 1, argv + argc));
    if (!opts) {
        std::println(stderr, "plasma-deck: {}", opts.error());
        return 2;
    }
    if (opts->help) {
        std::print("{}", usage_text());
        return 0;
    }
    const bool verbose = opts->verbose;

    Config config;
    if (!opts->config_path.empty()) {
        config = Config::load(opts->config_path);
    } else {
        config = Config::load_default();
    }

    // Fork before Qt starts any threads
    if (!opts->foreground) {
        daemonize();
    }

    if (verbose && opts->foreground) {
        std::println(stderr, "[plasma-deck] Starting (service: {} @ {})",
                     config.dbus.service, config.dbus.path);
    }

    // Before QCoreApplication and the session bus create their threads
    if (auto blocked = block_shutdown_signals(); !blocked) {
        std::println(stderr, "{}", blocked.error());
        return 1;
    }

    QCoreApplication app(argc, argv);

    LinuxEventLoop loop(std::move(config), verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    loop.run();
    return 0;
}
