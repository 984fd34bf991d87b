#pragma once

#include "config.hpp"
#include "coordinator.hpp"
#include "kwin/script_host.hpp"
#include "platform/linux/dbus_callbacks.hpp"
#include "platform/linux/kwin_scripting.hpp"
#include "platform/linux/streamdeck.hpp"
#include "platform/linux/theme_icon_provider.hpp"

#include <QDBusConnection>
#include <QDBusServiceWatcher>
#include <QSocketNotifier>
#include <memory>

// Runs on QCoreApplication's loop: D-Bus calls, deck input reports and
// SIGINT/SIGTERM (via signalfd) are all dispatched on the main thread.
class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    // Requires a QCoreApplication instance.
    bool init();
    void run();
    void request_stop();

private:
    bool open_deck();
    bool setup_signals();
    bool export_callbacks();
    void on_deck_readable();
    void on_signal();

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    QDBusConnection bus_;
    KWinScripting scripting_;
    ScriptHost script_host_;
    StreamDeck deck_;

    // Constructed once the deck's key count and image format are known
    std::unique_ptr<ThemeIconProvider> icons_;
    std::unique_ptr<Coordinator> core_;
    std::unique_ptr<DBusCallbacks> callbacks_;

    std::unique_ptr<QSocketNotifier> deck_notifier_;
    std::unique_ptr<QSocketNotifier> signal_notifier_;
    std::unique_ptr<QDBusServiceWatcher> kwin_watcher_;

    int signal_fd_ = -1;
    bool service_registered_ = false;
};
