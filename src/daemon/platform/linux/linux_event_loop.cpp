#include "platform/linux/linux_event_loop.hpp"

#include "platform/linux/shutdown_signals.hpp"

#include <QCoreApplication>
#include <QDBusError>
#include <format>
#include <print>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      bus_(QDBusConnection::sessionBus()),
      scripting_(bus_),
      script_host_(scripting_) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (service_registered_) {
        bus_.unregisterService(QString::fromStdString(config_.dbus.service));
        bus_.unregisterObject(QString::fromStdString(config_.dbus.path));
    }
    deck_notifier_.reset();
    signal_notifier_.reset();
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool LinuxEventLoop::init() {
    if (!bus_.isConnected()) {
        std::println(stderr, "Cannot connect to the session bus: {}",
                     bus_.lastError().message().toStdString());
        return false;
    }

    if (!setup_signals()) return false;
    if (!open_deck()) return false;

    icons_ = std::make_unique<ThemeIconProvider>(config_.icons, deck_.image_format());
    core_ = std::make_unique<Coordinator>(
        CallbackAddress{config_.dbus.service, config_.dbus.path, config_.dbus.interface},
        verbose_, deck_, *icons_, script_host_);

    if (!export_callbacks()) return false;

    deck_notifier_ = std::make_unique<QSocketNotifier>(deck_.event_fd(), QSocketNotifier::Read);
    QObject::connect(deck_notifier_.get(), &QSocketNotifier::activated,
                     deck_notifier_.get(), [this] { on_deck_readable(); });

    // The observer dies with KWin; there is nothing left to serve.
    kwin_watcher_ = std::make_unique<QDBusServiceWatcher>(
        QString::fromLatin1(KWinScripting::SERVICE), bus_,
        QDBusServiceWatcher::WatchForUnregistration);
    QObject::connect(kwin_watcher_.get(), &QDBusServiceWatcher::serviceUnregistered,
                     kwin_watcher_.get(), [this] {
                         std::println(stderr, "[plasma-deck] KWin left the session bus, shutting down");
                         request_stop();
                     });

    if (!core_->start()) return false;
    log("Observer script running");
    return true;
}

// The signals themselves were blocked in main() before any thread started.
bool LinuxEventLoop::setup_signals() {
    auto fd = open_shutdown_signalfd();
    if (!fd) {
        std::println(stderr, "{}", fd.error());
        return false;
    }
    signal_fd_ = *fd;

    signal_notifier_ = std::make_unique<QSocketNotifier>(signal_fd_, QSocketNotifier::Read);
    QObject::connect(signal_notifier_.get(), &QSocketNotifier::activated,
                     signal_notifier_.get(), [this] { on_signal(); });
    return true;
}

bool LinuxEventLoop::open_deck() {
    auto decks = enumerate_decks();
    log("Found " + std::to_string(decks.size()) + " Stream Deck device(s)");

    const DeckInfo* chosen = nullptr;
    for (const auto& d : decks) {
        if (config_.device.serial.empty() || d.serial == config_.device.serial) {
            chosen = &d;
            break;
        }
    }
    if (!chosen) {
        if (config_.device.serial.empty()) {
            std::println(stderr, "No supported Stream Deck found");
        } else {
            std::println(stderr, "No Stream Deck with serial {}", config_.device.serial);
        }
        return false;
    }

    if (!deck_.open(*chosen)) return false;
    if (!deck_.reset()) return false;
    if (!deck_.set_brightness(config_.device.brightness)) {
        std::println(stderr, "Warning: could not set deck brightness");
    }

    log(std::format("Opened '{}' device (serial number: '{}', fw: '{}', {} keys)",
                    deck_.name(), deck_.serial_number(), deck_.firmware_version(),
                    deck_.key_count()));
    return true;
}

bool LinuxEventLoop::export_callbacks() {
    callbacks_ = std::make_unique<DBusCallbacks>(
        config_.dbus.interface,
        [this](const HostEvent& ev) { core_->handle(ev); });

    auto path = QString::fromStdString(config_.dbus.path);
    if (!bus_.registerVirtualObject(path, callbacks_.get())) {
        std::println(stderr, "Failed to register D-Bus object {}: {}", config_.dbus.path,
                     bus_.lastError().message().toStdString());
        return false;
    }

    if (!bus_.registerService(QString::fromStdString(config_.dbus.service))) {
        std::println(stderr, "Failed to register D-Bus service {}: {}", config_.dbus.service,
                     bus_.lastError().message().toStdString());
        bus_.unregisterObject(path);
        return false;
    }
    service_registered_ = true;

    log("D-Bus service " + config_.dbus.service + " at " + config_.dbus.path);
    return true;
}

void LinuxEventLoop::run() {
    QCoreApplication::exec();

    // Clean shutdown: stop then unload the observer before leaving the bus
    log("Cleaning up");
    core_->shutdown();

    if (service_registered_) {
        bus_.unregisterService(QString::fromStdString(config_.dbus.service));
        bus_.unregisterObject(QString::fromStdString(config_.dbus.path));
        service_registered_ = false;
    }

    // Leave the keys dark.
    if (!deck_.reset()) {
        std::println(stderr, "Warning: could not reset deck on exit");
    }
}

void LinuxEventLoop::request_stop() {
    QCoreApplication::quit();
}

void LinuxEventLoop::on_deck_readable() {
    auto events = deck_.read_key_events();
    if (!events) {
        // The fd stays readable once the device is gone; stop watching it.
        std::println(stderr, "[plasma-deck] Stream Deck lost ({}), shutting down", events.error());
        deck_notifier_->setEnabled(false);
        request_stop();
        return;
    }
    for (const auto& ev : *events) {
        core_->handle(ev);
    }
}

void LinuxEventLoop::on_signal() {
    signalfd_siginfo info;
    if (::read(signal_fd_, &info, sizeof(info)) != sizeof(info)) return;
    log("Received signal, shutting down");
    request_stop();
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[plasma-deck] {}", msg);
    }
}
