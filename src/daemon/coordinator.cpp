#include "coordinator.hpp"

#include <print>
#include <variant>

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace

Coordinator::Coordinator(CallbackAddress callback, bool verbose,
                         KeyDevice& device, IconProvider& icons, ScriptHost& host)
    : callback_(std::move(callback)), verbose_(verbose),
      device_(device), icons_(icons), host_(host),
      slots_(device_.key_count()) {}

bool Coordinator::start() {
    if (state_ != CoordinatorState::Initializing) {
        warn("observer already started");
        return false;
    }

    auto script = host_.load(script_synth::observer_script(callback_));
    if (!script) {
        std::println(stderr, "[plasma-deck] failed to load observer script: {}",
                     to_string(script.error()));
        return false;
    }
    log("Loaded observer script #" + std::to_string(script->id) + ": " + script->path);

    auto res = host_.run(*script);
    if (!res) {
        std::println(stderr, "[plasma-deck] failed to run observer script: {}",
                     to_string(res.error()));
        if (auto unloaded = host_.unload(*script); !unloaded) {
            warn("failed to unload observer script: " + to_string(unloaded.error()));
        }
        return false;
    }

    observer_ = std::move(*script);
    state_ = CoordinatorState::Running;
    return true;
}

void Coordinator::handle(const HostEvent& event) {
    if (state_ != CoordinatorState::Running) {
        log("Ignoring event outside of running state");
        return;
    }

    std::visit(overloaded{
        [this](const KeyStateEvent& ev) { on_key(ev); },
        [this](const WindowAddedEvent& ev) { on_window_added(ev); },
        [this](const WindowRemovedEvent& ev) { on_window_removed(ev); },
        [this](const ScriptLogEvent& ev) { on_script_log(ev); },
    }, event);
}

void Coordinator::on_key(const KeyStateEvent& ev) {
    if (!ev.pressed) return;

    auto identity = slots_.occupant(ev.key);
    if (!identity) return;

    // Activation scripts finish inside run(); earlier ones can go now.
    unload_activations();

    auto script = host_.load(script_synth::activation_script(callback_, *identity));
    if (!script) {
        warn("activation script load failed: " + to_string(script.error()));
        return;
    }

    log("Key " + std::to_string(ev.key) + " -> activating " + *identity);
    auto res = host_.run(*script);
    activations_.push_back(std::move(*script));
    if (!res) {
        warn("activation script run failed: " + to_string(res.error()));
    }
}

void Coordinator::on_window_added(const WindowAddedEvent& ev) {
    log("Add " + ev.identity + " (" + ev.resource_class + ")");

    if (!windows_.insert(WindowData{ev.identity, ev.caption, ev.resource_class})) {
        log("Window " + ev.identity + " was already registered, metadata updated");
    }

    auto slot = slots_.assign(ev.identity);
    if (!slot) {
        log("No free key for " + ev.identity);
        return;
    }

    show_icon(*slot, ev.resource_class);
}

void Coordinator::on_window_removed(const WindowRemovedEvent& ev) {
    log("Remove " + ev.identity);

    if (auto slot = slots_.release(ev.identity)) {
        clear_key(*slot);
    }

    if (!windows_.remove(ev.identity)) {
        warn("removed window " + ev.identity + " was never registered");
    }
}

void Coordinator::on_script_log(const ScriptLogEvent& ev) {
    log("script: " + ev.message);
}

void Coordinator::show_icon(size_t key, const std::string& resource_class) {
    auto icon = icons_.icon_for(resource_class);
    if (!icon) {
        warn("icon for " + resource_class + ": " + icon.error());
        clear_key(key);
        return;
    }
    if (!icon->has_value()) {
        log("No icon for " + resource_class);
        clear_key(key);
        return;
    }

    auto res = device_.set_key_image(key, *icon);
    if (!res) {
        warn("failed to set image on key " + std::to_string(key) + ": " + res.error());
        clear_key(key);
    }
}

void Coordinator::clear_key(size_t key) {
    auto res = device_.set_key_image(key, std::nullopt);
    if (!res) {
        warn("failed to clear key " + std::to_string(key) + ": " + res.error());
    }
}

void Coordinator::unload_activations() {
    for (auto& script : activations_) {
        if (auto res = host_.unload(script); !res) {
            warn("activation script unload failed: " + to_string(res.error()));
        }
    }
    activations_.clear();
}

void Coordinator::shutdown() {
    if (state_ == CoordinatorState::Stopped) return;
    state_ = CoordinatorState::ShuttingDown;

    if (observer_) {
        log("Stopping observer script #" + std::to_string(observer_->id));
        if (auto res = host_.stop(*observer_); !res) {
            warn("observer stop failed: " + to_string(res.error()));
        }
        if (auto res = host_.unload(*observer_); !res) {
            warn("observer unload failed: " + to_string(res.error()));
        }
        observer_.reset();
    }

    unload_activations();
    state_ = CoordinatorState::Stopped;
}

void Coordinator::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[plasma-deck] {}", msg);
    }
}

void Coordinator::warn(const std::string& msg) {
    std::println(stderr, "[plasma-deck] warning: {}", msg);
}
