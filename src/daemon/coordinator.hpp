#pragma once

#include "host_event.hpp"
#include "kwin/script_host.hpp"
#include "kwin/script_synth.hpp"
#include "platform/icon_provider.hpp"
#include "platform/key_device.hpp"
#include "slot_table.hpp"
#include "window_registry.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

enum class CoordinatorState { Initializing, Running, ShuttingDown, Stopped };

// Keeps device keys in sync with the windows KWin reports and turns key
// presses into window activations. All methods run on the event loop thread.
class Coordinator {
public:
    Coordinator(CallbackAddress callback, bool verbose,
                KeyDevice& device, IconProvider& icons, ScriptHost& host);

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // Loads and runs the observer script. Returns false if either step fails;
    // nothing stays loaded on the host in that case.
    bool start();

    void handle(const HostEvent& event);

    // Stops and unloads the observer, then unloads any activation scripts.
    void shutdown();

    CoordinatorState state() const { return state_; }
    const SlotTable& slots() const { return slots_; }
    const WindowRegistry& windows() const { return windows_; }
    bool observer_loaded() const { return observer_.has_value(); }
    size_t pending_activations() const { return activations_.size(); }

private:
    void on_key(const KeyStateEvent& ev);
    void on_window_added(const WindowAddedEvent& ev);
    void on_window_removed(const WindowRemovedEvent& ev);
    void on_script_log(const ScriptLogEvent& ev);

    void show_icon(size_t key, const std::string& resource_class);
    void clear_key(size_t key);
    void unload_activations();

    void log(const std::string& msg);
    void warn(const std::string& msg);

    CallbackAddress callback_;
    bool verbose_;

    KeyDevice& device_;
    IconProvider& icons_;
    ScriptHost& host_;

    CoordinatorState state_ = CoordinatorState::Initializing;
    SlotTable slots_;
    WindowRegistry windows_;

    std::optional<LoadedScript> observer_;
    std::vector<LoadedScript> activations_;
};
