#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <variant>
#include <vector>

// Events delivered to the Coordinator. The first three arrive as D-Bus
// method calls from scripts running inside KWin, the last from the device.
struct WindowAddedEvent {
    std::string identity;
    std::string caption;
    std::string resource_class;
};

struct WindowRemovedEvent {
    std::string identity;
};

struct ScriptLogEvent {
    std::string message;
};

struct KeyStateEvent {
    size_t key = 0;
    bool pressed = false;
};

using HostEvent = std::variant<WindowAddedEvent, WindowRemovedEvent, ScriptLogEvent, KeyStateEvent>;

enum class HostEventError { UnknownMember, InvalidArgs };

// Maps an exported method call (member name plus string arguments) to an event.
std::expected<HostEvent, HostEventError>
    parse_host_call(const std::string& member, const std::vector<std::string>& args);

// Introspection XML for the exported callback interface.
std::string host_interface_xml(const std::string& interface_name);
