#include "host_event.hpp"

#include <format>

std::expected<HostEvent, HostEventError>
parse_host_call(const std::string& member, const std::vector<std::string>& args) {
    if (member == "WindowAdded") {
        if (args.size() != 3) return std::unexpected(HostEventError::InvalidArgs);
        return WindowAddedEvent{args[0], args[1], args[2]};
    }
    if (member == "WindowRemoved") {
        if (args.size() != 1) return std::unexpected(HostEventError::InvalidArgs);
        return WindowRemovedEvent{args[0]};
    }
    if (member == "Log") {
        if (args.size() != 1) return std::unexpected(HostEventError::InvalidArgs);
        return ScriptLogEvent{args[0]};
    }
    return std::unexpected(HostEventError::UnknownMember);
}

std::string host_interface_xml(const std::string& interface_name) {
    return std::format(R"(  <interface name="{}">
    <method name="Log">
      <arg name="message" type="s" direction="in"/>
    </method>
    <method name="WindowAdded">
      <arg name="identity" type="s" direction="in"/>
      <arg name="caption" type="s" direction="in"/>
      <arg name="resourceClass" type="s" direction="in"/>
    </method>
    <method name="WindowRemoved">
      <arg name="identity" type="s" direction="in"/>
    </method>
  </interface>
)", interface_name);
}
