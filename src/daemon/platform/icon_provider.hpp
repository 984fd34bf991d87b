#pragma once

#include "platform/key_device.hpp"

#include <expected>
#include <optional>
#include <string>

class IconProvider {
public:
    virtual ~IconProvider() = default;
    // Key image for an application class. nullopt when the application has
    // no usable icon, an error when one was found but could not be prepared.
    virtual std::expected<std::optional<KeyImage>, std::string>
        icon_for(const std::string& resource_class) = 0;
};
