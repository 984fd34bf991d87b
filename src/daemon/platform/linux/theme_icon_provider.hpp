#pragma once

#include "config.hpp"
#include "platform/icon_provider.hpp"
#include "platform/linux/key_image.hpp"

#include <map>

// Resolves application classes through .desktop files and the icon theme,
// then encodes the icon for the device. Results are cached per class.
class ThemeIconProvider : public IconProvider {
public:
    ThemeIconProvider(Config::Icons config, KeyImageFormat format);

    std::expected<std::optional<KeyImage>, std::string>
        icon_for(const std::string& resource_class) override;

private:
    Config::Icons config_;
    KeyImageFormat format_;
    std::map<std::string, std::optional<KeyImage>> cache_;
};
