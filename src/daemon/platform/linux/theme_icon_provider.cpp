#include "platform/linux/theme_icon_provider.hpp"

#include "icons/icon_lookup.hpp"

ThemeIconProvider::ThemeIconProvider(Config::Icons config, KeyImageFormat format)
    : config_(std::move(config)), format_(format) {}

std::expected<std::optional<KeyImage>, std::string>
ThemeIconProvider::icon_for(const std::string& resource_class) {
    if (auto it = cache_.find(resource_class); it != cache_.end()) {
        return it->second;
    }

    auto name = find_desktop_icon(config_.application_dirs, resource_class);
    auto path = name ? find_icon_file(config_.theme_dirs, config_.theme, *name) : std::nullopt;
    if (!path) {
        cache_[resource_class] = std::nullopt;
        return std::optional<KeyImage>{};
    }

    auto image = encode_key_image(*path, format_);
    if (!image) return std::unexpected(image.error());

    cache_[resource_class] = *image;
    return std::optional<KeyImage>(std::move(*image));
}
