#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

// Image already encoded in the device's native key format.
using KeyImage = std::vector<uint8_t>;

class KeyDevice {
public:
    virtual ~KeyDevice() = default;
    virtual size_t key_count() const = 0;
    // nullopt blanks the key.
    virtual std::expected<void, std::string>
        set_key_image(size_t key, const std::optional<KeyImage>& image) = 0;
};
