#pragma once

#include "platform/key_device.hpp"

#include <cstddef>
#include <expected>
#include <string>

// Native key image geometry of a Stream Deck model.
struct KeyImageFormat {
    size_t size = 72; // square, in pixels
    bool flip_x = true;
    bool flip_y = true;
};

// Decodes an image file (PNG, JPEG, BMP or SVG), fits it onto a black
// key-sized canvas and encodes it as JPEG in the device orientation.
std::expected<KeyImage, std::string> encode_key_image(const std::string& path,
                                                      const KeyImageFormat& format);

// All-black key image.
std::expected<KeyImage, std::string> blank_key_image(const KeyImageFormat& format);
