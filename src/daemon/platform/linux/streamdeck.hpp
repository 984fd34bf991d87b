#pragma once

#include "host_event.hpp"
#include "platform/key_device.hpp"
#include "platform/linux/key_image.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

struct DeckModel {
    uint16_t product_id;
    const char* name;
    size_t key_count;
    KeyImageFormat image;
};

struct DeckInfo {
    std::string hidraw_path; // e.g. /dev/hidraw3
    std::string serial;      // HID_UNIQ from sysfs, may be empty
    const DeckModel* model = nullptr;
};

struct HidId {
    uint16_t vendor = 0;
    uint16_t product = 0;
    std::string uniq;
};

// Parses a hidraw device's sysfs uevent file (HID_ID=bus:vendor:product).
std::optional<HidId> parse_hid_uevent(const std::string& content);

const DeckModel* find_deck_model(uint16_t vendor, uint16_t product);

// Compares a key-state input report (01 00 ...) with the last known key
// states and returns the keys that changed, updating `states`. Any other
// report changes nothing.
std::vector<KeyStateEvent> diff_key_report(std::span<const uint8_t> report,
                                           std::vector<bool>& states);

// Supported Stream Decks currently attached, ordered by hidraw node.
std::vector<DeckInfo> enumerate_decks();

// Stream Deck with a JPEG key protocol (Original V2, MK.2, XL, +).
class StreamDeck : public KeyDevice {
public:
    StreamDeck();
    ~StreamDeck() override;

    StreamDeck(const StreamDeck&) = delete;
    StreamDeck& operator=(const StreamDeck&) = delete;

    bool open(const DeckInfo& info);
    void close();

    bool reset();
    bool set_brightness(uint32_t percent);
    std::string serial_number();
    std::string firmware_version();

    size_t key_count() const override { return model_ ? model_->key_count : 0; }
    std::expected<void, std::string>
        set_key_image(size_t key, const std::optional<KeyImage>& image) override;

    const KeyImageFormat& image_format() const { return model_->image; }
    const char* name() const { return model_ ? model_->name : "none"; }

    // FD for event loop registration (readable when key reports arrive).
    int event_fd() const { return fd_; }

    // Drains pending input reports and returns keys whose state changed.
    // An error means the device is gone (unplugged, EIO) and will not
    // recover; the fd should no longer be watched.
    std::expected<std::vector<KeyStateEvent>, std::string> read_key_events();

private:
    static constexpr size_t FEATURE_REPORT_LENGTH = 32;
    static constexpr size_t IMAGE_REPORT_LENGTH = 1024;
    static constexpr size_t IMAGE_HEADER_LENGTH = 8;
    static constexpr size_t INPUT_REPORT_LENGTH = 512;

    bool send_feature(std::vector<uint8_t> report);
    std::string get_feature_string(uint8_t report_id, size_t offset);
    std::expected<void, std::string> write_image(size_t key, const KeyImage& image);

    int fd_ = -1;
    const DeckModel* model_ = nullptr;
    KeyImage blank_;
    std::vector<bool> key_states_;
};
