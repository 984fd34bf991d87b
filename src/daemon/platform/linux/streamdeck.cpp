#include "platform/linux/streamdeck.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <linux/hidraw.h>
#include <print>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr uint16_t VENDOR_ELGATO = 0x0fd9;
constexpr size_t KEY_STATE_OFFSET = 4;

constexpr std::array<DeckModel, 6> MODELS = {{
    {0x006d, "Stream Deck Original V2", 15, {.size = 72, .flip_x = true, .flip_y = true}},
    {0x0080, "Stream Deck MK.2", 15, {.size = 72, .flip_x = true, .flip_y = true}},
    {0x00a5, "Stream Deck MK.2", 15, {.size = 72, .flip_x = true, .flip_y = true}},
    {0x006c, "Stream Deck XL", 32, {.size = 96, .flip_x = true, .flip_y = true}},
    {0x008f, "Stream Deck XL", 32, {.size = 96, .flip_x = true, .flip_y = true}},
    {0x0084, "Stream Deck +", 8, {.size = 120, .flip_x = false, .flip_y = false}},
}};

} // namespace

std::optional<HidId> parse_hid_uevent(const std::string& content) {
    std::optional<HidId> id;
    std::string uniq;

    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        if (line.starts_with("HID_ID=")) {
            unsigned bus = 0, vendor = 0, product = 0;
            if (std::sscanf(line.c_str() + 7, "%x:%x:%x", &bus, &vendor, &product) != 3) {
                return std::nullopt;
            }
            id = HidId{static_cast<uint16_t>(vendor), static_cast<uint16_t>(product), {}};
        } else if (line.starts_with("HID_UNIQ=")) {
            uniq = line.substr(9);
        }
    }

    if (id) id->uniq = uniq;
    return id;
}

const DeckModel* find_deck_model(uint16_t vendor, uint16_t product) {
    if (vendor != VENDOR_ELGATO) return nullptr;
    auto it = std::find_if(MODELS.begin(), MODELS.end(),
                           [product](const DeckModel& m) { return m.product_id == product; });
    return it == MODELS.end() ? nullptr : &*it;
}

std::vector<KeyStateEvent> diff_key_report(std::span<const uint8_t> report,
                                           std::vector<bool>& states) {
    std::vector<KeyStateEvent> events;

    // 0x01 input report; byte 1 is 0x00 for key state (the + also
    // reports dials and touch strip with other values).
    if (report.size() < KEY_STATE_OFFSET || report[0] != 0x01 || report[1] != 0x00) return events;

    size_t available = std::min(states.size(), report.size() - KEY_STATE_OFFSET);
    for (size_t key = 0; key < available; key++) {
        bool pressed = report[KEY_STATE_OFFSET + key] != 0;
        if (pressed != states[key]) {
            states[key] = pressed;
            events.push_back(KeyStateEvent{key, pressed});
        }
    }
    return events;
}

std::vector<DeckInfo> enumerate_decks() {
    std::vector<DeckInfo> decks;

    std::error_code ec;
    fs::directory_iterator dir("/sys/class/hidraw", ec);
    if (ec) {
        std::println(stderr, "deck: cannot list /sys/class/hidraw: {}", ec.message());
        return decks;
    }

    for (const auto& entry : dir) {
        std::ifstream f(entry.path() / "device" / "uevent");
        if (!f.is_open()) continue;
        std::stringstream content;
        content << f.rdbuf();

        auto id = parse_hid_uevent(content.str());
        if (!id) continue;
        auto* model = find_deck_model(id->vendor, id->product);
        if (!model) continue;

        decks.push_back(DeckInfo{
            .hidraw_path = "/dev/" + entry.path().filename().string(),
            .serial = id->uniq,
            .model = model,
        });
    }

    std::sort(decks.begin(), decks.end(),
              [](const DeckInfo& a, const DeckInfo& b) { return a.hidraw_path < b.hidraw_path; });
    return decks;
}

StreamDeck::StreamDeck() = default;

StreamDeck::~StreamDeck() {
    close();
}

bool StreamDeck::open(const DeckInfo& info) {
    close();

    fd_ = ::open(info.hidraw_path.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
    if (fd_ < 0) {
        std::println(stderr, "deck: open {} failed: {}", info.hidraw_path, std::strerror(errno));
        return false;
    }

    model_ = info.model;
    key_states_.assign(model_->key_count, false);

    auto blank = blank_key_image(model_->image);
    if (!blank) {
        std::println(stderr, "deck: {}", blank.error());
        close();
        return false;
    }
    blank_ = std::move(*blank);
    return true;
}

void StreamDeck::close() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
    model_ = nullptr;
    key_states_.clear();
}

bool StreamDeck::send_feature(std::vector<uint8_t> report) {
    report.resize(FEATURE_REPORT_LENGTH, 0);
    if (::ioctl(fd_, HIDIOCSFEATURE(report.size()), report.data()) < 0) {
        std::println(stderr, "deck: set feature 0x{:02x} failed: {}", report[0], std::strerror(errno));
        return false;
    }
    return true;
}

std::string StreamDeck::get_feature_string(uint8_t report_id, size_t offset) {
    std::array<uint8_t, FEATURE_REPORT_LENGTH> buf{};
    buf[0] = report_id;
    int n = ::ioctl(fd_, HIDIOCGFEATURE(buf.size()), buf.data());
    if (n < 0 || static_cast<size_t>(n) <= offset) return {};

    auto begin = reinterpret_cast<const char*>(buf.data()) + offset;
    auto end = reinterpret_cast<const char*>(buf.data()) + n;
    return std::string(begin, std::find(begin, end, '\0'));
}

bool StreamDeck::reset() {
    if (fd_ < 0) return false;
    std::fill(key_states_.begin(), key_states_.end(), false);
    return send_feature({0x03, 0x02});
}

bool StreamDeck::set_brightness(uint32_t percent) {
    if (fd_ < 0) return false;
    return send_feature({0x03, 0x08, static_cast<uint8_t>(std::min<uint32_t>(percent, 100))});
}

std::string StreamDeck::serial_number() {
    return fd_ < 0 ? std::string() : get_feature_string(0x06, 2);
}

std::string StreamDeck::firmware_version() {
    return fd_ < 0 ? std::string() : get_feature_string(0x05, 6);
}

std::expected<void, std::string>
StreamDeck::set_key_image(size_t key, const std::optional<KeyImage>& image) {
    if (fd_ < 0) return std::unexpected(std::string("device not open"));
    if (key >= key_count()) {
        return std::unexpected("key " + std::to_string(key) + " out of range");
    }
    return write_image(key, image ? *image : blank_);
}

std::expected<void, std::string> StreamDeck::write_image(size_t key, const KeyImage& image) {
    constexpr size_t payload_max = IMAGE_REPORT_LENGTH - IMAGE_HEADER_LENGTH;
    std::array<uint8_t, IMAGE_REPORT_LENGTH> report{};

    size_t sent = 0;
    for (uint16_t page = 0; sent < image.size(); page++) {
        size_t chunk = std::min(payload_max, image.size() - sent);
        bool last = sent + chunk == image.size();

        report.fill(0);
        report[0] = 0x02;
        report[1] = 0x07;
        report[2] = static_cast<uint8_t>(key);
        report[3] = last ? 1 : 0;
        report[4] = static_cast<uint8_t>(chunk & 0xff);
        report[5] = static_cast<uint8_t>(chunk >> 8);
        report[6] = static_cast<uint8_t>(page & 0xff);
        report[7] = static_cast<uint8_t>(page >> 8);
        std::memcpy(report.data() + IMAGE_HEADER_LENGTH, image.data() + sent, chunk);

        ssize_t n;
        do {
            n = ::write(fd_, report.data(), report.size());
        } while (n < 0 && errno == EINTR);

        if (n != static_cast<ssize_t>(report.size())) {
            return std::unexpected(std::format("image page {} write failed: {}", page,
                                               n < 0 ? std::strerror(errno) : "short write"));
        }
        sent += chunk;
    }
    return {};
}

std::expected<std::vector<KeyStateEvent>, std::string> StreamDeck::read_key_events() {
    std::vector<KeyStateEvent> events;
    if (fd_ < 0) return events;

    std::array<uint8_t, INPUT_REPORT_LENGTH> buf;
    while (true) {
        ssize_t n = ::read(fd_, buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            return std::unexpected(std::format("read failed: {}", std::strerror(errno)));
        }
        if (n == 0) break;

        auto changed = diff_key_report(std::span(buf.data(), static_cast<size_t>(n)), key_states_);
        events.insert(events.end(), changed.begin(), changed.end());
    }
    return events;
}
