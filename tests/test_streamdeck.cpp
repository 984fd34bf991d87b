#include <catch2/catch_test_macros.hpp>

#include "platform/linux/key_image.hpp"
#include "platform/linux/streamdeck.hpp"

#include <array>
#include <cstdint>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image.h>
#include <stb_image_write.h>

namespace fs = std::filesystem;

namespace {

std::vector<uint8_t> key_report(std::initializer_list<size_t> pressed, size_t keys = 15) {
    std::vector<uint8_t> report(4 + keys, 0);
    report[0] = 0x01;
    report[1] = 0x00;
    report[2] = static_cast<uint8_t>(keys);
    for (size_t key : pressed) report[4 + key] = 1;
    return report;
}

// Per-process scratch directory, removed on scope exit.
struct TmpDir {
    fs::path root;

    TmpDir() {
        root = fs::temp_directory_path() / ("pd_test_deck_" + std::to_string(getpid()));
        fs::create_directories(root);
    }

    ~TmpDir() { fs::remove_all(root); }
};

// Decoded key image as RGB.
struct Decoded {
    std::unique_ptr<stbi_uc, decltype(&stbi_image_free)> rgb{nullptr, &stbi_image_free};
    int width = 0;
    int height = 0;

    std::array<int, 3> at(int x, int y) const {
        const stbi_uc* px = rgb.get() + (y * width + x) * 3;
        return {px[0], px[1], px[2]};
    }
};

Decoded decode_jpeg(const KeyImage& image) {
    Decoded out;
    int channels = 0;
    out.rgb.reset(stbi_load_from_memory(image.data(), static_cast<int>(image.size()),
                                        &out.width, &out.height, &channels, 3));
    return out;
}

bool is_red(const std::array<int, 3>& px) {
    return px[0] > 180 && px[1] < 80 && px[2] < 80;
}

bool is_black(const std::array<int, 3>& px) {
    return px[0] < 60 && px[1] < 60 && px[2] < 60;
}

// 8x4 icon: left half opaque red, right half fully transparent white.
void write_half_red_png(const fs::path& path) {
    std::vector<uint8_t> rgba(8 * 4 * 4);
    for (size_t y = 0; y < 4; y++) {
        for (size_t x = 0; x < 8; x++) {
            uint8_t* px = rgba.data() + (y * 8 + x) * 4;
            if (x < 4) {
                px[0] = 255; px[1] = 0; px[2] = 0; px[3] = 255;
            } else {
                px[0] = 255; px[1] = 255; px[2] = 255; px[3] = 0;
            }
        }
    }
    stbi_write_png(path.c_str(), 8, 4, 4, rgba.data(), 8 * 4);
}

} // namespace

TEST_CASE("Stream Deck identification", "[deck]") {

    SECTION("ParseUevent") {
        auto id = parse_hid_uevent(
            "DRIVER=hid-generic\n"
            "HID_ID=0003:00000FD9:00000080\n"
            "HID_NAME=Elgato Stream Deck MK.2\n"
            "HID_PHYS=usb-0000:00:14.0-2/input0\n"
            "HID_UNIQ=DL12K1A00042\n");
        REQUIRE(id.has_value());
        REQUIRE(id->vendor == 0x0fd9);
        REQUIRE(id->product == 0x0080);
        REQUIRE(id->uniq == "DL12K1A00042");
    }

    SECTION("UeventWithoutHidId") {
        REQUIRE_FALSE(parse_hid_uevent("DRIVER=hid-generic\n").has_value());
        REQUIRE_FALSE(parse_hid_uevent("HID_ID=garbage\n").has_value());
    }

    SECTION("KnownModels") {
        auto* mk2 = find_deck_model(0x0fd9, 0x0080);
        REQUIRE(mk2 != nullptr);
        REQUIRE(mk2->key_count == 15);
        REQUIRE(mk2->image.size == 72);

        auto* plus = find_deck_model(0x0fd9, 0x0084);
        REQUIRE(plus != nullptr);
        REQUIRE(plus->key_count == 8);
        REQUIRE_FALSE(plus->image.flip_x);
    }

    SECTION("UnsupportedDevices") {
        REQUIRE(find_deck_model(0x0fd9, 0x0063) == nullptr); // Mini, BMP protocol
        REQUIRE(find_deck_model(0x046d, 0x0080) == nullptr);
    }

    SECTION("ClosedDeviceRejectsImages") {
        StreamDeck deck;
        REQUIRE(deck.key_count() == 0);
        REQUIRE_FALSE(deck.set_key_image(0, std::nullopt).has_value());
        auto events = deck.read_key_events();
        REQUIRE(events.has_value());
        REQUIRE(events->empty());
    }
}

TEST_CASE("Key report diffing", "[deck]") {
    std::vector<bool> states(15, false);

    SECTION("PressThenRelease") {
        auto pressed = diff_key_report(key_report({2}), states);
        REQUIRE(pressed.size() == 1);
        REQUIRE(pressed[0].key == 2);
        REQUIRE(pressed[0].pressed);
        REQUIRE(states[2]);

        auto released = diff_key_report(key_report({}), states);
        REQUIRE(released.size() == 1);
        REQUIRE(released[0].key == 2);
        REQUIRE_FALSE(released[0].pressed);
    }

    SECTION("RepeatedReportIsSilent") {
        REQUIRE(diff_key_report(key_report({0, 7}), states).size() == 2);
        REQUIRE(diff_key_report(key_report({0, 7}), states).empty());

        // Only the key that changed is reported
        auto events = diff_key_report(key_report({0}), states);
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].key == 7);
        REQUIRE_FALSE(events[0].pressed);
    }

    SECTION("OtherReportsIgnored") {
        auto dial = key_report({1});
        dial[1] = 0x03; // Stream Deck + dial report
        REQUIRE(diff_key_report(dial, states).empty());
        REQUIRE(diff_key_report(std::vector<uint8_t>{0x01}, states).empty());
        REQUIRE_FALSE(states[1]);
    }

    SECTION("ShortReportCoversOnlyItsKeys") {
        auto report = key_report({0, 1}, 2);
        auto events = diff_key_report(report, states);
        REQUIRE(events.size() == 2);
        REQUIRE_FALSE(states[2]);
    }
}

TEST_CASE("Stream Deck input", "[deck]") {
    const DeckModel* mk2 = find_deck_model(0x0fd9, 0x0080);
    REQUIRE(mk2 != nullptr);

    SECTION("ReportsChangedKeysFromTheDevice") {
        TmpDir dir;
        auto fifo = dir.root / "hidraw";
        REQUIRE(::mkfifo(fifo.c_str(), 0600) == 0);

        StreamDeck deck;
        REQUIRE(deck.open(DeckInfo{.hidraw_path = fifo.string(), .serial = {}, .model = mk2}));

        auto nothing = deck.read_key_events();
        REQUIRE(nothing.has_value());
        REQUIRE(nothing->empty());

        int writer = ::open(fifo.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);
        REQUIRE(writer >= 0);
        // One full-length input report per read
        auto report = key_report({4});
        report.resize(512, 0);
        REQUIRE(::write(writer, report.data(), report.size()) == static_cast<ssize_t>(report.size()));
        ::close(writer);

        auto events = deck.read_key_events();
        REQUIRE(events.has_value());
        REQUIRE(events->size() == 1);
        REQUIRE((*events)[0].key == 4);
        REQUIRE((*events)[0].pressed);
    }

    SECTION("ReadErrorIsReported") {
        // Reading address 0 of our own memory fails with EIO, like an
        // unplugged hidraw node.
        StreamDeck deck;
        REQUIRE(deck.open(DeckInfo{.hidraw_path = "/proc/self/mem", .serial = {}, .model = mk2}));

        auto events = deck.read_key_events();
        REQUIRE_FALSE(events.has_value());
        REQUIRE(events.error().find("read failed") != std::string::npos);
    }
}

TEST_CASE("Key image encoding", "[deck]") {

    SECTION("BlankImageIsJpeg") {
        auto img = blank_key_image(KeyImageFormat{.size = 72, .flip_x = true, .flip_y = true});
        REQUIRE(img.has_value());
        REQUIRE(img->size() > 4);
        REQUIRE((*img)[0] == 0xFF);
        REQUIRE((*img)[1] == 0xD8);
        REQUIRE((*img)[img->size() - 2] == 0xFF);
        REQUIRE((*img)[img->size() - 1] == 0xD9);
    }

    SECTION("WideIconIsLetterboxedOntoBlack") {
        TmpDir dir;
        auto png = dir.root / "wide.png";
        write_half_red_png(png);

        auto img = encode_key_image(png.string(),
                                    KeyImageFormat{.size = 32, .flip_x = false, .flip_y = false});
        REQUIRE(img.has_value());

        auto key = decode_jpeg(*img);
        REQUIRE(key.rgb != nullptr);
        REQUIRE(key.width == 32);
        REQUIRE(key.height == 32);

        // 8x4 scales to 32x16, centred at rows 8..23
        REQUIRE(is_red(key.at(4, 16)));
        REQUIRE(is_black(key.at(27, 16))); // transparent blends to black
        REQUIRE(is_black(key.at(4, 2)));   // letterbox above
        REQUIRE(is_black(key.at(4, 29)));  // and below
    }

    SECTION("FlipMirrorsPixels") {
        TmpDir dir;
        auto png = dir.root / "wide.png";
        write_half_red_png(png);

        auto img = encode_key_image(png.string(),
                                    KeyImageFormat{.size = 32, .flip_x = true, .flip_y = true});
        REQUIRE(img.has_value());

        auto key = decode_jpeg(*img);
        REQUIRE(key.rgb != nullptr);
        REQUIRE(is_black(key.at(4, 16)));
        REQUIRE(is_red(key.at(27, 16)));
    }

    SECTION("SvgIconIsRasterized") {
        TmpDir dir;
        auto svg = dir.root / "wide.svg";
        std::ofstream(svg) << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"20\" height=\"10\">"
                              "<rect x=\"0\" y=\"0\" width=\"10\" height=\"10\" fill=\"#ff0000\"/>"
                              "</svg>";

        auto img = encode_key_image(svg.string(),
                                    KeyImageFormat{.size = 32, .flip_x = false, .flip_y = false});
        REQUIRE(img.has_value());

        auto key = decode_jpeg(*img);
        REQUIRE(key.rgb != nullptr);
        REQUIRE(is_red(key.at(4, 16)));
        REQUIRE(is_black(key.at(27, 16)));
        REQUIRE(is_black(key.at(4, 2)));
    }

    SECTION("InvalidSvgIsError") {
        TmpDir dir;
        auto svg = dir.root / "broken.svg";
        std::ofstream(svg) << "not an svg";
        auto img = encode_key_image(svg.string(), KeyImageFormat{});
        REQUIRE_FALSE(img.has_value());
        REQUIRE(img.error().find("failed to decode") != std::string::npos);
    }

    SECTION("UndecodableFileIsError") {
        auto img = encode_key_image("/tmp/pd_test_no_such_icon.png", KeyImageFormat{});
        REQUIRE_FALSE(img.has_value());
        REQUIRE(img.error().find("failed to decode") != std::string::npos);
    }
}
