#include "platform/linux/key_image.hpp"

#include <QImage>
#include <QPainter>
#include <QSvgRenderer>
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <jpeglib.h>
#include <memory>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_PNG
#define STBI_ONLY_JPEG
#define STBI_ONLY_BMP
#include <stb_image.h>

namespace {

constexpr int JPEG_QUALITY = 95;

// RGB888, row-major, size x size.
using Canvas = std::vector<uint8_t>;

// Straight-alpha RGBA pixels, row-major.
struct RgbaImage {
    std::vector<uint8_t> pixels;
    size_t width = 0;
    size_t height = 0;
};

bool is_svg(const std::string& path) {
    return path.ends_with(".svg") || path.ends_with(".svgz");
}

std::expected<RgbaImage, std::string> decode_raster(const std::string& path) {
    int w = 0, h = 0, channels = 0;
    std::unique_ptr<stbi_uc, decltype(&stbi_image_free)> pixels(
        stbi_load(path.c_str(), &w, &h, &channels, 4), &stbi_image_free);
    if (!pixels) {
        return std::unexpected("failed to decode " + path + ": " + stbi_failure_reason());
    }

    RgbaImage image{.width = static_cast<size_t>(w), .height = static_cast<size_t>(h)};
    image.pixels.assign(pixels.get(), pixels.get() + image.width * image.height * 4);
    return image;
}

// Renders the SVG at the key size, keeping its aspect ratio.
std::expected<RgbaImage, std::string> render_svg(const std::string& path, size_t size) {
    QSvgRenderer renderer(QString::fromStdString(path));
    if (!renderer.isValid()) {
        return std::unexpected("failed to decode " + path + ": invalid SVG");
    }

    QSize target(static_cast<int>(size), static_cast<int>(size));
    QSize natural = renderer.defaultSize();
    if (natural.isValid() && !natural.isEmpty()) {
        target = natural.scaled(target, Qt::KeepAspectRatio).expandedTo(QSize(1, 1));
    }

    QImage canvas(target, QImage::Format_ARGB32_Premultiplied);
    canvas.fill(Qt::transparent);
    {
        QPainter painter(&canvas);
        renderer.render(&painter);
    }

    QImage rgba = canvas.convertToFormat(QImage::Format_RGBA8888);
    RgbaImage image{.width = static_cast<size_t>(rgba.width()),
                    .height = static_cast<size_t>(rgba.height())};
    image.pixels.resize(image.width * image.height * 4);
    for (size_t y = 0; y < image.height; y++) {
        std::copy_n(rgba.constScanLine(static_cast<int>(y)), image.width * 4,
                    image.pixels.data() + y * image.width * 4);
    }
    return image;
}

// Box-filters an RGBA image into the centre of the canvas, keeping the
// aspect ratio. Transparent pixels blend to black.
void fit_onto(Canvas& canvas, size_t size, const uint8_t* rgba, size_t w, size_t h) {
    size_t tw = size, th = size;
    if (w > h) th = std::max<size_t>(1, size * h / w);
    else if (h > w) tw = std::max<size_t>(1, size * w / h);
    size_t ox = (size - tw) / 2;
    size_t oy = (size - th) / 2;

    for (size_t dy = 0; dy < th; dy++) {
        size_t sy0 = dy * h / th;
        size_t sy1 = std::max(sy0 + 1, (dy + 1) * h / th);
        for (size_t dx = 0; dx < tw; dx++) {
            size_t sx0 = dx * w / tw;
            size_t sx1 = std::max(sx0 + 1, (dx + 1) * w / tw);

            uint32_t acc[3] = {0, 0, 0};
            uint32_t count = 0;
            for (size_t sy = sy0; sy < sy1; sy++) {
                for (size_t sx = sx0; sx < sx1; sx++) {
                    const uint8_t* px = rgba + (sy * w + sx) * 4;
                    for (int c = 0; c < 3; c++) acc[c] += px[c] * px[3] / 255;
                    count++;
                }
            }

            uint8_t* out = canvas.data() + ((oy + dy) * size + (ox + dx)) * 3;
            for (int c = 0; c < 3; c++) out[c] = static_cast<uint8_t>(acc[c] / count);
        }
    }
}

void apply_flip(Canvas& canvas, const KeyImageFormat& format) {
    const size_t n = format.size;
    Canvas out(canvas.size());
    for (size_t y = 0; y < n; y++) {
        size_t sy = format.flip_y ? n - 1 - y : y;
        for (size_t x = 0; x < n; x++) {
            size_t sx = format.flip_x ? n - 1 - x : x;
            std::copy_n(canvas.data() + (sy * n + sx) * 3, 3, out.data() + (y * n + x) * 3);
        }
    }
    canvas = std::move(out);
}

std::expected<KeyImage, std::string> encode_jpeg(const Canvas& canvas, size_t size) {
    jpeg_compress_struct cinfo{};
    jpeg_error_mgr jerr{};
    cinfo.err = jpeg_std_error(&jerr);
    jpeg_create_compress(&cinfo);

    unsigned char* buf = nullptr;
    unsigned long buf_size = 0;
    jpeg_mem_dest(&cinfo, &buf, &buf_size);

    cinfo.image_width = static_cast<JDIMENSION>(size);
    cinfo.image_height = static_cast<JDIMENSION>(size);
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, JPEG_QUALITY, TRUE);

    jpeg_start_compress(&cinfo, TRUE);
    while (cinfo.next_scanline < cinfo.image_height) {
        auto* row = const_cast<JSAMPLE*>(canvas.data() + cinfo.next_scanline * size * 3);
        jpeg_write_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);

    if (!buf || buf_size == 0) {
        std::free(buf);
        return std::unexpected(std::string("jpeg encoding produced no data"));
    }
    KeyImage image(buf, buf + buf_size);
    std::free(buf);
    return image;
}

} // namespace

std::expected<KeyImage, std::string> encode_key_image(const std::string& path,
                                                      const KeyImageFormat& format) {
    auto decoded = is_svg(path) ? render_svg(path, format.size) : decode_raster(path);
    if (!decoded) return std::unexpected(decoded.error());

    Canvas canvas(format.size * format.size * 3, 0);
    fit_onto(canvas, format.size, decoded->pixels.data(), decoded->width, decoded->height);
    apply_flip(canvas, format);
    return encode_jpeg(canvas, format.size);
}

std::expected<KeyImage, std::string> blank_key_image(const KeyImageFormat& format) {
    Canvas canvas(format.size * format.size * 3, 0);
    return encode_jpeg(canvas, format.size);
}
