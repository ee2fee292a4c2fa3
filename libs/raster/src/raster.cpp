#include "tileforge/raster.h"

#include <png.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <algorithm>
#include <cstring>
#include <format>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tileforge::raster {

Image::Image(int w, int h) : width(w), height(h) {
    if (w < 0 || h < 0)
        throw std::invalid_argument(std::format("raster: invalid dimensions {}x{}", w, h));
    pixels.assign(static_cast<size_t>(w) * static_cast<size_t>(h) * 4, 0);
}

static size_t offset(const Image& img, int x, int y) {
    return (static_cast<size_t>(y) * static_cast<size_t>(img.width) + static_cast<size_t>(x)) * 4;
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<Rgba> parse_color(std::string_view hex) {
    if (!hex.empty() && hex[0] == '#') hex.remove_prefix(1);

    std::vector<int> d;
    for (char c : hex) {
        int v = hex_digit(c);
        if (v < 0) return std::nullopt;
        d.push_back(v);
    }
    auto byte = [&](size_t i) { return static_cast<uint8_t>(d[i] * 16 + d[i + 1]); };

    switch (d.size()) {
        case 3:
            return Rgba{static_cast<uint8_t>(d[0] * 17), static_cast<uint8_t>(d[1] * 17),
                        static_cast<uint8_t>(d[2] * 17), 255};
        case 6: return Rgba{byte(0), byte(2), byte(4), 255};
        case 8: return Rgba{byte(0), byte(2), byte(4), byte(6)};
        default: return std::nullopt;
    }
}

Image filled(int w, int h, Rgba c) {
    Image img(w, h);
    for (size_t i = 0; i < img.pixels.size(); i += 4) {
        img.pixels[i] = c.r;
        img.pixels[i + 1] = c.g;
        img.pixels[i + 2] = c.b;
        img.pixels[i + 3] = c.a;
    }
    return img;
}

Rgba pixel(const Image& img, int x, int y) {
    if (x < 0 || y < 0 || x >= img.width || y >= img.height)
        throw std::out_of_range("raster: pixel out of range");
    size_t o = offset(img, x, y);
    return {img.pixels[o], img.pixels[o + 1], img.pixels[o + 2], img.pixels[o + 3]};
}

bool contains_region(const Image& img, int x, int y, int w, int h) {
    return x >= 0 && y >= 0 && w > 0 && h > 0 && x + w <= img.width && y + h <= img.height;
}

Image crop(const Image& img, int x, int y, int w, int h) {
    if (!contains_region(img, x, y, w, h))
        throw std::out_of_range(std::format("raster: crop {}x{} at ({}, {}) exceeds {}x{}", w, h, x, y, img.width,
                                            img.height));
    Image out(w, h);
    const size_t row_bytes = static_cast<size_t>(w) * 4;
    for (int row = 0; row < h; row++) {
        std::memcpy(&out.pixels[offset(out, 0, row)], &img.pixels[offset(img, x, y + row)], row_bytes);
    }
    return out;
}

Image resize_nearest(const Image& img, int w, int h) {
    if (img.empty() || w <= 0 || h <= 0) return Image(std::max(w, 0), std::max(h, 0));
    Image out(w, h);
    for (int y = 0; y < h; y++) {
        int sy = static_cast<int>(static_cast<int64_t>(y) * img.height / h);
        for (int x = 0; x < w; x++) {
            int sx = static_cast<int>(static_cast<int64_t>(x) * img.width / w);
            std::memcpy(&out.pixels[offset(out, x, y)], &img.pixels[offset(img, sx, sy)], 4);
        }
    }
    return out;
}

void composite_over(Image& dst, const Image& src, int x, int y) {
    const int x0 = std::max(0, x);
    const int y0 = std::max(0, y);
    const int x1 = std::min(dst.width, x + src.width);
    const int y1 = std::min(dst.height, y + src.height);

    for (int py = y0; py < y1; py++) {
        for (int px = x0; px < x1; px++) {
            const uint8_t* s = &src.pixels[offset(src, px - x, py - y)];
            uint8_t* d = &dst.pixels[offset(dst, px, py)];
            const unsigned sa = s[3];
            if (sa == 255) {
                std::memcpy(d, s, 4);
                continue;
            }
            if (sa == 0) continue;

            // Porter-Duff "over" on straight alpha. out_a is the result
            // alpha times 255.
            const unsigned da = d[3];
            const unsigned out_a = sa * 255 + da * (255 - sa);
            for (int c = 0; c < 3; c++) {
                const unsigned num = s[c] * sa * 255 + d[c] * da * (255 - sa);
                d[c] = static_cast<uint8_t>((num + out_a / 2) / out_a);
            }
            d[3] = static_cast<uint8_t>((out_a + 127) / 255);
        }
    }
}

// ---------------------------------------------------------------------------
// Codecs
// ---------------------------------------------------------------------------

std::optional<Format> parse_format(std::string_view s) {
    if (s == "png") return Format::Png;
    if (s == "jpeg" || s == "jpg") return Format::Jpeg;
    if (s == "tga") return Format::Tga;
    return std::nullopt;
}

const char* to_string(Format f) {
    switch (f) {
        case Format::Png: return "png";
        case Format::Jpeg: return "jpeg";
        case Format::Tga: return "tga";
    }
    return "png";
}

namespace {

struct TgaHeader {
    int id_length = 0;
    int image_type = 0;
    int width = 0;
    int height = 0;
    int bytes_per_pixel = 0;
    bool top_origin = false;
};

TgaHeader read_tga_header(std::istream& r) {
    uint8_t hdr[18];
    if (!r.read(reinterpret_cast<char*>(hdr), sizeof(hdr))) throw std::runtime_error("tga: truncated header");

    TgaHeader h;
    h.id_length = hdr[0];
    h.image_type = hdr[2];
    h.width = hdr[12] | (hdr[13] << 8);
    h.height = hdr[14] | (hdr[15] << 8);
    h.bytes_per_pixel = hdr[16] / 8;
    h.top_origin = (hdr[17] & 0x20) != 0;

    if (hdr[1] != 0) throw std::runtime_error("tga: color-mapped images are not supported");
    if (h.image_type != 2 && h.image_type != 10)
        throw std::runtime_error(std::format("tga: unsupported image type {}, expected 2 or 10", h.image_type));
    if (hdr[16] != 24 && hdr[16] != 32)
        throw std::runtime_error(std::format("tga: unsupported pixel depth {}", hdr[16]));
    if (h.width == 0 || h.height == 0)
        throw std::runtime_error(std::format("tga: invalid dimensions {}x{}", h.width, h.height));
    return h;
}

// Reads the pixel stream of a TGA body in file order, expanding RLE packets.
class TgaPixelReader {
public:
    TgaPixelReader(std::istream& r, const TgaHeader& h) : r_(r), bpp_(h.bytes_per_pixel), rle_(h.image_type == 10) {}

    Rgba next() {
        if (!rle_) return read_one();
        if (left_ == 0) {
            const int packet = r_.get();
            if (packet == std::char_traits<char>::eof()) throw std::runtime_error("tga: truncated RLE packet");
            repeat_ = (packet & 0x80) != 0;
            left_ = (packet & 0x7F) + 1;
            if (repeat_) run_ = read_one();
        }
        left_--;
        return repeat_ ? run_ : read_one();
    }

private:
    Rgba read_one() {
        uint8_t bgra[4] = {0, 0, 0, 255};
        if (!r_.read(reinterpret_cast<char*>(bgra), bpp_)) throw std::runtime_error("tga: truncated pixel data");
        return {bgra[2], bgra[1], bgra[0], bgra[3]};
    }

    std::istream& r_;
    int bpp_;
    bool rle_;
    bool repeat_ = false;
    int left_ = 0;
    Rgba run_;
};

} // namespace

Image decode_tga(std::istream& r) {
    const TgaHeader h = read_tga_header(r);
    if (h.id_length > 0 && !r.ignore(h.id_length)) throw std::runtime_error("tga: truncated ID field");

    Image img(h.width, h.height);
    TgaPixelReader pixels(r, h);
    for (int row = 0; row < h.height; row++) {
        const int y = h.top_origin ? row : h.height - 1 - row;
        for (int x = 0; x < h.width; x++) {
            const Rgba c = pixels.next();
            uint8_t* d = &img.pixels[offset(img, x, y)];
            d[0] = c.r;
            d[1] = c.g;
            d[2] = c.b;
            d[3] = c.a;
        }
    }
    return img;
}

void encode_tga(std::ostream& w, const Image& img) {
    if (img.empty() || img.width > 0xFFFF || img.height > 0xFFFF)
        throw std::runtime_error(std::format("tga: cannot encode {}x{} image", img.width, img.height));

    const uint8_t hdr[18] = {
        0, 0, 2, 0, 0, 0, 0, 0, 0, 0, 0, 0,
        static_cast<uint8_t>(img.width), static_cast<uint8_t>(img.width >> 8),
        static_cast<uint8_t>(img.height), static_cast<uint8_t>(img.height >> 8),
        32, 0x28, // 8 alpha bits, top-left origin
    };
    w.write(reinterpret_cast<const char*>(hdr), sizeof(hdr));

    // RGBA to BGRA, whole image at once.
    std::vector<uint8_t> body(img.pixels);
    for (size_t i = 0; i < body.size(); i += 4) std::swap(body[i], body[i + 2]);
    w.write(reinterpret_cast<const char*>(body.data()), static_cast<std::streamsize>(body.size()));
    if (!w) throw std::runtime_error("tga: write failed");
}

Image decode_png(const std::vector<uint8_t>& data) {
    png_image png;
    std::memset(&png, 0, sizeof(png));
    png.version = PNG_IMAGE_VERSION;

    if (!png_image_begin_read_from_memory(&png, data.data(), data.size()))
        throw std::runtime_error(std::format("png: {}", png.message));

    png.format = PNG_FORMAT_RGBA;
    Image img(static_cast<int>(png.width), static_cast<int>(png.height));
    if (!png_image_finish_read(&png, nullptr, img.pixels.data(), 0, nullptr)) {
        std::string msg = png.message;
        png_image_free(&png);
        throw std::runtime_error(std::format("png: {}", msg));
    }
    return img;
}

static void append_bytes(void* ctx, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(ctx);
    const auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

std::vector<uint8_t> encode(const Image& img, Format format, int quality) {
    if (img.empty()) throw std::runtime_error("raster: cannot encode an empty image");

    std::vector<uint8_t> out;
    int ok = 0;
    switch (format) {
        case Format::Png:
            ok = stbi_write_png_to_func(append_bytes, &out, img.width, img.height, 4, img.pixels.data(),
                                        img.width * 4);
            break;
        case Format::Jpeg:
            ok = stbi_write_jpg_to_func(append_bytes, &out, img.width, img.height, 4, img.pixels.data(),
                                        std::clamp(quality, 1, 100));
            break;
        case Format::Tga: {
            std::ostringstream ss;
            encode_tga(ss, img);
            const std::string s = ss.str();
            out.assign(s.begin(), s.end());
            ok = 1;
            break;
        }
    }
    if (!ok) throw std::runtime_error(std::format("{}: encoding failed", to_string(format)));
    return out;
}

Image load_image(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error(std::format("raster: cannot open {}", path));
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    static const uint8_t png_sig[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    if (data.size() >= 8 && std::memcmp(data.data(), png_sig, 8) == 0) return decode_png(data);

    std::istringstream ss(std::string(data.begin(), data.end()));
    return decode_tga(ss);
}

} // namespace tileforge::raster
