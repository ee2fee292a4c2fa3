#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace tileforge::raster {

struct Image {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels; // RGBA, row-major, top-to-bottom, 4 bytes per pixel

    Image() = default;
    Image(int w, int h);

    [[nodiscard]] bool empty() const { return width <= 0 || height <= 0; }
};

struct Rgba {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    friend bool operator==(const Rgba&, const Rgba&) = default;
};

// parse_color accepts #RGB, #RRGGBB and #RRGGBBAA.
std::optional<Rgba> parse_color(std::string_view hex);

Image filled(int w, int h, Rgba c);
Rgba pixel(const Image& img, int x, int y);

// contains_region reports whether the rectangle lies inside img.
bool contains_region(const Image& img, int x, int y, int w, int h);

// crop copies a rectangle. Throws std::out_of_range when it leaves img.
Image crop(const Image& img, int x, int y, int w, int h);

// resize_nearest scales without interpolation, keeping pixel-art edges.
Image resize_nearest(const Image& img, int w, int h);

// composite_over alpha-blends src onto dst at (x, y), clipped to dst.
void composite_over(Image& dst, const Image& src, int x, int y);

// --- Codecs ---

enum class Format { Png, Jpeg, Tga };

std::optional<Format> parse_format(std::string_view s);
const char* to_string(Format f);

// decode_tga reads a true-color TGA (24/32 bpp), raw (type 2) or
// run-length encoded (type 10), with either vertical origin.
Image decode_tga(std::istream& r);

// encode_tga writes an uncompressed 32-bit true-color TGA with top-left origin.
void encode_tga(std::ostream& w, const Image& img);

// decode_png decodes any PNG to RGBA.
Image decode_png(const std::vector<uint8_t>& data);

std::vector<uint8_t> encode(const Image& img, Format format, int quality = 90);

// load_image reads a PNG or TGA file, detected by signature.
Image load_image(const std::string& path);

} // namespace tileforge::raster
