#pragma once

#include <ticon/icon.h>
#include <ticon/font/font.h>

#include <cstdint>
#include <vector>

namespace ticon {

/// Clip rectangle, half-open: [x0, x1) x [y0, y1).
struct PixelRect {
    int x0 = 0;
    int y0 = 0;
    int x1 = 0;
    int y1 = 0;

    bool contains(int x, int y) const { return x >= x0 && x < x1 && y >= y0 && y < y1; }
};

/// Opaque 24-bit RGB image, row-major, 3 bytes per pixel.
class RasterImage {
public:
    RasterImage() = default;
    RasterImage(int width, int height, Rgb fill = Rgb::white());

    int width() const { return _width; }
    int height() const { return _height; }
    PixelRect bounds() const { return {0, 0, _width, _height}; }

    const uint8_t* data() const { return _pixels.data(); }
    size_t byteSize() const { return _pixels.size(); }
    int stride() const { return _width * 3; }

    Rgb pixel(int x, int y) const;
    void setPixel(int x, int y, Rgb color);

    /// Fill [x, x+w) x [y, y+h), clipped to the image.
    void fillRect(int x, int y, int w, int h, Rgb color);

    /// Composite a coverage mask with its top-left at (x, y), clipped to
    /// clip and the image. Antialiased coverage is mixed with the existing
    /// pixel; otherwise coverage >= 128 writes color and lower is skipped.
    void composite(const font::TextMask& mask, int x, int y, Rgb color,
                   const PixelRect& clip, bool antialias);

private:
    size_t offset(int x, int y) const {
        return (static_cast<size_t>(y) * _width + x) * 3;
    }

    int _width = 0;
    int _height = 0;
    std::vector<uint8_t> _pixels;
};

} // namespace ticon
