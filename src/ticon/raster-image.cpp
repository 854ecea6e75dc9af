#include <ticon/raster-image.h>

#include <algorithm>

namespace ticon {

RasterImage::RasterImage(int width, int height, Rgb fill)
    : _width(std::max(0, width)), _height(std::max(0, height)),
      _pixels(static_cast<size_t>(_width) * _height * 3) {
    fillRect(0, 0, _width, _height, fill);
}

Rgb RasterImage::pixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= _width || y >= _height) return Rgb::black();
    const uint8_t* p = _pixels.data() + offset(x, y);
    return {p[0], p[1], p[2]};
}

void RasterImage::setPixel(int x, int y, Rgb color) {
    if (x < 0 || y < 0 || x >= _width || y >= _height) return;
    uint8_t* p = _pixels.data() + offset(x, y);
    p[0] = color.r;
    p[1] = color.g;
    p[2] = color.b;
}

void RasterImage::fillRect(int x, int y, int w, int h, Rgb color) {
    int x0 = std::max(0, x);
    int y0 = std::max(0, y);
    int x1 = std::min(_width, x + w);
    int y1 = std::min(_height, y + h);
    for (int py = y0; py < y1; ++py) {
        uint8_t* p = _pixels.data() + offset(x0, py);
        for (int px = x0; px < x1; ++px) {
            *p++ = color.r;
            *p++ = color.g;
            *p++ = color.b;
        }
    }
}

void RasterImage::composite(const font::TextMask& mask, int x, int y, Rgb color,
                            const PixelRect& clip, bool antialias) {
    const int cx0 = std::max(clip.x0, 0);
    const int cy0 = std::max(clip.y0, 0);
    const int cx1 = std::min(clip.x1, _width);
    const int cy1 = std::min(clip.y1, _height);

    for (int my = 0; my < mask.height(); ++my) {
        int py = y + my;
        if (py < cy0 || py >= cy1) continue;
        for (int mx = 0; mx < mask.width(); ++mx) {
            int px = x + mx;
            if (px < cx0 || px >= cx1) continue;

            uint8_t alpha = mask.at(mx, my);
            if (alpha == 0) continue;

            uint8_t* p = _pixels.data() + offset(px, py);
            if (!antialias) {
                if (alpha >= 128) {
                    p[0] = color.r;
                    p[1] = color.g;
                    p[2] = color.b;
                }
                continue;
            }

            uint8_t invAlpha = 255 - alpha;
            p[0] = static_cast<uint8_t>((p[0] * invAlpha + color.r * alpha + 127) / 255);
            p[1] = static_cast<uint8_t>((p[1] * invAlpha + color.g * alpha + 127) / 255);
            p[2] = static_cast<uint8_t>((p[2] * invAlpha + color.b * alpha + 127) / 255);
        }
    }
}

} // namespace ticon
