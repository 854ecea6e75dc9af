#pragma once

#include <ticon/base/factory.h>
#include <ticon/result.hpp>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ticon::font {

/// Tight ink box of a string, in pixels relative to the pen origin on the
/// baseline, y growing downwards. Empty when nothing is inked.
struct TextBounds {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    int width() const { return right - left; }
    int height() const { return bottom - top; }
    bool empty() const { return right <= left || bottom <= top; }

    /// Grow to include the rectangle [x0, x1) x [y0, y1).
    void unite(int x0, int y0, int x1, int y1) {
        if (x1 <= x0 || y1 <= y0) return;
        if (empty()) {
            left = x0; top = y0; right = x1; bottom = y1;
            return;
        }
        left = std::min(left, x0);
        top = std::min(top, y0);
        right = std::max(right, x1);
        bottom = std::max(bottom, y1);
    }
};

/// 8-bit coverage of a rendered string, covering exactly its ink box.
struct TextMask {
    TextBounds bounds;
    std::vector<uint8_t> coverage;  // row-major, bounds.width() per row

    int width() const { return bounds.width(); }
    int height() const { return bounds.height(); }
    uint8_t at(int x, int y) const { return coverage[static_cast<size_t>(y) * width() + x]; }
};

/// Font - a scalable font resolved at one pixel size.
/// Used for both measurement and drawing, so layout and pixels agree.
class Font : public base::ObjectFactory<Font> {
public:
    using Ptr = std::shared_ptr<Font>;

    virtual ~Font() = default;

    /// FreeType face over in-memory TTF/OTF data, set to pixelSize.
    static Result<Ptr> createImpl(std::shared_ptr<const std::vector<uint8_t>> data,
                                  const std::string& name, int pixelSize);

    /// Built-in 5x7 bitmap font, integer-scaled towards pixelSize.
    static Result<Ptr> createBuiltin(int pixelSize);

    virtual const std::string& name() const = 0;
    virtual int pixelSize() const = 0;
    virtual bool isBuiltin() const = 0;

    virtual TextBounds measure(const std::string& text) = 0;
    virtual TextMask rasterize(const std::string& text) = 0;

protected:
    Font() = default;
};

} // namespace ticon::font
