#include <ticon/font/font.h>
#include <ticon/font/freetype.h>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <algorithm>
#include <cstddef>
#include <cstdlib>

namespace ticon::font {

namespace {

uint8_t bitmapCoverage(const FT_Bitmap& bitmap, int x, int y) {
    const uint8_t* row = bitmap.buffer + static_cast<ptrdiff_t>(y) * std::abs(bitmap.pitch);
    if (bitmap.pixel_mode == FT_PIXEL_MODE_MONO) {
        return (row[x >> 3] & (0x80 >> (x & 7))) ? 255 : 0;
    }
    return row[x];
}

} // anonymous namespace

class FreeTypeFontImpl : public Font {
public:
    FreeTypeFontImpl(std::shared_ptr<const std::vector<uint8_t>> data,
                     std::string name, int pixelSize)
        : _data(std::move(data)), _name(std::move(name)), _pixelSize(pixelSize) {}

    ~FreeTypeFontImpl() override {
        if (_face) FT_Done_Face(_face);
    }

    Result<void> init() {
        if (!_data || _data->empty()) {
            return Err("FreeTypeFont: no font data for " + _name);
        }
        auto lib = ftLibrary();
        if (!lib) return Err("FreeTypeFont: no FreeType library", lib);

        FT_Error err = FT_New_Memory_Face(*lib,
                                          _data->data(),
                                          static_cast<FT_Long>(_data->size()),
                                          0, &_face);
        if (err) {
            _face = nullptr;
            return Err("FreeTypeFont: cannot open " + _name + ", FreeType error " + std::to_string(err));
        }

        err = FT_Set_Pixel_Sizes(_face, 0, static_cast<FT_UInt>(_pixelSize));
        if (err) {
            return Err("FreeTypeFont: " + _name + " does not load at " +
                       std::to_string(_pixelSize) + "px, FreeType error " + std::to_string(err));
        }
        return Ok();
    }

    const std::string& name() const override { return _name; }
    int pixelSize() const override { return _pixelSize; }
    bool isBuiltin() const override { return false; }

    TextBounds measure(const std::string& text) override {
        TextBounds bounds;
        forEachGlyph(text, [&](const FT_Bitmap& bitmap, int x, int y) {
            bounds.unite(x, y, x + static_cast<int>(bitmap.width), y + static_cast<int>(bitmap.rows));
        });
        return bounds;
    }

    TextMask rasterize(const std::string& text) override {
        TextMask mask;
        mask.bounds = measure(text);
        if (mask.bounds.empty()) return mask;

        mask.coverage.assign(static_cast<size_t>(mask.width()) * mask.height(), 0);
        forEachGlyph(text, [&](const FT_Bitmap& bitmap, int x, int y) {
            for (int gy = 0; gy < static_cast<int>(bitmap.rows); ++gy) {
                int my = y + gy - mask.bounds.top;
                for (int gx = 0; gx < static_cast<int>(bitmap.width); ++gx) {
                    int mx = x + gx - mask.bounds.left;
                    uint8_t& dst = mask.coverage[static_cast<size_t>(my) * mask.width() + mx];
                    // Overlapping glyphs (kerned pairs) keep the stronger coverage
                    dst = std::max(dst, bitmapCoverage(bitmap, gx, gy));
                }
            }
        });
        return mask;
    }

private:
    // Lay out text on a single baseline and call fn(bitmap, x, y) for every
    // non-empty glyph bitmap, (x, y) being its top-left relative to the origin.
    template<typename Fn>
    void forEachGlyph(const std::string& text, Fn&& fn) {
        if (!_face || text.empty()) return;

        const bool kerning = FT_HAS_KERNING(_face);
        FT_Pos pen = 0;  // 26.6
        FT_UInt previous = 0;

        for (unsigned char ch : text) {
            FT_UInt glyphIndex = FT_Get_Char_Index(_face, ch);
            if (kerning && previous && glyphIndex) {
                FT_Vector delta;
                if (FT_Get_Kerning(_face, previous, glyphIndex, FT_KERNING_DEFAULT, &delta) == 0) {
                    pen += delta.x;
                }
            }

            if (FT_Load_Glyph(_face, glyphIndex, FT_LOAD_RENDER) == 0) {
                const FT_GlyphSlot slot = _face->glyph;
                const FT_Bitmap& bitmap = slot->bitmap;
                if (bitmap.width > 0 && bitmap.rows > 0) {
                    int x = static_cast<int>((pen + 32) >> 6) + slot->bitmap_left;
                    int y = -slot->bitmap_top;
                    fn(bitmap, x, y);
                }
                pen += slot->advance.x;
            } else {
                pen += static_cast<FT_Pos>(_pixelSize) * 32;  // half an em
            }
            previous = glyphIndex;
        }
    }

    std::shared_ptr<const std::vector<uint8_t>> _data;
    std::string _name;
    int _pixelSize;
    FT_Face _face = nullptr;
};

Result<Font::Ptr> Font::createImpl(std::shared_ptr<const std::vector<uint8_t>> data,
                                   const std::string& name, int pixelSize) {
    auto impl = std::make_shared<FreeTypeFontImpl>(std::move(data), name, pixelSize);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Font creation failed", res);
    }
    return Ok(Ptr(std::move(impl)));
}

} // namespace ticon::font
