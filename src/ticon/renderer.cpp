#include <ticon/renderer.h>
#include <ytrace/ytrace.hpp>

#include <cmath>

namespace ticon {

RasterImage drawFrame() {
    // Black everywhere, then the white interior: exact border width
    RasterImage image(kImageSize, kImageSize, Rgb::black());
    image.fillRect(kBorderPx, kBorderPx,
                   kImageSize - 2 * kBorderPx, kImageSize - 2 * kBorderPx,
                   Rgb::white());
    return image;
}

class IconRendererImpl : public IconRenderer {
public:
    IconRendererImpl(font::FontResolver::Ptr fonts, RenderOptions options)
        : _fonts(std::move(fonts)), _options(options) {}

    Result<void> init() {
        if (!_fonts) return Err("IconRenderer: no font resolver");
        if (_options.layout.maxCorrectionPasses < 1) {
            ywarn("IconRenderer: maxCorrectionPasses {} raised to 1",
                  _options.layout.maxCorrectionPasses);
            _options.layout.maxCorrectionPasses = 1;
        }
        return Ok();
    }

    Result<LayoutResult> layout(const IconSpec& spec) override {
        return computeLayout(spec, *_fonts, _options.layout);
    }

    Result<RasterImage> render(const IconSpec& spec) override {
        RasterImage image = drawFrame();
        if (spec.empty()) return Ok(std::move(image));

        auto lay = layout(spec);
        if (!lay) return Err<RasterImage>("IconRenderer: layout failed", lay);

        // Glyphs never touch the border
        const PixelRect inside{kBorderPx, kBorderPx, kImageSize - kBorderPx, kImageSize - kBorderPx};

        for (size_t i = 0; i < spec.size(); ++i) {
            const LineSpec& line = spec[i];
            auto font = _fonts->resolve(lay->fontSizes[i]);
            if (!font) return Err<RasterImage>("IconRenderer: no font for line " + std::to_string(i), font);

            font::TextMask mask = (*font)->rasterize(line.text);
            if (mask.bounds.empty()) continue;

            // Center the ink box on (content center x, line center y)
            int x = static_cast<int>(std::lround(kContentCenterX - mask.width() / 2.0));
            int y = static_cast<int>(std::lround(lay->centersY[i] - mask.height() / 2.0));
            image.composite(mask, x, y, line.color, inside, _options.antialias);

            ydebug("IconRenderer: '{}' {} size={} box={}x{} at ({}, {})",
                   line.text, line.color.hex(), lay->fontSizes[i],
                   mask.width(), mask.height(), x, y);
        }
        return Ok(std::move(image));
    }

    const RenderOptions& options() const override { return _options; }

private:
    font::FontResolver::Ptr _fonts;
    RenderOptions _options;
};

Result<IconRenderer::Ptr> IconRenderer::createImpl(font::FontResolver::Ptr fonts, RenderOptions options) {
    auto impl = std::make_shared<IconRendererImpl>(std::move(fonts), options);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("IconRenderer creation failed", res);
    }
    return Ok(Ptr(std::move(impl)));
}

Result<IconRenderer::Ptr> IconRenderer::createImpl(font::FontResolver::Ptr fonts) {
    return createImpl(std::move(fonts), RenderOptions{});
}

} // namespace ticon
