#pragma once

#include <ticon/base/factory.h>
#include <ticon/font/font-resolver.h>
#include <ticon/icon.h>
#include <ticon/layout.h>
#include <ticon/raster-image.h>
#include <ticon/result.hpp>

#include <memory>

namespace ticon {

struct RenderOptions {
    bool antialias = true;
    LayoutOptions layout;
};

/// IconRenderer - turns an IconSpec into the final 400x400 raster.
///
/// render() keeps no state between calls: the frame is drawn fresh, the
/// layout is recomputed and every line is drawn with a font resolved at its
/// own size. It fails only when the font subsystem cannot provide any font.
class IconRenderer : public base::ObjectFactory<IconRenderer> {
public:
    using Ptr = std::shared_ptr<IconRenderer>;

    virtual ~IconRenderer() = default;

    static Result<Ptr> createImpl(font::FontResolver::Ptr fonts, RenderOptions options);
    static Result<Ptr> createImpl(font::FontResolver::Ptr fonts);

    virtual Result<RasterImage> render(const IconSpec& spec) = 0;

    /// Layout only, as used by render().
    virtual Result<LayoutResult> layout(const IconSpec& spec) = 0;

    virtual const RenderOptions& options() const = 0;

protected:
    IconRenderer() = default;
};

/// Black canvas with a white interior inset by kBorderPx.
RasterImage drawFrame();

} // namespace ticon
