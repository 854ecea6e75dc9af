//=============================================================================
// IconRenderer Tests
//
// End-to-end rendering. Exact pixel positions are checked with the built-in
// bitmap font; the FreeType cases run where DejaVu Sans Bold is installed.
//=============================================================================

#include <ticon/renderer.h>

#include <boost/ut.hpp>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace ticon;

namespace {

const std::string kDejaVuBold = "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf";

const Rgb kBlue{0x00, 0x78, 0xD4};
const Rgb kRed{0xE8, 0x11, 0x23};

IconRenderer::Ptr makeRenderer(std::vector<std::string> candidates, bool antialias = true) {
    auto fonts = font::FontResolver::create(std::move(candidates));
    if (!fonts) return nullptr;
    RenderOptions options;
    options.antialias = antialias;
    auto renderer = IconRenderer::create(*fonts, options);
    return renderer ? *renderer : nullptr;
}

struct PixelBox {
    int x0 = std::numeric_limits<int>::max();
    int y0 = std::numeric_limits<int>::max();
    int x1 = std::numeric_limits<int>::min();
    int y1 = std::numeric_limits<int>::min();
    size_t count = 0;

    void add(int x, int y) {
        x0 = std::min(x0, x);
        y0 = std::min(y0, y);
        x1 = std::max(x1, x);
        y1 = std::max(y1, y);
        ++count;
    }
    double centerX() const { return (x0 + x1 + 1) / 2.0; }
};

template<typename Pred>
PixelBox boxWhere(const RasterImage& image, Pred pred) {
    PixelBox box;
    for (int y = 0; y < image.height(); ++y) {
        for (int x = 0; x < image.width(); ++x) {
            if (pred(image.pixel(x, y))) box.add(x, y);
        }
    }
    return box;
}

bool borderIsExact(const RasterImage& image) {
    for (int y = 0; y < kImageSize; ++y) {
        for (int x = 0; x < kImageSize; ++x) {
            bool inBorder = x < kBorderPx || y < kBorderPx ||
                            x >= kImageSize - kBorderPx || y >= kImageSize - kBorderPx;
            if (inBorder && image.pixel(x, y) != Rgb::black()) return false;
        }
    }
    return true;
}

bool sameBytes(const RasterImage& a, const RasterImage& b) {
    return a.byteSize() == b.byteSize() && std::memcmp(a.data(), b.data(), a.byteSize()) == 0;
}

} // anonymous namespace

suite frame_tests = [] {
    "frame is a five pixel black border around white"_test = [] {
        auto image = drawFrame();
        expect(image.width() == 400_i);
        expect(image.height() == 400_i);
        expect(image.pixel(0, 0) == Rgb::black());
        expect(image.pixel(4, 200) == Rgb::black());
        expect(image.pixel(5, 5) == Rgb::white());
        expect(image.pixel(394, 394) == Rgb::white());
        expect(image.pixel(395, 200) == Rgb::black());
        expect(image.pixel(200, 399) == Rgb::black());
        expect(borderIsExact(image));
    };
};

suite renderer_tests = [] {
    "creation requires a font resolver"_test = [] {
        auto renderer = IconRenderer::create(font::FontResolver::Ptr{});
        expect(!renderer);
    };

    "non-positive correction passes are raised to one"_test = [] {
        auto fonts = font::FontResolver::create(std::vector<std::string>{});
        if (!fonts) { expect(false); return; }
        RenderOptions options;
        options.layout.maxCorrectionPasses = 0;
        auto renderer = IconRenderer::create(*fonts, options);
        if (!renderer) { expect(false); return; }
        expect((*renderer)->options().layout.maxCorrectionPasses == 1_i);
    };

    "empty spec renders the blank frame"_test = [] {
        auto renderer = makeRenderer({});
        if (!renderer) { expect(false); return; }

        auto image = renderer->render(IconSpec::fromSlots({{"   ", "#0078D4"}, {"", "#E81123"}}));
        if (!image) { expect(false) << error_msg(image); return; }
        expect(sameBytes(*image, drawFrame()));
    };

    "invalid color renders exactly like black"_test = [] {
        auto renderer = makeRenderer({});
        if (!renderer) { expect(false); return; }

        auto invalid = renderer->render(IconSpec::fromSlots({{"Team", "not-a-color"}}));
        auto black = renderer->render(IconSpec::fromSlots({{"Team", "#000000"}}));
        if (!invalid || !black) { expect(false); return; }
        expect(sameBytes(*invalid, *black));
    };

    "border stays exact for any content"_test = [] {
        auto renderer = makeRenderer({});
        if (!renderer) { expect(false); return; }

        const std::vector<std::vector<RawLine>> cases = {
            {{"I", "#0078D4"}},
            {{"WWWWWWWW", "#E81123"}},
            {{"I", "#107C10"}, {"I", "#107C10"}, {"I", "#107C10"}, {"I", "#107C10"}},
            {{"TEAM", "#0078D4"}, {"ALPHA", "#E81123"}},
        };
        for (const auto& slots : cases) {
            auto image = renderer->render(IconSpec::fromSlots(slots));
            if (!image) { expect(false); continue; }
            expect(borderIsExact(*image)) << slots.front().text;
        }
    };

    "TEAM over ALPHA with the built-in font"_test = [] {
        auto renderer = makeRenderer({});
        if (!renderer) { expect(false); return; }

        auto image = renderer->render(IconSpec::fromSlots({{"Team", "#0078D4"}, {"Alpha", "#E81123"}}));
        if (!image) { expect(false) << error_msg(image); return; }

        auto blue = boxWhere(*image, [](Rgb c) { return c == kBlue; });
        auto red = boxWhere(*image, [](Rgb c) { return c == kRed; });
        expect((blue.count > 0_u) >> fatal);
        expect((red.count > 0_u) >> fatal);

        // 368x112 ink box centered on (200, 144)
        expect(blue.x0 == 16_i);
        expect(blue.x1 == 383_i);
        expect(blue.y0 == 88_i);
        expect(blue.y1 == 199_i);
        // 377x91 ink box centered on (200, 265.5)
        expect(red.x0 == 12_i);
        expect(red.y0 == 220_i);
        expect(red.y1 == 310_i);

        expect(std::abs(blue.centerX() - 200.0) <= 3.0);
        expect(std::abs(red.centerX() - 200.0) <= 3.0);
        expect(blue.y1 < red.y0);

        // Nothing but frame and line colors
        auto other = boxWhere(*image, [](Rgb c) {
            return c != Rgb::black() && c != Rgb::white() && c != kBlue && c != kRed;
        });
        expect(other.count == 0_u);
    };

    "layout matches what render draws"_test = [] {
        auto renderer = makeRenderer({});
        if (!renderer) { expect(false); return; }

        auto spec = IconSpec::fromSlots({{"I", "#0078D4"}});
        auto lay = renderer->layout(spec);
        auto image = renderer->render(spec);
        if (!lay || !image) { expect(false); return; }

        // 280px tall "I" centered on y = 200
        auto blue = boxWhere(*image, [](Rgb c) { return c == kBlue; });
        expect(lay->fontSizes == std::vector<int>{400});
        expect(blue.y0 == 60_i);
        expect(blue.y1 == 339_i);
    };

    "DejaVu TEAM over ALPHA is centered and ordered"_test = [] {
        std::error_code ec;
        if (!std::filesystem::exists(kDejaVuBold, ec)) return;

        auto renderer = makeRenderer({kDejaVuBold});
        if (!renderer) { expect(false); return; }

        auto image = renderer->render(IconSpec::fromSlots({{"Team", "#0078D4"}, {"Alpha", "#E81123"}}));
        if (!image) { expect(false) << error_msg(image); return; }

        expect(borderIsExact(*image));

        // Antialiased edges blend towards white; classify by dominant channel
        auto blue = boxWhere(*image, [](Rgb c) { return c != Rgb::white() && c.b > c.r; });
        auto red = boxWhere(*image, [](Rgb c) { return c != Rgb::white() && c.r > c.b && c.r > c.g; });
        expect((blue.count > 0_u) >> fatal);
        expect((red.count > 0_u) >> fatal);

        auto exactBlue = boxWhere(*image, [](Rgb c) { return c == kBlue; });
        auto exactRed = boxWhere(*image, [](Rgb c) { return c == kRed; });
        expect(exactBlue.count > 0_u);
        expect(exactRed.count > 0_u);

        expect(std::abs(blue.centerX() - 200.0) <= 3.0) << "blue center " << blue.centerX();
        expect(std::abs(red.centerX() - 200.0) <= 3.0) << "red center " << red.centerX();
        expect(blue.y1 < red.y0);
        expect(blue.x0 >= kContentLeft - 1 && blue.x1 < kContentLeft + kContentSize + 1);
    };

    "without antialiasing only exact colors are written"_test = [] {
        std::error_code ec;
        if (!std::filesystem::exists(kDejaVuBold, ec)) return;

        auto renderer = makeRenderer({kDejaVuBold}, false);
        if (!renderer) { expect(false); return; }

        auto image = renderer->render(IconSpec::fromSlots({{"Team", "#0078D4"}, {"Alpha", "#E81123"}}));
        if (!image) { expect(false); return; }

        auto other = boxWhere(*image, [](Rgb c) {
            return c != Rgb::black() && c != Rgb::white() && c != kBlue && c != kRed;
        });
        expect(other.count == 0_u);
    };

    "rendering is deterministic"_test = [] {
        auto renderer = makeRenderer(font::FontResolver::defaultCandidates());
        if (!renderer) { expect(false); return; }

        auto spec = IconSpec::fromSlots({{"Sales", "#5C2D91"}, {"EMEA", "#107C10"}, {"2024", "#D83B01"}});
        auto a = renderer->render(spec);
        auto b = renderer->render(spec);
        if (!a || !b) { expect(false); return; }
        expect(sameBytes(*a, *b));
    };
};
