#include <ticon/layout.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace ticon {

namespace {

// Interline gap relative to the median line height
constexpr double kGapRatio = 0.18;

Result<font::TextBounds> measureAt(font::FontResolver& fonts, const std::string& text, int size) {
    auto font = fonts.resolve(size);
    if (!font) {
        return Err<font::TextBounds>("layout: cannot resolve a font at " + std::to_string(size) + "px", font);
    }
    return Ok((*font)->measure(text));
}

Result<std::vector<int>> measureHeights(font::FontResolver& fonts, const IconSpec& spec,
                                        const std::vector<int>& sizes) {
    std::vector<int> heights;
    heights.reserve(spec.size());
    for (size_t i = 0; i < spec.size(); ++i) {
        auto bounds = measureAt(fonts, spec[i].text, sizes[i]);
        if (!bounds) return Err<std::vector<int>>("layout: height measurement failed", bounds);
        heights.push_back(bounds->height());
    }
    return Ok(std::move(heights));
}

// Upper median for an even count.
int medianOf(std::vector<int> values) {
    std::sort(values.begin(), values.end());
    return values[values.size() / 2];
}

int blockHeight(const std::vector<int>& heights, int gap) {
    int sum = std::accumulate(heights.begin(), heights.end(), 0);
    return sum + gap * static_cast<int>(heights.size() - 1);
}

// a / 2 rounded towards negative infinity.
int floorHalf(int a) {
    return a >= 0 ? a / 2 : -((-a + 1) / 2);
}

} // anonymous namespace

Result<LayoutResult> computeLayout(const IconSpec& spec,
                                   font::FontResolver& fonts,
                                   const LayoutOptions& options) {
    LayoutResult out;
    const size_t n = spec.size();
    if (n == 0) return Ok(std::move(out));

    // 1) Fit each line to the content width on its own
    out.fontSizes.reserve(n);
    for (const auto& line : spec.lines()) {
        auto ref = measureAt(fonts, line.text, kReferenceFontSize);
        if (!ref) return Err<LayoutResult>("layout: width fit failed for '" + line.text + "'", ref);

        int refWidth = std::max(ref->width(), 1);
        int size = static_cast<int>(static_cast<double>(kContentSize) / refWidth * kReferenceFontSize);
        out.fontSizes.push_back(std::clamp(size, kMinFont, kMaxFont));
    }

    // 2) Heights at those sizes
    auto heights = measureHeights(fonts, spec, out.fontSizes);
    if (!heights) return Err<LayoutResult>("layout failed", heights);
    out.heights = std::move(*heights);

    // 3) Gap from the median height
    if (n > 1) {
        auto gap = static_cast<int>(std::lround(kGapRatio * medianOf(out.heights)));
        out.lineGap = std::max(gap, 1);
    }
    out.totalHeight = blockHeight(out.heights, out.lineGap);

    // 4) Shrink sizes and gap uniformly while the block overflows
    for (int pass = 0; pass < options.maxCorrectionPasses && out.totalHeight > kContentSize; ++pass) {
        const double ratio = static_cast<double>(kContentSize) / out.totalHeight;
        bool shrunk = false;
        for (int& size : out.fontSizes) {
            int scaled = std::max(static_cast<int>(size * ratio), kMinFont);
            if (pass > 0 && scaled >= size && size > kMinFont) {
                scaled = size - 1;
            }
            shrunk = shrunk || scaled != size;
            size = scaled;
        }

        heights = measureHeights(fonts, spec, out.fontSizes);
        if (!heights) return Err<LayoutResult>("layout failed after overflow correction", heights);
        out.heights = std::move(*heights);

        if (n > 1) {
            out.lineGap = std::max(static_cast<int>(out.lineGap * ratio), 1);
        }
        int before = out.totalHeight;
        out.totalHeight = blockHeight(out.heights, out.lineGap);
        out.correctionPasses = pass + 1;
        ydebug("layout: overflow pass {} ratio {:.4f}, height {} -> {}",
               out.correctionPasses, ratio, before, out.totalHeight);

        if (!shrunk) break;
    }
    if (out.totalHeight > kContentSize) {
        ywarn("layout: block is {}px tall, content square is {}px", out.totalHeight, kContentSize);
    }

    // 5) Center the block and record each line's center
    const int blockTop = kContentTop + floorHalf(kContentSize - out.totalHeight);
    out.centersY.reserve(n);
    double y = blockTop;
    for (size_t i = 0; i < n; ++i) {
        out.centersY.push_back(y + out.heights[i] / 2.0);
        y += out.heights[i] + out.lineGap;
    }

    return Ok(std::move(out));
}

} // namespace ticon
