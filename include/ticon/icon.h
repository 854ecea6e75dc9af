#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ticon {

//=============================================================================
// Canvas geometry
//=============================================================================

constexpr int kImageSize = 400;
constexpr int kBorderPx = 5;
constexpr int kInnerMarginPx = 5;

// Content square, strictly inside border + margin
constexpr int kContentLeft = kBorderPx + kInnerMarginPx;
constexpr int kContentTop = kBorderPx + kInnerMarginPx;
constexpr int kContentSize = kImageSize - 2 * (kBorderPx + kInnerMarginPx);  // 380
constexpr int kContentCenterX = kContentLeft + kContentSize / 2;            // 200

constexpr int kMaxLines = 4;
constexpr int kMaxChars = 8;
constexpr int kMinFont = 8;
constexpr int kMaxFont = 400;
constexpr int kReferenceFontSize = 100;

//=============================================================================
// Rgb
//=============================================================================

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb&) const = default;

    /// "#RRGGBB", uppercase.
    std::string hex() const;

    static constexpr Rgb black() { return {0, 0, 0}; }
    static constexpr Rgb white() { return {255, 255, 255}; }
};

//=============================================================================
// LineSpec / IconSpec
//=============================================================================

/// One rendered line. Text is already sanitized: 1..8 chars of uppercase
/// printable ASCII.
struct LineSpec {
    std::string text;
    Rgb color;
};

/// Raw input slot as entered by a user, before sanitizing.
struct RawLine {
    std::string text;
    std::string color;
};

/// Ordered, immutable list of 0..kMaxLines lines, top to bottom.
class IconSpec {
public:
    IconSpec() = default;

    /// Only the first kMaxLines slots are considered. Slots whose text
    /// sanitizes to empty are dropped; invalid colors become black.
    static IconSpec fromSlots(const std::vector<RawLine>& slots);

    const std::vector<LineSpec>& lines() const { return _lines; }
    size_t size() const { return _lines.size(); }
    bool empty() const { return _lines.empty(); }
    const LineSpec& operator[](size_t i) const { return _lines[i]; }

private:
    explicit IconSpec(std::vector<LineSpec> lines) : _lines(std::move(lines)) {}

    std::vector<LineSpec> _lines;
};

} // namespace ticon
