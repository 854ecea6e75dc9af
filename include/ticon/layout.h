#pragma once

#include <ticon/icon.h>
#include <ticon/font/font-resolver.h>
#include <ticon/result.hpp>

#include <vector>

namespace ticon {

struct LayoutOptions {
    /// Overflow rescale passes. The first pass is always a single uniform
    /// rescale; further passes only run while the block still overflows.
    /// 1 = strict single pass.
    int maxCorrectionPasses = 4;
};

/// Per-line sizes and vertical centers of an icon's text block.
/// All vectors are parallel to IconSpec::lines().
struct LayoutResult {
    std::vector<int> fontSizes;
    std::vector<int> heights;      // ink height at fontSizes[i]
    std::vector<double> centersY;  // absolute canvas y of each ink center
    int lineGap = 0;
    int totalHeight = 0;
    int correctionPasses = 0;
};

/// Adaptive layout: fit every line to the content width independently,
/// then shrink the whole block if it is taller than the content square and
/// center it vertically.
Result<LayoutResult> computeLayout(const IconSpec& spec,
                                   font::FontResolver& fonts,
                                   const LayoutOptions& options = {});

} // namespace ticon
