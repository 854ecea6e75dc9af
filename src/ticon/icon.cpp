#include <ticon/icon.h>
#include <ticon/sanitizer.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cstdio>

namespace ticon {

std::string Rgb::hex() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", r, g, b);
    return buf;
}

IconSpec IconSpec::fromSlots(const std::vector<RawLine>& slots) {
    if (slots.size() > static_cast<size_t>(kMaxLines)) {
        ywarn("IconSpec: {} input slots, only the first {} are used",
              slots.size(), kMaxLines);
    }

    std::vector<LineSpec> lines;
    size_t count = std::min(slots.size(), static_cast<size_t>(kMaxLines));
    for (size_t i = 0; i < count; ++i) {
        std::string text = sanitize(slots[i].text);
        if (text.empty()) continue;

        lines.push_back(LineSpec{std::move(text), colorOrBlack(slots[i].color)});
    }
    return IconSpec(std::move(lines));
}

} // namespace ticon
