#pragma once

#include <ticon/icon.h>

#include <optional>
#include <string>
#include <string_view>

namespace ticon {

/// Normalize raw UTF-8 input into render-safe line content:
/// NFKD, combining marks dropped, printable ASCII only, first kMaxChars
/// characters, trimmed, uppercase. Empty result means "no line".
std::string sanitize(std::string_view raw);

/// True iff value is '#' followed by exactly 6 hex digits (any case).
bool isValidHexColor(std::string_view value);

std::optional<Rgb> parseHexColor(std::string_view value);

/// Trims value, then parses it; black when it is not a valid hex color.
Rgb colorOrBlack(std::string_view value);

} // namespace ticon
