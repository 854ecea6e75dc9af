#include <ticon/sanitizer.h>
#include <ytrace/ytrace.hpp>

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>

#include <algorithm>
#include <cctype>

namespace ticon {

using icu::Normalizer2;
using icu::UnicodeString;

namespace {

constexpr UChar32 kFirstPrintable = 32;
constexpr UChar32 kLastPrintable = 126;

// NFKD form of the input; the undecomposed text when ICU cannot normalize.
UnicodeString decompose(std::string_view raw) {
    UnicodeString src = UnicodeString::fromUTF8(
        icu::StringPiece(raw.data(), static_cast<int32_t>(raw.size())));

    UErrorCode status = U_ZERO_ERROR;
    const Normalizer2* nfkd = Normalizer2::getNFKDInstance(status);
    if (U_FAILURE(status) || !nfkd) {
        ywarn("sanitize: NFKD unavailable ({}), filtering raw code points",
              u_errorName(status));
        return src;
    }

    UnicodeString out = nfkd->normalize(src, status);
    if (U_FAILURE(status)) {
        ywarn("sanitize: normalization failed ({}), filtering raw code points",
              u_errorName(status));
        return src;
    }
    return out;
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && isSpace(s.front())) s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back())) s.remove_suffix(1);
    return s;
}

} // anonymous namespace

std::string sanitize(std::string_view raw) {
    if (raw.empty()) return {};

    UnicodeString decomposed = decompose(raw);

    std::string ascii;
    ascii.reserve(kMaxChars);
    for (int32_t i = 0; i < decomposed.length();) {
        UChar32 cp = decomposed.char32At(i);
        i += U16_LENGTH(cp);

        // Accents and other combining marks
        if (u_getCombiningClass(cp) != 0) continue;
        if (cp < kFirstPrintable || cp > kLastPrintable) continue;

        ascii.push_back(static_cast<char>(cp));
        if (static_cast<int>(ascii.size()) == kMaxChars) break;
    }

    std::string out(trim(ascii));
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

bool isValidHexColor(std::string_view value) {
    if (value.size() != 7 || value[0] != '#') return false;
    return std::all_of(value.begin() + 1, value.end(),
                       [](char c) { return hexDigit(c) >= 0; });
}

std::optional<Rgb> parseHexColor(std::string_view value) {
    if (!isValidHexColor(value)) return std::nullopt;
    auto byteAt = [&](size_t pos) {
        return static_cast<uint8_t>(hexDigit(value[pos]) * 16 + hexDigit(value[pos + 1]));
    };
    return Rgb{byteAt(1), byteAt(3), byteAt(5)};
}

Rgb colorOrBlack(std::string_view value) {
    return parseHexColor(trim(value)).value_or(Rgb::black());
}

} // namespace ticon
