#include <ticon/palette.h>
#include <ticon/config.h>
#include <ticon/sanitizer.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cctype>

namespace ticon {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

} // anonymous namespace

Palette Palette::defaults() {
    return Palette({
        {"MS Blue", {0x00, 0x78, 0xD4}},
        {"Black",   {0x00, 0x00, 0x00}},
        {"Green",   {0x10, 0x7C, 0x10}},
        {"Purple",  {0x5C, 0x2D, 0x91}},
        {"Red",     {0xE8, 0x11, 0x23}},
        {"Orange",  {0xD8, 0x3B, 0x01}},
        {"Yellow",  {0xFF, 0xB9, 0x00}},
        {"Magenta", {0xB4, 0x00, 0x9E}},
        {"Cyan",    {0x00, 0x99, 0xBC}},
        {"Gray",    {0x60, 0x5E, 0x5C}},
    });
}

Palette Palette::fromConfig(const Config& config) {
    YAML::Node node = config.node(Config::KEY_PALETTE);
    if (!node || !node.IsSequence()) return defaults();

    std::vector<PaletteEntry> entries;
    for (const auto& item : node) {
        if (!item.IsMap() || !item["name"] || !item["color"]) {
            ywarn("Palette: skipping entry without name/color");
            continue;
        }
        auto name = item["name"].as<std::string>("");
        auto color = parseHexColor(trim(item["color"].as<std::string>("")));
        if (name.empty() || !color) {
            ywarn("Palette: skipping invalid entry '{}'", name);
            continue;
        }
        entries.push_back({std::move(name), *color});
    }

    if (entries.empty()) {
        ywarn("Palette: no valid entries in config, using defaults");
        return defaults();
    }
    return Palette(std::move(entries));
}

std::optional<Rgb> Palette::find(std::string_view name) const {
    name = trim(name);
    for (const auto& entry : _entries) {
        if (equalsIgnoreCase(entry.name, name)) return entry.color;
    }
    return std::nullopt;
}

Rgb Palette::defaultForSlot(size_t slot) const {
    if (_entries.empty()) return Rgb::black();
    return _entries[slot % _entries.size()].color;
}

std::string Palette::displayName(Rgb color) const {
    for (const auto& entry : _entries) {
        if (entry.color == color) return entry.name + " (" + color.hex() + ")";
    }
    return color.hex();
}

std::string Palette::resolve(std::string_view input) const {
    std::string_view text = trim(input);
    if (auto color = find(text)) return color->hex();

    // "Name (#RRGGBB)"
    auto open = text.find('(');
    auto close = text.find(')', open == std::string_view::npos ? 0 : open);
    if (open != std::string_view::npos && close != std::string_view::npos) {
        return upper(trim(text.substr(open + 1, close - open - 1)));
    }
    return upper(text);
}

} // namespace ticon
