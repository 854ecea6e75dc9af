#pragma once

#include <ticon/icon.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ticon {

class Config;

struct PaletteEntry {
    std::string name;
    Rgb color;
};

/// Palette - named color presets offered to the user.
/// Presentation-layer only; the renderer works on Rgb values.
class Palette {
public:
    Palette() = default;
    explicit Palette(std::vector<PaletteEntry> entries) : _entries(std::move(entries)) {}

    /// MS Blue, Black, Green, Purple, Red, Orange, Yellow, Magenta, Cyan, Gray.
    static Palette defaults();

    /// The "palette" sequence of the config; defaults() when it is absent
    /// or holds no valid entry.
    static Palette fromConfig(const Config& config);

    const std::vector<PaletteEntry>& entries() const { return _entries; }
    bool empty() const { return _entries.empty(); }

    /// Case-insensitive lookup by name.
    std::optional<Rgb> find(std::string_view name) const;

    /// Color preselected for input slot i (cycles through the entries).
    Rgb defaultForSlot(size_t slot) const;

    /// "MS Blue (#0078D4)" for palette colors, "#RRGGBB" otherwise.
    std::string displayName(Rgb color) const;

    /// Turn user input into a color string for IconSpec: a preset name or
    /// display name becomes its hex, anything else is returned trimmed and
    /// uppercased for validation downstream.
    std::string resolve(std::string_view input) const;

private:
    std::vector<PaletteEntry> _entries;
};

} // namespace ticon
