//=============================================================================
// IconSpec Tests
//=============================================================================

#include <ticon/icon.h>

#include <boost/ut.hpp>

#include <string>
#include <vector>

using namespace boost::ut;
using namespace ticon;

suite icon_spec_tests = [] {
    "no slots gives an empty spec"_test = [] {
        auto spec = IconSpec::fromSlots({});
        expect(spec.empty());
        expect(spec.size() == 0_u);
    };

    "lines keep slot order"_test = [] {
        auto spec = IconSpec::fromSlots({{"team", "#0078D4"}, {"alpha", "#E81123"}});
        expect((spec.size() == 2_u) >> fatal);
        expect(spec[0].text == std::string("TEAM"));
        expect(spec[0].color == Rgb{0x00, 0x78, 0xD4});
        expect(spec[1].text == std::string("ALPHA"));
        expect(spec[1].color == Rgb{0xE8, 0x11, 0x23});
    };

    "only the first four slots are used"_test = [] {
        auto spec = IconSpec::fromSlots({
            {"a", "#000000"}, {"b", "#000000"}, {"c", "#000000"},
            {"d", "#000000"}, {"e", "#000000"},
        });
        expect((spec.size() == 4_u) >> fatal);
        expect(spec[3].text == std::string("D"));
    };

    "the cap counts input slots, not surviving lines"_test = [] {
        auto spec = IconSpec::fromSlots({
            {"", "#000000"}, {"  ", "#000000"}, {"日本", "#000000"},
            {"", "#000000"}, {"late", "#000000"},
        });
        expect(spec.empty());
    };

    "slots that sanitize to empty are dropped"_test = [] {
        auto spec = IconSpec::fromSlots({{"", "#E81123"}, {"hi", "#107C10"}, {"   ", "#000000"}, {"yo", "#5C2D91"}});
        expect((spec.size() == 2_u) >> fatal);
        expect(spec[0].text == std::string("HI"));
        expect(spec[0].color == Rgb{0x10, 0x7C, 0x10});
        expect(spec[1].text == std::string("YO"));
    };

    "invalid colors become black"_test = [] {
        auto spec = IconSpec::fromSlots({{"a", "red"}, {"b", ""}, {"c", "#12345"}, {"d", "#GG0000"}});
        expect((spec.size() == 4_u) >> fatal);
        for (const auto& line : spec.lines()) {
            expect(line.color == Rgb::black()) << line.text;
        }
    };

    "colors are trimmed and case-insensitive"_test = [] {
        auto spec = IconSpec::fromSlots({{"x", "  #b4009e  "}});
        expect((spec.size() == 1_u) >> fatal);
        expect(spec[0].color == Rgb{0xB4, 0x00, 0x9E});
    };
};
