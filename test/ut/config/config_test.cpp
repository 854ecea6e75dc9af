//=============================================================================
// Config Tests
//
// Defaults, YAML file loading, TICON_* environment overrides and command
// line overrides, in that order of precedence.
//=============================================================================

#include <ticon/config.h>
#include <ticon/font/font-resolver.h>
#include <ticon/palette.h>

#include <boost/ut.hpp>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace ticon;

static const std::string kFixtures = std::string(CMAKE_SOURCE_DIR) + "/test/ut/config/fixtures";

namespace {

// Points XDG_CONFIG_HOME at an empty directory so the host config is never read
struct IsolatedEnv {
    IsolatedEnv() {
        dir = std::filesystem::temp_directory_path() / "ticon-config-test";
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
    }
    ~IsolatedEnv() {
        unsetenv("XDG_CONFIG_HOME");
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
    std::filesystem::path dir;
};

} // anonymous namespace

suite config_default_tests = [] {
    "defaults without a file"_test = [] {
        IsolatedEnv env;
        auto config = Config::create();
        if (!config) { expect(false) << error_msg(config); return; }

        expect((*config)->antialias());
        expect((*config)->maxCorrectionPasses() == 4_i);
        expect((*config)->exportDirectory() == std::string("."));
        expect((*config)->exportPrefix() == std::string("teams_icon_"));
        expect((*config)->fontCandidates() == font::FontResolver::defaultCandidates());
        expect((*config)->loadedFrom().empty());
    };

    "default palette is present"_test = [] {
        IsolatedEnv env;
        auto config = Config::create();
        if (!config) { expect(false); return; }

        expect((*config)->has(Config::KEY_PALETTE));
        auto palette = Palette::fromConfig(**config);
        expect(palette.entries().size() == 10_u);
        expect(palette.entries().front().name == std::string("MS Blue"));
    };

    "missing keys"_test = [] {
        IsolatedEnv env;
        auto config = Config::create();
        if (!config) { expect(false); return; }

        expect(!(*config)->has("no/such/key"));
        expect(!(*config)->get<int>("no/such/key").has_value());
        expect((*config)->get<int>("no/such/key", 7) == 7_i);
        // Present but wrong type
        expect(!(*config)->get<int>(Config::KEY_EXPORT_PREFIX).has_value());
    };

    "XDG path ends in ticon/config.yaml"_test = [] {
        IsolatedEnv env;
        auto path = Config::getXDGConfigPath();
        expect(path == env.dir / "ticon" / "config.yaml");
    };
};

suite config_file_tests = [] {
    "explicit file overrides defaults"_test = [] {
        IsolatedEnv env;
        auto config = Config::create(kFixtures + "/config.yaml");
        if (!config) { expect(false) << error_msg(config); return; }

        expect(!(*config)->antialias());
        expect((*config)->exportPrefix() == std::string("icon_"));
        // Untouched keys keep their defaults
        expect((*config)->exportDirectory() == std::string("."));
        expect((*config)->maxCorrectionPasses() == 4_i);

        auto fonts = (*config)->fontCandidates();
        expect((fonts.size() == 2_u) >> fatal);
        expect(fonts[0] == std::string("/opt/fonts/Custom-Bold.ttf"));
        expect(fonts[1] == std::string("fonts/Local-Bold.ttf"));
        expect((*config)->loadedFrom() == kFixtures + "/config.yaml");
    };

    "XDG file is picked up when no path is given"_test = [] {
        IsolatedEnv env;
        std::filesystem::create_directories(env.dir / "ticon");
        std::filesystem::copy_file(kFixtures + "/config.yaml", env.dir / "ticon" / "config.yaml",
                                   std::filesystem::copy_options::overwrite_existing);

        auto config = Config::create();
        if (!config) { expect(false) << error_msg(config); return; }
        expect((*config)->exportPrefix() == std::string("icon_"));
    };

    "missing explicit file is an error"_test = [] {
        IsolatedEnv env;
        auto config = Config::create(kFixtures + "/does-not-exist.yaml");
        expect(!config);
        if (!config) {
            expect(error_msg(config).find("does-not-exist.yaml") != std::string::npos);
        }
    };

    "malformed YAML is an error"_test = [] {
        IsolatedEnv env;
        auto config = Config::create(kFixtures + "/malformed.yaml");
        expect(!config);
    };

    "palette entries come from the file, invalid ones skipped"_test = [] {
        IsolatedEnv env;
        auto config = Config::create(kFixtures + "/config.yaml");
        if (!config) { expect(false); return; }

        auto palette = Palette::fromConfig(**config);
        expect((palette.entries().size() == 2_u) >> fatal);
        expect(palette.entries()[0].name == std::string("Teal"));
        expect(palette.entries()[1].color == Rgb{0x00, 0x00, 0x80});
        expect(!palette.find("Broken").has_value());
    };
};

suite config_override_tests = [] {
    "environment overrides the file"_test = [] {
        IsolatedEnv env;
        setenv("TICON_EXPORT_PREFIX", "env_", 1);
        setenv("TICON_LAYOUT_MAX_CORRECTION_PASSES", "2", 1);
        setenv("TICON_RENDER_ANTIALIAS", "1", 1);
        setenv("TICON_FONTS_CANDIDATES", "/a.ttf:/b.ttf", 1);

        auto config = Config::create(kFixtures + "/config.yaml");

        unsetenv("TICON_EXPORT_PREFIX");
        unsetenv("TICON_LAYOUT_MAX_CORRECTION_PASSES");
        unsetenv("TICON_RENDER_ANTIALIAS");
        unsetenv("TICON_FONTS_CANDIDATES");

        if (!config) { expect(false) << error_msg(config); return; }
        expect((*config)->exportPrefix() == std::string("env_"));
        expect((*config)->maxCorrectionPasses() == 2_i);
        expect((*config)->antialias());
        expect((*config)->fontCandidates() == std::vector<std::string>{"/a.ttf", "/b.ttf"});
    };

    "command line overrides win over everything"_test = [] {
        IsolatedEnv env;
        setenv("TICON_EXPORT_DIRECTORY", "/from/env", 1);

        YAML::Node overrides;
        overrides["export"]["directory"] = "/from/cli";
        overrides["render"]["antialias"] = true;
        auto config = Config::create(kFixtures + "/config.yaml", overrides);

        unsetenv("TICON_EXPORT_DIRECTORY");

        if (!config) { expect(false) << error_msg(config); return; }
        expect((*config)->exportDirectory() == std::string("/from/cli"));
        expect((*config)->antialias());
        // Siblings of overridden keys survive the merge
        expect((*config)->exportPrefix() == std::string("icon_"));
    };
};
