//=============================================================================
// ticon - render up to four lines of text into a 400x400 team icon PNG
//=============================================================================

#include <ticon/config.h>
#include <ticon/font/font-resolver.h>
#include <ticon/icon.h>
#include <ticon/palette.h>
#include <ticon/png-export.h>
#include <ticon/renderer.h>
#include <ticon/sanitizer.h>

#include <args.hxx>
#include <ytrace/ytrace.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <string>
#include <vector>

using namespace ticon;

namespace {

enum ExitCode {
    kExitOk = 0,
    kExitUsage = 1,
    kExitNothingToExport = 2,
    kExitFont = 3,
    kExitExport = 4,
    kExitConfig = 5,
};

void setupLogging(bool verbose) {
    auto logger = spdlog::stderr_color_mt("ticon");
    spdlog::set_default_logger(logger);
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%^%l%$] %v");
}

// Pair line texts with colors by position; missing colors take the palette
// default for their slot.
std::vector<RawLine> buildSlots(const std::vector<std::string>& lines,
                                const std::vector<std::string>& colors,
                                const Palette& palette) {
    if (lines.size() > static_cast<size_t>(kMaxLines)) {
        ywarn("{} lines given, only the first {} are used", lines.size(), kMaxLines);
    }
    if (colors.size() > lines.size()) {
        ywarn("{} colors given for {} lines, extra colors ignored", colors.size(), lines.size());
    }

    std::vector<RawLine> slots;
    for (size_t i = 0; i < lines.size() && i < static_cast<size_t>(kMaxLines); ++i) {
        std::string color = i < colors.size() ? palette.resolve(colors[i])
                                              : palette.defaultForSlot(i).hex();
        if (!isValidHexColor(color)) {
            ywarn("Line {}: invalid color '{}', using black", i + 1, color);
        }
        slots.push_back({lines[i], color});
    }
    return slots;
}

} // anonymous namespace

//=============================================================================
// Main
//=============================================================================

int main(int argc, char* argv[]) {
    args::ArgumentParser parser("ticon", "Render a 400x400 text icon as PNG");
    args::HelpFlag help(parser, "help", "Show help", {'h', "help"});
    args::ValueFlagList<std::string> lineFlags(parser, "text", "Line of text (repeatable, up to 4)", {'l', "line"});
    args::ValueFlagList<std::string> colorFlags(parser, "color", "Line color: preset name or #RRGGBB (by position)", {'c', "color"});
    args::ValueFlag<std::string> outputFlag(parser, "file", "Output PNG path", {'o', "output"});
    args::ValueFlag<std::string> dirFlag(parser, "dir", "Export directory for timestamped files", {'d', "dir"});
    args::ValueFlag<std::string> configFlag(parser, "config", "YAML config file", {"config"});
    args::ValueFlagList<std::string> fontFlags(parser, "path", "Font file tried before the configured ones (repeatable)", {"font"});
    args::Flag noAntialiasFlag(parser, "no-antialias", "Disable antialiased text", {"no-antialias"});
    args::Flag listPresetsFlag(parser, "list-presets", "Print the color presets and exit", {"list-presets"});
    args::Flag verboseFlag(parser, "verbose", "Debug logging", {'v', "verbose"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return kExitOk;
    } catch (const args::Error& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return kExitUsage;
    }

    setupLogging(args::get(verboseFlag));

    YAML::Node overrides(YAML::NodeType::Map);
    if (noAntialiasFlag) {
        overrides["render"]["antialias"] = false;
    }
    if (dirFlag) {
        overrides["export"]["directory"] = args::get(dirFlag);
    }

    auto configRes = Config::create(configFlag ? args::get(configFlag) : std::string(), overrides);
    if (!configRes) {
        yerror("{}", error_msg(configRes));
        return kExitConfig;
    }
    auto config = *configRes;
    auto palette = Palette::fromConfig(*config);

    if (listPresetsFlag) {
        for (const auto& entry : palette.entries()) {
            std::cout << palette.displayName(entry.color) << "\n";
        }
        return kExitOk;
    }

    auto spec = IconSpec::fromSlots(buildSlots(args::get(lineFlags), args::get(colorFlags), palette));
    if (spec.empty()) {
        std::cerr << "Nothing to export: enter at least one line of text." << std::endl;
        return kExitNothingToExport;
    }

    std::vector<std::string> candidates = args::get(fontFlags);
    for (auto& path : config->fontCandidates()) {
        candidates.push_back(std::move(path));
    }

    auto fontsRes = font::FontResolver::create(std::move(candidates));
    if (!fontsRes) {
        yerror("{}", error_msg(fontsRes));
        return kExitFont;
    }

    RenderOptions options;
    options.antialias = config->antialias();
    options.layout.maxCorrectionPasses = config->maxCorrectionPasses();

    auto rendererRes = IconRenderer::create(*fontsRes, options);
    if (!rendererRes) {
        yerror("{}", error_msg(rendererRes));
        return kExitFont;
    }

    auto image = (*rendererRes)->render(spec);
    if (!image) {
        yerror("Render failed: {}", error_msg(image));
        return kExitFont;
    }

    if (outputFlag) {
        std::string path = args::get(outputFlag);
        if (auto res = writePng(*image, path); !res) {
            yerror("{}", error_msg(res));
            return kExitExport;
        }
        yinfo("Icon saved: {}", path);
        return kExitOk;
    }

    auto exported = exportPng(*image, config->exportDirectory(), config->exportPrefix());
    if (!exported) {
        yerror("{}", error_msg(exported));
        return kExitExport;
    }
    std::cout << exported->string() << std::endl;
    return kExitOk;
}
