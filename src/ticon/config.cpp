#include <ticon/config.h>
#include <ticon/font/font-resolver.h>
#include <ticon/layout.h>
#include <ticon/palette.h>
#include <ticon/png-export.h>
#include <ytrace/ytrace.hpp>

#include <cctype>
#include <cstdlib>
#include <sstream>

namespace ticon {

namespace {

#ifdef _WIN32
constexpr char kListSeparator = ';';
#else
constexpr char kListSeparator = ':';
#endif

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream ss(value);
    std::string item;
    while (std::getline(ss, item, kListSeparator)) {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

// Navigates with reset() so no node content is ever overwritten
void setPath(YAML::Node& root, const std::string& path, const YAML::Node& value) {
    auto parts = splitPath(path);
    if (parts.empty()) return;

    YAML::Node current;
    current.reset(root);
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node next = current[parts[i]];
        if (!next.IsMap()) {
            next = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(next);
    }
    current[parts.back()] = value;
}

} // anonymous namespace

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map), _configPath(configPath), _cmdOverrides(cmdOverrides) {}

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<void> Config::init() noexcept {
    try {
        loadDefaults();

        if (!_configPath.empty()) {
            if (auto res = loadFile(_configPath); !res) {
                return Err("Cannot load config " + _configPath, res);
            }
            yinfo("Loaded config from: {}", _configPath);
        } else {
            auto xdgPath = getXDGConfigPath();
            std::error_code ec;
            if (std::filesystem::exists(xdgPath, ec)) {
                if (auto res = loadFile(xdgPath.string()); !res) {
                    ywarn("Failed to load config file {}: {}", xdgPath.string(), error_msg(res));
                } else {
                    yinfo("Loaded config from: {}", xdgPath.string());
                }
            }
        }

        applyEnvOverrides(YAML::Clone(_config), "");

        if (_cmdOverrides && _cmdOverrides.IsMap()) {
            mergeNodes(_config, _cmdOverrides);
        }
    } catch (const YAML::Exception& e) {
        return Err("Config: " + std::string(e.what()));
    }
    return Ok();
}

void Config::loadDefaults() {
    YAML::Node candidates(YAML::NodeType::Sequence);
    for (const auto& path : font::FontResolver::defaultCandidates()) {
        candidates.push_back(path);
    }
    setPath(_config, KEY_FONT_CANDIDATES, candidates);

    setPath(_config, KEY_RENDER_ANTIALIAS, YAML::Node(true));
    setPath(_config, KEY_LAYOUT_MAX_CORRECTION_PASSES, YAML::Node(LayoutOptions{}.maxCorrectionPasses));
    setPath(_config, KEY_EXPORT_DIRECTORY, YAML::Node("."));
    setPath(_config, KEY_EXPORT_PREFIX, YAML::Node(kDefaultExportPrefix));

    YAML::Node palette(YAML::NodeType::Sequence);
    for (const auto& entry : Palette::defaults().entries()) {
        YAML::Node item(YAML::NodeType::Map);
        item["name"] = entry.name;
        item["color"] = entry.color.hex();
        palette.push_back(item);
    }
    setPath(_config, KEY_PALETTE, palette);
}

Result<void> Config::loadFile(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Err<void>("Config file not found: " + path);
    }
    try {
        YAML::Node fileConfig = YAML::LoadFile(path);
        if (fileConfig && fileConfig.IsMap()) {
            mergeNodes(_config, fileConfig);
        } else if (fileConfig && !fileConfig.IsNull()) {
            return Err<void>("Config file is not a mapping: " + path);
        }
        _loadedFrom = path;
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()));
    }
}

void Config::applyEnvOverrides(const YAML::Node& node, const std::string& prefix) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string fullPath = prefix.empty() ? key : prefix + "/" + key;
        const YAML::Node& value = it->second;

        // Structured lists are file-only
        if (fullPath == KEY_PALETTE) continue;

        if (value.IsMap()) {
            applyEnvOverrides(value, fullPath);
            continue;
        }

        std::string envVar = pathToEnvVar(fullPath);
        const char* env = std::getenv(envVar.c_str());
        if (!env) continue;

        std::string s(env);
        if (value.IsSequence()) {
            YAML::Node list(YAML::NodeType::Sequence);
            for (const auto& item : splitList(s)) list.push_back(item);
            setPath(_config, fullPath, list);
        } else if (s == "1" || s == "0") {
            std::string old = value.as<std::string>("");
            bool isBool = old == "true" || old == "false";
            setPath(_config, fullPath, isBool ? YAML::Node(s == "1") : YAML::Node(s));
        } else {
            setPath(_config, fullPath, YAML::Node(s));
        }
        ydebug("Config override from env: {}={}", envVar, s);
    }
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '/' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        YAML::Node existing = target[key];
        if (value.IsMap() && existing.IsMap()) {
            mergeNodes(existing, value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

YAML::Node Config::node(const std::string& path) const {
    YAML::Node current;
    current.reset(_config);
    for (const auto& part : splitPath(path)) {
        if (!current.IsMap()) return YAML::Node();
        const YAML::Node& map = current;
        YAML::Node next = map[part];
        if (!next) return YAML::Node();
        current.reset(next);
    }
    return current;
}

bool Config::has(const std::string& path) const {
    YAML::Node value = node(path);
    return value && !value.IsNull();
}

std::vector<std::string> Config::getStringList(const std::string& path) const {
    std::vector<std::string> result;
    YAML::Node value = node(path);
    if (!value) return result;

    if (value.IsSequence()) {
        for (const auto& item : value) {
            if (item.IsScalar()) result.push_back(item.as<std::string>());
        }
    } else if (value.IsScalar()) {
        result = splitList(value.as<std::string>());
    }
    return result;
}

std::vector<std::string> Config::fontCandidates() const {
    return getStringList(KEY_FONT_CANDIDATES);
}

bool Config::antialias() const {
    return get<bool>(KEY_RENDER_ANTIALIAS, true);
}

int Config::maxCorrectionPasses() const {
    return get<int>(KEY_LAYOUT_MAX_CORRECTION_PASSES, LayoutOptions{}.maxCorrectionPasses);
}

std::string Config::exportDirectory() const {
    return get<std::string>(KEY_EXPORT_DIRECTORY, ".");
}

std::string Config::exportPrefix() const {
    return get<std::string>(KEY_EXPORT_PREFIX, kDefaultExportPrefix);
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;

#ifdef _WIN32
    const char* appData = std::getenv("APPDATA");
    if (appData && appData[0] != '\0') {
        configDir = appData;
    } else {
        configDir = "C:\\";
    }
#else
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }
#endif

    return configDir / "ticon" / "config.yaml";
}

} // namespace ticon
