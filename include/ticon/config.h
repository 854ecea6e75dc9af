#pragma once

#include <ticon/result.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ticon {

/// Config - YAML configuration with layered sources.
///
/// Precedence, lowest first: built-in defaults, config file (explicit path
/// or $XDG_CONFIG_HOME/ticon/config.yaml), TICON_* environment variables,
/// command line overrides. Keys are slash paths such as "render/antialias".
class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    /// An explicit configPath must exist and parse; the XDG file is optional.
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    // Non-copyable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Returns nullopt if the key doesn't exist or has the wrong type
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    /// Sequence of strings, or a single scalar as a one-element list.
    std::vector<std::string> getStringList(const std::string& path) const;

    bool has(const std::string& path) const;

    /// Raw node at path; null node when missing.
    YAML::Node node(const std::string& path) const;

    const YAML::Node& root() const { return _config; }

    /// Path of the file that was loaded, empty when none was.
    const std::string& loadedFrom() const { return _loadedFrom; }

    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "TICON_";

    static constexpr const char* KEY_FONT_CANDIDATES = "fonts/candidates";
    static constexpr const char* KEY_RENDER_ANTIALIAS = "render/antialias";
    static constexpr const char* KEY_LAYOUT_MAX_CORRECTION_PASSES = "layout/max-correction-passes";
    static constexpr const char* KEY_EXPORT_DIRECTORY = "export/directory";
    static constexpr const char* KEY_EXPORT_PREFIX = "export/prefix";
    static constexpr const char* KEY_PALETTE = "palette";

    std::vector<std::string> fontCandidates() const;
    bool antialias() const;
    int maxCorrectionPasses() const;
    std::string exportDirectory() const;
    std::string exportPrefix() const;

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    void applyEnvOverrides(const YAML::Node& node, const std::string& prefix);

    // "fonts/candidates" -> "TICON_FONTS_CANDIDATES"
    static std::string pathToEnvVar(const std::string& path);

    // Recursive map merge, source wins
    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    std::string _loadedFrom;
    YAML::Node _cmdOverrides;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node value = node(path);
    if (!value || value.IsNull()) {
        return std::nullopt;
    }
    try {
        return value.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace ticon
