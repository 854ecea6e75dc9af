#include <ticon/font/font-resolver.h>
#include <ytrace/ytrace.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <unordered_map>

namespace ticon::font {

namespace {

using FontData = std::shared_ptr<const std::vector<uint8_t>>;

Result<FontData> readFontFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return Err<FontData>("FontResolver: Failed to open file: " + path.string());
    }

    auto fileSize = file.tellg();
    if (fileSize <= 0) {
        return Err<FontData>("FontResolver: Empty or invalid file: " + path.string());
    }

    file.seekg(0, std::ios::beg);
    auto data = std::make_shared<std::vector<uint8_t>>(static_cast<size_t>(fileSize));
    if (!file.read(reinterpret_cast<char*>(data->data()), fileSize)) {
        return Err<FontData>("FontResolver: Failed to read file: " + path.string());
    }
    return Ok(FontData(std::move(data)));
}

// "C:\Windows\Fonts\arialbd.ttf" -> "arialbd"
std::string fontNameFromPath(const std::string& path) {
    std::string name = path;
    auto lastSlash = name.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        name = name.substr(lastSlash + 1);
    }
    auto lastDot = name.find_last_of('.');
    if (lastDot != std::string::npos) {
        name = name.substr(0, lastDot);
    }
    return name;
}

} // anonymous namespace

class FontResolverImpl : public FontResolver {
public:
    explicit FontResolverImpl(std::vector<std::string> candidates)
        : _candidates(std::move(candidates)) {}

    Result<void> init() {
        if (_candidates.empty()) {
            yinfo("FontResolver: no font candidates, using the built-in font");
        }
        return Ok();
    }

    Result<Font::Ptr> resolve(int pixelSize) override {
        for (const auto& candidate : _candidates) {
            auto data = loadCached(candidate);
            if (!data) continue;

            auto font = Font::create(*data, fontNameFromPath(candidate), pixelSize);
            if (!font) {
                ydebug("FontResolver: {} rejected at {}px: {}", candidate, pixelSize, error_msg(font));
                continue;
            }
            return font;
        }

        if (!_warnedFallback.exchange(true)) {
            ywarn("FontResolver: none of {} font candidates loaded, using the built-in font",
                  _candidates.size());
        }
        auto builtin = Font::createBuiltin(pixelSize);
        if (!builtin) {
            return Err<Font::Ptr>("FontResolver: no usable font", builtin);
        }
        return builtin;
    }

    const std::vector<std::string>& candidates() const override { return _candidates; }

private:
    // Only successful reads are cached so a font installed later still wins.
    Result<FontData> loadCached(const std::string& candidate) {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _cache.find(candidate);
        if (it != _cache.end()) return Ok(FontData(it->second));

        std::filesystem::path path(candidate);
        if (path.is_relative()) {
            std::error_code ec;
            auto cwd = std::filesystem::current_path(ec);
            if (!ec) path = cwd / path;
        }

        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            ydebug("FontResolver: {} does not exist", path.string());
            return Err<FontData>("FontResolver: missing " + path.string());
        }

        auto data = readFontFile(path);
        if (!data) {
            ydebug("FontResolver: {}", error_msg(data));
            return data;
        }
        ydebug("FontResolver: loaded {} ({} bytes)", path.string(), (*data)->size());
        _cache.emplace(candidate, *data);
        return data;
    }

    std::vector<std::string> _candidates;
    std::mutex _mutex;
    std::unordered_map<std::string, FontData> _cache;
    std::atomic<bool> _warnedFallback{false};
};

Result<FontResolver::Ptr> FontResolver::createImpl(std::vector<std::string> candidates) {
    auto impl = std::make_shared<FontResolverImpl>(std::move(candidates));
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("FontResolver creation failed", res);
    }
    return Ok(Ptr(std::move(impl)));
}

std::vector<std::string> FontResolver::defaultCandidates() {
    return {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/TTF/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/dejavu-sans-fonts/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf",
        "/Library/Fonts/Arial Bold.ttf",
        R"(C:\Windows\Fonts\segoeuib.ttf)",   // Segoe UI Bold
        R"(C:\Windows\Fonts\arialbd.ttf)",    // Arial Bold
        R"(C:\Windows\Fonts\calibrib.ttf)",   // Calibri Bold
        "fonts/DejaVuSans-Bold.ttf",
        "fonts/Arial-Bold.ttf",
    };
}

} // namespace ticon::font
