#include <ticon/png-export.h>
#include <ytrace/ytrace.hpp>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <ctime>
#include <fstream>
#include <system_error>

namespace ticon {

namespace {

void appendToVector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

} // anonymous namespace

Result<std::vector<uint8_t>> encodePng(const RasterImage& image) {
    if (image.width() <= 0 || image.height() <= 0) {
        return Err<std::vector<uint8_t>>("encodePng: empty image");
    }

    std::vector<uint8_t> png;
    int ok = stbi_write_png_to_func(appendToVector, &png,
                                    image.width(), image.height(), 3,
                                    image.data(), image.stride());
    if (!ok || png.empty()) {
        return Err<std::vector<uint8_t>>("encodePng: PNG encoder failed");
    }
    return Ok(std::move(png));
}

Result<void> writePng(const RasterImage& image, const std::filesystem::path& path) {
    auto png = encodePng(image);
    if (!png) return Err("Export error", png);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Err("Cannot write the file " + path.string() + ". Check folder permissions.");
    }
    file.write(reinterpret_cast<const char*>(png->data()), static_cast<std::streamsize>(png->size()));
    if (!file) {
        return Err("Export error: failed writing " + path.string());
    }
    return Ok();
}

std::string exportFileName(const std::string& prefix, std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &local);
    return prefix + stamp + ".png";
}

Result<std::filesystem::path> exportPng(const RasterImage& image,
                                        const std::filesystem::path& directory,
                                        const std::string& prefix) {
    std::error_code ec;
    std::filesystem::path dir = directory.empty() ? std::filesystem::current_path(ec) : directory;
    if (ec) {
        return Err<std::filesystem::path>("Export error: no current directory: " + ec.message());
    }
    if (!std::filesystem::is_directory(dir, ec)) {
        return Err<std::filesystem::path>("Export error: not a directory: " + dir.string());
    }

    auto path = std::filesystem::absolute(dir / exportFileName(prefix), ec);
    if (ec) {
        return Err<std::filesystem::path>("Export error: " + ec.message());
    }

    if (auto res = writePng(image, path); !res) {
        return Err<std::filesystem::path>("Export failed", res);
    }
    yinfo("Icon saved: {}", path.string());
    return Ok(std::move(path));
}

} // namespace ticon
