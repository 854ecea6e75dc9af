#pragma once

#include <ticon/raster-image.h>
#include <ticon/result.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ticon {

constexpr const char* kDefaultExportPrefix = "teams_icon_";

/// 24-bit RGB PNG of the image.
Result<std::vector<uint8_t>> encodePng(const RasterImage& image);

/// Encode and write to path, replacing an existing file.
Result<void> writePng(const RasterImage& image, const std::filesystem::path& path);

/// "<prefix>YYYYMMDD-HHMMSS.png" for the given local time.
std::string exportFileName(const std::string& prefix,
                           std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

/// Write the image into directory under a timestamped name; returns the
/// absolute path written.
Result<std::filesystem::path> exportPng(const RasterImage& image,
                                        const std::filesystem::path& directory,
                                        const std::string& prefix = kDefaultExportPrefix);

} // namespace ticon
