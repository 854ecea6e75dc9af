#pragma once

#include <ticon/font/font.h>
#include <ticon/base/factory.h>
#include <ticon/result.hpp>

#include <memory>
#include <string>
#include <vector>

namespace ticon::font {

/// FontResolver - ordered font candidate list with a built-in fallback.
///
/// resolve() tries every candidate file in order and returns the first one
/// that exists and loads at the requested pixel size; when none does, the
/// built-in bitmap font is returned. Relative candidate paths are taken
/// relative to the current working directory.
///
/// File contents are cached by path; faces are created per call, so the
/// fonts handed out must be used on the calling thread.
class FontResolver : public base::ObjectFactory<FontResolver> {
public:
    using Ptr = std::shared_ptr<FontResolver>;

    virtual ~FontResolver() = default;

    static Result<Ptr> createImpl(std::vector<std::string> candidates);

    /// Default bold font candidates, most preferred first.
    static std::vector<std::string> defaultCandidates();

    /// Fails only if not even the built-in font can be produced.
    virtual Result<Font::Ptr> resolve(int pixelSize) = 0;

    virtual const std::vector<std::string>& candidates() const = 0;

protected:
    FontResolver() = default;
};

} // namespace ticon::font
