#pragma once

#include <ticon/result.hpp>

typedef struct FT_LibraryRec_* FT_Library;

namespace ticon::font {

/// Thread-local FreeType library singleton.
/// FT_Library is not thread-safe, so one instance per thread. Fails when
/// FreeType cannot be initialized on this thread; the failure is sticky.
Result<FT_Library> ftLibrary();

} // namespace ticon::font
