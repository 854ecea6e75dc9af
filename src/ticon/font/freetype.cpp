#include <ticon/font/freetype.h>
#include <ytrace/ytrace.hpp>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <string>

namespace ticon::font {

Result<FT_Library> ftLibrary() {
    thread_local struct FTLib {
        FT_Library lib = nullptr;
        FT_Error err = 0;
        FTLib() {
            err = FT_Init_FreeType(&lib);
            if (err) {
                yerror("FreeType: FT_Init_FreeType failed with error {}", err);
                lib = nullptr;
            }
        }
        ~FTLib() { if (lib) FT_Done_FreeType(lib); }
    } instance;

    if (!instance.lib) {
        return Err<FT_Library>("FreeType: init failed with error " + std::to_string(instance.err));
    }
    return Ok(instance.lib);
}

} // namespace ticon::font
