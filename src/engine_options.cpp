#include "rastermath/engine_options.hpp"

#include <cstdlib>

#include <cpl_conv.h>
#include <cpl_string.h>

namespace rastermath {

namespace {
const char* config(const char* key) {
    return CPLGetConfigOption(key, nullptr);
}
}

EngineOptions EngineOptions::from_config() {
    EngineOptions opts;

    if (const char* driver = config("RASTERMATH_DRIVER")) {
        opts.driver = driver;
    }
    if (const char* creation = config("RASTERMATH_CREATION_OPTIONS")) {
        opts.creation_options.clear();
        CPLStringList tokens(CSLTokenizeString2(creation, " ,", CSLT_STRIPLEADSPACES |
                                                                CSLT_STRIPENDSPACES));
        for (int i = 0; i < tokens.Count(); i++) {
            opts.creation_options.emplace_back(tokens[i]);
        }
    }
    if (const char* nodata = config("RASTERMATH_NODATA")) {
        opts.default_nodata = CPLAtof(nodata);
    }
    if (const char* mask_nodata = config("RASTERMATH_MASK_NODATA")) {
        opts.mask_nodata = CPLAtof(mask_nodata);
    }
    if (const char* bx = config("RASTERMATH_BLOCKXSIZE")) {
        opts.block_width = std::atoi(bx);
    }
    if (const char* by = config("RASTERMATH_BLOCKYSIZE")) {
        opts.block_height = std::atoi(by);
    }
    if (const char* seed = config("RASTERMATH_SEED")) {
        opts.seed = static_cast<uint32_t>(std::strtoul(seed, nullptr, 10));
    }
    if (const char* attempts = config("RASTERMATH_SAMPLE_ATTEMPTS")) {
        opts.sample_attempts = std::atoi(attempts);
    }
    return opts;
}

} // namespace rastermath
