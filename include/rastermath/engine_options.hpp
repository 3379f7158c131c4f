#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace rastermath {

struct EngineOptions {
    std::string driver = "GTiff";
    std::vector<std::string> creation_options = {"COMPRESS=DEFLATE", "TILED=YES"};
    double default_nodata = -9999;  // used when the input declares none
    double mask_nodata = 0;
    int block_width = 0;            // 0: native block size of band 1
    int block_height = 0;
    uint32_t seed = 0;
    int sample_attempts = 10;

    // Defaults overridden by the RASTERMATH_* GDAL configuration options.
    static EngineOptions from_config();
};

} // namespace rastermath
