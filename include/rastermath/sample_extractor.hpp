#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "rastermath/matrix.hpp"
#include "rastermath/progress.hpp"

namespace rastermath {

struct ExtractionOptions {
    bool with_coords = false;
    bool only_coords = false;  // skip values and labels
};

struct SampleSet {
    Matrix values;                            // samples x bands
    std::vector<std::vector<int64_t>> labels; // one vector per label raster
    std::vector<std::array<int, 2>> coords;   // (column, row) per sample
};

// Collects every pixel whose value in the first label raster is non-zero,
// block by block. Label rasters must match the raster's extent.
SampleSet extract_samples(const std::string& raster_path,
                          const std::vector<std::string>& label_paths,
                          const ExtractionOptions& options = {},
                          ProgressSink* progress = nullptr);

} // namespace rastermath
