#pragma once

#include <cstddef>
#include <vector>

#include "rastermath/block_grid.hpp"
#include "rastermath/matrix.hpp"
#include "rastermath/raster_handle.hpp"

namespace rastermath {

struct Block {
    Window window;
    Matrix data;              // (window pixels) x (bands)
    std::vector<bool> valid;  // one flag per pixel

    size_t valid_count() const;
    Matrix valid_rows() const { return data.select_rows(valid); }
};

// Reads every band of a window into one matrix and flags the pixels that take
// part in computation. Only band 0 is compared with the raster's no-data.
class MaskedBlockReader {
public:
    MaskedBlockReader(const RasterHandle& raster, double nodata);
    MaskedBlockReader(const RasterHandle& raster, double nodata,
                      const RasterHandle* mask, double mask_nodata);

    Block read(const Window& window) const;

    const RasterInfo& info() const { return raster_.info(); }
    double nodata() const { return nodata_; }
    bool has_mask() const { return mask_ != nullptr; }

private:
    const RasterHandle& raster_;
    const RasterHandle* mask_;
    double nodata_;
    double mask_nodata_;
    NumericType type_;
};

} // namespace rastermath
