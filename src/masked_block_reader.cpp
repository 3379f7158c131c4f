#include "rastermath/masked_block_reader.hpp"

#include <algorithm>
#include <cmath>
#include <new>
#include <stdexcept>

#include <gdal.h>

#include "rastermath/errors.hpp"

namespace rastermath {

namespace {
bool matches(double value, double nodata) {
    if (std::isnan(nodata)) return std::isnan(value);
    return value == nodata;
}

// Pixels come back widened from the band type, so a Float32 band only ever
// holds the float rounding of its no-data value.
double nodata_as_stored(GDALDataType type, double nodata) {
    if (type == GDT_Float32 && GDALIsValueInRange(type, nodata)) {
        return static_cast<double>(static_cast<float>(nodata));
    }
    return nodata;
}
}

size_t Block::valid_count() const {
    return static_cast<size_t>(std::count(valid.begin(), valid.end(), true));
}

MaskedBlockReader::MaskedBlockReader(const RasterHandle& raster, double nodata)
    : MaskedBlockReader(raster, nodata, nullptr, 0.0) {}

MaskedBlockReader::MaskedBlockReader(const RasterHandle& raster, double nodata,
                                     const RasterHandle* mask, double mask_nodata)
    : raster_(raster)
    , mask_(mask)
    , nodata_(nodata_as_stored(raster.info().data_type, nodata))
    , mask_nodata_(mask_nodata)
    , type_(from_gdal(raster.info().data_type)) {
    if (mask_ && !mask_->info().same_extent(raster_.info())) {
        throw ExtentMismatch("Mask " + mask_->path() + " does not cover the extent of " +
                             raster_.path());
    }
}

Block MaskedBlockReader::read(const Window& window) const {
    if (!raster_.is_valid_window(window)) {
        throw std::out_of_range("Window out of bounds");
    }

    const size_t pixels = window.pixel_count();
    const int bands = raster_.bands();

    Block block{window, Matrix(), {}};
    std::vector<double> mask_values;
    try {
        block.data = Matrix(pixels, static_cast<size_t>(bands), type_);
        block.valid.assign(pixels, true);
        if (mask_) mask_values.resize(pixels);
    } catch (const std::bad_alloc&) {
        throw AllocationFailure("Impossible to allocate memory: region too large (" +
                                std::to_string(window.width) + "x" +
                                std::to_string(window.height) + " pixels, " +
                                std::to_string(bands) + " bands)");
    }

    for (int b = 0; b < bands; b++) {
        raster_.read_band(b, window, block.data.data() + b, static_cast<size_t>(bands));
    }
    if (mask_) {
        mask_->read_band(0, window, mask_values.data());
    }

    for (size_t i = 0; i < pixels; i++) {
        bool masked_out = mask_ && mask_values[i] == mask_nodata_;
        if (masked_out || matches(block.data(i, 0), nodata_)) {
            block.valid[i] = false;
        }
    }
    return block;
}

} // namespace rastermath
