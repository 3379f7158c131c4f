#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include <gdal_priv.h>

#include "rastermath/block_grid.hpp"

namespace rastermath {

struct RasterInfo {
    int width = 0;
    int height = 0;
    int band_count = 0;
    int block_width = 0;
    int block_height = 0;
    double nodata = 0.0;
    bool has_nodata = false;
    GDALDataType data_type = GDT_Unknown;
    std::array<double, 6> geotransform{};
    std::string projection;

    size_t pixel_count() const { return static_cast<size_t>(width) * height; }
    bool same_extent(const RasterInfo& other) const {
        return width == other.width && height == other.height;
    }
};

// Owns one GDAL dataset. Band indices are 0-based. Reads and writes go
// through a double buffer; pixel_stride (in elements) lets callers
// interleave several bands in one buffer.
class RasterHandle {
public:
    // Opens read-only. Throws OpenFailure.
    explicit RasterHandle(const std::string& path);

    // Creates a raster with the extent, geotransform and projection of
    // `like`, creating missing parent directories. Throws OpenFailure.
    static RasterHandle create(const std::string& path,
                               const RasterInfo& like,
                               int band_count,
                               GDALDataType data_type,
                               const std::string& driver_name,
                               const std::vector<std::string>& creation_options);

    RasterHandle(RasterHandle&&) noexcept = default;
    RasterHandle& operator=(RasterHandle&&) noexcept = default;
    RasterHandle(const RasterHandle&) = delete;
    RasterHandle& operator=(const RasterHandle&) = delete;

    void read_band(int band, const Window& window, double* out, size_t pixel_stride = 1) const;
    void write_band(int band, const Window& window, const double* in, size_t pixel_stride = 1);

    void set_nodata(double value);
    void flush();
    void close();

    bool is_open() const { return dataset_ != nullptr; }
    bool is_valid_window(const Window& window) const;

    const RasterInfo& info() const { return info_; }
    const std::string& path() const { return path_; }
    int width() const { return info_.width; }
    int height() const { return info_.height; }
    int bands() const { return info_.band_count; }

private:
    RasterHandle(std::string path, GDALDatasetUniquePtr dataset);

    GDALRasterBand* band_or_throw(int band) const;
    void band_io(GDALRWFlag flag, int band, const Window& window, double* buffer,
                 size_t pixel_stride) const;

    std::string path_;
    GDALDatasetUniquePtr dataset_;
    RasterInfo info_;
};

} // namespace rastermath
