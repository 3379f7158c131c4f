#include "rastermath/raster_handle.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <cpl_error.h>
#include <cpl_string.h>

#include "rastermath/errors.hpp"

namespace rastermath {

namespace {
std::string last_gdal_error() {
    const char* msg = CPLGetLastErrorMsg();
    return (msg && *msg) ? msg : "unknown GDAL error";
}

RasterInfo read_info(GDALDataset& ds) {
    RasterInfo info;
    info.width = ds.GetRasterXSize();
    info.height = ds.GetRasterYSize();
    info.band_count = ds.GetRasterCount();

    // Datasets without a geotransform report the identity-like default
    if (ds.GetGeoTransform(info.geotransform.data()) != CE_None) {
        info.geotransform = {0.0, 1.0, 0.0, 0.0, 0.0, 1.0};
    }
    const char* wkt = ds.GetProjectionRef();
    info.projection = wkt ? wkt : "";

    if (info.band_count > 0) {
        GDALRasterBand* band = ds.GetRasterBand(1);
        band->GetBlockSize(&info.block_width, &info.block_height);
        int has_nodata = 0;
        info.nodata = band->GetNoDataValue(&has_nodata);
        info.has_nodata = has_nodata != 0;
        info.data_type = band->GetRasterDataType();
    }
    return info;
}
}

RasterHandle::RasterHandle(std::string path, GDALDatasetUniquePtr dataset)
    : path_(std::move(path))
    , dataset_(std::move(dataset))
    , info_(read_info(*dataset_)) {}

RasterHandle::RasterHandle(const std::string& path) : path_(path) {
    GDALAllRegister();

    dataset_.reset(GDALDataset::Open(path.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
    if (!dataset_) {
        throw OpenFailure("Impossible to open " + path + ": " + last_gdal_error());
    }
    info_ = read_info(*dataset_);
}

RasterHandle RasterHandle::create(const std::string& path,
                                  const RasterInfo& like,
                                  int band_count,
                                  GDALDataType data_type,
                                  const std::string& driver_name,
                                  const std::vector<std::string>& creation_options) {
    if (band_count <= 0) {
        throw std::invalid_argument("Output band count must be positive");
    }

    GDALAllRegister();
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(driver_name.c_str());
    if (!driver) {
        throw OpenFailure("GDAL driver " + driver_name + " is not available");
    }

    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw OpenFailure("Cannot create directory " + parent.string() + ": " + ec.message());
        }
    }

    CPLStringList options;
    for (const auto& opt : creation_options) options.AddString(opt.c_str());

    GDALDatasetUniquePtr ds(driver->Create(path.c_str(), like.width, like.height, band_count,
                                           data_type, options.List()));
    if (!ds) {
        throw OpenFailure("Impossible to create " + path + ": " + last_gdal_error());
    }

    auto geotransform = like.geotransform;
    if (ds->SetGeoTransform(geotransform.data()) != CE_None) {
        throw OpenFailure("Cannot set geotransform on " + path + ": " + last_gdal_error());
    }
    if (!like.projection.empty() && ds->SetProjection(like.projection.c_str()) != CE_None) {
        throw OpenFailure("Cannot set projection on " + path + ": " + last_gdal_error());
    }

    return RasterHandle(path, std::move(ds));
}

bool RasterHandle::is_valid_window(const Window& window) const {
    return window.col >= 0 && window.row >= 0 &&
           window.col + window.width <= info_.width &&
           window.row + window.height <= info_.height &&
           window.width > 0 && window.height > 0;
}

GDALRasterBand* RasterHandle::band_or_throw(int band) const {
    if (!dataset_) throw std::logic_error("Raster " + path_ + " is closed");
    if (band < 0 || band >= info_.band_count) {
        throw std::out_of_range("Band index out of range for " + path_);
    }
    return dataset_->GetRasterBand(band + 1);
}

void RasterHandle::band_io(GDALRWFlag flag, int band, const Window& window, double* buffer,
                           size_t pixel_stride) const {
    if (!is_valid_window(window)) {
        throw std::out_of_range("Window out of bounds");
    }
    GDALRasterBand* rb = band_or_throw(band);

    const GSpacing pixel_space = static_cast<GSpacing>(sizeof(double) * pixel_stride);
    const GSpacing line_space = pixel_space * window.width;

    CPLErr err = rb->RasterIO(flag, window.col, window.row, window.width, window.height,
                              buffer, window.width, window.height, GDT_Float64,
                              pixel_space, line_space, nullptr);
    if (err != CE_None) {
        throw RasterIOError(std::string(flag == GF_Read ? "Read" : "Write") + " failed on " +
                            path_ + " band " + std::to_string(band + 1) + " at (" +
                            std::to_string(window.col) + ", " + std::to_string(window.row) +
                            "): " + last_gdal_error());
    }
}

void RasterHandle::read_band(int band, const Window& window, double* out, size_t pixel_stride) const {
    band_io(GF_Read, band, window, out, pixel_stride);
}

void RasterHandle::write_band(int band, const Window& window, const double* in, size_t pixel_stride) {
    // GDAL only reads from the buffer in GF_Write mode
    band_io(GF_Write, band, window, const_cast<double*>(in), pixel_stride);
}

void RasterHandle::set_nodata(double value) {
    for (int b = 0; b < info_.band_count; b++) {
        if (band_or_throw(b)->SetNoDataValue(value) != CE_None) {
            throw RasterIOError("Cannot set no-data on " + path_ + ": " + last_gdal_error());
        }
    }
    info_.nodata = value;
    info_.has_nodata = true;
}

void RasterHandle::flush() {
    if (!dataset_) return;
    if (dataset_->FlushCache() != CE_None) {
        throw RasterIOError("Flush failed on " + path_ + ": " + last_gdal_error());
    }
}

void RasterHandle::close() {
    dataset_.reset();
}

} // namespace rastermath
