#pragma once

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <cpl_string.h>
#include <gdal_priv.h>

// Helpers writing and reading small GeoTIFFs for the tests.
namespace rastermath_test {

inline const double TEST_GEOTRANSFORM[6] = {668780.0, 10.0, 0.0, 3481925.0, 0.0, -10.0};

inline const char* TEST_WKT =
    "LOCAL_CS[\"rastermath test\",UNIT[\"metre\",1],AXIS[\"Easting\",EAST],AXIS[\"Northing\",NORTH]]";

// bands[b] holds width * height row-major values of band b.
inline void write_raster(const std::string& path, int width, int height,
                         const std::vector<std::vector<double>>& bands,
                         GDALDataType type = GDT_Float32,
                         std::optional<double> nodata = std::nullopt,
                         const std::vector<std::string>& creation_options = {}) {
    GDALAllRegister();
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    if (!driver) throw std::runtime_error("GTiff driver missing");

    CPLStringList options;
    for (const auto& opt : creation_options) options.AddString(opt.c_str());

    GDALDatasetUniquePtr ds(driver->Create(path.c_str(), width, height,
                                           static_cast<int>(bands.size()), type, options.List()));
    if (!ds) throw std::runtime_error("Cannot create " + path);

    double gt[6];
    std::copy(TEST_GEOTRANSFORM, TEST_GEOTRANSFORM + 6, gt);
    if (ds->SetGeoTransform(gt) != CE_None) throw std::runtime_error("SetGeoTransform failed");
    if (ds->SetProjection(TEST_WKT) != CE_None) throw std::runtime_error("SetProjection failed");

    for (size_t b = 0; b < bands.size(); b++) {
        GDALRasterBand* band = ds->GetRasterBand(static_cast<int>(b) + 1);
        if (nodata && band->SetNoDataValue(*nodata) != CE_None) {
            throw std::runtime_error("SetNoDataValue failed");
        }
        std::vector<double> values = bands[b];
        if (band->RasterIO(GF_Write, 0, 0, width, height, values.data(), width, height,
                           GDT_Float64, 0, 0, nullptr) != CE_None) {
            throw std::runtime_error("RasterIO write failed");
        }
    }
}

// Band is 0-based.
inline std::vector<double> read_raster(const std::string& path, int band = 0) {
    GDALAllRegister();
    GDALDatasetUniquePtr ds(GDALDataset::Open(path.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
    if (!ds) throw std::runtime_error("Cannot open " + path);

    const int width = ds->GetRasterXSize();
    const int height = ds->GetRasterYSize();
    std::vector<double> values(static_cast<size_t>(width) * height);
    if (ds->GetRasterBand(band + 1)->RasterIO(GF_Read, 0, 0, width, height, values.data(),
                                              width, height, GDT_Float64, 0, 0,
                                              nullptr) != CE_None) {
        throw std::runtime_error("RasterIO read failed");
    }
    return values;
}

inline GDALDataType raster_type(const std::string& path) {
    GDALDatasetUniquePtr ds(GDALDataset::Open(path.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
    if (!ds) throw std::runtime_error("Cannot open " + path);
    return ds->GetRasterBand(1)->GetRasterDataType();
}

inline int raster_band_count(const std::string& path) {
    GDALDatasetUniquePtr ds(GDALDataset::Open(path.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
    if (!ds) throw std::runtime_error("Cannot open " + path);
    return ds->GetRasterCount();
}

} // namespace rastermath_test
