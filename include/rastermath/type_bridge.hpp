#pragma once

#include <string>

#include <gdal.h>

namespace rastermath {

// Element type tags of Matrix, named after the NumPy dtypes they mirror.
enum class NumericType {
    UInt8,
    Int8,
    UInt16,
    Int16,
    UInt32,
    Int32,
    Float32,
    Float64
};

GDALDataType to_gdal(NumericType type);
NumericType from_gdal(GDALDataType type);

std::string numeric_type_name(NumericType type);
NumericType numeric_type_from_name(const std::string& name);

bool is_integral(NumericType type);

// Smallest raster type holding every value in [min_value, max_value].
GDALDataType raster_type_for(double min_value, double max_value, bool integral);

// Orfeo ToolBox pixel type name of a GDAL type ("uint8", "float", ...).
std::string otb_type_name(GDALDataType type);

} // namespace rastermath
