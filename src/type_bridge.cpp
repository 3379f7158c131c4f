#include "rastermath/type_bridge.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

namespace rastermath {

namespace {
constexpr double FLOAT32_MAX_MAGNITUDE = 3.4e38;

struct TypeEntry {
    NumericType type;
    const char* name;
};

constexpr std::array<TypeEntry, 8> TYPE_NAMES = {{
    {NumericType::UInt8, "uint8"},
    {NumericType::Int8, "int8"},
    {NumericType::UInt16, "uint16"},
    {NumericType::Int16, "int16"},
    {NumericType::UInt32, "uint32"},
    {NumericType::Int32, "int32"},
    {NumericType::Float32, "float32"},
    {NumericType::Float64, "float64"},
}};

// Indexed by GDALDataType code, GDT_Unknown included.
constexpr std::array<const char*, 12> OTB_NAMES = {
    "uint8", "uint8", "uint16", "int16", "uint32", "int32",
    "float", "double", "cint16", "cint32", "cfloat", "cdouble"
};
}

GDALDataType to_gdal(NumericType type) {
    switch (type) {
    case NumericType::UInt8:
    case NumericType::Int8:    return GDT_Byte;
    case NumericType::UInt16:  return GDT_UInt16;
    case NumericType::Int16:   return GDT_Int16;
    case NumericType::UInt32:  return GDT_UInt32;
    case NumericType::Int32:   return GDT_Int32;
    case NumericType::Float32: return GDT_Float32;
    case NumericType::Float64: return GDT_Float64;
    }
    throw std::invalid_argument("Unknown numeric type");
}

NumericType from_gdal(GDALDataType type) {
    switch (type) {
    case GDT_Byte:    return NumericType::UInt8;
    case GDT_UInt16:  return NumericType::UInt16;
    case GDT_Int16:   return NumericType::Int16;
    case GDT_UInt32:  return NumericType::UInt32;
    case GDT_Int32:   return NumericType::Int32;
    case GDT_Float32: return NumericType::Float32;
    case GDT_Float64: return NumericType::Float64;
    default:
        break;
    }
    throw std::invalid_argument(std::string("GDAL data type ") + GDALGetDataTypeName(type) +
                                " has no numeric counterpart");
}

std::string numeric_type_name(NumericType type) {
    for (const auto& entry : TYPE_NAMES) {
        if (entry.type == type) return entry.name;
    }
    throw std::invalid_argument("Unknown numeric type");
}

NumericType numeric_type_from_name(const std::string& name) {
    for (const auto& entry : TYPE_NAMES) {
        if (name == entry.name) return entry.type;
    }
    throw std::invalid_argument("Numeric type '" + name + "' is not supported by GDAL");
}

bool is_integral(NumericType type) {
    return type != NumericType::Float32 && type != NumericType::Float64;
}

GDALDataType raster_type_for(double min_value, double max_value, bool integral) {
    if (integral) {
        if (min_value >= 0) {
            if (max_value <= 255) return GDT_Byte;
            if (max_value <= 65535) return GDT_UInt16;
            return GDT_UInt32;
        }
        if (min_value > -65535) return GDT_Int16;
        return GDT_Int32;
    }

    double magnitude = std::max(std::abs(min_value), std::abs(max_value));
    return magnitude <= FLOAT32_MAX_MAGNITUDE ? GDT_Float32 : GDT_Float64;
}

std::string otb_type_name(GDALDataType type) {
    auto code = static_cast<size_t>(type);
    if (code >= OTB_NAMES.size()) return "cdouble";
    return OTB_NAMES[code];
}

} // namespace rastermath
