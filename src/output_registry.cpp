#include "rastermath/output_registry.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <cpl_error.h>
#include <gdal.h>

#include "rastermath/errors.hpp"
#include "rastermath/type_bridge.hpp"

namespace rastermath {

namespace {
// Unsigned types cannot hold the negative default, they fall back to 0.
double type_default_nodata(GDALDataType type, double default_nodata) {
    return GDALIsValueInRange(type, default_nodata) ? default_nodata : 0.0;
}
}

OutputRegistry::OutputRegistry(const RasterInfo& input, double input_nodata,
                               RandomBlockSampler& sampler, const EngineOptions& options)
    : input_(input)
    , input_nodata_(input_nodata)
    , sampler_(sampler)
    , options_(options) {}

Matrix OutputRegistry::invoke(const std::string& name, const BlockFunction& function,
                              const Matrix& input, const FunctionArgs& args) {
    if (!function) throw FunctionFailure(name, "function is empty");
    try {
        return function(input, args);
    } catch (const FunctionFailure&) {
        throw;
    } catch (const std::exception& e) {
        throw FunctionFailure(name, e.what());
    }
}

Matrix OutputRegistry::sample_for_inference() {
    Matrix sample = sampler_.sample();
    for (int attempt = 1; sample.empty() && attempt < options_.sample_attempts; attempt++) {
        sample = sampler_.sample();
    }
    if (sample.empty()) {
        CPLError(CE_Warning, CPLE_AppDefined,
                 "rastermath: no valid pixel found in %d sampled blocks", options_.sample_attempts);
    }
    return sample;
}

GDALDataType OutputRegistry::infer_data_type(const std::string& name, const BlockFunction& function,
                                             const OutputRequest& request) {
    Matrix result = invoke(name, function, sample_for_inference(), request.args);

    GDALDataType type = to_gdal(result.type());
    if (request.type_policy == TypePolicy::ValueRange) {
        if (result.empty()) {
            CPLError(CE_Warning, CPLE_AppDefined,
                     "rastermath: empty sample result for %s, using its element type",
                     name.c_str());
        } else {
            auto [lo, hi] = result.min_max();
            type = raster_type_for(lo, hi, is_integral(result.type()));
        }
    }

    CPLDebug("RASTERMATH", "Using data type %s (from %s result of %s)",
             GDALGetDataTypeName(type), numeric_type_name(result.type()).c_str(), name.c_str());
    return type;
}

int OutputRegistry::infer_band_count(const std::string& name, const BlockFunction& function,
                                     const OutputRequest& request) {
    Matrix result = invoke(name, function, sample_for_inference(), request.args);
    if (result.ndim() == 1) return 1;
    if (result.cols() == 0) {
        throw ShapeMismatch("Function " + name + " returned a result without columns");
    }
    return static_cast<int>(result.cols());
}

const OutputSpec& OutputRegistry::add(const std::string& name, BlockFunction function,
                                      OutputRequest request) {
    if (closed_) {
        throw std::logic_error("Cannot add " + name + ": the engine is already running");
    }
    if (request.band_count && *request.band_count <= 0) {
        throw std::invalid_argument("Output band count must be positive");
    }

    // Inference happens before the output exists so a failing function
    // leaves nothing behind.
    GDALDataType data_type = request.data_type ? *request.data_type
                                               : infer_data_type(name, function, request);
    int band_count = request.band_count ? *request.band_count
                                        : infer_band_count(name, function, request);
    double nodata = input_nodata_;
    if (request.nodata) {
        nodata = *request.nodata;
        if (!GDALIsValueInRange(data_type, nodata)) {
            throw std::invalid_argument("No-data value " + std::to_string(nodata) +
                                        " does not fit in " + GDALGetDataTypeName(data_type));
        }
    } else if (!GDALIsValueInRange(data_type, nodata)) {
        nodata = type_default_nodata(data_type, options_.default_nodata);
        CPLDebug("RASTERMATH", "No-data %g does not fit in %s, using %g for %s",
                 input_nodata_, GDALGetDataTypeName(data_type), nodata, request.path.c_str());
    }

    RasterHandle raster = RasterHandle::create(request.path, input_, band_count, data_type,
                                               options_.driver, options_.creation_options);
    raster.set_nodata(nodata);

    specs_.push_back(OutputSpec{
        name,
        std::move(function),
        request.path,
        band_count,
        data_type,
        nodata,
        std::move(request.args),
        std::move(raster)
    });
    return specs_.back();
}

void OutputRegistry::flush_outputs() {
    for (auto& spec : specs_) spec.raster.flush();
}

void OutputRegistry::close_outputs() {
    for (auto& spec : specs_) spec.raster.close();
}

} // namespace rastermath
