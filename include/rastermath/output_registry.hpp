#pragma once

#include <deque>
#include <functional>
#include <optional>
#include <string>

#include <gdal.h>

#include "rastermath/engine_options.hpp"
#include "rastermath/function_args.hpp"
#include "rastermath/matrix.hpp"
#include "rastermath/random_block_sampler.hpp"
#include "rastermath/raster_handle.hpp"

namespace rastermath {

// Maps the valid pixels of a block (rows) x input bands (columns) to
// per-pixel results. A 1-D result counts as a single band.
using BlockFunction = std::function<Matrix(const Matrix&, const FunctionArgs&)>;

// How an unset output data type is resolved from a sample result.
enum class TypePolicy {
    ResultType,  // bridge the result's NumericType
    ValueRange   // smallest type holding the result's min/max
};

struct OutputRequest {
    std::string path;
    std::optional<int> band_count;
    std::optional<GDALDataType> data_type;
    std::optional<double> nodata;
    FunctionArgs args;
    TypePolicy type_policy = TypePolicy::ResultType;
};

// Resolved output; band_count and data_type are frozen from here on.
struct OutputSpec {
    std::string function_name;
    BlockFunction function;
    std::string path;
    int band_count;
    GDALDataType data_type;
    double nodata;
    FunctionArgs args;
    RasterHandle raster;
};

class OutputRegistry {
public:
    using const_iterator = std::deque<OutputSpec>::const_iterator;
    using iterator = std::deque<OutputSpec>::iterator;

    OutputRegistry(const RasterInfo& input, double input_nodata,
                   RandomBlockSampler& sampler, const EngineOptions& options);

    // Resolves unset fields by calling the function on sampled blocks, then
    // creates the output raster. The returned reference stays valid.
    const OutputSpec& add(const std::string& name, BlockFunction function, OutputRequest request);

    // No further add() once closed.
    void close() { closed_ = true; }
    bool closed() const { return closed_; }

    void flush_outputs();
    void close_outputs();

    size_t size() const { return specs_.size(); }
    bool empty() const { return specs_.empty(); }
    iterator begin() { return specs_.begin(); }
    iterator end() { return specs_.end(); }
    const_iterator begin() const { return specs_.begin(); }
    const_iterator end() const { return specs_.end(); }

    // Calls a block function, reporting anything it throws as FunctionFailure.
    static Matrix invoke(const std::string& name, const BlockFunction& function,
                         const Matrix& input, const FunctionArgs& args);

private:
    Matrix sample_for_inference();
    GDALDataType infer_data_type(const std::string& name, const BlockFunction& function,
                                 const OutputRequest& request);
    int infer_band_count(const std::string& name, const BlockFunction& function,
                         const OutputRequest& request);

    const RasterInfo& input_;
    double input_nodata_;
    RandomBlockSampler& sampler_;
    const EngineOptions& options_;
    std::deque<OutputSpec> specs_;
    bool closed_ = false;
};

} // namespace rastermath
