#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "rastermath/block_grid.hpp"
#include "rastermath/engine_options.hpp"
#include "rastermath/masked_block_reader.hpp"
#include "rastermath/output_registry.hpp"
#include "rastermath/progress.hpp"
#include "rastermath/random_block_sampler.hpp"
#include "rastermath/raster_handle.hpp"

namespace rastermath {

enum class RunState {
    Idle,
    Running,
    Completed,
    Cancelled,
    Failed
};

const char* run_state_name(RunState state);

struct OutputReport {
    std::string path;
    std::string function_name;
    int band_count;
    GDALDataType data_type;
    double nodata;
};

struct RunSummary {
    RunState state;
    size_t windows_processed;
    size_t total_windows;
    std::vector<OutputReport> outputs;
};

// Polled once per window; returning true stops the run.
using CancelHook = std::function<bool()>;

// Reads a raster window by window and writes the results of every registered
// function to its own output raster, aligned with the input.
class BlockProcessingEngine {
public:
    explicit BlockProcessingEngine(const std::string& raster_path,
                                   EngineOptions options = EngineOptions::from_config());
    BlockProcessingEngine(const std::string& raster_path, const std::string& mask_path,
                          EngineOptions options = EngineOptions::from_config());

    BlockProcessingEngine(const BlockProcessingEngine&) = delete;
    BlockProcessingEngine& operator=(const BlockProcessingEngine&) = delete;

    const OutputSpec& add_function(const std::string& name, BlockFunction function,
                                   OutputRequest request);

    // Not owned; nullptr restores the no-op sink.
    void set_progress(ProgressSink* sink);
    void set_cancel_hook(CancelHook hook) { cancel_ = std::move(hook); }

    // Processes every window once. Allowed only from Idle; outputs are closed
    // and the progress sink detached when it returns or throws.
    RunSummary run();

    // Valid pixels of a random block, for previews.
    Matrix random_block() { return sampler_.sample(); }
    RandomBlockSampler& sampler() { return sampler_; }

    const ProgressSink* progress() const { return progress_; }
    RunState state() const { return state_; }
    size_t position() const { return position_; }
    size_t total_windows() const { return grid_.size(); }

    const RasterInfo& info() const { return raster_.info(); }
    double nodata() const { return nodata_; }
    const BlockGrid& grid() const { return grid_; }
    const OutputRegistry& outputs() const { return registry_; }
    const EngineOptions& options() const { return options_; }

private:
    RunSummary process_windows();
    void write_outputs(const Block& block, const Matrix& valid_input, OutputSpec& spec);
    RunSummary finish(RunState state);
    RunSummary summary() const;

    EngineOptions options_;
    RasterHandle raster_;
    std::optional<RasterHandle> mask_;
    double nodata_;
    MaskedBlockReader reader_;
    BlockGrid grid_;
    RandomBlockSampler sampler_;
    OutputRegistry registry_;
    NullProgress null_progress_;
    ProgressSink* progress_;
    CancelHook cancel_;
    RunState state_ = RunState::Idle;
    size_t position_ = 0;
};

} // namespace rastermath
