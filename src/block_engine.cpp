#include "rastermath/block_engine.hpp"

#include <algorithm>
#include <new>
#include <stdexcept>
#include <utility>

#include <cpl_error.h>

#include "rastermath/errors.hpp"

namespace rastermath {

namespace {
int block_dimension(int requested, int native, int extent) {
    if (requested > 0) return requested;
    if (native > 0) return native;
    return std::max(extent, 1);
}

std::optional<RasterHandle> open_mask(const std::string& mask_path) {
    if (mask_path.empty()) return std::nullopt;
    return std::optional<RasterHandle>(std::in_place, mask_path);
}
}

const char* run_state_name(RunState state) {
    switch (state) {
    case RunState::Idle:      return "idle";
    case RunState::Running:   return "running";
    case RunState::Completed: return "completed";
    case RunState::Cancelled: return "cancelled";
    case RunState::Failed:    return "failed";
    }
    return "unknown";
}

BlockProcessingEngine::BlockProcessingEngine(const std::string& raster_path, EngineOptions options)
    : BlockProcessingEngine(raster_path, std::string(), std::move(options)) {}

BlockProcessingEngine::BlockProcessingEngine(const std::string& raster_path,
                                             const std::string& mask_path,
                                             EngineOptions options)
    : options_(std::move(options))
    , raster_(raster_path)
    , mask_(open_mask(mask_path))
    , nodata_(raster_.info().has_nodata ? raster_.info().nodata : options_.default_nodata)
    , reader_(raster_, nodata_, mask_ ? &*mask_ : nullptr, options_.mask_nodata)
    , grid_(raster_.width(), raster_.height(),
            block_dimension(options_.block_width, raster_.info().block_width, raster_.width()),
            block_dimension(options_.block_height, raster_.info().block_height, raster_.height()))
    , sampler_(reader_, grid_, options_.seed)
    , registry_(raster_.info(), nodata_, sampler_, options_)
    , progress_(&null_progress_) {
    CPLDebug("RASTERMATH", "%s: %dx%d, %d bands, %llu windows of %dx%d",
             raster_path.c_str(), raster_.width(), raster_.height(), raster_.bands(),
             static_cast<unsigned long long>(grid_.size()), grid_.block_width(), grid_.block_height());
}

const OutputSpec& BlockProcessingEngine::add_function(const std::string& name,
                                                      BlockFunction function,
                                                      OutputRequest request) {
    return registry_.add(name, std::move(function), std::move(request));
}

void BlockProcessingEngine::set_progress(ProgressSink* sink) {
    progress_ = sink ? sink : &null_progress_;
}

void BlockProcessingEngine::write_outputs(const Block& block, const Matrix& valid_input,
                                          OutputSpec& spec) {
    const size_t pixels = block.window.pixel_count();
    const size_t bands = static_cast<size_t>(spec.band_count);

    std::vector<double> buffer;
    try {
        buffer.assign(pixels * bands, spec.nodata);
    } catch (const std::bad_alloc&) {
        throw AllocationFailure("Impossible to allocate memory: region too large for " + spec.path);
    }

    if (valid_input.rows() > 0) {
        Matrix result = OutputRegistry::invoke(spec.function_name, spec.function,
                                               valid_input, spec.args).as_column();
        if (result.cols() > bands) {
            throw BandOverflow(static_cast<int>(result.cols()), spec.band_count);
        }
        if (result.rows() != valid_input.rows()) {
            throw ShapeMismatch("Function " + spec.function_name + " returned " +
                                std::to_string(result.rows()) + " rows for " +
                                std::to_string(valid_input.rows()) + " valid pixels");
        }

        // Bands past the result's width keep the no-data fill
        size_t src = 0;
        for (size_t i = 0; i < pixels; i++) {
            if (!block.valid[i]) continue;
            std::copy(result.row(src), result.row(src) + result.cols(), buffer.data() + i * bands);
            src++;
        }
    }

    for (size_t b = 0; b < bands; b++) {
        spec.raster.write_band(static_cast<int>(b), block.window, buffer.data() + b, bands);
    }
}

RunSummary BlockProcessingEngine::summary() const {
    RunSummary result{state_, position_, grid_.size(), {}};
    for (const auto& spec : registry_) {
        result.outputs.push_back(OutputReport{
            spec.path, spec.function_name, spec.band_count, spec.data_type, spec.nodata
        });
    }
    return result;
}

RunSummary BlockProcessingEngine::finish(RunState state) {
    try {
        registry_.flush_outputs();
    } catch (const Error&) {
        state_ = RunState::Failed;
        registry_.close_outputs();
        throw;
    }
    registry_.close_outputs();
    state_ = state;

    for (const auto& spec : registry_) {
        CPLDebug("RASTERMATH", "Saved %s using function %s", spec.path.c_str(),
                 spec.function_name.c_str());
    }
    CPLDebug("RASTERMATH", "Run %s after %llu of %llu windows", run_state_name(state_),
             static_cast<unsigned long long>(position_),
             static_cast<unsigned long long>(grid_.size()));
    return summary();
}

RunSummary BlockProcessingEngine::run() {
    if (state_ != RunState::Idle) {
        throw std::logic_error(std::string("Cannot run an engine in state ") +
                               run_state_name(state_));
    }
    try {
        RunSummary result = process_windows();
        progress_ = &null_progress_;
        return result;
    } catch (const std::exception&) {
        progress_ = &null_progress_;
        throw;
    }
}

RunSummary BlockProcessingEngine::process_windows() {
    state_ = RunState::Running;
    position_ = 0;
    registry_.close();

    const size_t total = grid_.size();
    progress_->tick(0, total);

    try {
        for (const Window& window : grid_) {
            Block block = reader_.read(window);

            if (cancel_ && cancel_()) {
                return finish(RunState::Cancelled);
            }

            Matrix valid_input = block.valid_rows();
            for (auto& spec : registry_) {
                write_outputs(block, valid_input, spec);
            }

            position_++;
            progress_->tick(position_, total);
        }
    } catch (const std::exception&) {
        state_ = RunState::Failed;
        registry_.close_outputs();
        throw;
    }

    return finish(RunState::Completed);
}

} // namespace rastermath
