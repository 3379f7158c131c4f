#include "rastermath/sample_extractor.hpp"

#include <algorithm>
#include <cmath>
#include <new>
#include <stdexcept>
#include <utility>

#include <cpl_error.h>

#include "rastermath/block_grid.hpp"
#include "rastermath/errors.hpp"
#include "rastermath/raster_handle.hpp"

namespace rastermath {

SampleSet extract_samples(const std::string& raster_path,
                          const std::vector<std::string>& label_paths,
                          const ExtractionOptions& options,
                          ProgressSink* progress) {
    if (label_paths.empty()) {
        throw std::invalid_argument("At least one label raster is required");
    }

    RasterHandle raster(raster_path);
    std::vector<RasterHandle> labels;
    for (const auto& path : label_paths) {
        labels.emplace_back(path);
        if (!labels.back().info().same_extent(raster.info())) {
            throw ExtentMismatch("Raster " + raster_path + " and labels " + path +
                                 " do not cover the same extent");
        }
    }

    const RasterInfo& info = raster.info();
    const size_t bands = static_cast<size_t>(info.band_count);
    BlockGrid grid(info.width, info.height,
                   info.block_width > 0 ? info.block_width : std::max(info.width, 1),
                   info.block_height > 0 ? info.block_height : 1);

    NullProgress null_progress;
    if (!progress) progress = &null_progress;

    SampleSet samples;
    std::vector<double> values;
    samples.labels.resize(options.only_coords ? 0 : labels.size());
    const bool keep_coords = options.with_coords || options.only_coords;

    size_t position = 0;
    progress->tick(0, grid.size());

    try {
        std::vector<double> roi;
        std::vector<double> label_values;
        std::vector<double> pixels;
        std::vector<size_t> selected;

        for (const Window& window : grid) {
            const size_t count = window.pixel_count();
            roi.resize(count);
            labels.front().read_band(0, window, roi.data());

            selected.clear();
            for (size_t i = 0; i < count; i++) {
                if (roi[i] != 0 && !std::isnan(roi[i])) selected.push_back(i);
            }

            if (!selected.empty()) {
                if (keep_coords) {
                    for (size_t i : selected) {
                        samples.coords.push_back({window.col + static_cast<int>(i % window.width),
                                                  window.row + static_cast<int>(i / window.width)});
                    }
                }

                if (!options.only_coords) {
                    for (size_t l = 0; l < labels.size(); l++) {
                        label_values.resize(count);
                        labels[l].read_band(0, window, label_values.data());
                        for (size_t i : selected) {
                            double label = label_values[i];
                            samples.labels[l].push_back(
                                std::isnan(label) ? 0 : static_cast<int64_t>(label));
                        }
                    }

                    pixels.resize(count * bands);
                    for (size_t b = 0; b < bands; b++) {
                        raster.read_band(static_cast<int>(b), window, pixels.data() + b, bands);
                    }
                    for (size_t i : selected) {
                        values.insert(values.end(), pixels.begin() + i * bands,
                                      pixels.begin() + (i + 1) * bands);
                    }
                }
            }

            progress->tick(++position, grid.size());
        }
    } catch (const std::bad_alloc&) {
        throw AllocationFailure("Impossible to allocate memory: ROI too big");
    }

    if (!options.only_coords) {
        size_t rows = bands == 0 ? 0 : values.size() / bands;
        samples.values = Matrix(rows, bands, std::move(values), from_gdal(info.data_type));
    }

    CPLDebug("RASTERMATH", "Extracted %llu samples from %s",
             static_cast<unsigned long long>(options.only_coords ? samples.coords.size()
                                                                 : samples.values.rows()),
             raster_path.c_str());
    return samples;
}

} // namespace rastermath
