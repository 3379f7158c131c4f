#include "rastermath/random_block_sampler.hpp"

#include <stdexcept>

namespace rastermath {

RandomBlockSampler::RandomBlockSampler(const MaskedBlockReader& reader, const BlockGrid& grid,
                                       uint32_t seed)
    : reader_(reader)
    , grid_(grid)
    , col_offsets_(grid.column_offsets())
    , row_offsets_(grid.row_offsets())
    , rng_(seed) {}

Window RandomBlockSampler::pick() {
    if (row_offsets_.empty() || col_offsets_.empty()) {
        throw std::logic_error("Cannot sample an empty raster");
    }
    std::uniform_int_distribution<size_t> row_dist(0, row_offsets_.size() - 1);
    std::uniform_int_distribution<size_t> col_dist(0, col_offsets_.size() - 1);

    int row = row_offsets_[row_dist(rng_)];
    int col = col_offsets_[col_dist(rng_)];
    return grid_.window_at(col, row);
}

Matrix RandomBlockSampler::sample() {
    return reader_.read(pick()).valid_rows();
}

} // namespace rastermath
