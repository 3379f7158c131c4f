#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include "rastermath/block_grid.hpp"
#include "rastermath/masked_block_reader.hpp"
#include "rastermath/matrix.hpp"

namespace rastermath {

// Uniform choice of one block-aligned window. Gives no coverage guarantee.
class RandomBlockSampler {
public:
    RandomBlockSampler(const MaskedBlockReader& reader, const BlockGrid& grid, uint32_t seed);

    Window pick();

    // Valid pixels of a randomly picked window.
    Matrix sample();

    void reseed(uint32_t seed) { rng_.seed(seed); }

private:
    const MaskedBlockReader& reader_;
    const BlockGrid& grid_;
    std::vector<int> col_offsets_;
    std::vector<int> row_offsets_;
    std::mt19937 rng_;
};

} // namespace rastermath
