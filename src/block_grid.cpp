#include "rastermath/block_grid.hpp"

#include <algorithm>
#include <stdexcept>

namespace rastermath {

BlockGrid::const_iterator::const_iterator(const BlockGrid* grid, int col, int row)
    : grid_(grid), col_(col), row_(row) {}

BlockGrid::const_iterator& BlockGrid::const_iterator::operator++() {
    col_ += grid_->block_width_;
    if (col_ >= grid_->width_) {
        col_ = 0;
        row_ += grid_->block_height_;
    }
    // Normalize past-the-end so it compares equal to end()
    if (row_ >= grid_->height_) {
        col_ = 0;
        row_ = grid_->height_;
    }
    return *this;
}

BlockGrid::const_iterator BlockGrid::const_iterator::operator++(int) {
    const_iterator prev = *this;
    ++(*this);
    return prev;
}

BlockGrid::BlockGrid(int width, int height, int block_width, int block_height)
    : width_(width)
    , height_(height)
    , block_width_(block_width)
    , block_height_(block_height) {
    if (width < 0 || height < 0) {
        throw std::invalid_argument("Raster dimensions must be non-negative");
    }
    if (block_width <= 0 || block_height <= 0) {
        throw std::invalid_argument("Block dimensions must be positive");
    }
}

BlockGrid::const_iterator BlockGrid::begin() const {
    if (width_ == 0 || height_ == 0) return end();
    return const_iterator(this, 0, 0);
}

BlockGrid::const_iterator BlockGrid::end() const {
    return const_iterator(this, 0, height_);
}

int BlockGrid::columns() const {
    if (height_ == 0) return 0;
    return (width_ + block_width_ - 1) / block_width_;
}

int BlockGrid::rows() const {
    if (width_ == 0) return 0;
    return (height_ + block_height_ - 1) / block_height_;
}

std::vector<int> BlockGrid::column_offsets() const {
    std::vector<int> offsets;
    for (int col = 0; col < width_; col += block_width_) offsets.push_back(col);
    return offsets;
}

std::vector<int> BlockGrid::row_offsets() const {
    std::vector<int> offsets;
    for (int row = 0; row < height_; row += block_height_) offsets.push_back(row);
    return offsets;
}

Window BlockGrid::window_at(int col, int row) const {
    if (col < 0 || row < 0 || col >= width_ || row >= height_) {
        throw std::out_of_range("Window offset outside the raster");
    }
    return Window{
        col,
        row,
        std::min(block_width_, width_ - col),
        std::min(block_height_, height_ - row)
    };
}

} // namespace rastermath
