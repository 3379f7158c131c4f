#pragma once

#include <cstddef>
#include <iterator>
#include <vector>

namespace rastermath {

struct Window {
    int col;
    int row;
    int width;
    int height;

    size_t pixel_count() const { return static_cast<size_t>(width) * height; }

    bool operator==(const Window& other) const {
        return col == other.col && row == other.row &&
               width == other.width && height == other.height;
    }
    bool operator!=(const Window& other) const { return !(*this == other); }
};

// Row-major tiling of a width x height raster into block-sized windows.
// Windows on the last column/row are clipped to the raster bounds.
class BlockGrid {
public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Window;
        using difference_type = std::ptrdiff_t;
        using pointer = const Window*;
        using reference = Window;

        const_iterator() = default;

        Window operator*() const { return grid_->window_at(col_, row_); }
        const_iterator& operator++();
        const_iterator operator++(int);

        bool operator==(const const_iterator& other) const {
            return col_ == other.col_ && row_ == other.row_;
        }
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        friend class BlockGrid;
        const_iterator(const BlockGrid* grid, int col, int row);

        const BlockGrid* grid_ = nullptr;
        int col_ = 0;
        int row_ = 0;
    };

    BlockGrid(int width, int height, int block_width, int block_height);

    const_iterator begin() const;
    const_iterator end() const;

    // Number of windows; equals std::distance(begin(), end()).
    size_t size() const { return static_cast<size_t>(columns()) * rows(); }
    int columns() const;
    int rows() const;

    std::vector<int> column_offsets() const;
    std::vector<int> row_offsets() const;

    // Window starting at (col, row), clipped to the raster.
    Window window_at(int col, int row) const;

    int width() const { return width_; }
    int height() const { return height_; }
    int block_width() const { return block_width_; }
    int block_height() const { return block_height_; }

private:
    int width_;
    int height_;
    int block_width_;
    int block_height_;
};

} // namespace rastermath
