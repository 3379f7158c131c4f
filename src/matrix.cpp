#include "rastermath/matrix.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace rastermath {

Matrix::Matrix(size_t rows, size_t cols, NumericType type, double fill)
    : rows_(rows)
    , cols_(cols)
    , type_(type)
    , data_(rows * cols, fill) {}

Matrix::Matrix(size_t rows, size_t cols, std::vector<double> values, NumericType type)
    : rows_(rows)
    , cols_(cols)
    , type_(type)
    , data_(std::move(values)) {
    if (data_.size() != rows * cols) {
        throw std::invalid_argument("Matrix values do not match its shape");
    }
}

Matrix Matrix::vector(std::vector<double> values, NumericType type) {
    Matrix m;
    m.rows_ = values.size();
    m.cols_ = 1;
    m.ndim_ = 1;
    m.type_ = type;
    m.data_ = std::move(values);
    return m;
}

std::vector<double> Matrix::column(size_t c) const {
    if (c >= cols_) throw std::out_of_range("Column index out of range");

    std::vector<double> out(rows_);
    for (size_t r = 0; r < rows_; r++) {
        out[r] = data_[r * cols_ + c];
    }
    return out;
}

void Matrix::fill(double value) {
    std::fill(data_.begin(), data_.end(), value);
}

Matrix Matrix::select_rows(const std::vector<bool>& keep) const {
    if (keep.size() != rows_) {
        throw std::invalid_argument("Row selector length does not match matrix rows");
    }

    size_t kept = static_cast<size_t>(std::count(keep.begin(), keep.end(), true));
    Matrix out(kept, cols_, type_);
    out.ndim_ = ndim_;

    size_t dst = 0;
    for (size_t r = 0; r < rows_; r++) {
        if (!keep[r]) continue;
        std::copy(row(r), row(r) + cols_, out.row(dst++));
    }
    return out;
}

Matrix Matrix::as_column() const {
    Matrix out(*this);
    out.ndim_ = 2;
    return out;
}

std::pair<double, double> Matrix::min_max() const {
    if (data_.empty()) throw std::logic_error("min_max of an empty matrix");

    auto [lo, hi] = std::minmax_element(data_.begin(), data_.end());
    return {*lo, *hi};
}

} // namespace rastermath
