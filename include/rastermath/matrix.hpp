#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "rastermath/type_bridge.hpp"

namespace rastermath {

// Row-major numeric buffer. Values are held as double; type() records the
// element type the data stands for (and the type an output inherits).
class Matrix {
public:
    Matrix() = default;
    Matrix(size_t rows, size_t cols, NumericType type = NumericType::Float64, double fill = 0.0);
    // Takes row-major values; values.size() must equal rows * cols.
    Matrix(size_t rows, size_t cols, std::vector<double> values, NumericType type);

    // 1-D result of n values; indexes as (n, 1).
    static Matrix vector(std::vector<double> values, NumericType type = NumericType::Float64);

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    size_t size() const { return data_.size(); }
    int ndim() const { return ndim_; }
    bool empty() const { return data_.empty(); }

    NumericType type() const { return type_; }
    void set_type(NumericType type) { type_ = type; }

    double& operator()(size_t r, size_t c) { return data_[r * cols_ + c]; }
    double operator()(size_t r, size_t c) const { return data_[r * cols_ + c]; }

    double* row(size_t r) { return data_.data() + r * cols_; }
    const double* row(size_t r) const { return data_.data() + r * cols_; }

    double* data() { return data_.data(); }
    const double* data() const { return data_.data(); }
    const std::vector<double>& values() const { return data_; }

    std::vector<double> column(size_t c) const;
    void fill(double value);

    // Rows whose flag is set, in order. keep.size() must equal rows().
    Matrix select_rows(const std::vector<bool>& keep) const;

    // A 1-D matrix reshaped to a single column; 2-D matrices are returned as-is.
    Matrix as_column() const;

    // Smallest and largest value. Throws std::logic_error when empty.
    std::pair<double, double> min_max() const;

private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    int ndim_ = 2;
    NumericType type_ = NumericType::Float64;
    std::vector<double> data_;
};

} // namespace rastermath
