#include <gtest/gtest.h>
#include "rastermath/matrix.hpp"

using rastermath::Matrix;
using rastermath::NumericType;

class MatrixTest : public ::testing::Test {
protected:
    Matrix pixels{4, 3, std::vector<double>{
        1, 10, 100,
        2, 20, 200,
        3, 30, 300,
        4, 40, 400
    }, NumericType::Int16};
};

TEST_F(MatrixTest, Shape) {
    EXPECT_EQ(pixels.rows(), 4u);
    EXPECT_EQ(pixels.cols(), 3u);
    EXPECT_EQ(pixels.ndim(), 2);
    EXPECT_EQ(pixels.type(), NumericType::Int16);
    EXPECT_DOUBLE_EQ(pixels(2, 1), 30);
}

TEST_F(MatrixTest, Column) {
    EXPECT_EQ(pixels.column(2), (std::vector<double>{100, 200, 300, 400}));
    EXPECT_THROW(pixels.column(3), std::out_of_range);
}

TEST_F(MatrixTest, SelectRowsKeepsOrderAndType) {
    Matrix selected = pixels.select_rows({true, false, false, true});

    ASSERT_EQ(selected.rows(), 2u);
    EXPECT_EQ(selected.type(), NumericType::Int16);
    EXPECT_DOUBLE_EQ(selected(0, 0), 1);
    EXPECT_DOUBLE_EQ(selected(1, 2), 400);
    EXPECT_THROW(pixels.select_rows({true}), std::invalid_argument);
}

TEST_F(MatrixTest, SelectNothing) {
    Matrix selected = pixels.select_rows({false, false, false, false});
    EXPECT_TRUE(selected.empty());
    EXPECT_EQ(selected.cols(), 3u);
}

TEST_F(MatrixTest, VectorReshapesToColumn) {
    Matrix v = Matrix::vector({5, 6, 7}, NumericType::Float32);

    EXPECT_EQ(v.ndim(), 1);
    EXPECT_EQ(v.rows(), 3u);
    EXPECT_EQ(v.cols(), 1u);

    Matrix c = v.as_column();
    EXPECT_EQ(c.ndim(), 2);
    EXPECT_DOUBLE_EQ(c(2, 0), 7);
    EXPECT_EQ(c.type(), NumericType::Float32);
}

TEST_F(MatrixTest, MinMax) {
    auto [lo, hi] = pixels.min_max();
    EXPECT_DOUBLE_EQ(lo, 1);
    EXPECT_DOUBLE_EQ(hi, 400);
    EXPECT_THROW(Matrix().min_max(), std::logic_error);
}

TEST_F(MatrixTest, Fill) {
    Matrix m(2, 2, NumericType::Float64, 1.5);
    EXPECT_DOUBLE_EQ(m(1, 1), 1.5);
    m.fill(-9999);
    EXPECT_DOUBLE_EQ(m(0, 1), -9999);
}

TEST_F(MatrixTest, RejectsMismatchedValues) {
    EXPECT_THROW(Matrix(2, 2, std::vector<double>{1, 2, 3}, NumericType::Float64),
                 std::invalid_argument);
}
