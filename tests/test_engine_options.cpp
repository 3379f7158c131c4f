#include <gtest/gtest.h>
#include "rastermath/engine_options.hpp"

#include <cpl_conv.h>

using rastermath::EngineOptions;

namespace {
const char* const KEYS[] = {
    "RASTERMATH_DRIVER",
    "RASTERMATH_CREATION_OPTIONS",
    "RASTERMATH_NODATA",
    "RASTERMATH_MASK_NODATA",
    "RASTERMATH_BLOCKXSIZE",
    "RASTERMATH_BLOCKYSIZE",
    "RASTERMATH_SEED",
    "RASTERMATH_SAMPLE_ATTEMPTS",
};
}

class EngineOptionsTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* key : KEYS) CPLSetConfigOption(key, nullptr);
    }
};

TEST_F(EngineOptionsTest, DefaultsWithoutConfig) {
    EngineOptions opts = EngineOptions::from_config();

    EXPECT_EQ(opts.driver, "GTiff");
    EXPECT_EQ(opts.creation_options, (std::vector<std::string>{"COMPRESS=DEFLATE", "TILED=YES"}));
    EXPECT_DOUBLE_EQ(opts.default_nodata, -9999.0);
    EXPECT_DOUBLE_EQ(opts.mask_nodata, 0.0);
    EXPECT_EQ(opts.block_width, 0);
    EXPECT_EQ(opts.block_height, 0);
    EXPECT_EQ(opts.seed, 0u);
    EXPECT_EQ(opts.sample_attempts, 10);
}

TEST_F(EngineOptionsTest, ReadsEveryOption) {
    CPLSetConfigOption("RASTERMATH_DRIVER", "HFA");
    CPLSetConfigOption("RASTERMATH_CREATION_OPTIONS", "COMPRESS=LZW, BIGTIFF=YES PREDICTOR=2");
    CPLSetConfigOption("RASTERMATH_NODATA", "-1.5");
    CPLSetConfigOption("RASTERMATH_MASK_NODATA", "255");
    CPLSetConfigOption("RASTERMATH_BLOCKXSIZE", "64");
    CPLSetConfigOption("RASTERMATH_BLOCKYSIZE", "32");
    CPLSetConfigOption("RASTERMATH_SEED", "4000000000");
    CPLSetConfigOption("RASTERMATH_SAMPLE_ATTEMPTS", "3");

    EngineOptions opts = EngineOptions::from_config();

    EXPECT_EQ(opts.driver, "HFA");
    EXPECT_EQ(opts.creation_options,
              (std::vector<std::string>{"COMPRESS=LZW", "BIGTIFF=YES", "PREDICTOR=2"}));
    EXPECT_DOUBLE_EQ(opts.default_nodata, -1.5);
    EXPECT_DOUBLE_EQ(opts.mask_nodata, 255.0);
    EXPECT_EQ(opts.block_width, 64);
    EXPECT_EQ(opts.block_height, 32);
    EXPECT_EQ(opts.seed, 4000000000u);
    EXPECT_EQ(opts.sample_attempts, 3);
}

TEST_F(EngineOptionsTest, EmptyCreationOptionsClearDefaults) {
    CPLSetConfigOption("RASTERMATH_CREATION_OPTIONS", "");

    EXPECT_TRUE(EngineOptions::from_config().creation_options.empty());
}
