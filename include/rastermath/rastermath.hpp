#pragma once

#include "rastermath/block_engine.hpp"
#include "rastermath/block_grid.hpp"
#include "rastermath/engine_options.hpp"
#include "rastermath/errors.hpp"
#include "rastermath/function_args.hpp"
#include "rastermath/masked_block_reader.hpp"
#include "rastermath/matrix.hpp"
#include "rastermath/output_registry.hpp"
#include "rastermath/progress.hpp"
#include "rastermath/random_block_sampler.hpp"
#include "rastermath/raster_handle.hpp"
#include "rastermath/sample_extractor.hpp"
#include "rastermath/type_bridge.hpp"

namespace rastermath {

inline constexpr const char* VERSION = "0.1.0";

} // namespace rastermath
