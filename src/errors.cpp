#include "rastermath/errors.hpp"

namespace rastermath {

BandOverflow::BandOverflow(int result_bands, int max_bands)
    : Error("Function output " + std::to_string(result_bands) +
            " bands, but the output has been defined with a maximum of " +
            std::to_string(max_bands) + " bands")
    , result_bands_(result_bands)
    , max_bands_(max_bands) {}

FunctionFailure::FunctionFailure(const std::string& function_name, const std::string& what)
    : Error("Function " + function_name + " failed: " + what)
    , function_name_(function_name) {}

} // namespace rastermath
