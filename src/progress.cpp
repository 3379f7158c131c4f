#include "rastermath/progress.hpp"

#include <utility>

#include <gdal.h>

namespace rastermath {

TermProgress::TermProgress(std::string message) : message_(std::move(message)) {}

void TermProgress::tick(size_t position, size_t total) {
    double complete = total == 0 ? 1.0 : static_cast<double>(position) / static_cast<double>(total);
    GDALTermProgress(complete, position == 0 ? message_.c_str() : nullptr, nullptr);
}

} // namespace rastermath
