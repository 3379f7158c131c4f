#pragma once

#include <stdexcept>
#include <string>

namespace rastermath {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raster or mask cannot be opened or created.
class OpenFailure : public Error {
public:
    using Error::Error;
};

// Auxiliary raster (mask, labels) does not cover the input's extent.
class ExtentMismatch : public Error {
public:
    using Error::Error;
};

class AllocationFailure : public Error {
public:
    using Error::Error;
};

// Function result has more columns than the output has bands.
class BandOverflow : public Error {
public:
    BandOverflow(int result_bands, int max_bands);

    int result_bands() const { return result_bands_; }
    int max_bands() const { return max_bands_; }

private:
    int result_bands_;
    int max_bands_;
};

// Function result rows do not match the number of valid pixels it was given.
class ShapeMismatch : public Error {
public:
    using Error::Error;
};

class FunctionFailure : public Error {
public:
    FunctionFailure(const std::string& function_name, const std::string& what);

    const std::string& function_name() const { return function_name_; }

private:
    std::string function_name_;
};

// GDAL reported an error during a read, write or flush.
class RasterIOError : public Error {
public:
    using Error::Error;
};

} // namespace rastermath
