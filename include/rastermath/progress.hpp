#pragma once

#include <cstddef>
#include <string>

namespace rastermath {

// Receives the engine's window position, 0 through total.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void tick(size_t position, size_t total) = 0;
};

class NullProgress : public ProgressSink {
public:
    void tick(size_t, size_t) override {}
};

// Renders through GDALTermProgress on stdout.
class TermProgress : public ProgressSink {
public:
    explicit TermProgress(std::string message = "rastermath... ");
    void tick(size_t position, size_t total) override;

private:
    std::string message_;
};

} // namespace rastermath
