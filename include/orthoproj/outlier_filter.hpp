#pragma once

#include <cstddef>

#include "orthoproj/config.hpp"
#include "orthoproj/rasterizer.hpp"

namespace orthoproj {

struct OutlierFilterResult {
    FaceRaster raster;
    std::size_t removed = 0;
};

// Drops occupied pixels lying more than `depth_threshold` behind the mean
// depth of the occupied pixels in their (2r+1)x(2r+1) window. Every pixel is
// judged against the unfiltered raster. A radius of 0 disables the filter.
// Throws std::invalid_argument on invalid config values.
class OutlierFilter {
public:
    explicit OutlierFilter(const OutlierFilterConfig& config);
    OutlierFilterResult process(const FaceRaster& raster) const;

private:
    OutlierFilterConfig config_;
};

} // namespace orthoproj
