#pragma once

#include "orthoproj/config.hpp"
#include "orthoproj/types.hpp"

namespace orthoproj {

// Fills unoccupied pixels that have at least one occupied pixel in their
// (2r+1)x(2r+1) window with the rounded mean color of those pixels.
// Runs a single pass against the input occupancy; filled pixels never seed
// further fills. A radius of 0 returns the input unchanged.
// Throws std::invalid_argument on a negative radius or mismatched buffers.
class GapFiller {
public:
    GapFiller(const GapFillerConfig& config, const Color& background);
    Projection process(const Projection& projection) const;

private:
    GapFillerConfig config_;
    Color background_;
};

} // namespace orthoproj
