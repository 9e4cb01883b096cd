#pragma once

#include <optional>

#include <Eigen/Core>

#include "orthoproj/types.hpp"

namespace orthoproj {

struct BoundingBox {
    Eigen::Index top;
    Eigen::Index left;
    Eigen::Index height;
    Eigen::Index width;
};

// Smallest rectangle holding every occupied pixel; nullopt if none is occupied.
std::optional<BoundingBox> occupied_bounds(const OccupancyMap& occupancy);

// Trims a projection to its occupied bounds. A projection with no occupied
// pixel becomes a 0x0 image and a 0x0 occupancy map.
// Throws std::invalid_argument when the image and occupancy shapes differ.
class Cropper {
public:
    Projection process(const Projection& projection) const;
    ProjectionSet process(const ProjectionSet& projections) const;
};

} // namespace orthoproj
