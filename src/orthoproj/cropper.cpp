#include "orthoproj/cropper.hpp"

#include <algorithm>
#include <stdexcept>

namespace orthoproj {

std::optional<BoundingBox> occupied_bounds(const OccupancyMap& occupancy) {
    Eigen::Index top = occupancy.rows();
    Eigen::Index left = occupancy.cols();
    Eigen::Index bottom = -1;
    Eigen::Index right = -1;

    for (Eigen::Index r = 0; r < occupancy.rows(); ++r) {
        for (Eigen::Index c = 0; c < occupancy.cols(); ++c) {
            if (!occupancy(r, c)) {
                continue;
            }
            top = std::min(top, r);
            left = std::min(left, c);
            bottom = std::max(bottom, r);
            right = std::max(right, c);
        }
    }

    if (bottom < 0) {
        return std::nullopt;
    }
    return BoundingBox{top, left, bottom - top + 1, right - left + 1};
}

Projection Cropper::process(const Projection& projection) const {
    if (projection.image.rows() != projection.occupancy.rows() ||
        projection.image.cols() != projection.occupancy.cols()) {
        throw std::invalid_argument("Image and occupancy map must have the same shape.");
    }

    Projection out;
    const std::optional<BoundingBox> box = occupied_bounds(projection.occupancy);
    if (!box.has_value()) {
        out.image = ProjectionImage(0, 0, Color::Zero());
        out.occupancy = OccupancyMap(0, 0);
        return out;
    }

    out.image = projection.image.crop(box->top, box->left, box->height, box->width);
    out.occupancy = projection.occupancy.block(box->top, box->left, box->height, box->width);
    return out;
}

ProjectionSet Cropper::process(const ProjectionSet& projections) const {
    ProjectionSet out;
    for (std::size_t i = 0; i < projections.size(); ++i) {
        out[i] = process(projections[i]);
    }
    return out;
}

} // namespace orthoproj
