#pragma once

#include "orthoproj/types.hpp"

namespace orthoproj {

// Repairs holes inside each projection's silhouette. The occupancy map is
// closed with a kernel_size x kernel_size square; unoccupied pixels inside the
// closed region are inpainted (Navier-Stokes) from their neighbours and marked
// occupied. Pixels outside the closed silhouette are left untouched.
// Throws std::invalid_argument on a kernel size below 1 or mismatched buffers.
class Padder {
public:
    Padder(int kernel_size, const Color& background);
    Projection process(const Projection& projection) const;
    ProjectionSet process(const ProjectionSet& projections) const;

private:
    int kernel_size_;
    Color background_;
};

// Padding with a precision x precision kernel against a white background.
ProjectionSet apply_padding(const ProjectionSet& projections, int precision);

} // namespace orthoproj
