#pragma once

#include <filesystem>
#include <string>

#include <Eigen/Core>

#include "orthoproj/types.hpp"

namespace orthoproj {

struct PointCloudData {
    Eigen::MatrixXd points;
    Eigen::MatrixXd colors;
};

// Reads whitespace-separated "x y z r g b" lines. Blank lines and lines
// starting with '#' are skipped.
// Throws std::runtime_error if the file cannot be opened or a line is malformed.
PointCloudData read_xyzrgb(const std::string& path);

// Writes face_<i>.bin for every face into output_dir:
// int32 rows, int32 cols, rows * cols * 3 uint8 RGB, then rows * cols uint8
// occupancy (0 or 1), all row-major.
// Throws std::runtime_error if a file cannot be written.
void write_projection_set(const std::filesystem::path& output_dir,
                          const ProjectionSet& projections);

// Reads a face file written by write_projection_set.
Projection read_projection(const std::filesystem::path& path);

} // namespace orthoproj
