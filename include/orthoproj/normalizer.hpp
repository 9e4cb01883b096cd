#pragma once

#include <cstdint>
#include <vector>

#include <Eigen/Core>

#include "orthoproj/config.hpp"
#include "orthoproj/types.hpp"

namespace orthoproj {

using VoxelMatrix = Eigen::Matrix<std::int32_t, Eigen::Dynamic, 3, Eigen::RowMajor>;

// Points on the voxel grid [0, 2^precision)^3 with their quantized colors.
// Row i of voxels and colors belongs to the same point.
struct NormalizedCloud {
    VoxelMatrix voxels;
    std::vector<Color> colors;
    int precision = 0;

    Eigen::Index size() const { return voxels.rows(); }
};

// Uniform scale and translation mapping raw coordinates onto the grid:
// voxel = floor((p - origin) * scale + offset), clamped to [0, 2^precision).
struct GridTransform {
    Eigen::Vector3d origin = Eigen::Vector3d::Zero();
    Eigen::Vector3d offset = Eigen::Vector3d::Zero();
    double scale = 1.0;
};

// Points and colors are (N, 3). Colors are in [0, 1] or [0, 255] depending on
// the configured color range.
// Throws std::invalid_argument on malformed input or invalid config values.
class Normalizer {
public:
    explicit Normalizer(const NormalizerConfig& config);

    GridTransform compute_transform(const Eigen::MatrixXd& points) const;
    NormalizedCloud process(const Eigen::MatrixXd& points, const Eigen::MatrixXd& colors) const;

private:
    NormalizerConfig config_;
};

// Quantizes colors to [0, 255] with round-half-away-from-zero, rescaling
// unit-range input according to `range`.
std::vector<Color> quantize_colors(const Eigen::MatrixXd& colors, ColorRange range);

// Collapses points sharing a voxel into one point with the mean color.
// Merged points keep the input order of their first member.
NormalizedCloud merge_duplicate_voxels(const NormalizedCloud& cloud);

} // namespace orthoproj
