#include "orthoproj/normalizer.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

#include "orthoproj/logger.hpp"

namespace orthoproj {
namespace {

struct VoxelIndex {
    std::int32_t ix;
    std::int32_t iy;
    std::int32_t iz;

    bool operator<(const VoxelIndex& other) const {
        if (ix != other.ix) {
            return ix < other.ix;
        }
        if (iy != other.iy) {
            return iy < other.iy;
        }
        return iz < other.iz;
    }
};

struct ColorSum {
    std::size_t first_row = 0;
    std::int64_t r = 0;
    std::int64_t g = 0;
    std::int64_t b = 0;
    std::int64_t count = 0;
};

void check_precision(int precision) {
    if (precision < kMinPrecision || precision > kMaxPrecision) {
        throw std::invalid_argument(
            "`precision` must be in [" + std::to_string(kMinPrecision) + ", " +
            std::to_string(kMaxPrecision) + "], got " + std::to_string(precision));
    }
}

void check_shape(const Eigen::MatrixXd& m, const char* name) {
    if (m.cols() != 3) {
        throw std::invalid_argument(std::string("`") + name +
                                    "` must have 3 columns, got cols=" +
                                    std::to_string(m.cols()));
    }
}

// Smallest non-zero difference between sorted coordinates on any axis, or 0
// when every axis holds a single distinct value.
double min_nonzero_gap(const Eigen::MatrixXd& points) {
    double best = 0.0;
    std::vector<double> column(static_cast<std::size_t>(points.rows()));
    for (Eigen::Index axis = 0; axis < 3; ++axis) {
        for (Eigen::Index i = 0; i < points.rows(); ++i) {
            column[static_cast<std::size_t>(i)] = points(i, axis);
        }
        std::sort(column.begin(), column.end());
        for (std::size_t i = 1; i < column.size(); ++i) {
            const double gap = column[i] - column[i - 1];
            if (gap > 0.0 && (best == 0.0 || gap < best)) {
                best = gap;
            }
        }
    }
    return best;
}

std::uint8_t mean_channel(std::int64_t sum, std::int64_t count) {
    return static_cast<std::uint8_t>((2 * sum + count) / (2 * count));
}

} // namespace

Normalizer::Normalizer(const NormalizerConfig& config) : config_(config) {}

GridTransform Normalizer::compute_transform(const Eigen::MatrixXd& points) const {
    check_precision(config_.precision);
    check_shape(points, "points");

    GridTransform transform;
    if (points.rows() == 0) {
        return transform;
    }
    if (!points.allFinite()) {
        throw std::invalid_argument("`points` must contain only finite coordinates.");
    }

    const double side = static_cast<double>(std::int64_t{1} << config_.precision);
    const Eigen::Vector3d min_bound = points.colwise().minCoeff().transpose();
    const Eigen::Vector3d max_bound = points.colwise().maxCoeff().transpose();
    const double max_extent = (max_bound - min_bound).maxCoeff();
    if (!std::isfinite(max_extent)) {
        throw std::invalid_argument(
            "`points` span a range too wide to voxelize; rescale the cloud first.");
    }

    transform.origin = min_bound;
    if (min_bound.minCoeff() < 0.0) {
        Logger::log(LogLevel::Debug, "Found negative coordinates, displacement applied.");
    }

    if (!(max_extent > 0.0)) {
        // Every point coincides; put the cloud at the grid centre.
        transform.scale = 0.0;
        transform.offset = Eigen::Vector3d::Constant(side / 2.0);
        Logger::log(LogLevel::Debug, "Zero-extent cloud mapped to the grid centre.");
        return transform;
    }

    const double fit_scale = side / max_extent;
    transform.scale = fit_scale;
    if (config_.mode == NormalizationMode::PreserveSpacing) {
        const double gap = min_nonzero_gap(points);
        const double spacing_scale = 1.0 / gap;
        if (max_extent * spacing_scale < side) {
            transform.scale = spacing_scale;
            std::ostringstream msg;
            msg << "Point spacing preserved with a scale factor of " << spacing_scale << ".";
            Logger::log(LogLevel::Debug, msg.str());
        } else {
            std::ostringstream msg;
            msg << "Cloud subsampled to fit a " << side << "x" << side << " projection.";
            Logger::log(LogLevel::Info, msg.str());
        }
    }
    return transform;
}

NormalizedCloud Normalizer::process(const Eigen::MatrixXd& points,
                                    const Eigen::MatrixXd& colors) const {
    check_precision(config_.precision);
    check_shape(points, "points");
    check_shape(colors, "colors");
    if (points.rows() != colors.rows()) {
        throw std::invalid_argument(
            "`points` and `colors` must have the same number of rows, got " +
            std::to_string(points.rows()) + " and " + std::to_string(colors.rows()));
    }

    const GridTransform transform = compute_transform(points);
    const std::int32_t max_voxel = (std::int32_t{1} << config_.precision) - 1;

    NormalizedCloud cloud;
    cloud.precision = config_.precision;
    cloud.voxels.resize(points.rows(), 3);
    for (Eigen::Index i = 0; i < points.rows(); ++i) {
        for (Eigen::Index axis = 0; axis < 3; ++axis) {
            const double scaled =
                (points(i, axis) - transform.origin[axis]) * transform.scale +
                transform.offset[axis];
            const double voxel = std::floor(scaled);
            cloud.voxels(i, axis) = static_cast<std::int32_t>(
                std::min(std::max(voxel, 0.0), static_cast<double>(max_voxel)));
        }
    }
    cloud.colors = quantize_colors(colors, config_.color_range);

    if (config_.merge_duplicates) {
        const Eigen::Index before = cloud.size();
        cloud = merge_duplicate_voxels(cloud);
        Logger::log(LogLevel::Debug,
                    "Merged " + std::to_string(before - cloud.size()) + " duplicate points.");
    }
    return cloud;
}

std::vector<Color> quantize_colors(const Eigen::MatrixXd& colors, ColorRange range) {
    check_shape(colors, "colors");
    std::vector<Color> out;
    out.reserve(static_cast<std::size_t>(colors.rows()));
    if (colors.rows() == 0) {
        return out;
    }
    if (!colors.allFinite()) {
        throw std::invalid_argument("`colors` must contain only finite values.");
    }

    bool unit = range == ColorRange::Unit;
    if (range == ColorRange::Auto) {
        unit = colors.minCoeff() >= 0.0 && colors.maxCoeff() <= 1.0;
        if (unit) {
            Logger::log(LogLevel::Debug, "Colors rescaled from [0, 1] to [0, 255].");
        }
    }
    const double factor = unit ? 255.0 : 1.0;

    for (Eigen::Index i = 0; i < colors.rows(); ++i) {
        Color color;
        for (Eigen::Index ch = 0; ch < 3; ++ch) {
            const double value = colors(i, ch) * factor;
            if (value < 0.0 || value > 255.0) {
                throw std::invalid_argument(
                    "Color channel out of range at row " + std::to_string(i) + ": " +
                    std::to_string(colors(i, ch)));
            }
            color[ch] = static_cast<std::uint8_t>(std::lround(value));
        }
        out.push_back(color);
    }
    return out;
}

NormalizedCloud merge_duplicate_voxels(const NormalizedCloud& cloud) {
    std::map<VoxelIndex, std::size_t> slots;
    std::vector<ColorSum> sums;
    sums.reserve(static_cast<std::size_t>(cloud.size()));

    for (Eigen::Index i = 0; i < cloud.size(); ++i) {
        const VoxelIndex idx{cloud.voxels(i, 0), cloud.voxels(i, 1), cloud.voxels(i, 2)};
        const auto inserted = slots.emplace(idx, sums.size());
        if (inserted.second) {
            ColorSum fresh;
            fresh.first_row = static_cast<std::size_t>(i);
            sums.push_back(fresh);
        }
        ColorSum& sum = sums[inserted.first->second];
        const Color& color = cloud.colors[static_cast<std::size_t>(i)];
        sum.r += color[0];
        sum.g += color[1];
        sum.b += color[2];
        ++sum.count;
    }

    NormalizedCloud merged;
    merged.precision = cloud.precision;
    merged.voxels.resize(static_cast<Eigen::Index>(sums.size()), 3);
    merged.colors.reserve(sums.size());
    for (std::size_t k = 0; k < sums.size(); ++k) {
        const ColorSum& sum = sums[k];
        merged.voxels.row(static_cast<Eigen::Index>(k)) =
            cloud.voxels.row(static_cast<Eigen::Index>(sum.first_row));
        merged.colors.emplace_back(mean_channel(sum.r, sum.count),
                                   mean_channel(sum.g, sum.count),
                                   mean_channel(sum.b, sum.count));
    }
    return merged;
}

} // namespace orthoproj
