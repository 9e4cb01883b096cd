#include "orthoproj/outlier_filter.hpp"

#include <cstdint>
#include <stdexcept>

#include "orthoproj/summed_area.hpp"

namespace orthoproj {

OutlierFilter::OutlierFilter(const OutlierFilterConfig& config) : config_(config) {}

OutlierFilterResult OutlierFilter::process(const FaceRaster& raster) const {
    if (config_.radius < 0) {
        throw std::invalid_argument("`outlier_filter.radius` must be >= 0.");
    }
    if (config_.depth_threshold < 0) {
        throw std::invalid_argument("`outlier_filter.depth_threshold` must be >= 0.");
    }

    OutlierFilterResult result{raster, 0};
    if (config_.radius == 0 || raster.side == 0) {
        return result;
    }

    const Eigen::Index n = raster.side;
    Eigen::Matrix<std::int64_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> counts(n, n);
    Eigen::Matrix<std::int64_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> depths(n, n);
    for (Eigen::Index r = 0; r < n; ++r) {
        for (Eigen::Index c = 0; c < n; ++c) {
            const auto& cell = raster.at(r, c);
            counts(r, c) = cell.has_value() ? 1 : 0;
            depths(r, c) = cell.has_value() ? cell->depth : 0;
        }
    }
    const SumTable count_table = summed_area(counts);
    const SumTable depth_table = summed_area(depths);
    const std::int64_t threshold = config_.depth_threshold;

    for (Eigen::Index r = 0; r < n; ++r) {
        for (Eigen::Index c = 0; c < n; ++c) {
            const auto& cell = raster.at(r, c);
            if (!cell.has_value()) {
                continue;
            }
            const Window w = clipped_window(count_table, r, c, config_.radius);
            const std::int64_t count = window_sum(count_table, w);
            const std::int64_t depth_sum = window_sum(depth_table, w);
            // depth > depth_sum / count + threshold, kept in integers.
            if (static_cast<std::int64_t>(cell->depth) * count > depth_sum + threshold * count) {
                result.raster.at(r, c).reset();
                ++result.removed;
            }
        }
    }
    return result;
}

} // namespace orthoproj
