#include "orthoproj/gap_filler.hpp"

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "orthoproj/summed_area.hpp"

namespace orthoproj {
namespace {

using ChannelMatrix =
    Eigen::Matrix<std::int64_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

std::uint8_t rounded_mean(std::int64_t sum, std::int64_t count) {
    return static_cast<std::uint8_t>((2 * sum + count) / (2 * count));
}

} // namespace

GapFiller::GapFiller(const GapFillerConfig& config, const Color& background)
    : config_(config), background_(background) {}

Projection GapFiller::process(const Projection& projection) const {
    if (config_.radius < 0) {
        throw std::invalid_argument("`filtering` must be >= 0, got " +
                                    std::to_string(config_.radius));
    }
    const Eigen::Index rows = projection.occupancy.rows();
    const Eigen::Index cols = projection.occupancy.cols();
    if (projection.image.rows() != rows || projection.image.cols() != cols) {
        throw std::invalid_argument("Image and occupancy map must have the same shape.");
    }

    Projection out = projection;
    if (config_.radius == 0 || rows == 0 || cols == 0) {
        return out;
    }

    ChannelMatrix counts(rows, cols);
    std::array<ChannelMatrix, 3> channels{ChannelMatrix(rows, cols), ChannelMatrix(rows, cols),
                                          ChannelMatrix(rows, cols)};
    for (Eigen::Index r = 0; r < rows; ++r) {
        for (Eigen::Index c = 0; c < cols; ++c) {
            const bool occupied = projection.occupancy(r, c);
            const Color color = projection.image.pixel(r, c);
            counts(r, c) = occupied ? 1 : 0;
            for (std::size_t ch = 0; ch < 3; ++ch) {
                channels[ch](r, c) = occupied ? color[static_cast<Eigen::Index>(ch)] : 0;
            }
        }
    }

    const SumTable count_table = summed_area(counts);
    const std::array<SumTable, 3> color_tables{
        summed_area(channels[0]), summed_area(channels[1]), summed_area(channels[2])};

    for (Eigen::Index r = 0; r < rows; ++r) {
        for (Eigen::Index c = 0; c < cols; ++c) {
            if (projection.occupancy(r, c)) {
                continue;
            }
            const Window w = clipped_window(count_table, r, c, config_.radius);
            const std::int64_t count = window_sum(count_table, w);
            if (count == 0) {
                continue;
            }
            const Color mean(rounded_mean(window_sum(color_tables[0], w), count),
                             rounded_mean(window_sum(color_tables[1], w), count),
                             rounded_mean(window_sum(color_tables[2], w), count));
            out.image.set_pixel(r, c, distinct_color(mean, background_));
            out.occupancy(r, c) = true;
        }
    }
    return out;
}

} // namespace orthoproj
