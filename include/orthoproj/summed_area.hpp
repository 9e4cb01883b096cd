#pragma once

#include <algorithm>
#include <cstdint>

#include <Eigen/Core>

namespace orthoproj {

using SumTable = Eigen::Matrix<std::int64_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Builds a (rows + 1, cols + 1) summed-area table of `values`; entry (r, c)
// holds the sum over [0, r) x [0, c).
template <typename Derived>
SumTable summed_area(const Eigen::MatrixBase<Derived>& values) {
    const Eigen::Index rows = values.rows();
    const Eigen::Index cols = values.cols();
    SumTable table = SumTable::Zero(rows + 1, cols + 1);
    for (Eigen::Index r = 0; r < rows; ++r) {
        std::int64_t row_sum = 0;
        for (Eigen::Index c = 0; c < cols; ++c) {
            row_sum += static_cast<std::int64_t>(values(r, c));
            table(r + 1, c + 1) = table(r, c + 1) + row_sum;
        }
    }
    return table;
}

// Square window of the given radius around (row, col), clipped to the table.
struct Window {
    Eigen::Index top;
    Eigen::Index left;
    Eigen::Index bottom;
    Eigen::Index right;
};

inline Window clipped_window(const SumTable& table, Eigen::Index row, Eigen::Index col,
                             Eigen::Index radius) {
    return {std::max<Eigen::Index>(row - radius, 0),
            std::max<Eigen::Index>(col - radius, 0),
            std::min<Eigen::Index>(row + radius + 1, table.rows() - 1),
            std::min<Eigen::Index>(col + radius + 1, table.cols() - 1)};
}

inline std::int64_t window_sum(const SumTable& table, const Window& w) {
    return table(w.bottom, w.right) - table(w.top, w.right) - table(w.bottom, w.left) +
           table(w.top, w.left);
}

} // namespace orthoproj
