#pragma once

#include <Eigen/Core>

#include "orthoproj/config.hpp"
#include "orthoproj/cropper.hpp"
#include "orthoproj/gap_filler.hpp"
#include "orthoproj/normalizer.hpp"
#include "orthoproj/outlier_filter.hpp"
#include "orthoproj/rasterizer.hpp"
#include "orthoproj/types.hpp"

namespace orthoproj {

// Runs normalization, rasterization, outlier removal, gap filling and
// optional cropping. Every call is independent; the engine holds no state
// besides its configuration.
// Throws std::invalid_argument before any processing when arguments or
// config values are invalid.
class ProjectionEngine {
public:
    explicit ProjectionEngine(const PipelineConfig& config);
    ProjectionSet process(const Eigen::MatrixXd& points, const Eigen::MatrixXd& colors) const;

private:
    void validate(const Eigen::MatrixXd& points, const Eigen::MatrixXd& colors) const;
    Projection process_face(const NormalizedCloud& cloud, Face face) const;

    PipelineConfig config_;
    Normalizer normalizer_;
    Rasterizer rasterizer_;
    OutlierFilter outlier_filter_;
    GapFiller gap_filler_;
    Cropper cropper_;
};

// Points and colors are (N, 3) and aligned row by row. Faces come back in the
// order +X, -X, +Y, -Y, +Z, -Z.
ProjectionSet generate_projections(const Eigen::MatrixXd& points,
                                   const Eigen::MatrixXd& colors,
                                   int precision,
                                   int filtering,
                                   bool crop = false);

ProjectionSet apply_cropping(const ProjectionSet& projections);

} // namespace orthoproj
