#include "orthoproj/projection_engine.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "orthoproj/logger.hpp"
#include "orthoproj/thread_joiner.hpp"

namespace orthoproj {

ProjectionEngine::ProjectionEngine(const PipelineConfig& config)
    : config_(config),
      normalizer_(config.normalizer),
      rasterizer_(config.rasterizer),
      outlier_filter_(config.outlier_filter),
      gap_filler_(config.gap_filler, config.rasterizer.background),
      cropper_() {}

void ProjectionEngine::validate(const Eigen::MatrixXd& points,
                                const Eigen::MatrixXd& colors) const {
    if (points.cols() != 3 || colors.cols() != 3) {
        throw std::invalid_argument(
            "`points` and `colors` must have 3 columns, got cols=" +
            std::to_string(points.cols()) + " and cols=" + std::to_string(colors.cols()));
    }
    if (points.rows() != colors.rows()) {
        throw std::invalid_argument(
            "`points` and `colors` must have the same length, got " +
            std::to_string(points.rows()) + " and " + std::to_string(colors.rows()));
    }
    const int precision = config_.normalizer.precision;
    if (precision < kMinPrecision || precision > kMaxPrecision) {
        throw std::invalid_argument(
            "`precision` must be in [" + std::to_string(kMinPrecision) + ", " +
            std::to_string(kMaxPrecision) + "], got " + std::to_string(precision));
    }
    if (config_.rasterizer.precision != precision) {
        throw std::invalid_argument("Normalizer and rasterizer precision differ.");
    }
    if (config_.gap_filler.radius < 0) {
        throw std::invalid_argument("`filtering` must be >= 0, got " +
                                    std::to_string(config_.gap_filler.radius));
    }
    if (config_.outlier_filter.radius < 0 || config_.outlier_filter.depth_threshold < 0) {
        throw std::invalid_argument("Outlier filter radius and depth threshold must be >= 0.");
    }
}

Projection ProjectionEngine::process_face(const NormalizedCloud& cloud, Face face) const {
    const FaceRaster raster = rasterizer_.rasterize(cloud, face);
    const OutlierFilterResult filtered = outlier_filter_.process(raster);
    if (config_.outlier_filter.radius > 0) {
        Logger::log(LogLevel::Info,
                    std::to_string(filtered.removed) + " points removed from projection " +
                        face_name(face));
    }

    const Projection projection = rasterizer_.to_projection(filtered.raster, cloud);
    Projection filled = gap_filler_.process(projection);
    Logger::log(LogLevel::Debug,
                std::string("Face ") + face_name(face) + ": " +
                    std::to_string(filtered.raster.occupied_count()) + " projected, " +
                    std::to_string(filled.occupancy.count()) + " occupied after gap filling");
    if (config_.crop.enabled) {
        return cropper_.process(filled);
    }
    return filled;
}

ProjectionSet ProjectionEngine::process(const Eigen::MatrixXd& points,
                                        const Eigen::MatrixXd& colors) const {
    validate(points, colors);

    const NormalizedCloud cloud = normalizer_.process(points, colors);
    Logger::log(LogLevel::Debug, "Normalized " + std::to_string(cloud.size()) +
                                     " points onto a " +
                                     std::to_string(rasterizer_.side()) + "^3 grid");

    ProjectionSet projections;
    if (!config_.rasterizer.parallel_faces) {
        for (Face face : kFaces) {
            projections[static_cast<std::size_t>(face)] = process_face(cloud, face);
        }
        return projections;
    }

    std::vector<std::exception_ptr> errors(kNumFaces);
    std::vector<std::thread> workers;
    workers.reserve(kNumFaces);
    ThreadJoiner joiner(workers);
    for (Face face : kFaces) {
        const std::size_t slot = static_cast<std::size_t>(face);
        workers.emplace_back([this, &cloud, &projections, &errors, face, slot]() {
            try {
                projections[slot] = process_face(cloud, face);
            } catch (...) {
                errors[slot] = std::current_exception();
            }
        });
    }
    joiner.join_all();
    for (const std::exception_ptr& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
    return projections;
}

ProjectionSet generate_projections(const Eigen::MatrixXd& points,
                                   const Eigen::MatrixXd& colors,
                                   int precision,
                                   int filtering,
                                   bool crop) {
    PipelineConfig config;
    config.set_precision(precision);
    config.gap_filler.radius = filtering;
    config.crop.enabled = crop;
    return ProjectionEngine(config).process(points, colors);
}

ProjectionSet apply_cropping(const ProjectionSet& projections) {
    return Cropper().process(projections);
}

} // namespace orthoproj
