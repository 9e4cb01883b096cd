#include <cstddef>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#include "orthoproj/config.hpp"
#include "orthoproj/io.hpp"
#include "orthoproj/logger.hpp"
#include "orthoproj/projection_engine.hpp"

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <points.xyzrgb> [--config <yaml>] [--precision=N]\n"
              << "       [--filtering=N] [--outlier-radius=N] [--crop|--no-crop]\n"
              << "       [--mode=fit_cube|preserve_spacing] [--merge-duplicates]\n"
              << "       [--parallel|--sequential] [--output-dir=DIR] [--log-level=LEVEL]\n"
              << "   or: " << program << " --crop-dir=DIR --output-dir=DIR\n";
}

orthoproj::ProjectionSet loadProjectionSet(const std::filesystem::path& dir) {
    orthoproj::ProjectionSet projections;
    for (std::size_t i = 0; i < projections.size(); ++i) {
        projections[i] =
            orthoproj::read_projection(dir / ("face_" + std::to_string(i) + ".bin"));
    }
    return projections;
}

int run(int argc, char** argv) {
    using namespace orthoproj;

    const ConfigOverrides overrides = ConfigOverrides::fromArgs(argc, argv);
    PipelineConfig config;
    if (overrides.config_path.has_value()) {
        config = load_config(*overrides.config_path);
    }
    apply_overrides(config, overrides);
    Logger::setMinLevel(config.log_level);

    if (overrides.crop_input_dir.has_value()) {
        if (!overrides.output_dir.has_value()) {
            printUsage(argv[0]);
            return 1;
        }
        const ProjectionSet cropped = apply_cropping(loadProjectionSet(*overrides.crop_input_dir));
        write_projection_set(config.output.output_dir, cropped);
        Logger::log(LogLevel::Info, "Cropped projections written to " + config.output.output_dir);
        return 0;
    }

    if (!overrides.input_path.has_value()) {
        printUsage(argv[0]);
        return 1;
    }

    const PointCloudData cloud = read_xyzrgb(*overrides.input_path);
    Logger::log(LogLevel::Info, "Loaded " + std::to_string(cloud.points.rows()) + " points from " +
                                    *overrides.input_path);

    const ProjectionEngine engine(config);
    const ProjectionSet projections = engine.process(cloud.points, cloud.colors);

    for (Face face : kFaces) {
        const Projection& p = projections[static_cast<std::size_t>(face)];
        Logger::log(LogLevel::Info, std::string("Projection ") + face_name(face) + ": " +
                                        std::to_string(p.image.rows()) + "x" +
                                        std::to_string(p.image.cols()) + ", " +
                                        std::to_string(p.occupancy.count()) + " occupied");
    }

    if (config.output.write_output) {
        write_projection_set(config.output.output_dir, projections);
        Logger::log(LogLevel::Info, "Projections written to " + config.output.output_dir);
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        orthoproj::Logger::log(orthoproj::LogLevel::Error, e.what());
        return 1;
    }
}
