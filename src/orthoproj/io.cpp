#include "orthoproj/io.hpp"

#include <array>
#include <cstdint>
#include <fstream>
#include <ios>
#include <istream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace orthoproj {
namespace {

std::filesystem::path face_path(const std::filesystem::path& output_dir, std::size_t index) {
    std::ostringstream name;
    name << "face_" << index << ".bin";
    return output_dir / name.str();
}

void write_projection_bin(const std::filesystem::path& path, const Projection& projection) {
    const std::int32_t rows = static_cast<std::int32_t>(projection.image.rows());
    const std::int32_t cols = static_cast<std::int32_t>(projection.image.cols());

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open output file: " + path.string());
    }

    out.write(reinterpret_cast<const char*>(&rows), sizeof(rows));
    out.write(reinterpret_cast<const char*>(&cols), sizeof(cols));
    out.write(reinterpret_cast<const char*>(projection.image.data()),
              static_cast<std::streamsize>(projection.image.buffer().size()));

    for (Eigen::Index i = 0; i < projection.occupancy.rows(); ++i) {
        for (Eigen::Index j = 0; j < projection.occupancy.cols(); ++j) {
            const std::uint8_t v = projection.occupancy(i, j) ? 1u : 0u;
            out.write(reinterpret_cast<const char*>(&v), sizeof(v));
        }
    }
    if (!out) {
        throw std::runtime_error("Failed to write output file: " + path.string());
    }
}

} // namespace

PointCloudData read_xyzrgb(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open point file: " + path);
    }

    std::vector<std::array<double, 6>> rows;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        const auto start = line.find_first_not_of(" \t\r\n");
        if (start == std::string::npos || line[start] == '#') {
            continue;
        }
        std::istringstream fields(line);
        std::array<double, 6> row{};
        for (double& value : row) {
            if (!(fields >> value)) {
                throw std::runtime_error("Malformed point at " + path + ":" +
                                         std::to_string(line_number));
            }
        }
        if (!(fields >> std::ws).eof()) {
            throw std::runtime_error("Unexpected trailing fields at " + path + ":" +
                                     std::to_string(line_number));
        }
        rows.push_back(row);
    }

    PointCloudData data;
    data.points.resize(static_cast<Eigen::Index>(rows.size()), 3);
    data.colors.resize(static_cast<Eigen::Index>(rows.size()), 3);
    for (std::size_t i = 0; i < rows.size(); ++i) {
        const Eigen::Index r = static_cast<Eigen::Index>(i);
        data.points.row(r) << rows[i][0], rows[i][1], rows[i][2];
        data.colors.row(r) << rows[i][3], rows[i][4], rows[i][5];
    }
    return data;
}

void write_projection_set(const std::filesystem::path& output_dir,
                          const ProjectionSet& projections) {
    std::filesystem::create_directories(output_dir);
    for (std::size_t i = 0; i < projections.size(); ++i) {
        write_projection_bin(face_path(output_dir, i), projections[i]);
    }
}

Projection read_projection(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open projection file: " + path.string());
    }

    std::int32_t rows = 0;
    std::int32_t cols = 0;
    in.read(reinterpret_cast<char*>(&rows), sizeof(rows));
    in.read(reinterpret_cast<char*>(&cols), sizeof(cols));
    if (!in || rows < 0 || cols < 0) {
        throw std::runtime_error("Corrupt projection header: " + path.string());
    }

    Projection projection;
    projection.image = ProjectionImage(rows, cols, Color::Zero());
    projection.occupancy = OccupancyMap::Constant(rows, cols, false);
    for (Eigen::Index r = 0; r < rows; ++r) {
        for (Eigen::Index c = 0; c < cols; ++c) {
            std::array<std::uint8_t, 3> rgb{};
            in.read(reinterpret_cast<char*>(rgb.data()), 3);
            projection.image.set_pixel(r, c, Color(rgb[0], rgb[1], rgb[2]));
        }
    }
    for (Eigen::Index r = 0; r < rows; ++r) {
        for (Eigen::Index c = 0; c < cols; ++c) {
            std::uint8_t v = 0;
            in.read(reinterpret_cast<char*>(&v), sizeof(v));
            projection.occupancy(r, c) = v != 0;
        }
    }
    if (!in) {
        throw std::runtime_error("Truncated projection file: " + path.string());
    }
    return projection;
}

} // namespace orthoproj
