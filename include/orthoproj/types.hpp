#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include <Eigen/Core>

namespace orthoproj {

// Faces in output order. A Pos* face looks along the positive axis, so its
// nearest point has the smallest coordinate on that axis.
enum class Face {
    PosX = 0,
    NegX = 1,
    PosY = 2,
    NegY = 3,
    PosZ = 4,
    NegZ = 5
};

constexpr std::size_t kNumFaces = 6;

constexpr std::array<Face, kNumFaces> kFaces = {
    Face::PosX, Face::NegX, Face::PosY, Face::NegY, Face::PosZ, Face::NegZ};

const char* face_name(Face face);

using Color = Eigen::Matrix<std::uint8_t, 3, 1>;

// Returns `color`, or `color` with its blue channel moved one step toward the
// middle of the range when it equals `background`.
Color distinct_color(const Color& color, const Color& background);

// (rows, cols) boolean grid, row-major.
using OccupancyMap = Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Row-major RGB image stored interleaved as a (rows, 3 * cols) uint8 matrix.
class ProjectionImage {
public:
    using Buffer = Eigen::Matrix<std::uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

    ProjectionImage() = default;
    ProjectionImage(Eigen::Index rows, Eigen::Index cols, const Color& fill);

    Eigen::Index rows() const { return data_.rows(); }
    Eigen::Index cols() const { return data_.cols() / 3; }
    bool empty() const { return data_.size() == 0; }

    Color pixel(Eigen::Index row, Eigen::Index col) const;
    void set_pixel(Eigen::Index row, Eigen::Index col, const Color& color);

    // Copy of the rectangle [top, top + height) x [left, left + width).
    ProjectionImage crop(Eigen::Index top, Eigen::Index left,
                         Eigen::Index height, Eigen::Index width) const;

    const Buffer& buffer() const { return data_; }
    const std::uint8_t* data() const { return data_.data(); }

    bool operator==(const ProjectionImage& other) const;
    bool operator!=(const ProjectionImage& other) const { return !(*this == other); }

private:
    Buffer data_;
};

struct Projection {
    ProjectionImage image;
    OccupancyMap occupancy;
};

// Always holds exactly kNumFaces entries, indexed by static_cast<size_t>(Face).
using ProjectionSet = std::array<Projection, kNumFaces>;

} // namespace orthoproj
