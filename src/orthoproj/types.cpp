#include "orthoproj/types.hpp"

#include <stdexcept>
#include <string>

namespace orthoproj {

const char* face_name(Face face) {
    switch (face) {
        case Face::PosX:
            return "+X";
        case Face::NegX:
            return "-X";
        case Face::PosY:
            return "+Y";
        case Face::NegY:
            return "-Y";
        case Face::PosZ:
            return "+Z";
        case Face::NegZ:
            return "-Z";
    }
    return "?";
}

Color distinct_color(const Color& color, const Color& background) {
    if (color != background) {
        return color;
    }
    Color out = color;
    out[2] = static_cast<std::uint8_t>(out[2] >= 128 ? out[2] - 1 : out[2] + 1);
    return out;
}

ProjectionImage::ProjectionImage(Eigen::Index rows, Eigen::Index cols, const Color& fill)
    : data_(rows, 3 * cols) {
    for (Eigen::Index c = 0; c < cols; ++c) {
        data_.col(3 * c).setConstant(fill[0]);
        data_.col(3 * c + 1).setConstant(fill[1]);
        data_.col(3 * c + 2).setConstant(fill[2]);
    }
}

Color ProjectionImage::pixel(Eigen::Index row, Eigen::Index col) const {
    return Color(data_(row, 3 * col), data_(row, 3 * col + 1), data_(row, 3 * col + 2));
}

void ProjectionImage::set_pixel(Eigen::Index row, Eigen::Index col, const Color& color) {
    data_(row, 3 * col) = color[0];
    data_(row, 3 * col + 1) = color[1];
    data_(row, 3 * col + 2) = color[2];
}

ProjectionImage ProjectionImage::crop(Eigen::Index top, Eigen::Index left,
                                      Eigen::Index height, Eigen::Index width) const {
    if (top < 0 || left < 0 || height < 0 || width < 0 ||
        top + height > rows() || left + width > cols()) {
        throw std::invalid_argument(
            "Crop rectangle out of bounds: top=" + std::to_string(top) +
            " left=" + std::to_string(left) + " height=" + std::to_string(height) +
            " width=" + std::to_string(width));
    }
    ProjectionImage out;
    out.data_ = data_.block(top, 3 * left, height, 3 * width);
    return out;
}

bool ProjectionImage::operator==(const ProjectionImage& other) const {
    return data_.rows() == other.data_.rows() && data_.cols() == other.data_.cols() &&
           data_ == other.data_;
}

} // namespace orthoproj
