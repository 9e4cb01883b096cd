#include "orthoproj/padder.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/photo.hpp>

#include "orthoproj/logger.hpp"

namespace orthoproj {
namespace {

constexpr double kInpaintRadius = 3.0;

cv::Mat to_mat(const ProjectionImage& image) {
    cv::Mat mat(static_cast<int>(image.rows()), static_cast<int>(image.cols()), CV_8UC3);
    for (Eigen::Index r = 0; r < image.rows(); ++r) {
        for (Eigen::Index c = 0; c < image.cols(); ++c) {
            const Color color = image.pixel(r, c);
            mat.at<cv::Vec3b>(static_cast<int>(r), static_cast<int>(c)) =
                cv::Vec3b(color[0], color[1], color[2]);
        }
    }
    return mat;
}

cv::Mat to_mat(const OccupancyMap& occupancy) {
    cv::Mat mat(static_cast<int>(occupancy.rows()), static_cast<int>(occupancy.cols()), CV_8UC1);
    for (Eigen::Index r = 0; r < occupancy.rows(); ++r) {
        for (Eigen::Index c = 0; c < occupancy.cols(); ++c) {
            mat.at<std::uint8_t>(static_cast<int>(r), static_cast<int>(c)) =
                occupancy(r, c) ? 1 : 0;
        }
    }
    return mat;
}

} // namespace

Padder::Padder(int kernel_size, const Color& background)
    : kernel_size_(kernel_size), background_(background) {}

Projection Padder::process(const Projection& projection) const {
    if (kernel_size_ < 1) {
        throw std::invalid_argument("Padding kernel size must be >= 1, got " +
                                    std::to_string(kernel_size_));
    }
    const Eigen::Index rows = projection.occupancy.rows();
    const Eigen::Index cols = projection.occupancy.cols();
    if (projection.image.rows() != rows || projection.image.cols() != cols) {
        throw std::invalid_argument("Image and occupancy map must have the same shape.");
    }

    Projection out = projection;
    if (rows == 0 || cols == 0) {
        return out;
    }

    // The border keeps the closing away from the image edges.
    const int border = 3 * kernel_size_;
    const cv::Scalar fill(background_[0], background_[1], background_[2]);
    cv::Mat image;
    cv::Mat occupancy;
    cv::copyMakeBorder(to_mat(projection.image), image, border, border, border, border,
                       cv::BORDER_CONSTANT, fill);
    cv::copyMakeBorder(to_mat(projection.occupancy), occupancy, border, border, border, border,
                       cv::BORDER_CONSTANT, cv::Scalar(0));

    const cv::Mat kernel = cv::Mat::ones(kernel_size_, kernel_size_, CV_8UC1);
    cv::Mat closed;
    cv::morphologyEx(occupancy, closed, cv::MORPH_CLOSE, kernel);

    cv::Mat mask;
    cv::compare(closed, occupancy, mask, cv::CMP_GT);
    const int holes = cv::countNonZero(mask);
    if (holes == 0) {
        return out;
    }

    cv::Mat inpainted;
    cv::inpaint(image, mask, inpainted, kInpaintRadius, cv::INPAINT_NS);

    for (Eigen::Index r = 0; r < rows; ++r) {
        for (Eigen::Index c = 0; c < cols; ++c) {
            const int pr = static_cast<int>(r) + border;
            const int pc = static_cast<int>(c) + border;
            if (mask.at<std::uint8_t>(pr, pc) == 0) {
                continue;
            }
            const cv::Vec3b& value = inpainted.at<cv::Vec3b>(pr, pc);
            out.image.set_pixel(r, c, distinct_color(Color(value[0], value[1], value[2]),
                                                     background_));
            out.occupancy(r, c) = true;
        }
    }
    Logger::log(LogLevel::Debug, "Padding inpainted " + std::to_string(holes) + " pixels.");
    return out;
}

ProjectionSet Padder::process(const ProjectionSet& projections) const {
    ProjectionSet out;
    for (std::size_t i = 0; i < projections.size(); ++i) {
        out[i] = process(projections[i]);
    }
    return out;
}

ProjectionSet apply_padding(const ProjectionSet& projections, int precision) {
    return Padder(precision, Color(255, 255, 255)).process(projections);
}

} // namespace orthoproj
