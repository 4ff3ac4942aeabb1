#include "scrollstitch/core/Frame.hpp"

#include <stdexcept>
#include <string>

namespace scrollstitch {

int cvTypeFor(PixelFormat f) {
    switch (f) {
        case PixelFormat::Gray8:  return CV_8UC1;
        case PixelFormat::RGB24:  return CV_8UC3;
        case PixelFormat::RGBA32: return CV_8UC4;
    }
    throw std::invalid_argument("cvTypeFor: unknown pixel format");
}

Frame::Frame(std::uint32_t width, std::uint32_t height, PixelFormat format,
             std::vector<std::uint8_t> pixels,
             std::uint64_t sequence,
             std::chrono::steady_clock::time_point timestamp)
    : pixels_(std::move(pixels)),
      width_(width),
      height_(height),
      format_(format),
      sequence_(sequence),
      timestamp_(timestamp)
{
    if (bytesPerPixel(format_) == 0) {
        throw std::invalid_argument("Frame: unknown pixel format");
    }
    if (pixels_.size() != bytes()) {
        throw std::invalid_argument("Frame: buffer holds " + std::to_string(pixels_.size()) +
                                    " bytes, expected " + std::to_string(bytes()));
    }
}

Frame Frame::clone() const {
    return Frame(*this);
}

cv::Mat Frame::view() const {
    if (empty()) return {};
    // cv::Mat has no const header; callers only read through it
    return cv::Mat(static_cast<int>(height_), static_cast<int>(width_), cvTypeFor(format_),
                   const_cast<std::uint8_t*>(pixels_.data()), rowBytes());
}

Frame Frame::fromMat(const cv::Mat& m,
                     std::uint64_t sequence,
                     std::chrono::steady_clock::time_point timestamp)
{
    if (m.empty()) {
        throw std::invalid_argument("Frame::fromMat: empty image");
    }
    if (m.depth() != CV_8U) {
        throw std::invalid_argument("Frame::fromMat: only 8-bit images are supported");
    }

    PixelFormat fmt{};
    switch (m.channels()) {
        case 1: fmt = PixelFormat::Gray8;  break;
        case 3: fmt = PixelFormat::RGB24;  break;
        case 4: fmt = PixelFormat::RGBA32; break;
        default:
            throw std::invalid_argument("Frame::fromMat: unsupported channel count " +
                                        std::to_string(m.channels()));
    }

    cv::Mat packed = m.isContinuous() ? m : m.clone();
    std::vector<std::uint8_t> px(packed.data, packed.data + packed.total() * packed.elemSize());
    return Frame(static_cast<std::uint32_t>(packed.cols),
                 static_cast<std::uint32_t>(packed.rows),
                 fmt, std::move(px), sequence, timestamp);
}

} // namespace scrollstitch
