#pragma once

#include <opencv2/core.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace scrollstitch {

/// Pixel storage layouts that the pipeline currently understands.
enum class PixelFormat : std::uint8_t {
    Gray8 = 0, ///< 8-bit grayscale, 1 byte per pixel
    RGB24,     ///< 24-bit RGB, 3 bytes per pixel, interleaved
    RGBA32     ///< 32-bit RGBA, 4 bytes per pixel
};

/// Bytes per pixel for a format (0 for unknown values).
[[nodiscard]] constexpr std::size_t bytesPerPixel(PixelFormat f) noexcept {
    switch (f) {
        case PixelFormat::Gray8:  return 1;
        case PixelFormat::RGB24:  return 3;
        case PixelFormat::RGBA32: return 4;
        default: return 0;
    }
}

/// One captured raster, row-major and tightly packed.
/// Frames are moved from stage to stage; only the cropper produces a new one.
class Frame {
public:
    Frame() = default;

    /// Takes ownership of 'pixels'. Throws std::invalid_argument if the
    /// buffer size does not match width * height * bytesPerPixel(format).
    Frame(std::uint32_t width, std::uint32_t height, PixelFormat format,
          std::vector<std::uint8_t> pixels,
          std::uint64_t sequence = 0,
          std::chrono::steady_clock::time_point timestamp = {});

    Frame(Frame&&) noexcept = default;
    Frame& operator=(Frame&&) noexcept = default;

    /// Explicit deep copy; implicit copies are disabled.
    [[nodiscard]] Frame clone() const;

    [[nodiscard]] std::uint32_t width()  const noexcept { return width_; }
    [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
    [[nodiscard]] PixelFormat   format() const noexcept { return format_; }
    [[nodiscard]] std::uint64_t sequence() const noexcept { return sequence_; }
    [[nodiscard]] std::chrono::steady_clock::time_point timestamp() const noexcept { return timestamp_; }

    [[nodiscard]] bool empty() const noexcept { return width_ == 0 || height_ == 0; }
    [[nodiscard]] std::size_t rowBytes() const noexcept { return std::size_t(width_) * bytesPerPixel(format_); }
    [[nodiscard]] std::size_t bytes() const noexcept { return rowBytes() * height_; }

    [[nodiscard]] std::span<const std::uint8_t> data() const noexcept { return pixels_; }
    [[nodiscard]] const std::uint8_t* row(std::uint32_t y) const noexcept {
        return pixels_.data() + std::size_t(y) * rowBytes();
    }

    /// Read-only cv::Mat header over the pixel buffer (no copy).
    /// Valid only while this frame is alive and not moved from.
    [[nodiscard]] cv::Mat view() const;

    /// Copy an 8-bit image (1, 3 or 4 channels) into a new frame.
    [[nodiscard]] static Frame fromMat(const cv::Mat& m,
                                       std::uint64_t sequence = 0,
                                       std::chrono::steady_clock::time_point timestamp = {});

private:
    Frame(const Frame&) = default;
    Frame& operator=(const Frame&) = default;

    std::vector<std::uint8_t> pixels_;
    std::uint32_t width_{0};
    std::uint32_t height_{0};
    PixelFormat   format_{PixelFormat::Gray8};
    std::uint64_t sequence_{0};
    std::chrono::steady_clock::time_point timestamp_{};
};

/// OpenCV element type matching a pixel format (CV_8UC1/3/4).
[[nodiscard]] int cvTypeFor(PixelFormat f);

} // namespace scrollstitch
