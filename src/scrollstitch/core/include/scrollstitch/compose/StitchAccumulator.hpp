#pragma once

#include "scrollstitch/align/OverlapAligner.hpp"
#include "scrollstitch/core/Frame.hpp"

#include <opencv2/core.hpp>

#include <mutex>
#include <vector>

namespace scrollstitch {

/// Incremental vertical stitcher:
/// - the first frame is taken whole;
/// - every Advance(offset) appends the bottom 'offset' rows of the frame;
/// - finalize() concatenates the slices into one image (CV_8UC1/3/4).
///
/// Rows are only ever appended, so the canvas height never decreases and no
/// output row is written twice. snapshot() may be called from another thread.
class StitchAccumulator {
public:
    StitchAccumulator() = default;

    /// Seed the canvas with 'first'. Throws std::logic_error if already seeded.
    void start(const Frame& first);

    /// Append the bottom 'offset' rows of 'frame'.
    /// Throws InvalidRegion on width/format mismatch, std::invalid_argument
    /// if offset is outside [1, frame.height()].
    void append(const Frame& frame, int offset);

    /// Act on a classification. Returns false once accumulation has stopped
    /// (NoOverlap); Duplicate frames are ignored.
    bool accept(const AlignmentResult& r, const Frame& frame);

    /// Copy of the canvas so far; empty before start().
    [[nodiscard]] cv::Mat snapshot() const;

    /// Produce the output image and discard the canvas.
    /// Throws std::logic_error if nothing was accumulated.
    [[nodiscard]] cv::Mat finalize();

    [[nodiscard]] bool started() const;
    [[nodiscard]] bool stopped() const;
    [[nodiscard]] int  width() const;
    [[nodiscard]] int  height() const;
    [[nodiscard]] std::size_t sliceCount() const;

private:
    mutable std::mutex mtx_;

    std::vector<cv::Mat> slices_;   // owned copies, all of the same width/type
    PixelFormat format_{PixelFormat::Gray8};
    int  width_{0};
    int  height_{0};
    bool stopped_{false};
    bool finalized_{false};

    cv::Mat concatLocked() const;
};

} // namespace scrollstitch
