#include "scrollstitch/compose/StitchAccumulator.hpp"
#include "scrollstitch/core/Errors.hpp"

#include <stdexcept>
#include <string>

namespace scrollstitch {

void StitchAccumulator::start(const Frame& first) {
    if (first.empty()) {
        throw std::invalid_argument("StitchAccumulator::start: empty frame");
    }
    std::lock_guard<std::mutex> lk(mtx_);
    if (!slices_.empty() || finalized_) {
        throw std::logic_error("StitchAccumulator::start: canvas already seeded");
    }
    slices_.push_back(first.view().clone()); // detach from the frame buffer
    format_ = first.format();
    width_  = static_cast<int>(first.width());
    height_ = static_cast<int>(first.height());
}

void StitchAccumulator::append(const Frame& frame, int offset) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (slices_.empty() || finalized_) {
        throw std::logic_error("StitchAccumulator::append: canvas not active");
    }
    if (stopped_) {
        throw std::logic_error("StitchAccumulator::append: accumulation already stopped");
    }
    if (static_cast<int>(frame.width()) != width_ || frame.format() != format_) {
        throw InvalidRegion("StitchAccumulator::append: frame width " +
                            std::to_string(frame.width()) + " differs from canvas width " +
                            std::to_string(width_));
    }
    const int h = static_cast<int>(frame.height());
    if (offset < 1 || offset > h) {
        throw std::invalid_argument("StitchAccumulator::append: offset " + std::to_string(offset) +
                                    " outside [1, " + std::to_string(h) + "]");
    }

    // the bottom 'offset' rows are the content that just scrolled into view
    slices_.push_back(frame.view().rowRange(h - offset, h).clone());
    height_ += offset;
}

bool StitchAccumulator::accept(const AlignmentResult& r, const Frame& frame) {
    switch (r.classification) {
        case Classification::Advance:
            append(frame, r.offset);
            return true;
        case Classification::Duplicate:
            return true;
        case Classification::NoOverlap: {
            std::lock_guard<std::mutex> lk(mtx_);
            stopped_ = true;
            return false;
        }
    }
    return false;
}

cv::Mat StitchAccumulator::concatLocked() const {
    if (slices_.empty()) return {};
    if (slices_.size() == 1) return slices_.front().clone();
    cv::Mat out;
    cv::vconcat(slices_, out);
    return out;
}

cv::Mat StitchAccumulator::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return concatLocked();
}

cv::Mat StitchAccumulator::finalize() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (slices_.empty()) {
        throw std::logic_error("StitchAccumulator::finalize: nothing accumulated");
    }
    cv::Mat out = concatLocked();
    slices_.clear();
    finalized_ = true;
    return out;
}

bool StitchAccumulator::started() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return !slices_.empty() || finalized_;
}

bool StitchAccumulator::stopped() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return stopped_;
}

int StitchAccumulator::width() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return width_;
}

int StitchAccumulator::height() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return height_;
}

std::size_t StitchAccumulator::sliceCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return slices_.size();
}

} // namespace scrollstitch
