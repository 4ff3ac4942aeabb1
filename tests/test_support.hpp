#pragma once

#include "scrollstitch/core/Capture.hpp"
#include "scrollstitch/core/Frame.hpp"

#include <opencv2/core.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <utility>
#include <stdexcept>
#include <vector>

namespace testsupport {

/* Uniform random 8-bit image; 'channels' is 1, 3 or 4. */
cv::Mat noiseImage(int w, int h, std::uint64_t seed, int channels = 1);

/* Frame made of uniform random pixels. */
scrollstitch::Frame noiseFrame(int w, int h, std::uint64_t seed, int channels = 1);

/* Rows [y, y + h) of 'page' as a frame. */
scrollstitch::Frame viewOf(const cv::Mat& page, int y, int h, std::uint64_t seq = 0);

/* True when both images have the same size, type and bytes. */
bool sameImage(const cv::Mat& a, const cv::Mat& b);

/* Frames are move-only; build a vector from temporaries. */
template <class... F>
std::vector<scrollstitch::Frame> frameList(F&&... f) {
    std::vector<scrollstitch::Frame> v;
    v.reserve(sizeof...(f));
    (v.push_back(std::forward<F>(f)), ...);
    return v;
}

/* Hands out a fixed list of frames, then end of input. Optionally throws
   instead of returning the frame at index 'failAt'. */
class ScriptedSource final : public scrollstitch::IFrameSource {
public:
    explicit ScriptedSource(std::vector<scrollstitch::Frame> frames, int failAt = -1)
        : frames_(std::move(frames)), failAt_(failAt) {}

    std::optional<scrollstitch::Frame> next() override {
        const int i = served_++;
        if (i == failAt_) throw std::runtime_error("capture device lost");
        if (i >= static_cast<int>(frames_.size())) return std::nullopt;
        return std::move(frames_[static_cast<std::size_t>(i)]);
    }

    [[nodiscard]] int served() const noexcept { return served_; }

private:
    std::vector<scrollstitch::Frame> frames_;
    int failAt_;
    int served_{0};
};

/* Endless source repeating the same frame. */
class RepeatingSource final : public scrollstitch::IFrameSource {
public:
    explicit RepeatingSource(scrollstitch::Frame f) : frame_(std::move(f)) {}

    std::optional<scrollstitch::Frame> next() override {
        ++served_;
        return frame_.clone();
    }

    [[nodiscard]] int served() const noexcept { return served_; }

private:
    scrollstitch::Frame frame_;
    int served_{0};
};

/* Counts scroll steps; throws on step number 'failAt' (1-based) if set. */
class CountingDriver final : public scrollstitch::IScrollDriver {
public:
    explicit CountingDriver(int failAt = 0) : failAt_(failAt) {}

    void step(scrollstitch::ScrollKey key) override {
        ++steps_;
        lastKey_ = key;
        if (steps_ == failAt_) throw std::runtime_error("key injection refused");
    }

    [[nodiscard]] int steps() const noexcept { return steps_; }
    [[nodiscard]] scrollstitch::ScrollKey lastKey() const noexcept { return lastKey_; }

private:
    int failAt_;
    int steps_{0};
    scrollstitch::ScrollKey lastKey_{scrollstitch::ScrollKey::Space};
};

/* Virtual time: sleep() advances now() instantly. */
class FakeClock final : public scrollstitch::IClock {
public:
    std::chrono::steady_clock::time_point now() override { return t_; }
    void sleep(std::chrono::milliseconds d) override { t_ += d; slept_ += d; }

    void advance(std::chrono::milliseconds d) { t_ += d; }
    [[nodiscard]] std::chrono::milliseconds slept() const noexcept { return slept_; }

private:
    std::chrono::steady_clock::time_point t_{};
    std::chrono::milliseconds slept_{0};
};

} // namespace testsupport
