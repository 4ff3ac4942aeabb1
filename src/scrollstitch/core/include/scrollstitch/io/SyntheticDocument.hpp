#pragma once
#include "scrollstitch/core/Capture.hpp"

#include <opencv2/core.hpp>
#include <cstdint>
#include <string>

namespace scrollstitch {

/**
 * A tall synthetic page seen through a fixed-size viewport.
 *
 * It is both the frame source and the scroll driver of a simulated session:
 * next() returns the viewport at the current scroll position, step() moves
 * the viewport down by the amount configured for the key, stopping at the
 * end of the page (after which frames repeat and the session stalls).
 *
 * Patterns: "page" (text-like lines over textured paper, default),
 * "noise" (textured paper only), "blank" (uniform gray).
 */
class SyntheticDocument final : public IFrameSource, public IScrollDriver {
public:
    struct Options {
        int viewW = 800, viewH = 600;      // viewport size
        int docH  = 2400;                  // total page height
        int stepSpace = 40;                // pixels per scroll key
        int stepDown = 20;
        int stepPageDown = 90;
        bool color = false;                // RGB24 frames instead of Gray8
        unsigned seed = 1;                 // texture RNG seed
        std::string pattern = "page";
        std::size_t maxFrames = 0;         // 0 = unlimited, else end of input after N
    };

    explicit SyntheticDocument(const Options& opt);
    SyntheticDocument();

    std::optional<Frame> next() override;
    void step(ScrollKey key) override;

    [[nodiscard]] int scrollY() const noexcept { return scrollY_; }
    [[nodiscard]] int maxScrollY() const noexcept { return master_.rows - opt_.viewH; }

    /// The whole page, for comparing against a stitched result.
    [[nodiscard]] const cv::Mat& page() const noexcept { return master_; }

private:
    Options opt_;
    cv::Mat master_;        // 8UC1 or 8UC3
    int scrollY_ = 0;
    std::uint64_t seq_ = 0;

    cv::Mat makePage() const;
};

} // namespace scrollstitch
