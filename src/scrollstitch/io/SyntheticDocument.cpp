#include "scrollstitch/io/SyntheticDocument.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>

namespace scrollstitch {

SyntheticDocument::SyntheticDocument()
    : SyntheticDocument(Options{}) {}

SyntheticDocument::SyntheticDocument(const Options& opt)
    : opt_(opt)
{
    if (opt_.viewW <= 0 || opt_.viewH <= 0 || opt_.docH < opt_.viewH) {
        throw std::invalid_argument("SyntheticDocument: need positive viewport and docH >= viewH");
    }
    master_ = makePage();
}

cv::Mat SyntheticDocument::makePage() const {
    const int w = opt_.viewW, h = opt_.docH;

    if (opt_.pattern == "blank") {
        cv::Mat flat(h, w, CV_8UC1, cv::Scalar(200));
        if (opt_.color) cv::cvtColor(flat, flat, cv::COLOR_GRAY2RGB);
        return flat;
    }

    // textured "paper"; the blur keeps it smooth but never flat
    cv::Mat base(h, w, CV_8UC1);
    cv::RNG rng(opt_.seed ? opt_.seed : 1u);
    rng.fill(base, cv::RNG::NORMAL, 150, 30);
    cv::GaussianBlur(base, base, {0, 0}, 1.2);

    if (opt_.pattern != "noise") {
        // text-like lines: a row label plus a run of word blocks
        const int lineH = 28;
        for (int y = 12, line = 0; y + lineH < h; y += lineH, ++line) {
            cv::putText(base, std::to_string(line), {6, y + 18}, cv::FONT_HERSHEY_SIMPLEX,
                        0.5, cv::Scalar(20), 1, cv::LINE_AA);
            int x = 48;
            while (x < w - 16) {
                const int wordW = rng.uniform(12, 70);
                const int shade = rng.uniform(30, 90);
                cv::rectangle(base, {x, y + 6}, {std::min(x + wordW, w - 8), y + 18},
                              cv::Scalar(shade), cv::FILLED);
                x += wordW + rng.uniform(6, 14);
            }
        }
    }

    if (opt_.color) {
        cv::Mat rgb;
        cv::cvtColor(base, rgb, cv::COLOR_GRAY2RGB);
        // tint by row band so channels differ
        for (int y = 0; y < h; ++y) {
            auto* p = rgb.ptr<cv::Vec3b>(y);
            const int tint = (y / 64) % 3;
            for (int x = 0; x < w; ++x) p[x][tint] = cv::saturate_cast<uchar>(p[x][tint] + 25);
        }
        return rgb;
    }
    return base;
}

std::optional<Frame> SyntheticDocument::next() {
    if (opt_.maxFrames > 0 && seq_ >= opt_.maxFrames) return std::nullopt;

    cv::Mat view = master_.rowRange(scrollY_, scrollY_ + opt_.viewH);
    return Frame::fromMat(view, seq_++, std::chrono::steady_clock::now());
}

void SyntheticDocument::step(ScrollKey key) {
    int d = opt_.stepSpace;
    if (key == ScrollKey::Down)     d = opt_.stepDown;
    if (key == ScrollKey::PageDown) d = opt_.stepPageDown;
    scrollY_ = std::clamp(scrollY_ + d, 0, maxScrollY());
}

} // namespace scrollstitch
