#include "scrollstitch/align/OverlapAligner.hpp"
#include "scrollstitch/core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace scrollstitch {

const char* toString(Classification c) noexcept {
    switch (c) {
        case Classification::Advance:   return "advance";
        case Classification::Duplicate: return "duplicate";
        case Classification::NoOverlap: return "no-overlap";
    }
    return "unknown";
}

/*
  Mean absolute difference between prev[offset .. H) and curr[0 .. H - offset),
  normalized by 255.

  Only every 'sampleStride'-th pixel of a row is visited, with every channel of
  that pixel. The running sum is compared against bound * samples after each
  row so that hopeless candidates are abandoned early; a candidate that is
  abandoned always reports a score strictly above 'bound'.
*/
double OverlapAligner::scoreAt(const Frame& prev, const Frame& curr, int offset,
                               double bound) const
{
    const int H = static_cast<int>(prev.height());
    const int W = static_cast<int>(prev.width());
    const int rows = H - offset;
    if (offset < 0 || rows <= 0 || W <= 0) return 1.0;

    const int stride = std::max(1, opt_.sampleStride);
    const int bpp = static_cast<int>(bytesPerPixel(prev.format()));
    const int perRow = ((W + stride - 1) / stride) * bpp;

    const double samples = double(perRow) * rows;
    const double limit = bound * 255.0 * samples;

    std::uint64_t sum = 0;
    for (int y = 0; y < rows; ++y) {
        const std::uint8_t* a = prev.row(static_cast<std::uint32_t>(y + offset));
        const std::uint8_t* b = curr.row(static_cast<std::uint32_t>(y));
        for (int x = 0; x < W; x += stride) {
            const int i = x * bpp;
            for (int c = 0; c < bpp; ++c) {
                sum += static_cast<std::uint64_t>(std::abs(int(a[i + c]) - int(b[i + c])));
            }
        }
        if (double(sum) > limit) {
            return std::nextafter(std::max(bound, double(sum) / (255.0 * samples)), 2.0);
        }
    }
    return double(sum) / (255.0 * samples);
}

AlignmentResult OverlapAligner::align(const Frame& prev, const Frame& curr) const {
    if (prev.width() != curr.width() || prev.height() != curr.height() ||
        prev.format() != curr.format()) {
        std::ostringstream os;
        os << "cannot align frames of different geometry: "
           << prev.width() << 'x' << prev.height() << " vs "
           << curr.width() << 'x' << curr.height();
        throw InvalidRegion(os.str());
    }
    if (prev.empty()) {
        throw InvalidRegion("cannot align empty frames");
    }

    AlignmentResult out{};
    const int H = static_cast<int>(prev.height());

    int maxOffset = opt_.overlapPixels;
    if (maxOffset >= H) {
        maxOffset = H - 1;
        out.searchClamped = true;
    }

    // 1) zero motion
    const double s0 = scoreAt(prev, curr, 0);

    // 2) best non-zero offset; strict '<' keeps the smaller offset on ties
    int    bestOffset = -1;
    double bestScore  = std::numeric_limits<double>::infinity();
    for (int d = std::max(1, opt_.minOffset); d <= maxOffset; ++d) {
        const double bound = std::isinf(bestScore) ? 1.0 : bestScore;
        const double s = scoreAt(prev, curr, d, bound);
        if (s < bestScore) {
            bestScore  = s;
            bestOffset = d;
        }
    }

    // 3) classify. Zero motion wins only if no shift matches strictly better:
    //    sparse content scores low at offset 0 even after a real scroll.
    if (s0 <= opt_.duplicateThreshold && !(bestScore < s0)) {
        out.offset = 0;
        out.score = s0;
        out.confidence = 1.0 - s0;
        out.classification = Classification::Duplicate;
        return out;
    }

    if (bestOffset < 0) {
        // nothing searchable (frame too short for the configured min offset)
        out.offset = 0;
        out.score = s0;
        out.confidence = 1.0 - std::min(1.0, s0);
        out.classification = Classification::NoOverlap;
        return out;
    }

    out.offset = bestOffset;
    out.score = bestScore;
    out.confidence = 1.0 - std::min(1.0, bestScore);

    if (bestScore <= opt_.duplicateThreshold && bestOffset <= opt_.duplicateOffsetTolerance) {
        out.classification = Classification::Duplicate;
    } else if (bestScore > opt_.maxDissimilarity) {
        out.classification = Classification::NoOverlap;
    } else {
        out.classification = Classification::Advance;
    }
    return out;
}

} // namespace scrollstitch
