#pragma once

#include "scrollstitch/core/Config.hpp"
#include "scrollstitch/core/Frame.hpp"

#include <cstdint>

namespace scrollstitch {

/** How a frame relates to the previously accepted one. */
enum class Classification : std::uint8_t {
    Advance = 0,  // new content scrolled in by 'offset' rows
    Duplicate,    // nothing moved
    NoOverlap     // no offset matches: end of content or a jump
};

[[nodiscard]] const char* toString(Classification c) noexcept;

/** Result of aligning one consecutive frame pair. */
struct AlignmentResult {
    int    offset{0};          // rows curr has scrolled past prev (>= 0)
    double confidence{0.0};    // 1 - score of the winning offset
    double score{1.0};         // normalized mean absolute difference [0..1]
    Classification classification{Classification::NoOverlap};
    bool   searchClamped{false}; // overlap window was larger than the frames
};

/**
 * Vertical overlap search between two equally sized frames.
 *
 * For a candidate offset d, row y of 'curr' is compared with row y + d of
 * 'prev' over all rows the two frames share, sampling every
 * 'sampleStride'-th pixel (all channels) across the full width.
 * Offset 0 is always probed first to detect duplicates; the search then
 * covers [minOffset, overlapPixels], clamped to height - 1. The smallest
 * offset wins on equal scores.
 */
class OverlapAligner {
public:
    explicit OverlapAligner(const AlignOptions& opt) : opt_(opt) {}

    /// Throws InvalidRegion if the frames differ in width, height or format.
    [[nodiscard]] AlignmentResult align(const Frame& prev, const Frame& curr) const;

    /// Score of a single offset; 'bound' lets the scan stop early once the
    /// score can no longer beat it (the returned value is then > bound).
    [[nodiscard]] double scoreAt(const Frame& prev, const Frame& curr, int offset,
                                 double bound = 1.0) const;

    [[nodiscard]] const AlignOptions& options() const noexcept { return opt_; }

private:
    AlignOptions opt_;
};

} // namespace scrollstitch
