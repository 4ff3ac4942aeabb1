#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace scrollstitch {

/* Key used to advance the view by one scroll unit. */
enum class ScrollKey : std::uint8_t {
    Space = 0,
    Down,
    PageDown
};

/* Rectangle in source-frame pixel coordinates. */
struct CropRegion {
    int x{0};
    int y{0};
    int width{0};
    int height{0};

    bool operator==(const CropRegion&) const = default;
};

/* Tunables of the overlap search. Scores are mean absolute byte
   differences normalized to [0..1]. */
struct AlignOptions {
    int    overlapPixels {125};           // largest scroll offset searched
    int    minOffset {1};                 // smallest non-zero offset searched
    int    sampleStride {4};              // horizontal pixel stride while scoring
    double duplicateThreshold {0.002};    // strict similarity for Duplicate
    int    duplicateOffsetTolerance {0};  // "near zero" for Duplicate
    double maxDissimilarity {0.08};       // above this at every offset -> NoOverlap
};

/* Everything a capture session needs, gathered by the front end and
   validated once when the session is created. */
struct CaptureConfig {
    std::optional<CropRegion> crop{};     // empty = use the whole frame
    AlignOptions align{};

    ScrollKey scrollKey {ScrollKey::Space};
    std::chrono::milliseconds initialDelay {3000};
    std::chrono::milliseconds settleDelay {200};

    std::size_t maxFrames {0};                    // 0 = unlimited
    std::chrono::milliseconds maxDuration {0};    // 0 = unlimited
    int stallRetryLimit {3};                      // consecutive duplicates tolerated

    /// Throws ConfigError (or InvalidRegion for a degenerate crop).
    void validate() const;
};

/// "x,y,w,h" with ',', ':' or ' ' as separators. Empty result when the
/// string does not hold exactly four integers or w/h are not positive.
[[nodiscard]] std::optional<CropRegion> parseCropRegion(std::string_view text);

/// "space", "down" or "pagedown", case-insensitive.
[[nodiscard]] std::optional<ScrollKey> parseScrollKey(std::string_view text);

[[nodiscard]] const char* toString(ScrollKey key) noexcept;

} // namespace scrollstitch
