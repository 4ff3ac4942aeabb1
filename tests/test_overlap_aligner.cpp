#include "scrollstitch/align/OverlapAligner.hpp"
#include "scrollstitch/core/Errors.hpp"
#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <opencv2/imgproc.hpp>

using namespace scrollstitch;
using testsupport::noiseFrame;
using testsupport::noiseImage;
using testsupport::viewOf;

namespace {

AlignOptions window(int overlap) {
    AlignOptions o{};
    o.overlapPixels = overlap;
    return o;
}

} // namespace

TEST_CASE("identical_frames_are_duplicates") {
    const int channels = GENERATE(1, 3, 4);
    OverlapAligner aligner(window(100));

    Frame a = noiseFrame(120, 200, 42, channels);
    Frame b = a.clone();

    AlignmentResult r = aligner.align(a, b);
    REQUIRE(r.classification == Classification::Duplicate);
    REQUIRE(r.offset == 0);
    REQUIRE(r.confidence == Catch::Approx(1.0));
}

TEST_CASE("shifted_copy_is_found_at_the_exact_offset") {
    const int width = GENERATE(1, 3, 64, 257);
    const int k     = GENERATE(1, 7, 40, 99);
    const int H = 200;
    OverlapAligner aligner(window(100));

    cv::Mat page = noiseImage(width, H + k, static_cast<std::uint64_t>(width * 1000 + k));
    Frame prev = viewOf(page, 0, H);
    Frame curr = viewOf(page, k, H);

    AlignmentResult r = aligner.align(prev, curr);
    REQUIRE(r.classification == Classification::Advance);
    REQUIRE(r.offset == k);
    REQUIRE(r.score == Catch::Approx(0.0));
    REQUIRE_FALSE(r.searchClamped);
}

TEST_CASE("shifted_color_copy_is_found_at_the_exact_offset") {
    OverlapAligner aligner(window(125));
    cv::Mat page = noiseImage(90, 330, 8, 3);
    AlignmentResult r = aligner.align(viewOf(page, 0, 300), viewOf(page, 30, 300));
    REQUIRE(r.classification == Classification::Advance);
    REQUIRE(r.offset == 30);
}

TEST_CASE("disjoint_frames_have_no_overlap") {
    OverlapAligner aligner(window(100));
    AlignmentResult r = aligner.align(noiseFrame(160, 200, 1), noiseFrame(160, 200, 2));
    REQUIRE(r.classification == Classification::NoOverlap);
    REQUIRE(r.confidence < 0.9);
}

TEST_CASE("blank_content_degenerates_to_duplicate") {
    OverlapAligner aligner(window(100));
    cv::Mat flat(200, 80, CV_8UC1, cv::Scalar(200));
    AlignmentResult r = aligner.align(Frame::fromMat(flat), Frame::fromMat(flat));
    REQUIRE(r.classification == Classification::Duplicate);
    REQUIRE(r.offset == 0);
}

TEST_CASE("equal_scores_prefer_the_smaller_offset") {
    // rows repeat with period 6: offsets 3, 9, 15, ... all match exactly
    cv::Mat tile = noiseImage(50, 6, 77);
    cv::Mat page;
    cv::repeat(tile, 40, 1, page);

    OverlapAligner aligner(window(60));
    AlignmentResult r = aligner.align(viewOf(page, 0, 200), viewOf(page, 3, 200));
    REQUIRE(r.classification == Classification::Advance);
    REQUIRE(r.offset == 3);
}

TEST_CASE("window_larger_than_frame_is_clamped_and_flagged") {
    OverlapAligner aligner(window(125));
    cv::Mat page = noiseImage(40, 70, 19);

    AlignmentResult r = aligner.align(viewOf(page, 0, 50), viewOf(page, 20, 50));
    REQUIRE(r.searchClamped);
    REQUIRE(r.classification == Classification::Advance);
    REQUIRE(r.offset == 20);
}

TEST_CASE("small_pixel_noise_still_aligns") {
    OverlapAligner aligner(window(100));
    cv::Mat page = noiseImage(100, 260, 5);
    cv::Mat next = page.rowRange(25, 225).clone();

    // +-2 grey levels of compression-like noise
    cv::Mat jitter(next.size(), CV_16S);
    cv::RNG rng(3);
    rng.fill(jitter, cv::RNG::UNIFORM, -2, 3);
    cv::Mat wide;
    next.convertTo(wide, CV_16S);
    wide += jitter;
    wide.convertTo(next, CV_8U);

    AlignmentResult r = aligner.align(viewOf(page, 0, 200), Frame::fromMat(next));
    REQUIRE(r.classification == Classification::Advance);
    REQUIRE(r.offset == 25);
}

TEST_CASE("offsets_below_min_offset_are_not_searched") {
    AlignOptions o = window(100);
    o.minOffset = 5;
    OverlapAligner aligner(o);

    cv::Mat page = noiseImage(100, 203, 6);
    AlignmentResult r = aligner.align(viewOf(page, 0, 200), viewOf(page, 3, 200));
    REQUIRE(r.classification == Classification::NoOverlap);
}

TEST_CASE("scroll_beyond_the_window_has_no_overlap") {
    OverlapAligner aligner(window(50));
    cv::Mat page = noiseImage(100, 280, 12);
    AlignmentResult r = aligner.align(viewOf(page, 0, 200), viewOf(page, 80, 200));
    REQUIRE(r.classification == Classification::NoOverlap);
}

TEST_CASE("frames_of_different_geometry_are_rejected") {
    OverlapAligner aligner(window(100));
    REQUIRE_THROWS_AS(aligner.align(noiseFrame(100, 200, 1), noiseFrame(101, 200, 1)), InvalidRegion);
    REQUIRE_THROWS_AS(aligner.align(noiseFrame(100, 200, 1), noiseFrame(100, 199, 1)), InvalidRegion);
    REQUIRE_THROWS_AS(aligner.align(noiseFrame(100, 200, 1, 1), noiseFrame(100, 200, 1, 3)), InvalidRegion);
}

TEST_CASE("bounded_score_stops_early_above_the_bound") {
    OverlapAligner aligner(window(100));
    Frame a = noiseFrame(64, 100, 1);
    Frame b = noiseFrame(64, 100, 2);

    const double full = aligner.scoreAt(a, b, 10);
    const double bounded = aligner.scoreAt(a, b, 10, 0.01);
    REQUIRE(full > 0.2);
    REQUIRE(bounded > 0.01);
}

TEST_CASE("sparse_page_scroll_is_not_mistaken_for_a_duplicate") {
    // white page with a single short run of text: the unshifted frames
    // already differ by less than the duplicate threshold
    cv::Mat page(640, 800, CV_8UC1, cv::Scalar(255));
    cv::rectangle(page, cv::Rect(200, 300, 40, 6), cv::Scalar(0), cv::FILLED);

    OverlapAligner aligner(window(100));
    Frame prev = viewOf(page, 0, 600);
    Frame curr = viewOf(page, 40, 600);
    REQUIRE(aligner.scoreAt(prev, curr, 0) <= aligner.options().duplicateThreshold);

    AlignmentResult r = aligner.align(prev, curr);
    REQUIRE(r.classification == Classification::Advance);
    REQUIRE(r.offset == 40);
    REQUIRE(r.score == Catch::Approx(0.0));
}
