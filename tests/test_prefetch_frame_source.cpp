#include "scrollstitch/io/PrefetchFrameSource.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace scrollstitch;
using testsupport::ScriptedSource;

TEST_CASE("prefetch_preserves_frame_order_and_end_of_input") {
    ScriptedSource inner(testsupport::frameList(
        testsupport::noiseFrame(8, 8, 1),
        testsupport::noiseFrame(8, 8, 2),
        testsupport::noiseFrame(8, 8, 3)));
    cv::Mat expected[] = {testsupport::noiseImage(8, 8, 1),
                          testsupport::noiseImage(8, 8, 2),
                          testsupport::noiseImage(8, 8, 3)};

    PrefetchFrameSource src(inner);
    for (const auto& e : expected) {
        auto f = src.next();
        REQUIRE(f.has_value());
        REQUIRE(testsupport::sameImage(f->view(), e));
    }
    REQUIRE_FALSE(src.next().has_value());
    REQUIRE_FALSE(src.next().has_value());
}

TEST_CASE("prefetch_delivers_source_errors_after_earlier_frames") {
    ScriptedSource inner(testsupport::frameList(
        testsupport::noiseFrame(8, 8, 1),
        testsupport::noiseFrame(8, 8, 2)), 1);

    PrefetchFrameSource src(inner);
    REQUIRE(src.next().has_value());
    REQUIRE_THROWS_AS(src.next(), std::runtime_error);
    REQUIRE_FALSE(src.next().has_value());
}

TEST_CASE("prefetch_can_be_destroyed_with_a_frame_pending") {
    testsupport::RepeatingSource inner(testsupport::noiseFrame(8, 8, 4));
    {
        PrefetchFrameSource src(inner);
        REQUIRE(src.next().has_value());
    }
    // one consumed, at most one more fetched into the slot
    REQUIRE(inner.served() >= 1);
    REQUIRE(inner.served() <= 2);
}

TEST_CASE("prefetch_of_an_empty_source_ends_immediately") {
    ScriptedSource inner(std::vector<Frame>{});
    PrefetchFrameSource src(inner);
    REQUIRE_FALSE(src.next().has_value());
}
