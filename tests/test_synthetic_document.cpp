#include "scrollstitch/io/SyntheticDocument.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace scrollstitch;

TEST_CASE("synthetic_document_scrolls_by_the_key_specific_step") {
    SyntheticDocument::Options o{};
    o.viewW = 100; o.viewH = 50; o.docH = 400;
    o.stepSpace = 30; o.stepDown = 10; o.stepPageDown = 45;
    SyntheticDocument doc(o);

    doc.step(ScrollKey::Space);
    REQUIRE(doc.scrollY() == 30);
    doc.step(ScrollKey::Down);
    REQUIRE(doc.scrollY() == 40);
    doc.step(ScrollKey::PageDown);
    REQUIRE(doc.scrollY() == 85);

    auto f = doc.next();
    REQUIRE(f.has_value());
    REQUIRE(testsupport::sameImage(f->view(), doc.page().rowRange(85, 135)));
}

TEST_CASE("synthetic_document_stops_at_the_end_of_the_page") {
    SyntheticDocument::Options o{};
    o.viewW = 40; o.viewH = 50; o.docH = 120; o.stepPageDown = 100;
    SyntheticDocument doc(o);

    doc.step(ScrollKey::PageDown);
    doc.step(ScrollKey::PageDown);
    REQUIRE(doc.scrollY() == doc.maxScrollY());
    REQUIRE(doc.maxScrollY() == 70);
}

TEST_CASE("synthetic_document_is_deterministic_for_a_seed") {
    SyntheticDocument::Options o{};
    o.viewW = 64; o.viewH = 32; o.docH = 200; o.seed = 9;
    SyntheticDocument a(o), b(o);
    REQUIRE(testsupport::sameImage(a.page(), b.page()));

    o.color = true;
    SyntheticDocument c(o);
    REQUIRE(c.page().type() == CV_8UC3);
    REQUIRE(c.next()->format() == PixelFormat::RGB24);
}

TEST_CASE("synthetic_document_frame_limit_ends_input") {
    SyntheticDocument::Options o{};
    o.viewW = 16; o.viewH = 16; o.docH = 64; o.maxFrames = 2;
    SyntheticDocument doc(o);

    REQUIRE(doc.next()->sequence() == 0);
    REQUIRE(doc.next()->sequence() == 1);
    REQUIRE_FALSE(doc.next().has_value());
}

TEST_CASE("synthetic_document_rejects_a_page_shorter_than_the_viewport") {
    SyntheticDocument::Options o{};
    o.viewH = 600; o.docH = 500;
    REQUIRE_THROWS_AS(SyntheticDocument(o), std::invalid_argument);
}
