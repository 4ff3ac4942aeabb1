#include "scrollstitch/core/Errors.hpp"
#include "scrollstitch/io/ImageFolderSource.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <filesystem>
#include <fstream>

using namespace scrollstitch;
namespace fs = std::filesystem;

namespace {

fs::path freshDir(const std::string& name) {
    fs::path d = fs::temp_directory_path() / ("scrollstitch_" + name);
    fs::remove_all(d);
    fs::create_directories(d);
    return d;
}

} // namespace

TEST_CASE("folder_frames_come_in_file_name_order_as_rgb") {
    const fs::path dir = freshDir("frames_rgb");
    cv::Mat a = testsupport::noiseImage(20, 10, 1, 3);
    cv::Mat b = testsupport::noiseImage(20, 10, 2, 3);
    // written as BGR, read back as RGB
    REQUIRE(cv::imwrite((dir / "frame_002.png").string(), b));
    REQUIRE(cv::imwrite((dir / "frame_001.png").string(), a));
    { std::ofstream((dir / "notes.txt").string()) << "ignored"; }

    ImageFolderSource src(dir);
    REQUIRE(src.size() == 2);

    auto f1 = src.next();
    auto f2 = src.next();
    REQUIRE(f1.has_value());
    REQUIRE(f2.has_value());
    REQUIRE_FALSE(src.next().has_value());

    cv::Mat aRgb, bRgb;
    cv::cvtColor(a, aRgb, cv::COLOR_BGR2RGB);
    cv::cvtColor(b, bRgb, cv::COLOR_BGR2RGB);
    REQUIRE(f1->format() == PixelFormat::RGB24);
    REQUIRE(f1->sequence() == 0);
    REQUIRE(f2->sequence() == 1);
    REQUIRE(testsupport::sameImage(f1->view(), aRgb));
    REQUIRE(testsupport::sameImage(f2->view(), bRgb));

    fs::remove_all(dir);
}

TEST_CASE("folder_source_skips_unreadable_images") {
    const fs::path dir = freshDir("frames_skip");
    { std::ofstream((dir / "a.png").string()) << "broken"; }
    REQUIRE(cv::imwrite((dir / "b.PNG").string(), testsupport::noiseImage(8, 8, 1)));

    ImageFolderSource::Options o{};
    o.grayscale = true;
    ImageFolderSource src(dir, o);

    auto f = src.next();
    REQUIRE(f.has_value());
    REQUIRE(f->format() == PixelFormat::Gray8);
    REQUIRE(src.skipped() == 1);
    REQUIRE_FALSE(src.next().has_value());

    fs::remove_all(dir);
}

TEST_CASE("folder_source_requires_a_directory") {
    REQUIRE_THROWS_AS(ImageFolderSource(fs::temp_directory_path() / "scrollstitch_no_such_dir"),
                      CaptureError);
}

TEST_CASE("list_images_filters_extensions_case_insensitively") {
    const fs::path dir = freshDir("frames_list");
    for (const char* n : {"x.JPG", "y.png", "z.gif", "w.tif"}) {
        std::ofstream((dir / n).string()) << "-";
    }
    auto files = ImageFolderSource::listImages(dir, {"jpg", "tif"});
    REQUIRE(files.size() == 2);
    REQUIRE(files[0].filename() == "w.tif");
    REQUIRE(files[1].filename() == "x.JPG");
    REQUIRE(ImageFolderSource::listImages(dir, {}).size() == 4);
    fs::remove_all(dir);
}
