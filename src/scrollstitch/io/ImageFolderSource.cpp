#include "scrollstitch/io/ImageFolderSource.hpp"
#include "scrollstitch/core/Errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <system_error>

namespace scrollstitch {

namespace {

bool ieq(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i)
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    return true;
}

std::string extOf(const std::filesystem::path& p) {
    std::string e = p.extension().string();
    if (!e.empty() && e[0] == '.') e.erase(0, 1);
    return e;
}

} // namespace

std::vector<std::filesystem::path>
ImageFolderSource::listImages(const std::filesystem::path& folder,
                              const std::vector<std::string>& allow)
{
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    for (const auto& de : std::filesystem::directory_iterator(folder, ec)) {
        if (!de.is_regular_file()) continue;
        const std::string e = extOf(de.path());
        const bool ok = allow.empty() ||
            std::any_of(allow.begin(), allow.end(), [&](const std::string& a){ return ieq(e, a); });
        if (ok) files.push_back(de.path());
    }
    std::sort(files.begin(), files.end());
    return files;
}

ImageFolderSource::ImageFolderSource(const std::filesystem::path& folder)
    : ImageFolderSource(folder, Options{}) {}

ImageFolderSource::ImageFolderSource(const std::filesystem::path& folder, const Options& opt)
    : opt_(opt)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(folder, ec)) {
        throw CaptureError("ImageFolderSource: not a directory: " + folder.string());
    }
    files_ = listImages(folder, opt_.extensions);
}

std::optional<Frame> ImageFolderSource::next() {
    while (pos_ < files_.size()) {
        const auto& p = files_[pos_++];
        cv::Mat img = cv::imread(p.string(), opt_.grayscale ? cv::IMREAD_GRAYSCALE : cv::IMREAD_COLOR);
        if (img.empty() || img.depth() != CV_8U) {
            ++skipped_;
            continue;
        }
        if (!opt_.grayscale) cv::cvtColor(img, img, cv::COLOR_BGR2RGB);
        return Frame::fromMat(img, seq_++, std::chrono::steady_clock::now());
    }
    return std::nullopt;
}

} // namespace scrollstitch
