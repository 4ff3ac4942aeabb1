#pragma once
#include "scrollstitch/core/Capture.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace scrollstitch {

/**
 * Frames from a directory of still images (e.g. frames extracted from a
 * screen recording), in lexicographic file-name order.
 *
 * Files whose extension is not in 'extensions' are ignored; files that fail
 * to decode are skipped and counted. Images are loaded as RGB24, or Gray8
 * when 'grayscale' is set.
 */
class ImageFolderSource final : public IFrameSource {
public:
    struct Options {
        std::vector<std::string> extensions{"png", "jpg", "jpeg", "bmp", "tif", "tiff"};
        bool grayscale = false;
    };

    /// Throws CaptureError if 'folder' is not a readable directory.
    ImageFolderSource(const std::filesystem::path& folder, const Options& opt);
    explicit ImageFolderSource(const std::filesystem::path& folder);

    std::optional<Frame> next() override;

    [[nodiscard]] std::size_t size() const noexcept { return files_.size(); }
    [[nodiscard]] std::size_t skipped() const noexcept { return skipped_; }

    /// Sorted image files of 'folder' whose extension is in 'allow'
    /// (case-insensitive; empty 'allow' accepts every regular file).
    static std::vector<std::filesystem::path>
    listImages(const std::filesystem::path& folder, const std::vector<std::string>& allow);

private:
    Options opt_;
    std::vector<std::filesystem::path> files_;
    std::size_t pos_ = 0;
    std::size_t skipped_ = 0;
    std::uint64_t seq_ = 0;
};

} // namespace scrollstitch
