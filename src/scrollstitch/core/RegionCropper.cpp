#include "scrollstitch/core/RegionCropper.hpp"
#include "scrollstitch/core/Errors.hpp"

#include <cstring>
#include <sstream>

namespace scrollstitch {

bool regionFits(const CropRegion& r, std::uint32_t width, std::uint32_t height) noexcept {
    if (r.width <= 0 || r.height <= 0 || r.x < 0 || r.y < 0) return false;
    // 64-bit sums: x + width must not wrap
    return std::int64_t(r.x) + r.width  <= std::int64_t(width) &&
           std::int64_t(r.y) + r.height <= std::int64_t(height);
}

Frame crop(const Frame& frame, const CropRegion& r) {
    if (!regionFits(r, frame.width(), frame.height())) {
        std::ostringstream os;
        os << "crop region " << r.x << ',' << r.y << ' ' << r.width << 'x' << r.height
           << " does not fit frame " << frame.width() << 'x' << frame.height();
        throw InvalidRegion(os.str());
    }

    const std::size_t bpp    = bytesPerPixel(frame.format());
    const std::size_t outRow = std::size_t(r.width) * bpp;
    const std::size_t xOff   = std::size_t(r.x) * bpp;

    std::vector<std::uint8_t> px(outRow * std::size_t(r.height));
    for (int y = 0; y < r.height; ++y) {
        const std::uint8_t* src = frame.row(static_cast<std::uint32_t>(r.y + y)) + xOff;
        std::memcpy(px.data() + std::size_t(y) * outRow, src, outRow);
    }

    return Frame(static_cast<std::uint32_t>(r.width), static_cast<std::uint32_t>(r.height),
                 frame.format(), std::move(px), frame.sequence(), frame.timestamp());
}

} // namespace scrollstitch
