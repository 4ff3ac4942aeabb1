#pragma once

#include "scrollstitch/core/Config.hpp"
#include "scrollstitch/core/Frame.hpp"

namespace scrollstitch {

/// True when 'region' lies fully inside a width x height frame.
[[nodiscard]] bool regionFits(const CropRegion& region,
                              std::uint32_t width, std::uint32_t height) noexcept;

/// Copy 'region' out of 'frame' into a new frame with the same format,
/// sequence and timestamp. Throws InvalidRegion when the rectangle is empty
/// or not fully contained in the frame.
[[nodiscard]] Frame crop(const Frame& frame, const CropRegion& region);

} // namespace scrollstitch
