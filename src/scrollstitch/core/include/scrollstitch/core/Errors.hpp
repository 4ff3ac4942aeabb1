#pragma once

#include <stdexcept>
#include <string>

namespace scrollstitch {

/* Base class for every error raised by the capture pipeline. */
class StitchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/* Crop rectangle (or frame geometry) that cannot be applied.
   Fatal: a session never clamps silently. */
class InvalidRegion : public StitchError {
public:
    using StitchError::StitchError;
};

/* Configuration rejected by CaptureConfig::validate(). */
class ConfigError : public StitchError {
public:
    using StitchError::StitchError;
};

/* FrameSource or ScrollDriver failure, or a capture session that produced
   no usable frame at all. */
class CaptureError : public StitchError {
public:
    using StitchError::StitchError;
};

} // namespace scrollstitch
