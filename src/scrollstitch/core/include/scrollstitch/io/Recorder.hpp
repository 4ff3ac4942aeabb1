#pragma once

#include "scrollstitch/core/Capture.hpp"

#include <cstdint>
#include <fstream>
#include <string>

namespace scrollstitch {

// Binary frame container SSF1, used to record a capture and replay it later.
//
// Header:
//   char     magic[4] = 'S','S','F','1'
//   uint32_t version  = 1
//
// One record per frame:
//   uint32_t width
//   uint32_t height
//   uint8_t  format (PixelFormat)
//   uint8_t  _pad[3] = {0,0,0}
//   uint64_t timestamp_ns
//   uint64_t seq
//   uint32_t crc32      (zlib crc32 of data)
//   uint32_t data_size
//   uint8_t  data[data_size]
//
// Everything little-endian (as on x86/amd64).

class FrameRecorder {
public:
    /// Throws CaptureError if the file cannot be created.
    explicit FrameRecorder(const std::string& path);
    ~FrameRecorder();

    /// Throws CaptureError on a write failure.
    void write(const Frame& f);

    [[nodiscard]] std::uint64_t written() const noexcept { return written_; }

private:
    std::ofstream ofs_;
    std::uint64_t written_{0};
};

class FramePlayer {
public:
    /// Throws CaptureError if the file is missing or not an SSF1 file.
    explicit FramePlayer(const std::string& path);
    ~FramePlayer();

    /// Next frame, std::nullopt at a clean end of file. A truncated record
    /// or a CRC mismatch throws CaptureError.
    std::optional<Frame> readNext();

private:
    std::ifstream ifs_;
    std::uint64_t size_{0};   // file size, bounds every payload
};

/* Replays a recording through the IFrameSource interface. */
class RecordedFrameSource final : public IFrameSource {
public:
    explicit RecordedFrameSource(const std::string& path) : player_(path) {}

    std::optional<Frame> next() override { return player_.readNext(); }

private:
    FramePlayer player_;
};

/* Passes frames through from 'inner' and records each one on the way. */
class RecordingFrameSource final : public IFrameSource {
public:
    RecordingFrameSource(IFrameSource& inner, const std::string& path)
        : inner_(inner), recorder_(path) {}

    std::optional<Frame> next() override;

    [[nodiscard]] std::uint64_t recorded() const noexcept { return recorder_.written(); }

private:
    IFrameSource& inner_;
    FrameRecorder recorder_;
};

/// zlib CRC-32 of a frame's pixel payload.
[[nodiscard]] std::uint32_t payloadCrc32(const Frame& f);

} // namespace scrollstitch
