#include "scrollstitch/io/Recorder.hpp"
#include "scrollstitch/core/Errors.hpp"

#include <zlib.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace scrollstitch {

namespace {
#pragma pack(push, 1)
struct FileHeader {
    char     magic[4];   // 'S','S','F','1'
    uint32_t version;    // 1
};
struct RecordHeader {
    uint32_t width;
    uint32_t height;
    uint8_t  format;
    uint8_t  pad[3];
    uint64_t timestamp_ns;
    uint64_t seq;
    uint32_t crc32;
    uint32_t data_size;
}; // 36 bytes with pack(1)
#pragma pack(pop)

static_assert(sizeof(FileHeader)   == 8,  "FileHeader size unexpected");
static_assert(sizeof(RecordHeader) == 36, "RecordHeader size unexpected");

} // namespace

std::uint32_t payloadCrc32(const Frame& f) {
    const auto d = f.data();
    uLong crc = ::crc32(0L, Z_NULL, 0);
    // zlib takes uInt lengths; feed large buffers in chunks
    std::size_t off = 0;
    while (off < d.size()) {
        const std::size_t n = std::min<std::size_t>(d.size() - off, 1u << 30);
        crc = ::crc32(crc, reinterpret_cast<const Bytef*>(d.data() + off), static_cast<uInt>(n));
        off += n;
    }
    return static_cast<std::uint32_t>(crc);
}

//---------------- FrameRecorder ----------------

FrameRecorder::FrameRecorder(const std::string& path)
    : ofs_(path, std::ios::binary)
{
    if (!ofs_) throw CaptureError("FrameRecorder: cannot create " + path);

    FileHeader h{};
    std::memcpy(h.magic, "SSF1", 4);
    h.version = 1u;
    ofs_.write(reinterpret_cast<const char*>(&h), sizeof(h));
    if (!ofs_) throw CaptureError("FrameRecorder: cannot write header to " + path);
}

FrameRecorder::~FrameRecorder() = default;

void FrameRecorder::write(const Frame& f)
{
    RecordHeader rh{};
    rh.width        = f.width();
    rh.height       = f.height();
    rh.format       = static_cast<std::uint8_t>(f.format());
    rh.timestamp_ns = static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                        f.timestamp().time_since_epoch()).count());
    rh.seq          = f.sequence();
    rh.crc32        = payloadCrc32(f);
    rh.data_size    = static_cast<std::uint32_t>(f.bytes());

    ofs_.write(reinterpret_cast<const char*>(&rh), sizeof(rh));
    if (rh.data_size) {
        ofs_.write(reinterpret_cast<const char*>(f.data().data()), rh.data_size);
    }
    if (!ofs_) throw CaptureError("FrameRecorder: write failed");
    ++written_;
}

//---------------- FramePlayer ----------------

FramePlayer::FramePlayer(const std::string& path)
    : ifs_(path, std::ios::binary)
{
    if (!ifs_) throw CaptureError("FramePlayer: cannot open " + path);

    ifs_.seekg(0, std::ios::end);
    size_ = static_cast<std::uint64_t>(ifs_.tellg());
    ifs_.seekg(0, std::ios::beg);

    FileHeader h{};
    ifs_.read(reinterpret_cast<char*>(&h), sizeof(h));
    if (!ifs_ || std::memcmp(h.magic, "SSF1", 4) != 0 || h.version != 1u) {
        throw CaptureError("FramePlayer: not an SSF1 recording: " + path);
    }
}

FramePlayer::~FramePlayer() = default;

std::optional<Frame> FramePlayer::readNext()
{
    RecordHeader rh{};
    ifs_.read(reinterpret_cast<char*>(&rh), sizeof(rh));
    if (ifs_.gcount() == 0 && ifs_.eof()) return std::nullopt;
    if (!ifs_) throw CaptureError("FramePlayer: truncated record header");

    // validate the header before trusting data_size with an allocation
    if (rh.format > static_cast<std::uint8_t>(PixelFormat::RGBA32)) {
        throw CaptureError("FramePlayer: unknown pixel format in frame " + std::to_string(rh.seq));
    }
    const std::uint64_t expected = std::uint64_t(rh.width) * rh.height *
                                   bytesPerPixel(static_cast<PixelFormat>(rh.format));
    if (rh.data_size != expected) {
        throw CaptureError("FramePlayer: payload size " + std::to_string(rh.data_size) +
                           " does not match " + std::to_string(rh.width) + "x" +
                           std::to_string(rh.height) + " in frame " + std::to_string(rh.seq));
    }
    const std::uint64_t pos = static_cast<std::uint64_t>(ifs_.tellg());
    if (pos > size_ || size_ - pos < rh.data_size) {
        throw CaptureError("FramePlayer: truncated frame payload");
    }

    std::vector<std::uint8_t> px(rh.data_size);
    if (rh.data_size) {
        ifs_.read(reinterpret_cast<char*>(px.data()), rh.data_size);
        if (!ifs_) throw CaptureError("FramePlayer: truncated frame payload");
    }

    Frame f;
    try {
        f = Frame(rh.width, rh.height, static_cast<PixelFormat>(rh.format), std::move(px),
                  rh.seq, std::chrono::steady_clock::time_point{}); // replay sets its own pace
    } catch (const std::invalid_argument& e) {
        throw CaptureError(std::string("FramePlayer: malformed record: ") + e.what());
    }
    if (payloadCrc32(f) != rh.crc32) {
        throw CaptureError("FramePlayer: CRC mismatch in frame " + std::to_string(rh.seq));
    }
    return f;
}

//---------------- RecordingFrameSource ----------------

std::optional<Frame> RecordingFrameSource::next()
{
    auto f = inner_.next();
    if (f) recorder_.write(*f);
    return f;
}

} // namespace scrollstitch
