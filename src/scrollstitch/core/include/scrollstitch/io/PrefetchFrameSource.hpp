#pragma once
#include "scrollstitch/core/Capture.hpp"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>

namespace scrollstitch {

/*
  Acquires frames from 'inner' on a worker thread while the caller aligns
  and stitches the previous one.

  - Single-slot handoff: the worker fetches the next frame only once the
    slot is empty, so at most one frame is pending and order is preserved.
  - End of input and exceptions thrown by 'inner' are delivered to the
    caller of next() in sequence, after every frame fetched before them.

  Meant for sources that do not depend on a scroll step (recordings,
  extracted video frames). 'inner' must outlive this object.
*/
class PrefetchFrameSource final : public IFrameSource {
public:
    explicit PrefetchFrameSource(IFrameSource& inner);
    ~PrefetchFrameSource() override;

    PrefetchFrameSource(const PrefetchFrameSource&) = delete;
    PrefetchFrameSource& operator=(const PrefetchFrameSource&) = delete;

    std::optional<Frame> next() override;

private:
    IFrameSource& inner_;

    std::mutex m_;                   // protects everything below
    std::condition_variable cv_;
    std::optional<Frame> slot_;
    bool ended_{false};
    bool closing_{false};
    std::exception_ptr error_;

    std::thread worker_;             // started last

    void run();
};

} // namespace scrollstitch
