#pragma once

#include "scrollstitch/core/Config.hpp"
#include "scrollstitch/core/Frame.hpp"

#include <chrono>
#include <optional>

namespace scrollstitch {

/*
  Producer of raw frames (live screen samples or pre-extracted video frames).

  next(): the next frame in capture order, std::nullopt at end of input.
  Failures are reported by throwing; the orchestrator treats any exception
  as a capture error.
*/
class IFrameSource {
public:
    virtual ~IFrameSource() = default;

    [[nodiscard]] virtual std::optional<Frame> next() = 0;
};

/* Advances the captured view by one scroll unit. Throws on failure. */
class IScrollDriver {
public:
    virtual ~IScrollDriver() = default;

    virtual void step(ScrollKey key) = 0;
};

/* Scroll driver for sources that already move on their own (recordings,
   extracted video frames). */
class NullScrollDriver final : public IScrollDriver {
public:
    void step(ScrollKey) override {}
};

/* Time base of a capture session, injectable so that tests run without
   real waiting. */
class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual std::chrono::steady_clock::time_point now() = 0;
    virtual void sleep(std::chrono::milliseconds d) = 0;
};

class SteadyClock final : public IClock {
public:
    std::chrono::steady_clock::time_point now() override;
    void sleep(std::chrono::milliseconds d) override;
};

} // namespace scrollstitch
