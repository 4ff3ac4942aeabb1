#pragma once

#include "scrollstitch/align/OverlapAligner.hpp"
#include "scrollstitch/compose/StitchAccumulator.hpp"
#include "scrollstitch/core/Capture.hpp"
#include "scrollstitch/core/Config.hpp"

#include <opencv2/core.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace scrollstitch {

enum class SessionState : std::uint8_t {
    Idle = 0,
    Priming,
    Capturing,
    Finalizing,
    Done,
    Aborted
};

/// Why the capture loop ended.
enum class Termination : std::uint8_t {
    EndOfInput = 0,   // frame source exhausted
    EndOfContent,     // NoOverlap: scrolled past the end or content jumped
    Stalled,          // too many consecutive duplicates
    Stopped,          // external stop request
    FrameBudget,      // maxFrames reached
    TimeBudget,       // maxDuration elapsed
    Aborted           // capture error after at least one accepted frame
};

[[nodiscard]] const char* toString(SessionState s) noexcept;
[[nodiscard]] const char* toString(Termination t) noexcept;

/// Best-effort output of one session plus what happened along the way.
struct CaptureResult {
    cv::Mat image;                              // stitched canvas (CV_8UC1/3/4)
    SessionState state{SessionState::Idle};     // Done or Aborted
    Termination termination{Termination::EndOfInput};
    std::vector<AlignmentResult> alignments;    // one per frame after the first
    std::size_t framesCaptured{0};              // frames pulled from the source
    std::size_t framesAccepted{0};              // first frame + every Advance
    std::size_t scrollSteps{0};
    bool configurationWarning{false};           // overlap window was clamped
    std::string error;                          // set when state == Aborted

    [[nodiscard]] bool completedNormally() const noexcept {
        return state == SessionState::Done &&
               termination != Termination::Stalled &&
               termination != Termination::Aborted;
    }
};

/*
  Everything one capture invocation owns. Lives inside the orchestrator for
  the duration of run(); nothing here is shared with other sessions.
*/
struct CaptureSession {
    CaptureConfig config;
    StitchAccumulator canvas;
    std::optional<Frame> previous;       // last accepted (cropped) frame
    int consecutiveDuplicates{0};
    std::chrono::steady_clock::time_point captureStart{};
    CaptureResult result;
};

/*
  Drives one scroll-capture session:

    Idle -> Priming -> Capturing -> Finalizing -> Done
                \___________\___________\______> Aborted

  Priming waits the initial delay, captures and crops the first frame and
  seeds the canvas. Each Capturing iteration issues one scroll step, waits
  the settle delay, captures, crops and aligns the new frame against the
  last accepted one. Budgets, stall detection and requestStop() end the loop
  and the canvas is finalized with whatever has been accumulated.

  Errors:
    - ConfigError / InvalidRegion from the constructor for bad settings;
    - InvalidRegion from run() if the first frame cannot be cropped;
    - CaptureError from run() if no frame could be captured at all.
  Any later failure yields state Aborted with the partial canvas.
*/
class CaptureOrchestrator {
public:
    struct Observer {
        std::function<void(SessionState)> onState;
        // called after every aligned frame; 'canvasHeight' is after acting on it
        std::function<void(const Frame&, const AlignmentResult&, int canvasHeight)> onFrame;
    };

    CaptureOrchestrator(CaptureConfig config, IFrameSource& source, IScrollDriver& driver);
    CaptureOrchestrator(CaptureConfig config, IFrameSource& source, IScrollDriver& driver,
                        IClock& clock, Observer observer = {});

    CaptureOrchestrator(const CaptureOrchestrator&) = delete;
    CaptureOrchestrator& operator=(const CaptureOrchestrator&) = delete;

    /// Run the session to completion. Callable once.
    [[nodiscard]] CaptureResult run();

    /// Thread-safe; honoured at the next point inside Capturing.
    void requestStop() noexcept { stop_.store(true); }

    [[nodiscard]] SessionState state() const noexcept { return state_.load(); }

    /// Canvas so far (empty before the first frame).
    [[nodiscard]] cv::Mat preview() const { return session_.canvas.snapshot(); }

private:
    SteadyClock    ownClock_;
    IFrameSource&  source_;
    IScrollDriver& driver_;
    IClock&        clock_;
    Observer       observer_;
    OverlapAligner aligner_;
    CaptureSession session_;

    std::atomic<SessionState> state_{SessionState::Idle};
    std::atomic<bool> stop_{false};

    void transition(SessionState s);
    [[nodiscard]] Frame prepare(Frame raw) const;
    void prime();
    void captureLoop();
    [[nodiscard]] bool budgetExhausted();
    void abortWith(const std::string& what);
    CaptureResult finish();
};

} // namespace scrollstitch
