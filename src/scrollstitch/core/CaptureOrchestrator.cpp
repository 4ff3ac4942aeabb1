#include "scrollstitch/core/CaptureOrchestrator.hpp"
#include "scrollstitch/core/Errors.hpp"
#include "scrollstitch/core/RegionCropper.hpp"

#include <exception>
#include <limits>
#include <stdexcept>
#include <utility>

namespace scrollstitch {

const char* toString(SessionState s) noexcept {
    switch (s) {
        case SessionState::Idle:       return "idle";
        case SessionState::Priming:    return "priming";
        case SessionState::Capturing:  return "capturing";
        case SessionState::Finalizing: return "finalizing";
        case SessionState::Done:       return "done";
        case SessionState::Aborted:    return "aborted";
    }
    return "unknown";
}

const char* toString(Termination t) noexcept {
    switch (t) {
        case Termination::EndOfInput:   return "end-of-input";
        case Termination::EndOfContent: return "end-of-content";
        case Termination::Stalled:      return "stalled";
        case Termination::Stopped:      return "stopped";
        case Termination::FrameBudget:  return "frame-budget";
        case Termination::TimeBudget:   return "time-budget";
        case Termination::Aborted:      return "aborted";
    }
    return "unknown";
}

CaptureOrchestrator::CaptureOrchestrator(CaptureConfig config, IFrameSource& source,
                                         IScrollDriver& driver)
    : CaptureOrchestrator(std::move(config), source, driver, ownClock_) {}

CaptureOrchestrator::CaptureOrchestrator(CaptureConfig config, IFrameSource& source,
                                         IScrollDriver& driver, IClock& clock,
                                         Observer observer)
    : source_(source),
      driver_(driver),
      clock_(clock),
      observer_(std::move(observer)),
      aligner_(config.align),
      session_{std::move(config)}
{
    session_.config.validate();
}

void CaptureOrchestrator::transition(SessionState s) {
    state_.store(s);
    if (observer_.onState) observer_.onState(s);
}

Frame CaptureOrchestrator::prepare(Frame raw) const {
    if (!session_.config.crop) return raw;
    return crop(raw, *session_.config.crop);
}

void CaptureOrchestrator::abortWith(const std::string& what) {
    session_.result.termination = Termination::Aborted;
    session_.result.error = what;
    transition(SessionState::Aborted);
}

CaptureResult CaptureOrchestrator::run() {
    if (state() != SessionState::Idle) {
        throw std::logic_error("CaptureOrchestrator::run: session already used");
    }

    prime();
    captureLoop();
    return finish();
}

/* Initial delay, first frame, seed the canvas. Nothing has been accepted
   yet, so every failure here aborts without output. */
void CaptureOrchestrator::prime() {
    transition(SessionState::Priming);
    clock_.sleep(session_.config.initialDelay);

    std::optional<Frame> first;
    try {
        first = source_.next();
    } catch (const std::exception& e) {
        abortWith(e.what());
        throw CaptureError(std::string("first capture failed: ") + e.what());
    }
    if (!first) {
        abortWith("frame source produced no frames");
        throw CaptureError("frame source produced no frames");
    }
    ++session_.result.framesCaptured;

    try {
        Frame f = prepare(std::move(*first));
        session_.canvas.start(f);
        session_.previous = std::move(f);
    } catch (const InvalidRegion& e) {
        abortWith(e.what());
        throw;
    } catch (const std::exception& e) {
        // e.g. an empty first frame: nothing to seed the canvas with
        abortWith(e.what());
        throw CaptureError(std::string("first frame unusable: ") + e.what());
    }
    ++session_.result.framesAccepted;
    session_.captureStart = clock_.now();
}

bool CaptureOrchestrator::budgetExhausted() {
    const CaptureConfig& c = session_.config;
    if (c.maxFrames > 0 && session_.result.framesCaptured >= c.maxFrames) {
        session_.result.termination = Termination::FrameBudget;
        return true;
    }
    if (c.maxDuration.count() > 0 &&
        clock_.now() - session_.captureStart >= c.maxDuration) {
        session_.result.termination = Termination::TimeBudget;
        return true;
    }
    return false;
}

void CaptureOrchestrator::captureLoop() {
    transition(SessionState::Capturing);
    CaptureResult& res = session_.result;
    const CaptureConfig& cfg = session_.config;

    while (true) {
        if (stop_.load()) { res.termination = Termination::Stopped; return; }
        if (budgetExhausted()) return;

        std::optional<Frame> raw;
        try {
            driver_.step(cfg.scrollKey);
            ++res.scrollSteps;
            // the settle delay is what orders the scroll before the capture
            clock_.sleep(cfg.settleDelay);
            if (stop_.load()) { res.termination = Termination::Stopped; return; }
            raw = source_.next();
        } catch (const std::exception& e) {
            abortWith(e.what());
            return;
        }
        if (!raw) { res.termination = Termination::EndOfInput; return; }
        ++res.framesCaptured;

        AlignmentResult r{};
        std::optional<Frame> curr;
        try {
            curr = prepare(std::move(*raw));
            r = aligner_.align(*session_.previous, *curr);
        } catch (const InvalidRegion& e) {
            // geometry changed mid-session (e.g. window resize): no resampling
            abortWith(e.what());
            return;
        }

        if (r.searchClamped) res.configurationWarning = true;
        res.alignments.push_back(r);

        switch (r.classification) {
            case Classification::Advance:
                session_.canvas.append(*curr, r.offset);
                ++res.framesAccepted;
                session_.consecutiveDuplicates = 0;
                break;
            case Classification::Duplicate:
                if (session_.consecutiveDuplicates < std::numeric_limits<int>::max())
                    ++session_.consecutiveDuplicates;
                break;
            case Classification::NoOverlap:
                session_.canvas.accept(r, *curr);
                break;
        }

        if (observer_.onFrame) observer_.onFrame(*curr, r, session_.canvas.height());

        if (r.classification == Classification::Advance) {
            session_.previous = std::move(curr);
        } else if (r.classification == Classification::NoOverlap) {
            res.termination = Termination::EndOfContent;
            return;
        } else if (session_.consecutiveDuplicates > cfg.stallRetryLimit) {
            res.termination = Termination::Stalled;
            return;
        }
    }
}

CaptureResult CaptureOrchestrator::finish() {
    const bool aborted = state() == SessionState::Aborted;
    if (!aborted) transition(SessionState::Finalizing);

    session_.result.image = session_.canvas.finalize();
    session_.previous.reset();

    if (aborted) {
        session_.result.state = SessionState::Aborted;
    } else {
        session_.result.state = SessionState::Done;
        transition(SessionState::Done);
    }
    return std::move(session_.result);
}

} // namespace scrollstitch
