#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "scrollstitch/core/Errors.hpp"
#include "scrollstitch/io/Recorder.hpp"
#include "scrollstitch/io/SyntheticDocument.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

int run_simulate(int argc, char** argv) {
    try {
        scrollstitch::SyntheticDocument::Options o{};
        o.viewW   = argValueInt(argc, argv, "view-width", o.viewW);
        o.viewH   = argValueInt(argc, argv, "view-height", o.viewH);
        o.docH    = argValueInt(argc, argv, "doc-height", o.docH);
        o.stepSpace    = argValueInt(argc, argv, "step-space", o.stepSpace);
        o.stepDown     = argValueInt(argc, argv, "step-down", o.stepDown);
        o.stepPageDown = argValueInt(argc, argv, "step-pagedown", o.stepPageDown);
        o.pattern = argValue(argc, argv, "pattern", o.pattern);
        o.color   = argHas(argc, argv, "color");
        o.seed    = static_cast<unsigned>(argValueInt(argc, argv, "seed", 1));

        scrollstitch::CaptureConfig cfg = session_config_from_args(argc, argv);
        // nothing to focus on in a simulation
        cfg.initialDelay = std::chrono::milliseconds(argValueInt(argc, argv, "delay", 0) * 1000);
        cfg.settleDelay  = std::chrono::milliseconds(argValueInt(argc, argv, "scroll-delay", 0));

        const std::string record = argValue(argc, argv, "record", "");

        std::cout << "[simulate] page " << o.viewW << "x" << o.docH << " (" << o.pattern << ")"
                  << ", viewport height " << o.viewH << "\n";

        scrollstitch::SyntheticDocument doc(o);
        std::unique_ptr<scrollstitch::RecordingFrameSource> rec;
        scrollstitch::IFrameSource* source = &doc;
        if (!record.empty()) {
            rec = std::make_unique<scrollstitch::RecordingFrameSource>(doc, record);
            source = rec.get();
        }

        const int rc = run_session("simulate", cfg, *source, doc, argc, argv);
        if (rec) std::cout << "[simulate] recorded " << rec->recorded() << " frames to " << record << "\n";
        return rc;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[simulate] " << e.what() << '\n';
        return 1;
    } catch (const scrollstitch::StitchError& e) {
        std::cerr << "[simulate] error: " << e.what() << '\n';
        return 1;
    }
}
