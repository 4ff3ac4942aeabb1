// src/scrollstitch/cli/mode_play.cpp
#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "scrollstitch/core/Errors.hpp"
#include "scrollstitch/io/ImageFolderSource.hpp"
#include "scrollstitch/io/PrefetchFrameSource.hpp"
#include "scrollstitch/io/Recorder.hpp"

#include <cctype>
#include <chrono>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

// ---------------- helpers ----------------

static std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c: s) {
        if (c==',' || c==';' || std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty()) { out.push_back(cur); cur.clear(); }
        } else cur.push_back(c);
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

// ---------------- main mode ----------------

int run_play(int argc, char** argv)
{
    const std::string file   = argValue(argc, argv, "file", "");     // .ssf recording
    const std::string folder = argValue(argc, argv, "folder", "");   // extracted frames
    const std::string extstr = argValue(argc, argv, "ext", "png,jpg,jpeg,tif,tiff,bmp");
    const bool prefetch      = argHas(argc, argv, "prefetch");

    if (folder.empty() == file.empty()) {
        std::cerr
            << "[play] usage:\n"
            << "  scroll-stitch-cli play --folder=DIR [--ext=png,jpg,tif] [--gray] [session options]\n"
            << "  scroll-stitch-cli play --file=frames.ssf [--prefetch] [session options]\n";
        return 1;
    }

    try {
        scrollstitch::CaptureConfig cfg = session_config_from_args(argc, argv);
        // recorded frames need neither a focus delay nor a settle delay
        cfg.initialDelay = std::chrono::milliseconds(0);
        cfg.settleDelay  = std::chrono::milliseconds(0);
        // recorded frames move on their own: a pause in the recording is a run
        // of duplicates, not a stall, so read on to the end unless asked not to
        if (argValue(argc, argv, "stall-limit", "").empty()) {
            cfg.stallRetryLimit = std::numeric_limits<int>::max();
        }

        std::unique_ptr<scrollstitch::IFrameSource> base;
        if (!folder.empty()) {
            scrollstitch::ImageFolderSource::Options fo{};
            fo.extensions = split_list(extstr);
            fo.grayscale  = argHas(argc, argv, "gray");
            auto src = std::make_unique<scrollstitch::ImageFolderSource>(folder, fo);
            if (src->size() == 0) {
                std::cerr << "[play] no images found in '" << folder << "' with ext: " << extstr << "\n";
                return 1;
            }
            std::cout << "[play] found " << src->size() << " images in " << folder
                      << " (ext=" << extstr << ")\n";
            base = std::move(src);
        } else {
            base = std::make_unique<scrollstitch::RecordedFrameSource>(file);
            std::cout << "[play] replaying " << file << "\n";
        }

        std::unique_ptr<scrollstitch::PrefetchFrameSource> ahead;
        scrollstitch::IFrameSource* source = base.get();
        if (prefetch) {
            ahead = std::make_unique<scrollstitch::PrefetchFrameSource>(*base);
            source = ahead.get();
        }

        scrollstitch::NullScrollDriver driver;
        const int rc = run_session("play", cfg, *source, driver, argc, argv);

        if (auto* fs = dynamic_cast<scrollstitch::ImageFolderSource*>(base.get()); fs && fs->skipped() > 0) {
            std::cerr << "[play] skipped " << fs->skipped() << " unreadable image(s)\n";
        }
        return rc;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[play] " << e.what() << '\n';
        return 1;
    } catch (const scrollstitch::StitchError& e) {
        std::cerr << "[play] error: " << e.what() << '\n';
        return 1;
    }
}
