#include "utils.hpp"
#include "args.hpp"

#include "scrollstitch/core/Errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <thread>

namespace ss = scrollstitch;

// ------------ Ctrl+C ------------
static std::atomic<bool> g_interrupted{false};

extern "C" void on_sigint(int) { g_interrupted.store(true); }

/* Polls the Ctrl+C flag for the lifetime of one session, so a stop also
   lands while the session sleeps or waits on a blocking capture. */
class StopRelay {
public:
    explicit StopRelay(ss::CaptureOrchestrator& orch)
        : orch_(orch), th_([this]{ loop(); }) {}
    ~StopRelay() {
        done_.store(true);
        th_.join();
    }

    StopRelay(const StopRelay&) = delete;
    StopRelay& operator=(const StopRelay&) = delete;

private:
    void loop() {
        while (!done_.load()) {
            if (g_interrupted.load()) orch_.requestStop();
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }

    ss::CaptureOrchestrator& orch_;
    std::atomic<bool> done_{false};
    std::thread th_;
};

// ------------ small helpers for the manifest ------------
static std::string iso_utc_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}

static std::string jesc(const std::string& s) {
    std::string o; o.reserve(s.size()+8);
    for (char c: s) {
        switch(c){
            case '\"': o += "\\\""; break;
            case '\\': o += "\\\\"; break;
            case '\n': o += "\\n"; break;
            case '\r': o += "\\r"; break;
            case '\t': o += "\\t"; break;
            default: o += (unsigned char)c < 0x20 ? '?' : c;
        }
    }
    return o;
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

// ------------ session options ------------

std::optional<ss::CropRegion> builtin_crop_preset(const std::string& name) {
    static const std::map<std::string, ss::CropRegion> presets{
        {"1080p",     {0, 0, 1920, 1080}},
        {"720p",      {0, 0, 1280, 720}},
        {"4k",        {0, 0, 3840, 2160}},
        {"vm-small",  {100, 100, 1024, 768}},
        {"vm-medium", {100, 100, 1280, 800}},
        {"vm-large",  {100, 100, 1920, 1080}},
    };
    auto it = presets.find(lower(name));
    if (it == presets.end()) return std::nullopt;
    return it->second;
}

ss::CaptureConfig session_config_from_args(int argc, char** argv) {
    ss::CaptureConfig cfg{};

    const std::string crop   = argValue(argc, argv, "crop", "");
    const std::string preset = argValue(argc, argv, "crop-preset", "");
    if (!crop.empty()) {
        cfg.crop = ss::parseCropRegion(crop);
        if (!cfg.crop) throw std::invalid_argument("--crop expects x,y,width,height (e.g. 100,50,1920,1080)");
    } else if (!preset.empty()) {
        cfg.crop = builtin_crop_preset(preset);
        if (!cfg.crop) throw std::invalid_argument("unknown crop preset '" + preset + "'");
    }

    const std::string key = argValue(argc, argv, "key", "space");
    auto k = ss::parseScrollKey(key);
    if (!k) throw std::invalid_argument("--key must be space, down or pagedown");
    cfg.scrollKey = *k;

    cfg.align.overlapPixels            = argValueInt(argc, argv, "overlap", cfg.align.overlapPixels);
    cfg.align.minOffset                = argValueInt(argc, argv, "min-offset", cfg.align.minOffset);
    cfg.align.sampleStride             = argValueInt(argc, argv, "stride", cfg.align.sampleStride);
    cfg.align.duplicateThreshold       = argValueDouble(argc, argv, "dup-threshold", cfg.align.duplicateThreshold);
    cfg.align.duplicateOffsetTolerance = argValueInt(argc, argv, "dup-tolerance", cfg.align.duplicateOffsetTolerance);
    cfg.align.maxDissimilarity         = argValueDouble(argc, argv, "max-diff", cfg.align.maxDissimilarity);

    cfg.initialDelay    = std::chrono::seconds(argValueInt(argc, argv, "delay", 3));
    cfg.settleDelay     = std::chrono::milliseconds(argValueInt(argc, argv, "scroll-delay", 200));
    cfg.maxFrames       = static_cast<std::size_t>(std::max(0, argValueInt(argc, argv, "max-frames", 0)));
    cfg.maxDuration     = std::chrono::seconds(std::max(0, argValueInt(argc, argv, "duration", 0)));
    cfg.stallRetryLimit = argValueInt(argc, argv, "stall-limit", cfg.stallRetryLimit);
    return cfg;
}

// ------------ outputs ------------

bool is_supported_format(const std::string& format) {
    static const char* kFormats[] = {"png", "jpg", "jpeg", "bmp", "tif", "tiff", "webp"};
    const std::string f = lower(format);
    return std::any_of(std::begin(kFormats), std::end(kFormats), [&](const char* k){ return f == k; });
}

std::string build_output_path(const std::string& output, const std::string& format) {
    std::filesystem::path p(output);
    if (p.has_extension()) return output;
    return output + "." + lower(format);
}

bool save_image(const cv::Mat& image, const std::string& path) {
    if (image.empty()) {
        std::cout << "[save] image is empty, nothing to save\n";
        return false;
    }
    // frames are RGB(A); the encoder expects BGR(A)
    cv::Mat out;
    if (image.channels() == 3)      cv::cvtColor(image, out, cv::COLOR_RGB2BGR);
    else if (image.channels() == 4) cv::cvtColor(image, out, cv::COLOR_RGBA2BGRA);
    else                            out = image;

    bool ok = false;
    try {
        ok = cv::imwrite(path, out);
    } catch (const cv::Exception& e) {
        std::cerr << "[save] encoder error: " << e.what() << "\n";
    }
    if (ok) {
        std::cout << "[save] image saved to " << path
                  << " (" << image.cols << "x" << image.rows << ")\n";
    } else {
        std::cout << "[save] failed to save " << path << "\n";
    }
    return ok;
}

bool write_manifest(const std::string& path, const ss::CaptureResult& res,
                    const ss::CaptureConfig& cfg, const std::string& mode,
                    const std::string& imagePath)
{
    std::ostringstream js;
    js << "{\n"
       << "  \"created_utc\": \"" << iso_utc_now() << "\",\n"
       << "  \"mode\": \"" << jesc(mode) << "\",\n"
       << "  \"image\": \"" << jesc(imagePath) << "\",\n"
       << "  \"width\": " << res.image.cols << ",\n"
       << "  \"height\": " << res.image.rows << ",\n"
       << "  \"state\": \"" << ss::toString(res.state) << "\",\n"
       << "  \"termination\": \"" << ss::toString(res.termination) << "\",\n"
       << "  \"completed_normally\": " << (res.completedNormally() ? "true" : "false") << ",\n"
       << "  \"configuration_warning\": " << (res.configurationWarning ? "true" : "false") << ",\n"
       << "  \"error\": \"" << jesc(res.error) << "\",\n"
       << "  \"frames_captured\": " << res.framesCaptured << ",\n"
       << "  \"frames_accepted\": " << res.framesAccepted << ",\n"
       << "  \"scroll_steps\": " << res.scrollSteps << ",\n"
       << "  \"overlap_pixels\": " << cfg.align.overlapPixels << ",\n"
       << "  \"scroll_key\": \"" << ss::toString(cfg.scrollKey) << "\",\n";
    if (cfg.crop) {
        js << "  \"crop\": [" << cfg.crop->x << ", " << cfg.crop->y << ", "
           << cfg.crop->width << ", " << cfg.crop->height << "],\n";
    } else {
        js << "  \"crop\": null,\n";
    }
    js << "  \"alignments\": [";
    for (std::size_t i = 0; i < res.alignments.size(); ++i) {
        const auto& a = res.alignments[i];
        js << (i ? ",\n" : "\n")
           << "    {\"class\": \"" << ss::toString(a.classification) << "\", \"offset\": " << a.offset
           << ", \"confidence\": " << std::fixed << std::setprecision(4) << a.confidence << "}";
    }
    js << (res.alignments.empty() ? "]\n" : "\n  ]\n") << "}\n";

    std::error_code ec;
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    std::ofstream f(path, std::ios::binary);
    f << js.str();
    if (!f) {
        std::cerr << "[manifest] failed to write " << path << "\n";
        return false;
    }
    std::cout << "[manifest] " << path << "\n";
    return true;
}

// ------------ session ------------

int run_session(const std::string& tag, const ss::CaptureConfig& cfg,
                ss::IFrameSource& source, ss::IScrollDriver& driver,
                int argc, char** argv)
{
    const bool quiet           = argHas(argc, argv, "quiet");
    const std::string format   = argValue(argc, argv, "format", "png");
    const std::string output   = argValue(argc, argv, "output", "00");
    const std::string manifest = argValue(argc, argv, "manifest", "");

    if (!is_supported_format(format)) {
        std::cerr << "[" << tag << "] unsupported output format '" << format << "'\n";
        return 1;
    }
    const std::string imagePath = build_output_path(output, format);

    ss::CaptureOrchestrator::Observer obs;
    obs.onState = [&](ss::SessionState s) {
        if (!quiet) std::cout << "[" << tag << "] state: " << ss::toString(s) << "\n";
    };
    bool warned = false;
    obs.onFrame = [&](const ss::Frame& f, const ss::AlignmentResult& r, int canvasH) {
        if (r.searchClamped && !warned) {
            warned = true;
            std::cout << "[" << tag << "] warning: overlap window " << cfg.align.overlapPixels
                      << " >= frame height " << f.height() << ", search clamped\n";
        }
        if (quiet) return;
        std::cout << "[" << tag << "] frame " << f.sequence() << ": " << ss::toString(r.classification);
        if (r.classification == ss::Classification::Advance) std::cout << "(" << r.offset << ")";
        std::cout << " confidence=" << std::fixed << std::setprecision(3) << r.confidence
                  << " canvas=" << canvasH << "px\n";
    };

    ss::SteadyClock clock;
    g_interrupted.store(false);
    std::signal(SIGINT, on_sigint);

    ss::CaptureResult res;
    try {
        ss::CaptureOrchestrator orch(cfg, source, driver, clock, obs);
        StopRelay relay(orch);
        std::cout << "[" << tag << "] starting in " << cfg.initialDelay.count() / 1000.0
                  << " s, key=" << ss::toString(cfg.scrollKey)
                  << ", overlap=" << cfg.align.overlapPixels << " (Ctrl+C stops early)\n";
        res = orch.run();
    } catch (const ss::StitchError& e) {
        std::signal(SIGINT, SIG_DFL);
        std::cerr << "[" << tag << "] error: " << e.what() << "\n";
        return 1;
    }
    std::signal(SIGINT, SIG_DFL);

    std::cout << "[" << tag << "] " << ss::toString(res.state) << " (" << ss::toString(res.termination)
              << "): " << res.framesAccepted << "/" << res.framesCaptured << " frames used, "
              << res.image.cols << "x" << res.image.rows << "\n";
    if (!res.error.empty()) std::cerr << "[" << tag << "] capture error: " << res.error << "\n";

    const bool saved = save_image(res.image, imagePath);
    const bool described = manifest.empty() || write_manifest(manifest, res, cfg, tag, imagePath);

    if (!saved || !described) return 1;
    return res.state == ss::SessionState::Aborted ? 2 : 0;
}
