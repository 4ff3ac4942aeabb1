#include "scrollstitch/core/Config.hpp"
#include "scrollstitch/core/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>
#include <vector>

namespace scrollstitch {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))  s.remove_suffix(1);
    return s;
}

} // namespace

void CaptureConfig::validate() const {
    if (crop && (crop->width <= 0 || crop->height <= 0 || crop->x < 0 || crop->y < 0)) {
        throw InvalidRegion("crop region must have x,y >= 0 and width,height > 0");
    }
    if (align.overlapPixels < 1) {
        throw ConfigError("overlapPixels must be at least 1");
    }
    if (align.minOffset < 1 || align.minOffset > align.overlapPixels) {
        throw ConfigError("minOffset must be in [1, overlapPixels]");
    }
    if (align.sampleStride < 1) {
        throw ConfigError("sampleStride must be at least 1");
    }
    if (align.duplicateOffsetTolerance < 0) {
        throw ConfigError("duplicateOffsetTolerance must not be negative");
    }
    auto inUnit = [](double v){ return v >= 0.0 && v <= 1.0; };
    if (!inUnit(align.duplicateThreshold) || !inUnit(align.maxDissimilarity)) {
        throw ConfigError("similarity thresholds must lie in [0, 1]");
    }
    if (align.duplicateThreshold > align.maxDissimilarity) {
        throw ConfigError("duplicateThreshold must not exceed maxDissimilarity");
    }
    if (stallRetryLimit < 1) {
        throw ConfigError("stallRetryLimit must be at least 1");
    }
    if (initialDelay.count() < 0 || settleDelay.count() < 0 || maxDuration.count() < 0) {
        throw ConfigError("delays and budgets must not be negative");
    }
}

std::optional<CropRegion> parseCropRegion(std::string_view text) {
    std::vector<int> parts;
    std::size_t start = 0;
    for (std::size_t i = 0; i <= text.size(); ++i) {
        if (i < text.size() && text[i] != ',' && text[i] != ':' && text[i] != ' ') continue;

        std::string_view tok = trim(text.substr(start, i - start));
        start = i + 1;
        if (tok.empty()) continue;

        int v = 0;
        auto [ptr, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), v);
        // unparsable tokens are ignored, not fatal
        if (ec == std::errc{} && ptr == tok.data() + tok.size()) parts.push_back(v);
    }

    if (parts.size() != 4 || parts[2] <= 0 || parts[3] <= 0) return std::nullopt;
    return CropRegion{parts[0], parts[1], parts[2], parts[3]};
}

std::optional<ScrollKey> parseScrollKey(std::string_view text) {
    const std::string k = lower(trim(text));
    if (k == "space")    return ScrollKey::Space;
    if (k == "down")     return ScrollKey::Down;
    if (k == "pagedown") return ScrollKey::PageDown;
    return std::nullopt;
}

const char* toString(ScrollKey key) noexcept {
    switch (key) {
        case ScrollKey::Space:    return "space";
        case ScrollKey::Down:     return "down";
        case ScrollKey::PageDown: return "pagedown";
    }
    return "unknown";
}

} // namespace scrollstitch
