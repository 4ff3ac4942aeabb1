#include "scrollstitch/core/Capture.hpp"

#include <thread>

namespace scrollstitch {

std::chrono::steady_clock::time_point SteadyClock::now() {
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleep(std::chrono::milliseconds d) {
    if (d.count() > 0) std::this_thread::sleep_for(d);
}

} // namespace scrollstitch
