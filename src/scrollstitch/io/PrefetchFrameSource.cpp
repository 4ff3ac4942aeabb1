#include "scrollstitch/io/PrefetchFrameSource.hpp"

namespace scrollstitch {

PrefetchFrameSource::PrefetchFrameSource(IFrameSource& inner)
    : inner_(inner),
      worker_([this]{ run(); }) {}

PrefetchFrameSource::~PrefetchFrameSource() {
    {
        std::lock_guard<std::mutex> lk(m_);
        closing_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void PrefetchFrameSource::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lk(m_);
            cv_.wait(lk, [this]{ return !slot_ || closing_; });
            if (closing_) return;
        }

        std::optional<Frame> f;
        std::exception_ptr err;
        try {
            f = inner_.next();
        } catch (...) {
            // handed to the consumer, rethrown from next()
            err = std::current_exception();
        }

        {
            std::lock_guard<std::mutex> lk(m_);
            if (err) {
                error_ = err;
            } else if (!f) {
                ended_ = true;
            } else {
                slot_ = std::move(f);
            }
        }
        cv_.notify_all();
        if (err || !f) return;
    }
}

std::optional<Frame> PrefetchFrameSource::next() {
    std::unique_lock<std::mutex> lk(m_);
    cv_.wait(lk, [this]{ return slot_.has_value() || ended_ || error_; });

    if (slot_) {
        std::optional<Frame> out = std::move(slot_);
        slot_.reset();
        lk.unlock();
        cv_.notify_all();
        return out;
    }
    if (error_) {
        std::exception_ptr e = error_;
        error_ = nullptr;
        ended_ = true;
        std::rethrow_exception(e);
    }
    return std::nullopt;
}

} // namespace scrollstitch
