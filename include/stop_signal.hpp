#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace mender {

// One-shot, thread-safe stop flag. Callbacks run under the signal's lock, so
// they must be short and must not subscribe to or unsubscribe from the same
// signal; once unsubscribe() returns the callback will not run again.
class StopSignal {
public:
    using Callback = std::function<void()>;

    StopSignal() = default;
    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    void stop();
    bool stopped() const { return stopped_.load(); }

    // Returns 0 and runs cb immediately if the signal already fired.
    uint64_t subscribe(Callback cb);
    void unsubscribe(uint64_t id);

    // Returns true if the signal fired within the timeout.
    bool wait_for(std::chrono::milliseconds timeout);

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::atomic<bool> stopped_{false};
    std::map<uint64_t, Callback> callbacks_;
    uint64_t next_id_{1};
};

class StopSubscription {
public:
    StopSubscription(StopSignal* sig, StopSignal::Callback cb)
        : sig_(sig), id_(sig ? sig->subscribe(std::move(cb)) : 0) {}
    ~StopSubscription() { reset(); }
    StopSubscription(const StopSubscription&) = delete;
    StopSubscription& operator=(const StopSubscription&) = delete;

    void reset() {
        if (sig_ && id_ != 0)
            sig_->unsubscribe(id_);
        sig_ = nullptr;
        id_ = 0;
    }
private:
    StopSignal* sig_;
    uint64_t id_;
};

} // namespace mender
