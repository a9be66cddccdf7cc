#include "stop_signal.hpp"

namespace mender {

void StopSignal::stop() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (stopped_.exchange(true))
    return;
  for (auto &kv : callbacks_)
    kv.second();
  callbacks_.clear();
  cv_.notify_all();
}

uint64_t StopSignal::subscribe(Callback cb) {
  std::unique_lock<std::mutex> lk(mtx_);
  if (stopped_.load()) {
    lk.unlock();
    cb();
    return 0;
  }
  uint64_t id = next_id_++;
  callbacks_.emplace(id, std::move(cb));
  return id;
}

void StopSignal::unsubscribe(uint64_t id) {
  std::lock_guard<std::mutex> lk(mtx_);
  callbacks_.erase(id);
}

bool StopSignal::wait_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mtx_);
  return cv_.wait_for(lk, timeout, [this] { return stopped_.load(); });
}

} // namespace mender
