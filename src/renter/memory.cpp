#include "memory.hpp"
#include "logging.hpp"

namespace mender {

bool MemoryManager::request(uint64_t bytes, StopSignal *stop) {
  StopSubscription sub(stop, [this] {
    std::lock_guard<std::mutex> lk(mtx_);
    cv_.notify_all();
  });
  std::unique_lock<std::mutex> lk(mtx_);
  uint64_t need = bytes > capacity_ ? capacity_ : bytes;
  cv_.wait(lk, [&] { return available_ >= need || (stop && stop->stopped()); });
  if (stop && stop->stopped())
    return false;
  // oversized requests drive the counter below zero until credited back
  if (bytes > available_) {
    available_ = 0;
    overdraft_ += bytes - need;
  } else {
    available_ -= bytes;
  }
  return true;
}

void MemoryManager::credit(uint64_t bytes) {
  std::lock_guard<std::mutex> lk(mtx_);
  uint64_t repay = bytes < overdraft_ ? bytes : overdraft_;
  overdraft_ -= repay;
  available_ += bytes - repay;
  if (available_ > capacity_) {
    Logger::instance().log(LogLevel::CRITICAL,
                           "memory credited beyond capacity: %llu > %llu",
                           (unsigned long long)available_,
                           (unsigned long long)capacity_);
    available_ = capacity_;
  }
  cv_.notify_all();
}

uint64_t MemoryManager::available() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return available_;
}

} // namespace mender
