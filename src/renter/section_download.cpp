#include "section_download.hpp"
#include "errors.hpp"

namespace mender {

void PendingDownload::finish(std::vector<uint8_t> data, std::error_code ec) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (done_)
    return;
  data_ = std::move(data);
  err_ = ec;
  done_ = true;
  cv_.notify_all();
}

bool PendingDownload::finished() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return done_;
}

std::error_code PendingDownload::wait(StopSignal *stop,
                                      std::vector<uint8_t> &data) {
  StopSubscription sub(stop, [this] {
    std::lock_guard<std::mutex> lk(mtx_);
    cv_.notify_all();
  });
  std::unique_lock<std::mutex> lk(mtx_);
  cv_.wait(lk, [&] { return done_ || (stop && stop->stopped()); });
  if (stop && stop->stopped())
    return errc::interrupted;
  data = std::move(data_);
  return err_;
}

} // namespace mender
