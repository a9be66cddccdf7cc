#include "host_db.hpp"

namespace mender {

void HostReputation::increment_successful_interactions(const PublicKey &host) {
  std::lock_guard<std::mutex> lk(mtx_);
  counters_[host].success++;
}

void HostReputation::increment_failed_interactions(const PublicKey &host) {
  std::lock_guard<std::mutex> lk(mtx_);
  counters_[host].failure++;
}

uint64_t HostReputation::successes(const PublicKey &host) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = counters_.find(host);
  return it == counters_.end() ? 0 : it->second.success;
}

uint64_t HostReputation::failures(const PublicKey &host) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = counters_.find(host);
  return it == counters_.end() ? 0 : it->second.failure;
}

} // namespace mender
