#include "worker_pool.hpp"
#include <mutex>

namespace mender {

void WorkerPool::add(const Hash &contract_id,
                     std::shared_ptr<RepairWorker> worker) {
  std::unique_lock<std::shared_mutex> lk(mtx_);
  workers_[contract_id] = std::move(worker);
}

bool WorkerPool::remove(const Hash &contract_id) {
  std::unique_lock<std::shared_mutex> lk(mtx_);
  return workers_.erase(contract_id) > 0;
}

size_t WorkerPool::size() const {
  std::shared_lock<std::shared_mutex> lk(mtx_);
  return workers_.size();
}

std::vector<std::shared_ptr<RepairWorker>> WorkerPool::snapshot() const {
  std::shared_lock<std::shared_mutex> lk(mtx_);
  std::vector<std::shared_ptr<RepairWorker>> out;
  out.reserve(workers_.size());
  for (const auto &kv : workers_)
    out.push_back(kv.second);
  return out;
}

} // namespace mender
