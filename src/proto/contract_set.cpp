#include "contract_set.hpp"
#include "logging.hpp"

namespace mender {

void ContractSet::insert(const RenterContract &c) {
  std::unique_lock<std::mutex> lk(mtx_);
  cv_.wait(lk, [&] {
    auto it = contracts_.find(c.id);
    return it == contracts_.end() || !it->second.held;
  });
  contracts_[c.id] = Entry{c, false};
}

bool ContractSet::remove(const Hash &id) {
  std::unique_lock<std::mutex> lk(mtx_);
  cv_.wait(lk, [&] {
    auto it = contracts_.find(id);
    return it == contracts_.end() || !it->second.held;
  });
  if (contracts_.erase(id) == 0)
    return false;
  cv_.notify_all();
  return true;
}

std::optional<RenterContract> ContractSet::view(const Hash &id) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = contracts_.find(id);
  if (it == contracts_.end())
    return std::nullopt;
  return it->second.contract;
}

std::vector<Hash> ContractSet::ids() const {
  std::lock_guard<std::mutex> lk(mtx_);
  std::vector<Hash> out;
  out.reserve(contracts_.size());
  for (const auto &kv : contracts_)
    out.push_back(kv.first);
  return out;
}

size_t ContractSet::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return contracts_.size();
}

bool ContractSet::acquire(const Hash &id, RenterContract &out) {
  std::unique_lock<std::mutex> lk(mtx_);
  for (;;) {
    auto it = contracts_.find(id);
    if (it == contracts_.end())
      return false;
    if (!it->second.held) {
      it->second.held = true;
      out = it->second.contract;
      return true;
    }
    // the entry may be removed while we wait, so look it up again
    cv_.wait(lk);
  }
}

void ContractSet::release(const RenterContract &c) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = contracts_.find(c.id);
  if (it == contracts_.end() || !it->second.held) {
    Logger::instance().log(LogLevel::ERROR,
                           "release of contract %s that is not held",
                           hash_hex(c.id).c_str());
    return;
  }
  it->second.contract = c;
  it->second.held = false;
  cv_.notify_all();
}

} // namespace mender
