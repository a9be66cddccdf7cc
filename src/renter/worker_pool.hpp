#pragma once
#include <map>
#include <memory>
#include <shared_mutex>
#include <vector>
#include "chunk.hpp"
#include "crypto.hpp"

namespace mender {

class RepairWorker {
public:
    virtual ~RepairWorker() = default;
    // Must not block; the worker uploads the chunk's remaining pieces later.
    virtual void queue_chunk_repair(std::shared_ptr<UnfinishedChunk> chunk) = 0;
};

// Workers keyed by the contract they upload through. Membership changes take
// the write lock; fan-out only takes the read lock.
class WorkerPool {
public:
    void add(const Hash& contract_id, std::shared_ptr<RepairWorker> worker);
    bool remove(const Hash& contract_id);
    size_t size() const;
    std::vector<std::shared_ptr<RepairWorker>> snapshot() const;

    template <typename Fn>
    void for_each(Fn fn) const {
        std::shared_lock<std::shared_mutex> lk(mtx_);
        for (const auto& kv : workers_)
            fn(*kv.second);
    }

private:
    mutable std::shared_mutex mtx_;
    std::map<Hash, std::shared_ptr<RepairWorker>> workers_;
};

} // namespace mender
