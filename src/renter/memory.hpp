#pragma once
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include "stop_signal.hpp"

namespace mender {

class MemoryAccountant {
public:
    virtual ~MemoryAccountant() = default;
    // Returns bytes to the shared budget.
    virtual void credit(uint64_t bytes) = 0;
};

// Fixed budget shared by all repairs. request() blocks until enough memory is
// free; a request larger than the whole budget waits for the budget to be full.
class MemoryManager : public MemoryAccountant {
public:
    explicit MemoryManager(uint64_t capacity) : capacity_(capacity), available_(capacity) {}

    // Returns false if stop fired before the memory became available.
    bool request(uint64_t bytes, StopSignal* stop);
    void credit(uint64_t bytes) override;

    uint64_t available() const;
    uint64_t capacity() const { return capacity_; }

private:
    const uint64_t capacity_;
    uint64_t available_;
    uint64_t overdraft_{0};
    mutable std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace mender
