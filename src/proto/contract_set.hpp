#pragma once
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <vector>
#include "contract.hpp"

namespace mender {

// Registry of renter contracts. acquire() hands out exclusive access to one
// contract id at a time; the holder must release() it, possibly from another
// thread.
class ContractSet {
public:
    void insert(const RenterContract& c);
    bool remove(const Hash& id);
    std::optional<RenterContract> view(const Hash& id) const;
    std::vector<Hash> ids() const;
    size_t size() const;

    // Blocks while another holder has the contract. Returns false if the id is unknown.
    bool acquire(const Hash& id, RenterContract& out);
    void release(const RenterContract& c);

private:
    struct Entry {
        RenterContract contract;
        bool held{false};
    };
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::map<Hash, Entry> contracts_;
};

// Holds a contract for the lifetime of the scope. commit() replaces the copy
// that will be written back; without it the original is returned unchanged.
class ScopedContract {
public:
    ScopedContract(ContractSet& set, const Hash& id)
        : set_(set), held_(set.acquire(id, contract_)) {}
    ~ScopedContract() {
        if (held_)
            set_.release(contract_);
    }
    ScopedContract(const ScopedContract&) = delete;
    ScopedContract& operator=(const ScopedContract&) = delete;

    bool held() const { return held_; }
    const RenterContract& get() const { return contract_; }
    void commit(const RenterContract& updated) { contract_ = updated; }

private:
    ContractSet& set_;
    RenterContract contract_;
    bool held_;
};

} // namespace mender
