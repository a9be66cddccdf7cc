#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include "crypto.hpp"
#include "protocol.hpp"

namespace mender {

struct HostEntry {
    PublicKey public_key{};
    std::string net_address;
    Currency download_bandwidth_price{0};
    std::string version;
};

// Success/failure counters keyed by host identity.
class HostDB {
public:
    virtual ~HostDB() = default;
    virtual void increment_successful_interactions(const PublicKey& host) = 0;
    virtual void increment_failed_interactions(const PublicKey& host) = 0;
};

class HostReputation : public HostDB {
public:
    void increment_successful_interactions(const PublicKey& host) override;
    void increment_failed_interactions(const PublicKey& host) override;
    uint64_t successes(const PublicKey& host) const;
    uint64_t failures(const PublicKey& host) const;
private:
    struct Counters {
        uint64_t success{0};
        uint64_t failure{0};
    };
    mutable std::mutex mtx_;
    std::map<PublicKey, Counters> counters_;
};

} // namespace mender
