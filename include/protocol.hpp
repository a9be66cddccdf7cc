#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "crypto.hpp"
#include "encoding.hpp"

namespace mender {

constexpr uint64_t kSectorSize = uint64_t(1) << 22; // 4 MiB

using Currency = uint64_t;

// To absorb small pricing drift between renter and host, sector prices are
// inflated by 0.2% (1/500).
constexpr uint64_t kHostPriceLeewayDivisor = 500;

constexpr size_t kSpecifierSize = 16;
using Specifier = std::array<uint8_t, kSpecifierSize>;
Specifier make_specifier(const char* name);
extern const Specifier kRPCDownload;

// Negotiation replies
extern const char* const kAcceptResponse;
extern const char* const kStopResponse;
constexpr uint64_t kMaxResponseLen = 128;

// Size limits for objects read from a host
constexpr uint64_t kMaxHostSettingsLen = 16 * 1024;
constexpr uint64_t kMaxRevisionLen = 2048;
constexpr uint64_t kMaxSignatureLen = 16000;
constexpr uint64_t kMaxSectorListLen = kSectorSize + 16;

constexpr std::chrono::seconds kNegotiateSettingsTime{120};
constexpr std::chrono::seconds kNegotiateRecentRevisionTime{120};
constexpr std::chrono::seconds kNegotiateRevisionTime{120};
constexpr std::chrono::seconds kNegotiateDownloadTime{600};
constexpr std::chrono::seconds kIdleSessionTime{3600};
constexpr std::chrono::seconds kDialTimeout{45};

struct HostSettings {
    bool accepting_contracts{false};
    std::string net_address;
    Currency download_bandwidth_price{0};
    uint64_t max_download_batch_size{0};
    uint64_t revision_number{0};
    std::string version;

    void encode(Encoder& e) const;
    bool decode(Decoder& d);
};

struct DownloadAction {
    Hash merkle_root{};
    uint64_t offset{0};
    uint64_t length{0};

    void encode(Encoder& e) const;
    bool decode(Decoder& d);
};

enum : uint64_t { kRenterKeyIndex = 0, kHostKeyIndex = 1 };

struct TransactionSignature {
    Hash parent_id{};
    uint64_t public_key_index{0};
    uint64_t covered_revision{0};
    Signature signature{};

    void encode(Encoder& e) const;
    bool decode(Decoder& d);
};

std::vector<uint8_t> encode_action_list(const std::vector<DownloadAction>& actions);
std::vector<uint8_t> encode_sector_list(const std::vector<std::vector<uint8_t>>& sectors);
bool decode_sector_list(const std::vector<uint8_t>& body, std::vector<std::vector<uint8_t>>& sectors);

} // namespace mender
