#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <system_error>
#include <vector>
#include "connection.hpp"
#include "contract_set.hpp"
#include "host_db.hpp"
#include "revision_store.hpp"
#include "stop_signal.hpp"

namespace mender {

struct DownloaderConfig {
    std::chrono::milliseconds dial_timeout{kDialTimeout};
    std::chrono::milliseconds settings_timeout{kNegotiateSettingsTime};
    std::chrono::milliseconds recent_revision_timeout{kNegotiateRecentRevisionTime};
    std::chrono::milliseconds revision_timeout{kNegotiateRevisionTime};
    std::chrono::milliseconds download_timeout{kNegotiateDownloadTime};
    std::chrono::milliseconds idle_timeout{kIdleSessionTime};
};

// bandwidth_price * kSectorSize
std::error_code sector_price(Currency bandwidth_price, Currency& out);
// price inflated by the 0.2% host price leeway
std::error_code apply_price_leeway(Currency price, Currency& out);

// Retrieves sectors from one host over one contract, paying for each with a
// new signed revision. Not thread-safe: calls to sector() must be serialized.
// close() may be called from any thread.
class SectorDownloader {
public:
    // Dials the host and agrees on the most recent revision. Returns null and
    // sets ec on failure. cancel, if given, must outlive the downloader.
    static std::unique_ptr<SectorDownloader> connect(const HostEntry& host, const Hash& contract_id,
                                                     ContractSet& contracts, HostDB& hdb,
                                                     StopSignal* cancel, std::error_code& ec,
                                                     const DownloaderConfig& cfg = DownloaderConfig());
    ~SectorDownloader();
    SectorDownloader(const SectorDownloader&) = delete;
    SectorDownloader& operator=(const SectorDownloader&) = delete;

    // Downloads the sector with Merkle root `root` and revises the contract to
    // pay for it. On error `out` is empty and the contract is unchanged.
    std::error_code sector(const Hash& root, std::vector<uint8_t>& out);

    void close();
    bool closed() const { return state_.load() == State::Closed; }

    void set_revision_saver(RevisionSaver fn) { save_fn_ = std::move(fn); }
    const Hash& contract_id() const { return contract_id_; }
    const HostEntry& host() const { return host_; }

private:
    enum class State { Open, Closed };

    SectorDownloader(const HostEntry& host, const Hash& contract_id, ContractSet& contracts,
                     HostDB& hdb, StopSignal* cancel, const DownloaderConfig& cfg);

    std::error_code handshake(const RenterContract& contract);
    std::error_code verify_recent_revision(const RenterContract& contract);
    std::error_code exchange(const RenterContract& contract, const Hash& root,
                             const FileContractRevision& rev, SignedRevision& signed_rev,
                             bool& stop_response, std::vector<uint8_t>& out);
    std::error_code negotiate_revision(const FileContractRevision& rev, const SecretKey& sk,
                                       SignedRevision& out, bool& stop_response);
    std::error_code verify_settings(HostSettings& out);
    std::error_code read_acceptance(const char* what, bool* stop_response);
    std::error_code write_response(const char* resp);
    void graceful_shutdown();
    void abandon();
    void on_cancel();

    HostEntry host_;
    Hash contract_id_;
    ContractSet& contracts_;
    HostDB& hdb_;
    StopSignal* cancel_;
    DownloaderConfig cfg_;
    RevisionSaver save_fn_;

    Connection conn_;
    std::atomic<State> state_{State::Open};
    std::mutex close_mtx_;
    std::unique_ptr<StopSubscription> watcher_;
};

} // namespace mender
