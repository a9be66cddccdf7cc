#include "downloader.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <limits>

namespace mender {

std::error_code sector_price(Currency bandwidth_price, Currency &out) {
  if (bandwidth_price > std::numeric_limits<Currency>::max() / kSectorSize)
    return errc::currency_overflow;
  out = bandwidth_price * kSectorSize;
  return {};
}

std::error_code apply_price_leeway(Currency price, Currency &out) {
  Currency fudge = price / kHostPriceLeewayDivisor;
  if (price > std::numeric_limits<Currency>::max() - fudge)
    return errc::currency_overflow;
  out = price + fudge;
  return {};
}

SectorDownloader::SectorDownloader(const HostEntry &host,
                                   const Hash &contract_id,
                                   ContractSet &contracts, HostDB &hdb,
                                   StopSignal *cancel,
                                   const DownloaderConfig &cfg)
    : host_(host), contract_id_(contract_id), contracts_(contracts), hdb_(hdb),
      cancel_(cancel), cfg_(cfg) {}

SectorDownloader::~SectorDownloader() { close(); }

std::unique_ptr<SectorDownloader>
SectorDownloader::connect(const HostEntry &host, const Hash &contract_id,
                          ContractSet &contracts, HostDB &hdb,
                          StopSignal *cancel, std::error_code &ec,
                          const DownloaderConfig &cfg) {
  ec.clear();
  auto contract = contracts.view(contract_id);
  if (!contract || contract->last_revision.valid_proof_outputs.size() != 2) {
    ec = errc::invalid_contract;
    return nullptr;
  }
  Currency price = 0;
  if ((ec = sector_price(host.download_bandwidth_price, price)))
    return nullptr;
  if (contract->renter_funds() < price) {
    ec = errc::insufficient_funds;
    return nullptr;
  }

  std::unique_ptr<SectorDownloader> d(
      new SectorDownloader(host, contract_id, contracts, hdb, cancel, cfg));
  ec = d->handshake(*contract);
  if (ec) {
    d->abandon();
    // a revision mismatch might not be the host's fault
    if (!is_revision_mismatch(ec))
      hdb.increment_failed_interactions(contract->host_public_key);
    Logger::instance().log(LogLevel::WARN,
                           "download session with %s failed: %s (%s)",
                           host.net_address.c_str(), ec.message().c_str(),
                           error_class_name(classify(ec)));
    return nullptr;
  }
  hdb.increment_successful_interactions(contract->host_public_key);
  return d;
}

std::error_code SectorDownloader::handshake(const RenterContract &contract) {
  if (auto ec = conn_.dial(host_.net_address, cfg_.dial_timeout, cancel_))
    return ec;
  if (cancel_)
    watcher_.reset(new StopSubscription(cancel_, [this] { on_cancel(); }));

  ScopedDeadline deadline(conn_, cfg_.recent_revision_timeout,
                          cfg_.idle_timeout);
  Encoder e;
  e.write_fixed(kRPCDownload);
  if (auto ec = conn_.write_object(e.data())) {
    if (is_interruption(ec))
      return ec;
    Logger::instance().log(LogLevel::WARN, "couldn't initiate RPC: %s",
                           ec.message().c_str());
    return errc::rpc_init_failed;
  }
  return verify_recent_revision(contract);
}

std::error_code
SectorDownloader::verify_recent_revision(const RenterContract &contract) {
  Encoder id;
  id.write_fixed(contract.id);
  if (auto ec = conn_.write_object(id.data()))
    return ec;

  std::vector<uint8_t> body;
  if (auto ec = conn_.read_object(body, kHashSize))
    return ec;
  Hash challenge{};
  Decoder cd(body);
  if (!cd.read_fixed(challenge) || !cd.done())
    return errc::malformed_object;

  Encoder sig;
  sig.write_fixed(sign_hash(challenge, contract.secret_key));
  if (auto ec = conn_.write_object(sig.data()))
    return ec;
  if (auto ec = read_acceptance("revision request", nullptr))
    return ec;

  FileContractRevision last;
  if (auto ec = conn_.read_object(body, kMaxRevisionLen))
    return ec;
  Decoder rd(body);
  if (!last.decode(rd) || !rd.done())
    return errc::malformed_object;

  std::vector<TransactionSignature> sigs;
  if (auto ec = conn_.read_object(body, kMaxRevisionLen))
    return ec;
  Decoder sd(body);
  uint64_t n = 0;
  if (!sd.read_count(n, kHashSize + 16 + kSignatureSize))
    return errc::malformed_object;
  sigs.resize(n);
  for (auto &s : sigs) {
    if (!s.decode(sd))
      return errc::malformed_object;
  }
  if (!sd.done())
    return errc::malformed_object;

  if (last.unlock_conditions.unlock_hash() !=
      contract.last_revision.unlock_conditions.unlock_hash())
    return errc::unlock_conditions_mismatch;
  if (last.revision_number != contract.last_revision.revision_number) {
    Logger::instance().log(
        LogLevel::WARN,
        "revision mismatch with %s: ours %llu, host has %llu",
        host_.net_address.c_str(),
        (unsigned long long)contract.last_revision.revision_number,
        (unsigned long long)last.revision_number);
    return errc::revision_mismatch;
  }

  bool host_signed = false;
  for (const auto &s : sigs) {
    if (!verify_revision_signature(last, s))
      return errc::bad_host_signature;
    if (s.public_key_index == kHostKeyIndex)
      host_signed = true;
  }
  if (!host_signed)
    return errc::bad_host_signature;
  return {};
}

std::error_code SectorDownloader::sector(const Hash &root,
                                         std::vector<uint8_t> &out) {
  out.clear();
  if (closed() || !conn_.is_open())
    return conn_.interrupted() ? make_error_code(errc::interrupted)
                               : make_error_code(errc::connection_closed);
  ScopedDeadline deadline(conn_, cfg_.settings_timeout, cfg_.idle_timeout);

  ScopedContract held(contracts_, contract_id_);
  if (!held.held())
    return errc::contract_not_present;
  const RenterContract &contract = held.get();

  Currency price = 0;
  if (auto ec = sector_price(host_.download_bandwidth_price, price))
    return ec;
  if (auto ec = apply_price_leeway(price, price))
    return ec;
  if (contract.renter_funds() < price)
    return errc::insufficient_funds;
  if (contract.download_spending >
      std::numeric_limits<Currency>::max() - price)
    return errc::currency_overflow;
  FileContractRevision rev;
  if (auto ec = new_download_revision(contract.last_revision, price, rev))
    return ec;

  SignedRevision signed_rev;
  bool stop_response = false;
  std::error_code ec =
      exchange(contract, root, rev, signed_rev, stop_response, out);
  if (ec) {
    out.clear();
    hdb_.increment_failed_interactions(contract.host_public_key);
    Logger::instance().log(LogLevel::WARN, "sector %s from %s failed: %s (%s)",
                           hash_hex(root).c_str(), host_.net_address.c_str(),
                           ec.message().c_str(),
                           error_class_name(classify(ec)));
  } else {
    hdb_.increment_successful_interactions(contract.host_public_key);
  }
  if (ec) {
    // Either framing is lost or the host has signed a revision we did not
    // keep, so the session cannot continue. Skip the stop round-trip.
    abandon();
  } else if (stop_response) {
    // the host ended the session; the next call will fail
    Logger::instance().log(LogLevel::INFO, "host %s sent stop, closing",
                           host_.net_address.c_str());
    abandon();
  }
  if (ec)
    return ec;

  RenterContract updated = contract;
  updated.last_revision = rev;
  updated.last_revision_txn = signed_rev;
  updated.download_spending += price;
  held.commit(updated);
  return {};
}

std::error_code SectorDownloader::exchange(const RenterContract &contract,
                                           const Hash &root,
                                           const FileContractRevision &rev,
                                           SignedRevision &signed_rev,
                                           bool &stop_response,
                                           std::vector<uint8_t> &out) {
  conn_.extend_deadline(cfg_.settings_timeout);
  HostSettings settings;
  if (auto ec = verify_settings(settings))
    return ec;
  if (auto ec = write_response(kAcceptResponse))
    return ec;

  conn_.extend_deadline(cfg_.revision_timeout);
  DownloadAction action;
  action.merkle_root = root;
  action.offset = 0;
  action.length = kSectorSize;
  if (auto ec = conn_.write_object(encode_action_list({action})))
    return ec;

  // The host may or may not receive the new signature if we die during the
  // exchange, so record the current revision as the fallback first.
  if (save_fn_) {
    if (auto ec = save_fn_(contract.last_revision, contract.merkle_roots)) {
      Logger::instance().log(LogLevel::ERROR,
                             "failed to save fallback revision: %s",
                             ec.message().c_str());
      return ec;
    }
  }

  conn_.extend_deadline(cfg_.revision_timeout);
  if (auto ec =
          negotiate_revision(rev, contract.secret_key, signed_rev, stop_response))
    return ec;

  conn_.extend_deadline(cfg_.download_timeout);
  std::vector<uint8_t> body;
  if (auto ec = conn_.read_object(body, kMaxSectorListLen))
    return ec;
  std::vector<std::vector<uint8_t>> sectors;
  if (!decode_sector_list(body, sectors))
    return errc::malformed_object;
  body.clear();
  body.shrink_to_fit();
  if (sectors.size() != 1)
    return errc::wrong_sector_count;
  if (sectors[0].size() != kSectorSize)
    return errc::short_sector;
  if (merkle_root(sectors[0]) != root)
    return errc::bad_sector_data;
  out = std::move(sectors[0]);
  return {};
}

std::error_code SectorDownloader::negotiate_revision(
    const FileContractRevision &rev, const SecretKey &sk, SignedRevision &out,
    bool &stop_response) {
  TransactionSignature renter_sig = sign_revision(rev, kRenterKeyIndex, sk);

  Encoder re;
  rev.encode(re);
  if (auto ec = conn_.write_object(re.data()))
    return ec;
  if (auto ec = read_acceptance("revision", nullptr))
    return ec;

  Encoder se;
  renter_sig.encode(se);
  if (auto ec = conn_.write_object(se.data()))
    return ec;
  // a stop here still carries the host's signature
  if (auto ec = read_acceptance("transaction signature", &stop_response))
    return ec;

  std::vector<uint8_t> body;
  if (auto ec = conn_.read_object(body, kMaxSignatureLen))
    return ec;
  TransactionSignature host_sig;
  Decoder d(body);
  if (!host_sig.decode(d) || !d.done())
    return errc::malformed_object;

  out.revision = rev;
  out.signatures = {renter_sig, host_sig};
  if (host_sig.public_key_index != kHostKeyIndex || !out.fully_signed())
    return errc::bad_host_signature;
  return {};
}

std::error_code SectorDownloader::verify_settings(HostSettings &out) {
  std::vector<uint8_t> body;
  if (auto ec = conn_.read_object(body, kMaxHostSettingsLen))
    return ec;
  std::vector<uint8_t> sig_body;
  if (auto ec = conn_.read_object(sig_body, kSignatureSize))
    return ec;
  Signature sig{};
  Decoder sd(sig_body);
  if (!sd.read_fixed(sig) || !sd.done())
    return errc::malformed_object;
  if (!verify_hash(hash_bytes(body), host_.public_key, sig))
    return errc::bad_host_signature;
  Decoder d(body);
  if (!out.decode(d) || !d.done())
    return errc::malformed_object;
  return {};
}

std::error_code SectorDownloader::read_acceptance(const char *what,
                                                  bool *stop_response) {
  std::vector<uint8_t> body;
  if (auto ec = conn_.read_object(body, kMaxResponseLen))
    return ec;
  std::string resp;
  Decoder d(body);
  if (!d.read_string(resp, kMaxResponseLen) || !d.done())
    return errc::malformed_object;
  if (resp == kAcceptResponse)
    return {};
  if (resp == kStopResponse && stop_response) {
    *stop_response = true;
    return {};
  }
  Logger::instance().log(LogLevel::WARN, "host %s did not accept %s: %s",
                         host_.net_address.c_str(), what, resp.c_str());
  return errc::host_rejected;
}

std::error_code SectorDownloader::write_response(const char *resp) {
  Encoder e;
  e.write_string(resp);
  return conn_.write_object(e.data());
}

void SectorDownloader::graceful_shutdown() {
  ScopedDeadline deadline(conn_, cfg_.settings_timeout, cfg_.idle_timeout);
  HostSettings settings;
  // errors are irrelevant at this point
  (void)verify_settings(settings);
  (void)write_response(kStopResponse);
}

void SectorDownloader::close() {
  std::lock_guard<std::mutex> lk(close_mtx_);
  State expected = State::Open;
  if (state_.compare_exchange_strong(expected, State::Closed) &&
      conn_.is_open())
    graceful_shutdown();
  watcher_.reset();
  conn_.close();
}

void SectorDownloader::abandon() {
  std::lock_guard<std::mutex> lk(close_mtx_);
  state_ = State::Closed;
  watcher_.reset();
  conn_.close();
}

void SectorDownloader::on_cancel() {
  state_ = State::Closed;
  conn_.interrupt();
}

} // namespace mender
