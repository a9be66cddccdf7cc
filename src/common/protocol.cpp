#include "protocol.hpp"
#include <algorithm>
#include <cstring>

namespace mender {

Specifier make_specifier(const char *name) {
  Specifier s{};
  size_t n = std::min(std::strlen(name), s.size());
  std::memcpy(s.data(), name, n);
  return s;
}

const Specifier kRPCDownload = make_specifier("Download");

const char *const kAcceptResponse = "accept";
const char *const kStopResponse = "stop";

void HostSettings::encode(Encoder &e) const {
  e.write_bool(accepting_contracts);
  e.write_string(net_address);
  e.write_u64(download_bandwidth_price);
  e.write_u64(max_download_batch_size);
  e.write_u64(revision_number);
  e.write_string(version);
}

bool HostSettings::decode(Decoder &d) {
  return d.read_bool(accepting_contracts) &&
         d.read_string(net_address, 256) &&
         d.read_u64(download_bandwidth_price) &&
         d.read_u64(max_download_batch_size) && d.read_u64(revision_number) &&
         d.read_string(version, 64);
}

void DownloadAction::encode(Encoder &e) const {
  e.write_fixed(merkle_root);
  e.write_u64(offset);
  e.write_u64(length);
}

bool DownloadAction::decode(Decoder &d) {
  return d.read_fixed(merkle_root) && d.read_u64(offset) && d.read_u64(length);
}

void TransactionSignature::encode(Encoder &e) const {
  e.write_fixed(parent_id);
  e.write_u64(public_key_index);
  e.write_u64(covered_revision);
  e.write_fixed(signature);
}

bool TransactionSignature::decode(Decoder &d) {
  return d.read_fixed(parent_id) && d.read_u64(public_key_index) &&
         d.read_u64(covered_revision) && d.read_fixed(signature);
}

std::vector<uint8_t>
encode_action_list(const std::vector<DownloadAction> &actions) {
  Encoder e;
  e.write_u64(actions.size());
  for (const auto &a : actions)
    a.encode(e);
  return e.take();
}

std::vector<uint8_t>
encode_sector_list(const std::vector<std::vector<uint8_t>> &sectors) {
  Encoder e;
  e.write_u64(sectors.size());
  for (const auto &s : sectors)
    e.write_bytes(s);
  return e.take();
}

bool decode_sector_list(const std::vector<uint8_t> &body,
                        std::vector<std::vector<uint8_t>> &sectors) {
  Decoder d(body);
  uint64_t n;
  if (!d.read_count(n, 8))
    return false;
  sectors.clear();
  sectors.resize(n);
  for (uint64_t i = 0; i < n; i++) {
    if (!d.read_bytes(sectors[i], kSectorSize))
      return false;
  }
  return d.done();
}

} // namespace mender
