#include "contract.hpp"
#include "errors.hpp"
#include <limits>

namespace mender {

namespace {

void encode_outputs(Encoder &e, const std::vector<ProofOutput> &outs) {
  e.write_u64(outs.size());
  for (const auto &o : outs) {
    e.write_u64(o.value);
    e.write_fixed(o.unlock_hash);
  }
}

bool decode_outputs(Decoder &d, std::vector<ProofOutput> &outs) {
  uint64_t n;
  if (!d.read_count(n, 8 + kHashSize))
    return false;
  outs.resize(n);
  for (auto &o : outs) {
    if (!d.read_u64(o.value) || !d.read_fixed(o.unlock_hash))
      return false;
  }
  return true;
}

} // namespace

void UnlockConditions::encode(Encoder &e) const {
  e.write_fixed(renter_key);
  e.write_fixed(host_key);
  e.write_u64(signatures_required);
}

bool UnlockConditions::decode(Decoder &d) {
  return d.read_fixed(renter_key) && d.read_fixed(host_key) &&
         d.read_u64(signatures_required);
}

Hash UnlockConditions::unlock_hash() const {
  Encoder e;
  encode(e);
  return hash_bytes(e.data());
}

void FileContractRevision::encode(Encoder &e) const {
  e.write_fixed(parent_id);
  unlock_conditions.encode(e);
  e.write_u64(revision_number);
  e.write_u64(file_size);
  e.write_fixed(file_merkle_root);
  e.write_u64(window_start);
  e.write_u64(window_end);
  encode_outputs(e, valid_proof_outputs);
  encode_outputs(e, missed_proof_outputs);
  e.write_fixed(unlock_hash);
}

bool FileContractRevision::decode(Decoder &d) {
  return d.read_fixed(parent_id) && unlock_conditions.decode(d) &&
         d.read_u64(revision_number) && d.read_u64(file_size) &&
         d.read_fixed(file_merkle_root) && d.read_u64(window_start) &&
         d.read_u64(window_end) && decode_outputs(d, valid_proof_outputs) &&
         decode_outputs(d, missed_proof_outputs) && d.read_fixed(unlock_hash);
}

Hash FileContractRevision::sig_hash() const {
  Encoder e;
  encode(e);
  return hash_bytes(e.data());
}

void SignedRevision::encode(Encoder &e) const {
  revision.encode(e);
  e.write_u64(signatures.size());
  for (const auto &s : signatures)
    s.encode(e);
}

bool SignedRevision::decode(Decoder &d) {
  uint64_t n;
  if (!revision.decode(d) || !d.read_count(n, kHashSize + 16 + kSignatureSize))
    return false;
  signatures.resize(n);
  for (auto &s : signatures) {
    if (!s.decode(d))
      return false;
  }
  return true;
}

bool SignedRevision::fully_signed() const {
  bool renter = false, host = false;
  for (const auto &s : signatures) {
    if (!verify_revision_signature(revision, s))
      return false;
    if (s.public_key_index == kRenterKeyIndex)
      renter = true;
    else if (s.public_key_index == kHostKeyIndex)
      host = true;
  }
  return renter && host;
}

bool verify_revision_signature(const FileContractRevision &rev,
                               const TransactionSignature &sig) {
  if (sig.parent_id != rev.parent_id || sig.covered_revision != 0)
    return false;
  const PublicKey *pk = nullptr;
  if (sig.public_key_index == kRenterKeyIndex)
    pk = &rev.unlock_conditions.renter_key;
  else if (sig.public_key_index == kHostKeyIndex)
    pk = &rev.unlock_conditions.host_key;
  else
    return false;
  return verify_hash(rev.sig_hash(), *pk, sig.signature);
}

TransactionSignature sign_revision(const FileContractRevision &rev,
                                   uint64_t key_index, const SecretKey &sk) {
  TransactionSignature sig;
  sig.parent_id = rev.parent_id;
  sig.public_key_index = key_index;
  sig.covered_revision = 0;
  sig.signature = sign_hash(rev.sig_hash(), sk);
  return sig;
}

Currency RenterContract::renter_funds() const {
  if (last_revision.valid_proof_outputs.empty())
    return 0;
  return last_revision.valid_proof_outputs[0].value;
}

void RenterContract::encode(Encoder &e) const {
  e.write_fixed(id);
  e.write_fixed(host_public_key);
  last_revision.encode(e);
  last_revision_txn.encode(e);
  e.write_fixed(secret_key);
  e.write_u64(download_spending);
  e.write_u64(merkle_roots.size());
  for (const auto &r : merkle_roots)
    e.write_fixed(r);
}

bool RenterContract::decode(Decoder &d) {
  uint64_t n;
  if (!d.read_fixed(id) || !d.read_fixed(host_public_key) ||
      !last_revision.decode(d) || !last_revision_txn.decode(d) ||
      !d.read_fixed(secret_key) || !d.read_u64(download_spending) ||
      !d.read_count(n, kHashSize))
    return false;
  merkle_roots.resize(n);
  for (auto &r : merkle_roots) {
    if (!d.read_fixed(r))
      return false;
  }
  return true;
}

std::error_code new_download_revision(const FileContractRevision &current,
                                      Currency cost,
                                      FileContractRevision &out) {
  if (current.valid_proof_outputs.size() != 2 ||
      current.missed_proof_outputs.size() != 2)
    return errc::invalid_contract;
  const Currency max = std::numeric_limits<Currency>::max();
  if (current.valid_proof_outputs[0].value < cost ||
      current.missed_proof_outputs[0].value < cost)
    return errc::insufficient_funds;
  if (current.valid_proof_outputs[1].value > max - cost ||
      current.missed_proof_outputs[1].value > max - cost ||
      current.revision_number == std::numeric_limits<uint64_t>::max())
    return errc::currency_overflow;

  out = current;
  // both the valid and the missed payout move from renter to host
  out.valid_proof_outputs[0].value -= cost;
  out.valid_proof_outputs[1].value += cost;
  out.missed_proof_outputs[0].value -= cost;
  out.missed_proof_outputs[1].value += cost;
  out.revision_number++;
  return {};
}

} // namespace mender
