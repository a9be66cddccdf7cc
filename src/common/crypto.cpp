#include "crypto.hpp"
#include "util.hpp"
#include <algorithm>
#include <cstring>
#include <sodium.h>

namespace mender {

static_assert(crypto_sign_PUBLICKEYBYTES == kPublicKeySize, "ed25519 key size");
static_assert(crypto_sign_SECRETKEYBYTES == kSecretKeySize, "ed25519 secret size");
static_assert(crypto_sign_BYTES == kSignatureSize, "ed25519 signature size");

static constexpr uint8_t kLeafPrefix = 0x00;
static constexpr uint8_t kNodePrefix = 0x01;

bool crypto_init() { return sodium_init() >= 0; }

Hash hash_bytes(const uint8_t *data, size_t len) {
  Hash h{};
  crypto_generichash(h.data(), h.size(), data, len, nullptr, 0);
  return h;
}

Hash hash_bytes(const std::vector<uint8_t> &data) {
  return hash_bytes(data.data(), data.size());
}

std::string hash_hex(const Hash &h) { return bytes_to_hex(h.data(), h.size()); }

Hash MerkleTree::join(const Hash &left, const Hash &right) {
  crypto_generichash_state st;
  crypto_generichash_init(&st, nullptr, 0, kHashSize);
  crypto_generichash_update(&st, &kNodePrefix, 1);
  crypto_generichash_update(&st, left.data(), left.size());
  crypto_generichash_update(&st, right.data(), right.size());
  Hash out{};
  crypto_generichash_final(&st, out.data(), out.size());
  return out;
}

void MerkleTree::push(const uint8_t *segment, size_t len) {
  crypto_generichash_state st;
  crypto_generichash_init(&st, nullptr, 0, kHashSize);
  crypto_generichash_update(&st, &kLeafPrefix, 1);
  crypto_generichash_update(&st, segment, len);
  SubTree leaf;
  crypto_generichash_final(&st, leaf.sum.data(), leaf.sum.size());
  leaf.height = 0;
  stack_.push_back(leaf);
  leaves_++;

  // collapse equal-height subtrees
  while (stack_.size() >= 2 &&
         stack_[stack_.size() - 1].height == stack_[stack_.size() - 2].height) {
    SubTree right = stack_.back();
    stack_.pop_back();
    SubTree &left = stack_.back();
    left.sum = join(left.sum, right.sum);
    left.height++;
  }
}

Hash MerkleTree::root() const {
  if (stack_.empty())
    return Hash{};
  Hash acc = stack_.back().sum;
  for (size_t i = stack_.size() - 1; i-- > 0;)
    acc = join(stack_[i].sum, acc);
  return acc;
}

Hash merkle_root(const std::vector<uint8_t> &data) {
  MerkleTree tree;
  size_t off = 0;
  while (off < data.size()) {
    size_t n = std::min(kSegmentSize, data.size() - off);
    tree.push(data.data() + off, n);
    off += n;
  }
  return tree.root();
}

void generate_keypair(PublicKey &pk, SecretKey &sk) {
  crypto_sign_keypair(pk.data(), sk.data());
}

PublicKey public_key_of(const SecretKey &sk) {
  PublicKey pk{};
  crypto_sign_ed25519_sk_to_pk(pk.data(), sk.data());
  return pk;
}

Signature sign_hash(const Hash &h, const SecretKey &sk) {
  Signature sig{};
  crypto_sign_detached(sig.data(), nullptr, h.data(), h.size(), sk.data());
  return sig;
}

bool verify_hash(const Hash &h, const PublicKey &pk, const Signature &sig) {
  return crypto_sign_verify_detached(sig.data(), h.data(), h.size(),
                                     pk.data()) == 0;
}

} // namespace mender
