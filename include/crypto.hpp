#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mender {

constexpr size_t kHashSize = 32;
constexpr size_t kPublicKeySize = 32;
constexpr size_t kSecretKeySize = 64;
constexpr size_t kSignatureSize = 64;
constexpr size_t kSegmentSize = 64;

using Hash = std::array<uint8_t, kHashSize>;
using PublicKey = std::array<uint8_t, kPublicKeySize>;
using SecretKey = std::array<uint8_t, kSecretKeySize>;
using Signature = std::array<uint8_t, kSignatureSize>;

// Must be called once before any other function here; safe to call repeatedly.
bool crypto_init();

Hash hash_bytes(const uint8_t* data, size_t len);
Hash hash_bytes(const std::vector<uint8_t>& data);
std::string hash_hex(const Hash& h);

// Binary Merkle tree over fixed-size segments. Leaves are H(0x00 || segment),
// interior nodes H(0x01 || left || right).
class MerkleTree {
public:
    void push(const uint8_t* segment, size_t len);
    Hash root() const;
    size_t leaves() const { return leaves_; }
private:
    struct SubTree {
        Hash sum;
        int height;
    };
    std::vector<SubTree> stack_;
    size_t leaves_{0};
    static Hash join(const Hash& left, const Hash& right);
};

Hash merkle_root(const std::vector<uint8_t>& data);

void generate_keypair(PublicKey& pk, SecretKey& sk);
PublicKey public_key_of(const SecretKey& sk);
Signature sign_hash(const Hash& h, const SecretKey& sk);
bool verify_hash(const Hash& h, const PublicKey& pk, const Signature& sig);

} // namespace mender
