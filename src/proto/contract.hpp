#pragma once
#include <system_error>
#include <vector>
#include "crypto.hpp"
#include "encoding.hpp"
#include "protocol.hpp"

namespace mender {

struct UnlockConditions {
    PublicKey renter_key{};
    PublicKey host_key{};
    uint64_t signatures_required{2};

    void encode(Encoder& e) const;
    bool decode(Decoder& d);
    Hash unlock_hash() const;
};

struct ProofOutput {
    Currency value{0};
    Hash unlock_hash{};
};

struct FileContractRevision {
    Hash parent_id{};
    UnlockConditions unlock_conditions;
    uint64_t revision_number{0};
    uint64_t file_size{0};
    Hash file_merkle_root{};
    uint64_t window_start{0};
    uint64_t window_end{0};
    std::vector<ProofOutput> valid_proof_outputs;
    std::vector<ProofOutput> missed_proof_outputs;
    Hash unlock_hash{};

    void encode(Encoder& e) const;
    bool decode(Decoder& d);
    // The message both parties sign.
    Hash sig_hash() const;
};

// A revision together with the signatures that make it enforceable.
struct SignedRevision {
    FileContractRevision revision;
    std::vector<TransactionSignature> signatures;

    void encode(Encoder& e) const;
    bool decode(Decoder& d);
    // True if both the renter and the host have validly signed.
    bool fully_signed() const;
};

bool verify_revision_signature(const FileContractRevision& rev, const TransactionSignature& sig);
TransactionSignature sign_revision(const FileContractRevision& rev, uint64_t key_index, const SecretKey& sk);

struct RenterContract {
    Hash id{};
    PublicKey host_public_key{};
    FileContractRevision last_revision;
    SignedRevision last_revision_txn;
    SecretKey secret_key{};
    Currency download_spending{0};
    std::vector<Hash> merkle_roots;

    Currency renter_funds() const;

    void encode(Encoder& e) const;
    bool decode(Decoder& d);
};

// Builds the revision that pays `cost` from renter to host. Fails with
// insufficient_funds or currency_overflow instead of wrapping.
std::error_code new_download_revision(const FileContractRevision& current, Currency cost,
                                      FileContractRevision& out);

} // namespace mender
