#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace mender {

using Shards = std::vector<std::vector<uint8_t>>;

class ErasureCoder {
public:
    virtual ~ErasureCoder() = default;
    // Total number of pieces produced by encode().
    virtual size_t num_pieces() const = 0;
    // Number of pieces needed to recover the data.
    virtual size_t min_pieces() const = 0;
    virtual size_t shard_size(size_t data_len) const = 0;
    virtual bool encode(const std::vector<uint8_t>& data, Shards& shards) const = 0;
    // present[i] marks shards[i] as usable. Returns the first data_len bytes.
    virtual std::optional<std::vector<uint8_t>> recover(const Shards& shards,
                                                        const std::vector<bool>& present,
                                                        size_t data_len) const = 0;
};

// Interleaved XOR parity: data shard i belongs to parity group i % parity_count,
// so each group survives the loss of one of its members.
class ParityCoder : public ErasureCoder {
public:
    ParityCoder(size_t data_count, size_t parity_count)
        : data_count_(data_count), parity_count_(parity_count) {}

    size_t num_pieces() const override { return data_count_ + parity_count_; }
    size_t min_pieces() const override { return data_count_; }
    size_t shard_size(size_t data_len) const override;
    bool encode(const std::vector<uint8_t>& data, Shards& shards) const override;
    std::optional<std::vector<uint8_t>> recover(const Shards& shards,
                                                const std::vector<bool>& present,
                                                size_t data_len) const override;
private:
    size_t data_count_;
    size_t parity_count_;
};

} // namespace mender
