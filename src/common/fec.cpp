#include "fec.hpp"
#include "crypto.hpp"
#include <algorithm>
#include <cstring>

namespace mender {

size_t ParityCoder::shard_size(size_t data_len) const {
  if (data_count_ == 0)
    return 0;
  size_t n = (data_len + data_count_ - 1) / data_count_;
  // pieces are kept segment aligned
  return (n + kSegmentSize - 1) / kSegmentSize * kSegmentSize;
}

bool ParityCoder::encode(const std::vector<uint8_t> &data,
                         Shards &shards) const {
  shards.clear();
  if (data_count_ == 0 || data.empty())
    return false;
  size_t total = data.size();
  size_t size = shard_size(total);
  shards.resize(num_pieces(), std::vector<uint8_t>(size, 0));

  size_t offset = 0;
  for (size_t i = 0; i < data_count_ && offset < total; i++) {
    size_t n = std::min(size, total - offset);
    std::memcpy(shards[i].data(), data.data() + offset, n);
    offset += n;
  }

  for (size_t i = 0; i < data_count_ && parity_count_ > 0; i++) {
    auto &p = shards[data_count_ + i % parity_count_];
    for (size_t j = 0; j < size; j++)
      p[j] ^= shards[i][j];
  }
  return true;
}

std::optional<std::vector<uint8_t>>
ParityCoder::recover(const Shards &shards, const std::vector<bool> &present,
                     size_t data_len) const {
  if (shards.size() != num_pieces() || present.size() != num_pieces())
    return std::nullopt;
  size_t size = shard_size(data_len);
  Shards data(data_count_);
  for (size_t i = 0; i < data_count_; i++) {
    if (present[i]) {
      if (shards[i].size() != size)
        return std::nullopt;
      data[i] = shards[i];
      continue;
    }
    if (parity_count_ == 0)
      return std::nullopt;
    size_t group = i % parity_count_;
    if (!present[data_count_ + group] ||
        shards[data_count_ + group].size() != size)
      return std::nullopt;
    std::vector<uint8_t> rec = shards[data_count_ + group];
    for (size_t k = group; k < data_count_; k += parity_count_) {
      if (k == i)
        continue;
      if (!present[k] || shards[k].size() != size)
        return std::nullopt; // two losses in one group
      for (size_t j = 0; j < size; j++)
        rec[j] ^= shards[k][j];
    }
    data[i] = std::move(rec);
  }

  std::vector<uint8_t> out;
  out.reserve(data_count_ * size);
  for (auto &d : data)
    out.insert(out.end(), d.begin(), d.end());
  if (out.size() < data_len)
    return std::nullopt;
  out.resize(data_len);
  return out;
}

} // namespace mender
