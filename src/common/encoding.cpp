#include "encoding.hpp"

namespace mender {

void Encoder::write_u64(uint64_t v) {
  for (int i = 0; i < 8; i++)
    buf_.push_back((uint8_t)(v >> (8 * i)));
}

void Encoder::write_bytes(const uint8_t *data, size_t len) {
  write_u64(len);
  buf_.insert(buf_.end(), data, data + len);
}

void Encoder::write_string(const std::string &s) {
  write_bytes(reinterpret_cast<const uint8_t *>(s.data()), s.size());
}

bool Decoder::read_u64(uint64_t &v) {
  if (!ok_ || remaining() < 8)
    return fail();
  v = 0;
  for (int i = 0; i < 8; i++)
    v |= (uint64_t)data_[pos_ + i] << (8 * i);
  pos_ += 8;
  return true;
}

bool Decoder::read_u8(uint8_t &v) {
  if (!ok_ || remaining() < 1)
    return fail();
  v = data_[pos_++];
  return true;
}

bool Decoder::read_bool(bool &v) {
  uint8_t b;
  if (!read_u8(b) || b > 1)
    return fail();
  v = b == 1;
  return true;
}

bool Decoder::read_bytes(std::vector<uint8_t> &out, uint64_t max_len) {
  uint64_t n;
  if (!read_u64(n))
    return false;
  if (n > max_len || n > remaining())
    return fail();
  out.assign(data_ + pos_, data_ + pos_ + n);
  pos_ += n;
  return true;
}

bool Decoder::read_string(std::string &out, uint64_t max_len) {
  std::vector<uint8_t> raw;
  if (!read_bytes(raw, max_len))
    return false;
  out.assign(raw.begin(), raw.end());
  return true;
}

bool Decoder::read_count(uint64_t &n, size_t min_elem_size) {
  if (!read_u64(n))
    return false;
  if (min_elem_size > 0 && n > remaining() / min_elem_size)
    return fail();
  return true;
}

} // namespace mender
