#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mender {

// Little-endian, length-prefixed binary encoding used on the wire and on disk.
class Encoder {
public:
    void write_u64(uint64_t v);
    void write_u8(uint8_t v) { buf_.push_back(v); }
    void write_bool(bool v) { buf_.push_back(v ? 1 : 0); }
    void write_bytes(const uint8_t* data, size_t len);
    void write_bytes(const std::vector<uint8_t>& v) { write_bytes(v.data(), v.size()); }
    void write_string(const std::string& s);
    template <size_t N>
    void write_fixed(const std::array<uint8_t, N>& a) { buf_.insert(buf_.end(), a.begin(), a.end()); }

    const std::vector<uint8_t>& data() const { return buf_; }
    std::vector<uint8_t> take() { return std::move(buf_); }
private:
    std::vector<uint8_t> buf_;
};

class Decoder {
public:
    Decoder(const uint8_t* data, size_t len) : data_(data), len_(len) {}
    explicit Decoder(const std::vector<uint8_t>& v) : data_(v.data()), len_(v.size()) {}

    bool read_u64(uint64_t& v);
    bool read_u8(uint8_t& v);
    bool read_bool(bool& v);
    bool read_bytes(std::vector<uint8_t>& out, uint64_t max_len);
    bool read_string(std::string& out, uint64_t max_len);
    template <size_t N>
    bool read_fixed(std::array<uint8_t, N>& a) {
        if (!ok_ || remaining() < N) return fail();
        for (size_t i = 0; i < N; i++) a[i] = data_[pos_ + i];
        pos_ += N;
        return true;
    }
    // Reads a list length and rejects counts that cannot fit in the input.
    bool read_count(uint64_t& n, size_t min_elem_size);

    size_t remaining() const { return len_ - pos_; }
    bool ok() const { return ok_; }
    bool done() const { return ok_ && pos_ == len_; }
private:
    bool fail() { ok_ = false; return false; }
    const uint8_t* data_;
    size_t len_;
    size_t pos_{0};
    bool ok_{true};
};

} // namespace mender
