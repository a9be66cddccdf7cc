#pragma once
#include <string>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace mender {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
std::vector<uint8_t> hex_to_bytes(const std::string& hex);
std::string bytes_to_hex(const uint8_t* data, size_t len);

} // namespace mender
