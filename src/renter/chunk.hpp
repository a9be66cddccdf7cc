#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "fec.hpp"

namespace mender {

struct RenterFile {
    std::string name;
    std::shared_ptr<const ErasureCoder> erasure_code;
};

// One repair attempt for one chunk. The logical and physical buffers only
// live while the chunk is being repaired.
struct UnfinishedChunk {
    std::shared_ptr<const RenterFile> renter_file;
    std::string local_path;
    uint64_t index{0};
    int64_t offset{0};
    uint64_t length{0};

    size_t pieces_needed{0};
    size_t minimum_pieces{0};
    size_t pieces_completed{0};
    std::vector<bool> piece_usage;

    std::vector<uint8_t> logical_chunk_data;
    Shards physical_chunk_data;
};

} // namespace mender
