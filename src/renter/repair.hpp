#pragma once
#include <memory>
#include <system_error>
#include "chunk.hpp"
#include "memory.hpp"
#include "section_download.hpp"
#include "stop_signal.hpp"
#include "worker_pool.hpp"

namespace mender {

// Turns an under-replicated chunk into the physical pieces that still need
// uploading and hands them to the workers. Safe to run concurrently for
// different chunks.
class ChunkRepairer {
public:
    ChunkRepairer(SectionDownloader& downloader, MemoryAccountant& memory, WorkerPool& workers,
                  StopSignal& stop)
        : downloader_(downloader), memory_(memory), workers_(workers), stop_(stop) {}

    // Network fetches are only worth it once more than a quarter of the
    // chunk's redundancy is missing.
    static bool should_download(const UnfinishedChunk& chunk);

    // Fills chunk.logical_chunk_data from disk, falling back to the network
    // only when allow_download is set.
    std::error_code fetch_logical_data(UnfinishedChunk& chunk, bool allow_download);
    std::error_code download_logical_data(UnfinishedChunk& chunk);

    // Failures are logged and leave the chunk for a later attempt.
    std::error_code repair_chunk(const std::shared_ptr<UnfinishedChunk>& chunk);

private:
    std::error_code read_local(UnfinishedChunk& chunk);

    SectionDownloader& downloader_;
    MemoryAccountant& memory_;
    WorkerPool& workers_;
    StopSignal& stop_;
};

} // namespace mender
