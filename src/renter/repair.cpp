#include "repair.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace mender {

bool ChunkRepairer::should_download(const UnfinishedChunk &chunk) {
  size_t redundancy = chunk.pieces_needed > chunk.minimum_pieces
                          ? chunk.pieces_needed - chunk.minimum_pieces
                          : 0;
  size_t min_missing = redundancy / 4;
  return chunk.pieces_completed + min_missing < chunk.pieces_needed;
}

std::error_code ChunkRepairer::download_logical_data(UnfinishedChunk &chunk) {
  if (!chunk.renter_file)
    return errc::file_not_local;
  auto d = downloader_.start(*chunk.renter_file, (uint64_t)chunk.offset,
                             chunk.length);
  if (!d)
    return stop_.stopped() ? make_error_code(errc::interrupted)
                           : make_error_code(errc::dial_failed);
  std::vector<uint8_t> data;
  std::error_code ec = d->wait(&stop_, data);
  if (ec == errc::interrupted) {
    Logger::instance().log(LogLevel::DEBUG,
                           "repair download of chunk %llu interrupted",
                           (unsigned long long)chunk.index);
    return ec;
  }
  if (ec)
    return ec;
  chunk.logical_chunk_data = std::move(data);
  return {};
}

std::error_code ChunkRepairer::read_local(UnfinishedChunk &chunk) {
  int fd = ::open(chunk.local_path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    Logger::instance().log(LogLevel::WARN, "chunk %llu: open %s: %s (%s)",
                           (unsigned long long)chunk.index,
                           chunk.local_path.c_str(), std::strerror(errno),
                           make_error_code(errc::open_failed).message().c_str());
    return errc::open_failed;
  }
  chunk.logical_chunk_data.resize(chunk.length);
  size_t off = 0;
  while (off < chunk.length) {
    ssize_t n = ::pread(fd, chunk.logical_chunk_data.data() + off,
                        chunk.length - off, chunk.offset + (off_t)off);
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0) {
      Logger::instance().log(LogLevel::WARN, "chunk %llu: read %s at %lld: %s",
                             (unsigned long long)chunk.index,
                             chunk.local_path.c_str(),
                             (long long)chunk.offset + (long long)off,
                             n == 0 ? "unexpected end of file"
                                    : std::strerror(errno));
      ::close(fd);
      chunk.logical_chunk_data.clear();
      chunk.logical_chunk_data.shrink_to_fit();
      return errc::read_failed;
    }
    off += (size_t)n;
  }
  ::close(fd);
  return {};
}

std::error_code ChunkRepairer::fetch_logical_data(UnfinishedChunk &chunk,
                                                  bool allow_download) {
  if (chunk.local_path.empty())
    return allow_download ? download_logical_data(chunk)
                          : make_error_code(errc::file_not_local);

  std::error_code ec = read_local(chunk);
  if (ec && allow_download)
    return download_logical_data(chunk);
  return ec;
}

std::error_code
ChunkRepairer::repair_chunk(const std::shared_ptr<UnfinishedChunk> &chunk) {
  bool download = should_download(*chunk);

  std::error_code ec = fetch_logical_data(*chunk, download);
  if (ec) {
    Logger::instance().log(LogLevel::DEBUG,
                           "fetching logical data of chunk %llu failed: %s",
                           (unsigned long long)chunk->index,
                           ec.message().c_str());
    return ec;
  }

  if (!chunk->renter_file || !chunk->renter_file->erasure_code ||
      !chunk->renter_file->erasure_code->encode(chunk->logical_chunk_data,
                                                 chunk->physical_chunk_data)) {
    Logger::instance().log(LogLevel::DEBUG,
                           "encoding physical data of chunk %llu failed",
                           (unsigned long long)chunk->index);
    uint64_t freed = chunk->logical_chunk_data.size();
    std::vector<uint8_t>().swap(chunk->logical_chunk_data);
    memory_.credit(freed);
    return errc::encode_failed;
  }
  uint64_t freed = chunk->logical_chunk_data.size();
  std::vector<uint8_t>().swap(chunk->logical_chunk_data);

  if (chunk->physical_chunk_data.size() < chunk->piece_usage.size()) {
    Logger::instance().log(
        LogLevel::CRITICAL,
        "chunk %llu: %zu physical pieces for %zu piece slots; file "
        "parameters are corrupt",
        (unsigned long long)chunk->index, chunk->physical_chunk_data.size(),
        chunk->piece_usage.size());
    memory_.credit(freed);
    return errc::pieces_mismatch;
  }

  // pieces already placed on a host are not needed again
  for (size_t i = 0; i < chunk->piece_usage.size(); i++) {
    if (chunk->piece_usage[i]) {
      freed += chunk->physical_chunk_data[i].size();
      std::vector<uint8_t>().swap(chunk->physical_chunk_data[i]);
    }
  }
  memory_.credit(freed);

  workers_.for_each(
      [&](RepairWorker &w) { w.queue_chunk_repair(chunk); });
  return {};
}

} // namespace mender
