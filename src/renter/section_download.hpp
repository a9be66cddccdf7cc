#pragma once
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <system_error>
#include <vector>
#include "chunk.hpp"
#include "stop_signal.hpp"

namespace mender {

// Completion handle for a ranged download of a file section.
class PendingDownload {
public:
    void finish(std::vector<uint8_t> data, std::error_code ec);
    bool finished() const;
    // Blocks until the download finishes or stop fires; stop wins with
    // errc::interrupted.
    std::error_code wait(StopSignal* stop, std::vector<uint8_t>& data);

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool done_{false};
    std::vector<uint8_t> data_;
    std::error_code err_;
};

class SectionDownloader {
public:
    virtual ~SectionDownloader() = default;
    virtual std::shared_ptr<PendingDownload> start(const RenterFile& file, uint64_t offset,
                                                   uint64_t length) = 0;
};

} // namespace mender
