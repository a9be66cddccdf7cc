#include "revision_store.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace mender {

static constexpr uint64_t kMaxRecordLen = 64ull << 20;

FileRevisionStore::FileRevisionStore(std::string dir) : dir_(std::move(dir)) {}

std::string FileRevisionStore::path_for(const Hash &contract_id) const {
  return dir_ + "/" + hash_hex(contract_id) + ".rev";
}

std::vector<Hash> FileRevisionStore::stored_ids() const {
  std::vector<Hash> ids;
  DIR *dir = ::opendir(dir_.c_str());
  if (!dir) {
    Logger::instance().log(LogLevel::WARN, "opendir %s: %s", dir_.c_str(),
                           std::strerror(errno));
    return ids;
  }
  static const std::string suffix = ".rev";
  while (struct dirent *ent = ::readdir(dir)) {
    std::string name = ent->d_name;
    if (name.size() != kHashSize * 2 + suffix.size() ||
        name.compare(kHashSize * 2, suffix.size(), suffix) != 0)
      continue;
    std::vector<uint8_t> raw = hex_to_bytes(name.substr(0, kHashSize * 2));
    if (raw.size() != kHashSize)
      continue;
    Hash id{};
    std::copy(raw.begin(), raw.end(), id.begin());
    ids.push_back(id);
  }
  ::closedir(dir);
  std::sort(ids.begin(), ids.end());
  return ids;
}

RevisionSaver FileRevisionStore::saver() {
  return [this](const FileContractRevision &rev,
                const std::vector<Hash> &roots) { return save(rev, roots); };
}

std::error_code FileRevisionStore::save(const FileContractRevision &rev,
                                        const std::vector<Hash> &roots) {
  Encoder e;
  rev.encode(e);
  e.write_u64(roots.size());
  for (const auto &r : roots)
    e.write_fixed(r);
  const auto &buf = e.data();

  std::string path = path_for(rev.parent_id);
  std::string tmp = path + ".tmp";
  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
  if (fd < 0) {
    Logger::instance().log(LogLevel::ERROR, "open %s: %s", tmp.c_str(),
                           std::strerror(errno));
    return errc::persist_failed;
  }
  size_t off = 0;
  while (off < buf.size()) {
    ssize_t n = ::write(fd, buf.data() + off, buf.size() - off);
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0) {
      Logger::instance().log(LogLevel::ERROR, "write %s: %s", tmp.c_str(),
                             std::strerror(errno));
      ::close(fd);
      ::unlink(tmp.c_str());
      return errc::persist_failed;
    }
    off += (size_t)n;
  }
  if (::fsync(fd) != 0) {
    Logger::instance().log(LogLevel::ERROR, "fsync %s: %s", tmp.c_str(),
                           std::strerror(errno));
    ::close(fd);
    ::unlink(tmp.c_str());
    return errc::persist_failed;
  }
  ::close(fd);
  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    Logger::instance().log(LogLevel::ERROR, "rename %s: %s", path.c_str(),
                           std::strerror(errno));
    ::unlink(tmp.c_str());
    return errc::persist_failed;
  }
  return {};
}

std::error_code FileRevisionStore::load(const Hash &contract_id,
                                        FileContractRevision &rev,
                                        std::vector<Hash> &roots) const {
  std::string path = path_for(contract_id);
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0)
    return std::error_code(errno, std::generic_category());
  struct stat st;
  if (::fstat(fd, &st) != 0 || (uint64_t)st.st_size > kMaxRecordLen) {
    ::close(fd);
    return errc::object_too_large;
  }
  std::vector<uint8_t> buf((size_t)st.st_size);
  size_t off = 0;
  while (off < buf.size()) {
    ssize_t n = ::read(fd, buf.data() + off, buf.size() - off);
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0) {
      int err = n < 0 ? errno : EIO;
      ::close(fd);
      return std::error_code(err, std::generic_category());
    }
    off += (size_t)n;
  }
  ::close(fd);

  Decoder d(buf);
  uint64_t count;
  if (!rev.decode(d) || !d.read_count(count, kHashSize))
    return errc::malformed_object;
  roots.resize(count);
  for (auto &r : roots) {
    if (!d.read_fixed(r))
      return errc::malformed_object;
  }
  if (!d.done())
    return errc::malformed_object;
  return {};
}

} // namespace mender
