#include "revcache/disk_store.hpp"

#include "revcache/log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <functional>
#include <sstream>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace revcache {
namespace fs = std::filesystem;

namespace {

std::string errno_text(const std::string &what) {
  return what + ": " + std::strerror(errno);
}

bool fsync_dir(const std::string &dir) {
  int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dfd < 0)
    return false;
  bool ok = ::fsync(dfd) == 0;
  ::close(dfd);
  return ok;
}

bool ends_with(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

TimePoint mtime_of(const struct stat &st) {
  const auto since_epoch = std::chrono::seconds(st.st_mtim.tv_sec) +
                           std::chrono::nanoseconds(st.st_mtim.tv_nsec);
  return TimePoint(
      std::chrono::duration_cast<Clock::duration>(since_epoch));
}

timespec to_timespec(TimePoint t) {
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                      t.time_since_epoch())
                      .count();
  timespec ts{};
  ts.tv_sec = static_cast<time_t>(ns / 1000000000LL);
  ts.tv_nsec = static_cast<long>(ns % 1000000000LL);
  if (ts.tv_nsec < 0) {
    ts.tv_nsec += 1000000000L;
    --ts.tv_sec;
  }
  return ts;
}

bool write_all(int fd, const void *data, std::size_t len) {
  auto *p = static_cast<const char *>(data);
  while (len > 0) {
    ssize_t w = ::write(fd, p, len);
    if (w < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    p += w;
    len -= static_cast<std::size_t>(w);
  }
  return true;
}

} // namespace

StagedWrite::StagedWrite(int fd, std::string tmp_path, std::string final_path,
                         bool fsync)
    : fd_(fd), tmp_path_(std::move(tmp_path)),
      final_path_(std::move(final_path)), fsync_(fsync) {}

StagedWrite::StagedWrite(StagedWrite &&other) noexcept
    : fd_(std::exchange(other.fd_, -1)),
      tmp_path_(std::move(other.tmp_path_)),
      final_path_(std::move(other.final_path_)),
      written_(other.written_), fsync_(other.fsync_) {}

StagedWrite &StagedWrite::operator=(StagedWrite &&other) noexcept {
  if (this != &other) {
    discard();
    fd_ = std::exchange(other.fd_, -1);
    tmp_path_ = std::move(other.tmp_path_);
    final_path_ = std::move(other.final_path_);
    written_ = other.written_;
    fsync_ = other.fsync_;
  }
  return *this;
}

StagedWrite::~StagedWrite() { discard(); }

bool StagedWrite::append(const void *data, std::size_t len, std::string *err) {
  if (fd_ < 0) {
    if (err)
      *err = "staged write is closed";
    return false;
  }
  if (!write_all(fd_, data, len)) {
    if (err)
      *err = errno_text("write " + tmp_path_);
    return false;
  }
  written_ += len;
  return true;
}

bool StagedWrite::commit(TimePoint stored_at, std::string *err) {
  if (fd_ < 0) {
    if (err)
      *err = "staged write is closed";
    return false;
  }
  if (fsync_ && ::fsync(fd_) != 0) {
    if (err)
      *err = errno_text("fsync " + tmp_path_);
    discard();
    return false;
  }
  const timespec ts = to_timespec(stored_at);
  const timespec times[2] = {ts, ts};
  if (::futimens(fd_, times) != 0) {
    if (err)
      *err = errno_text("futimens " + tmp_path_);
    discard();
    return false;
  }
  ::close(fd_);
  fd_ = -1;
  if (::rename(tmp_path_.c_str(), final_path_.c_str()) != 0) {
    if (err)
      *err = errno_text("rename " + tmp_path_);
    ::unlink(tmp_path_.c_str());
    return false;
  }
  if (fsync_)
    fsync_dir(fs::path(final_path_).parent_path().string());
  return true;
}

void StagedWrite::discard() {
  if (fd_ < 0)
    return;
  ::close(fd_);
  fd_ = -1;
  ::unlink(tmp_path_.c_str());
}

EntryFile::EntryFile(int fd, std::string key, TimePoint stored_at,
                     std::size_t size)
    : fd_(fd), key_(std::move(key)), stored_at_(stored_at), size_(size) {}

EntryFile::EntryFile(EntryFile &&other) noexcept
    : fd_(std::exchange(other.fd_, -1)), key_(std::move(other.key_)),
      stored_at_(other.stored_at_), size_(other.size_) {}

EntryFile &EntryFile::operator=(EntryFile &&other) noexcept {
  if (this != &other) {
    if (fd_ >= 0)
      ::close(fd_);
    fd_ = std::exchange(other.fd_, -1);
    key_ = std::move(other.key_);
    stored_at_ = other.stored_at_;
    size_ = other.size_;
  }
  return *this;
}

EntryFile::~EntryFile() {
  if (fd_ >= 0)
    ::close(fd_);
}

ssize_t EntryFile::read(void *buf, std::size_t len) {
  while (true) {
    ssize_t r = ::read(fd_, buf, len);
    if (r < 0 && errno == EINTR)
      continue;
    return r;
  }
}

DiskStore::DiskStore(DiskConfig cfg) : cfg_(std::move(cfg)) {
  while (cfg_.root.size() > 1 && cfg_.root.back() == '/')
    cfg_.root.pop_back();
}

bool DiskStore::init(std::string *err) {
  std::error_code ec;
  fs::create_directories(cfg_.root, ec);
  if (ec || !fs::is_directory(cfg_.root, ec)) {
    if (err)
      *err = "cache root " + cfg_.root + " cannot be created";
    return false;
  }
  const std::string probe = temp_path_for(cfg_.root + "/.probe");
  int fd = ::open(probe.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
  if (fd < 0) {
    if (err)
      *err = errno_text("cache root " + cfg_.root + " is not writable");
    return false;
  }
  ::close(fd);
  ::unlink(probe.c_str());
  const auto removed = remove_temp_files();
  if (removed > 0)
    log_info("removed " + std::to_string(removed) +
             " stale temporary files from " + cfg_.root);
  return true;
}

bool DiskStore::valid_key(const std::string &key) {
  if (key.size() < 2 || key[0] != '/' || key.back() == '/')
    return false;
  std::size_t pos = 1;
  while (pos <= key.size()) {
    auto next = key.find('/', pos);
    if (next == std::string::npos)
      next = key.size();
    const std::string part = key.substr(pos, next - pos);
    if (part.empty() || part == "." || part == "..")
      return false;
    if (part.find('\0') != std::string::npos)
      return false;
    pos = next + 1;
  }
  return !ends_with(key, kTempSuffix);
}

bool DiskStore::is_index_key(const std::string &key) {
  return ends_with(key, std::string("/") + kIndexFileName);
}

std::chrono::seconds DiskStore::duration_for(const std::string &key) const {
  return is_index_key(key) ? cfg_.index_duration : cfg_.file_duration;
}

std::string DiskStore::path_for(const std::string &key) const {
  return cfg_.root + key;
}

std::string DiskStore::temp_path_for(const std::string &final_path) const {
  const auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
  std::ostringstream os;
  os << final_path << "." << ::getpid() << "-" << std::hex << tid << "-"
     << std::dec << temp_seq_.fetch_add(1) << kTempSuffix;
  return os.str();
}

bool DiskStore::is_fresh(const std::string &key, TimePoint stored_at,
                         TimePoint now) const {
  return now - stored_at < duration_for(key);
}

bool DiskStore::is_fresh(const CacheEntry &entry, TimePoint now) const {
  return is_fresh(entry.key, entry.stored_at, now);
}

std::optional<EntryFile> DiskStore::open(const std::string &key) {
  ++lookups_;
  if (!valid_key(key)) {
    ++misses_;
    return std::nullopt;
  }
  const std::string path = path_for(key);
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    if (errno != ENOENT && errno != ENOTDIR) {
      ++corrupt_;
      log_warn(errno_text("unreadable cache entry " + path));
    }
    ++misses_;
    return std::nullopt;
  }
  struct stat st {};
  if (::fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
    ::close(fd);
    ++corrupt_;
    ++misses_;
    log_warn("cache entry " + path + " is not a regular file");
    return std::nullopt;
  }
  ++hits_;
  return EntryFile(fd, key, mtime_of(st), static_cast<std::size_t>(st.st_size));
}

std::optional<CacheEntry> DiskStore::lookup(const std::string &key) {
  auto file = open(key);
  if (!file)
    return std::nullopt;
  CacheEntry e;
  e.key = key;
  e.stored_at = file->stored_at();
  e.size_bytes = file->size_bytes();
  e.body.resize(e.size_bytes);
  std::size_t off = 0;
  while (off < e.body.size()) {
    ssize_t r = file->read(e.body.data() + off, e.body.size() - off);
    if (r <= 0)
      break;
    off += static_cast<std::size_t>(r);
  }
  if (off != e.size_bytes) {
    --hits_;
    ++misses_;
    ++corrupt_;
    log_warn("short read on cache entry " + path_for(key) + ", treating as miss");
    return std::nullopt;
  }
  return e;
}

bool DiskStore::contains_fresh(const std::string &key, TimePoint now) const {
  if (!valid_key(key))
    return false;
  struct stat st {};
  if (::stat(path_for(key).c_str(), &st) != 0 || !S_ISREG(st.st_mode))
    return false;
  return is_fresh(key, mtime_of(st), now);
}

std::optional<StagedWrite> DiskStore::begin(const std::string &key,
                                            std::string *err) {
  if (!valid_key(key)) {
    if (err)
      *err = "invalid cache key " + key;
    return std::nullopt;
  }
  const std::string final_path = path_for(key);
  std::error_code ec;
  fs::create_directories(fs::path(final_path).parent_path(), ec);
  if (ec) {
    if (err)
      *err = "cannot create directory for " + final_path + ": " + ec.message();
    return std::nullopt;
  }
  std::string tmp = temp_path_for(final_path);
  int fd = ::open(tmp.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
  if (fd < 0) {
    if (err)
      *err = errno_text("open " + tmp);
    return std::nullopt;
  }
  return StagedWrite(fd, std::move(tmp), final_path, cfg_.fsync);
}

void DiskStore::record_put(bool ok, std::size_t bytes) {
  if (ok) {
    ++puts_;
    bytes_written_ += bytes;
  } else {
    ++put_failures_;
  }
}

std::optional<CacheEntry> DiskStore::put(const std::string &key,
                                         const Bytes &body,
                                         TimePoint stored_at,
                                         std::string *err) {
  auto staged = begin(key, err);
  if (!staged) {
    record_put(false, 0);
    return std::nullopt;
  }
  if (!staged->append(body.data(), body.size(), err) ||
      !staged->commit(stored_at, err)) {
    record_put(false, 0);
    return std::nullopt;
  }
  record_put(true, body.size());
  CacheEntry e;
  e.key = key;
  e.body = body;
  e.stored_at = stored_at;
  e.size_bytes = body.size();
  return e;
}

SweepResult DiskStore::erase_expired(TimePoint now) {
  SweepResult result;
  std::error_code ec;
  fs::recursive_directory_iterator it(cfg_.root, ec), end;
  for (; !ec && it != end; it.increment(ec)) {
    const auto &p = it->path();
    const std::string name = p.filename().string();
    if (ends_with(name, kTempSuffix))
      continue;
    struct stat st {};
    if (::lstat(p.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
      continue;
    const std::string key = "/" + p.lexically_relative(cfg_.root).string();
    if (is_fresh(key, mtime_of(st), now)) {
      result.bytes_used += static_cast<std::uint64_t>(st.st_size);
      continue;
    }
    if (::unlink(p.c_str()) == 0) {
      ++result.files_removed;
      result.bytes_freed += static_cast<std::uint64_t>(st.st_size);
    } else {
      result.bytes_used += static_cast<std::uint64_t>(st.st_size);
    }
  }
  ++sweeps_;
  files_expired_ += result.files_removed;
  return result;
}

std::size_t DiskStore::remove_temp_files() {
  std::size_t removed = 0;
  std::error_code ec;
  fs::recursive_directory_iterator it(cfg_.root, ec), end;
  for (; !ec && it != end; it.increment(ec)) {
    const auto &p = it->path();
    if (!ends_with(p.filename().string(), kTempSuffix))
      continue;
    std::error_code rm_ec;
    if (fs::is_regular_file(p, rm_ec) && fs::remove(p, rm_ec))
      ++removed;
  }
  return removed;
}

DiskStats DiskStore::stats() const {
  DiskStats s;
  s.lookups = lookups_;
  s.hits = hits_;
  s.misses = misses_;
  s.corrupt = corrupt_;
  s.puts = puts_;
  s.put_failures = put_failures_;
  s.bytes_written = bytes_written_;
  s.sweeps = sweeps_;
  s.files_expired = files_expired_;
  return s;
}

} // namespace revcache
