#pragma once

#include "revcache/types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <sys/types.h>

namespace revcache {

struct DiskConfig {
  std::string root{"./cache"};
  std::chrono::seconds file_duration{1209600};
  std::chrono::seconds index_duration{60};
  bool fsync{true};
};

struct DiskStats {
  std::uint64_t lookups{0};
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t corrupt{0};
  std::uint64_t puts{0};
  std::uint64_t put_failures{0};
  std::uint64_t bytes_written{0};
  std::uint64_t sweeps{0};
  std::uint64_t files_expired{0};
};

struct SweepResult {
  std::size_t files_removed{0};
  std::uint64_t bytes_freed{0};
  std::uint64_t bytes_used{0};
};

// Body being staged under a temporary name. Nothing is visible under the
// final key until commit() succeeds; an uncommitted write is removed on
// destruction.
class StagedWrite {
public:
  StagedWrite() = default;
  StagedWrite(StagedWrite &&other) noexcept;
  StagedWrite &operator=(StagedWrite &&other) noexcept;
  StagedWrite(const StagedWrite &) = delete;
  StagedWrite &operator=(const StagedWrite &) = delete;
  ~StagedWrite();

  bool append(const void *data, std::size_t len, std::string *err = nullptr);
  bool commit(TimePoint stored_at, std::string *err = nullptr);
  void discard();

  bool open() const { return fd_ >= 0; }
  std::size_t bytes_written() const { return written_; }
  const std::string &temp_path() const { return tmp_path_; }

private:
  friend class DiskStore;
  StagedWrite(int fd, std::string tmp_path, std::string final_path,
              bool fsync);

  int fd_{-1};
  std::string tmp_path_;
  std::string final_path_;
  std::size_t written_{0};
  bool fsync_{true};
};

// An entry opened for reading. Metadata comes from the open descriptor so
// a concurrent replacement never mixes two versions.
class EntryFile {
public:
  EntryFile(EntryFile &&other) noexcept;
  EntryFile &operator=(EntryFile &&other) noexcept;
  EntryFile(const EntryFile &) = delete;
  EntryFile &operator=(const EntryFile &) = delete;
  ~EntryFile();

  // Returns bytes read, 0 at end of entry, -1 on error.
  ssize_t read(void *buf, std::size_t len);

  const std::string &key() const { return key_; }
  TimePoint stored_at() const { return stored_at_; }
  std::size_t size_bytes() const { return size_; }

private:
  friend class DiskStore;
  EntryFile(int fd, std::string key, TimePoint stored_at, std::size_t size);

  int fd_{-1};
  std::string key_;
  TimePoint stored_at_{};
  std::size_t size_{0};
};

class DiskStore {
public:
  explicit DiskStore(DiskConfig cfg);

  bool init(std::string *err = nullptr);

  std::optional<CacheEntry> lookup(const std::string &key);
  std::optional<EntryFile> open(const std::string &key);
  bool is_fresh(const CacheEntry &entry, TimePoint now) const;
  bool is_fresh(const std::string &key, TimePoint stored_at,
                TimePoint now) const;
  bool contains_fresh(const std::string &key, TimePoint now) const;

  std::optional<CacheEntry> put(const std::string &key, const Bytes &body,
                                TimePoint stored_at = Clock::now(),
                                std::string *err = nullptr);
  std::optional<StagedWrite> begin(const std::string &key,
                                   std::string *err = nullptr);
  // Bookkeeping for writes committed through a StagedWrite.
  void record_put(bool ok, std::size_t bytes);

  SweepResult erase_expired(TimePoint now);
  std::size_t remove_temp_files();

  std::chrono::seconds duration_for(const std::string &key) const;
  std::string path_for(const std::string &key) const;
  const std::string &root() const { return cfg_.root; }
  DiskStats stats() const;

  static bool valid_key(const std::string &key);
  static bool is_index_key(const std::string &key);

private:
  std::string temp_path_for(const std::string &final_path) const;

  DiskConfig cfg_;
  std::atomic<std::uint64_t> lookups_{0};
  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> corrupt_{0};
  std::atomic<std::uint64_t> puts_{0};
  std::atomic<std::uint64_t> put_failures_{0};
  std::atomic<std::uint64_t> bytes_written_{0};
  std::atomic<std::uint64_t> sweeps_{0};
  std::atomic<std::uint64_t> files_expired_{0};
  mutable std::atomic<std::uint64_t> temp_seq_{0};
};

inline constexpr const char *kIndexFileName = "index.json";
inline constexpr const char *kTempSuffix = ".tmp";

} // namespace revcache
