#include <catch2/catch.hpp>

#include "revcache/disk_store.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace revcache;
namespace fs = std::filesystem;

namespace {
std::string scratch_dir(const std::string &name) {
  const auto dir = fs::temp_directory_path() /
                   ("revcache_" + name + "_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  return dir.string();
}

Bytes bytes_of(const std::string &s) { return Bytes(s.begin(), s.end()); }

DiskConfig config_for(const std::string &root) {
  DiskConfig cfg;
  cfg.root = root;
  cfg.file_duration = std::chrono::hours(24);
  cfg.index_duration = std::chrono::seconds(60);
  cfg.fsync = false;
  return cfg;
}

std::size_t count_temp_files(const std::string &root) {
  std::size_t n = 0;
  for (const auto &e : fs::recursive_directory_iterator(root)) {
    const auto name = e.path().filename().string();
    if (name.size() > 4 && name.compare(name.size() - 4, 4, ".tmp") == 0)
      ++n;
  }
  return n;
}
} // namespace

TEST_CASE("put then lookup returns the stored body", "[disk]") {
  const auto root = scratch_dir("put_lookup");
  DiskStore store(config_for(root));
  REQUIRE(store.init());

  const auto t0 = Clock::now();
  auto stored = store.put("/software/v1.tar.gz", bytes_of("payload"), t0);
  REQUIRE(stored.has_value());
  REQUIRE(stored->size_bytes == 7);
  REQUIRE(fs::exists(root + "/software/v1.tar.gz"));

  auto e = store.lookup("/software/v1.tar.gz");
  REQUIRE(e.has_value());
  REQUIRE(e->body == bytes_of("payload"));
  REQUIRE(e->size_bytes == 7);
  REQUIRE(std::chrono::abs(e->stored_at - t0) < std::chrono::seconds(1));
  REQUIRE(count_temp_files(root) == 0);

  REQUIRE_FALSE(store.lookup("/software/v2.tar.gz").has_value());
  const auto s = store.stats();
  REQUIRE(s.hits == 1);
  REQUIRE(s.misses == 1);
  REQUIRE(s.puts == 1);
  REQUIRE(s.bytes_written == 7);
  fs::remove_all(root);
}

TEST_CASE("freshness boundary is exclusive", "[disk]") {
  const auto root = scratch_dir("fresh");
  DiskStore store(config_for(root));
  REQUIRE(store.init());
  const auto t0 = Clock::now();
  REQUIRE(store.put("/a/file.bin", bytes_of("x"), t0));
  auto e = store.lookup("/a/file.bin");
  REQUIRE(e.has_value());

  const auto d = std::chrono::hours(24);
  REQUIRE(store.is_fresh(*e, e->stored_at + d - std::chrono::seconds(1)));
  REQUIRE_FALSE(store.is_fresh(*e, e->stored_at + d));
  REQUIRE_FALSE(store.is_fresh(*e, e->stored_at + d + std::chrono::seconds(1)));
  REQUIRE(store.contains_fresh("/a/file.bin", t0));
  REQUIRE_FALSE(store.contains_fresh("/a/file.bin", t0 + d + std::chrono::seconds(1)));
  fs::remove_all(root);
}

TEST_CASE("directory indices use the index duration", "[disk]") {
  const auto root = scratch_dir("index");
  DiskStore store(config_for(root));
  REQUIRE(store.init());
  REQUIRE(DiskStore::is_index_key("/pub/index.json"));
  REQUIRE_FALSE(DiskStore::is_index_key("/pub/index.json.bak"));
  REQUIRE(store.duration_for("/pub/index.json") == std::chrono::seconds(60));
  REQUIRE(store.duration_for("/pub/a.iso") == std::chrono::hours(24));

  const auto t0 = Clock::now();
  REQUIRE(store.put("/pub/index.json", bytes_of("[]"), t0));
  REQUIRE(store.contains_fresh("/pub/index.json", t0 + std::chrono::seconds(59)));
  REQUIRE_FALSE(store.contains_fresh("/pub/index.json", t0 + std::chrono::seconds(61)));
  fs::remove_all(root);
}

TEST_CASE("put replaces an existing entry", "[disk]") {
  const auto root = scratch_dir("replace");
  DiskStore store(config_for(root));
  REQUIRE(store.init());
  const auto t0 = Clock::now() - std::chrono::hours(48);
  REQUIRE(store.put("/r.bin", bytes_of("old"), t0));
  const auto t1 = Clock::now();
  REQUIRE(store.put("/r.bin", bytes_of("newer"), t1));
  auto e = store.lookup("/r.bin");
  REQUIRE(e.has_value());
  REQUIRE(e->body == bytes_of("newer"));
  REQUIRE(store.is_fresh(*e, t1));
  fs::remove_all(root);
}

TEST_CASE("uncommitted staged writes are never visible", "[disk]") {
  const auto root = scratch_dir("staged");
  DiskStore store(config_for(root));
  REQUIRE(store.init());
  {
    auto w = store.begin("/partial.bin");
    REQUIRE(w.has_value());
    REQUIRE(w->append("half", 4));
    REQUIRE(fs::exists(w->temp_path()));
    REQUIRE_FALSE(store.lookup("/partial.bin").has_value());
  }
  REQUIRE_FALSE(fs::exists(root + "/partial.bin"));
  REQUIRE(count_temp_files(root) == 0);

  auto w = store.begin("/partial.bin");
  REQUIRE(w.has_value());
  REQUIRE(w->append("abc", 3));
  w->discard();
  REQUIRE_FALSE(w->append("d", 1));
  REQUIRE_FALSE(w->commit(Clock::now()));
  REQUIRE(count_temp_files(root) == 0);

  auto ok = store.begin("/partial.bin");
  REQUIRE(ok.has_value());
  REQUIRE(ok->append("whole", 5));
  REQUIRE(ok->bytes_written() == 5);
  REQUIRE(ok->commit(Clock::now()));
  auto e = store.lookup("/partial.bin");
  REQUIRE(e.has_value());
  REQUIRE(e->body == bytes_of("whole"));
  fs::remove_all(root);
}

TEST_CASE("unreadable entries are corrupt misses", "[disk]") {
  const auto root = scratch_dir("corrupt");
  DiskStore store(config_for(root));
  REQUIRE(store.init());
  fs::create_directories(root + "/dir.bin");
  REQUIRE_FALSE(store.lookup("/dir.bin").has_value());
  REQUIRE_FALSE(store.open("/dir.bin").has_value());
  REQUIRE(store.stats().corrupt == 2);
  REQUIRE_FALSE(store.contains_fresh("/dir.bin", Clock::now()));
  fs::remove_all(root);
}

TEST_CASE("put fails cleanly when the directory cannot be created", "[disk]") {
  const auto root = scratch_dir("blocked");
  DiskStore store(config_for(root));
  REQUIRE(store.init());
  std::ofstream(root + "/blocked") << "a file where a directory should be";
  std::string err;
  REQUIRE_FALSE(store.put("/blocked/x.bin", bytes_of("x"), Clock::now(), &err));
  REQUIRE_FALSE(err.empty());
  REQUIRE(store.stats().put_failures == 1);
  REQUIRE_FALSE(store.lookup("/blocked/x.bin").has_value());
  fs::remove_all(root);
}

TEST_CASE("key validation", "[disk]") {
  REQUIRE(DiskStore::valid_key("/a"));
  REQUIRE(DiskStore::valid_key("/a/b/c.tar.gz"));
  REQUIRE(DiskStore::valid_key("/index.json"));
  REQUIRE_FALSE(DiskStore::valid_key(""));
  REQUIRE_FALSE(DiskStore::valid_key("/"));
  REQUIRE_FALSE(DiskStore::valid_key("a/b"));
  REQUIRE_FALSE(DiskStore::valid_key("/a/"));
  REQUIRE_FALSE(DiskStore::valid_key("/a//b"));
  REQUIRE_FALSE(DiskStore::valid_key("/a/../b"));
  REQUIRE_FALSE(DiskStore::valid_key("/a/./b"));
  REQUIRE_FALSE(DiskStore::valid_key("/a/b.tmp"));

  const auto root = scratch_dir("badkey");
  DiskStore store(config_for(root));
  REQUIRE(store.init());
  REQUIRE_FALSE(store.put("/../escape", bytes_of("x")).has_value());
  REQUIRE_FALSE(fs::exists(fs::path(root).parent_path() / "escape"));
  fs::remove_all(root);
}

TEST_CASE("erase_expired removes only stale entries", "[disk]") {
  const auto root = scratch_dir("sweep");
  DiskStore store(config_for(root));
  REQUIRE(store.init());
  const auto now = Clock::now();
  REQUIRE(store.put("/old/a.bin", bytes_of("aaaa"), now - std::chrono::hours(25)));
  REQUIRE(store.put("/new/b.bin", bytes_of("bb"), now - std::chrono::hours(1)));
  REQUIRE(store.put("/new/index.json", bytes_of("[]"), now - std::chrono::minutes(5)));

  const auto r = store.erase_expired(now);
  REQUIRE(r.files_removed == 2);
  REQUIRE(r.bytes_freed == 6);
  REQUIRE(r.bytes_used == 2);
  REQUIRE_FALSE(fs::exists(root + "/old/a.bin"));
  REQUIRE_FALSE(fs::exists(root + "/new/index.json"));
  REQUIRE(fs::exists(root + "/new/b.bin"));
  REQUIRE(store.stats().sweeps == 1);
  REQUIRE(store.stats().files_expired == 2);
  fs::remove_all(root);
}

TEST_CASE("init removes stale temporary files", "[disk]") {
  const auto root = scratch_dir("init");
  fs::create_directories(root + "/deep/dir");
  std::ofstream(root + "/deep/dir/file.bin.123-abc-0.tmp") << "junk";
  std::ofstream(root + "/deep/dir/file.bin") << "kept";
  DiskStore store(config_for(root));
  REQUIRE(store.init());
  REQUIRE(count_temp_files(root) == 0);
  REQUIRE(fs::exists(root + "/deep/dir/file.bin"));
  fs::remove_all(root);
}

TEST_CASE("init fails when the root is not a directory", "[disk]") {
  const auto root = scratch_dir("notdir");
  std::ofstream(root) << "x";
  DiskStore store(config_for(root));
  std::string err;
  REQUIRE_FALSE(store.init(&err));
  REQUIRE(err.find(root) != std::string::npos);
  fs::remove_all(root);
}
