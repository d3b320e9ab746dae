#include <catch2/catch.hpp>
#include "revcache/proxy.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <random>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace revcache;
namespace fs = std::filesystem;

namespace {
std::string body_for(const std::string &path) {
  std::string body;
  for (int i = 0; i < 64; ++i)
    body += path;
  return body;
}

// Origin that fails roughly one request in four, sometimes mid-body.
class FlakyUpstream final : public IUpstream {
public:
  UpstreamResult get(const std::string &path, IBodySink &sink) override {
    ++calls;
    const auto roll = rng_roll();
    UpstreamResult r;
    if (roll % 8 == 0) {
      r.status = 503;
      r.error = "upstream status 503";
      return r;
    }
    const std::string body = body_for(path);
    HttpResponseHead head;
    head.status = 200;
    head.headers.emplace_back("content-length", std::to_string(body.size()));
    r.status = 200;
    sink.on_head(head);
    const std::size_t cut = roll % 8 == 1 ? body.size() / 2 : body.size();
    for (std::size_t off = 0; off < cut; off += 100) {
      const std::size_t n = std::min<std::size_t>(100, cut - off);
      sink.on_data(body.data() + off, n);
      r.bytes += n;
    }
    if (cut != body.size()) {
      r.error = "upstream closed mid-body";
      return r;
    }
    r.ok = true;
    return r;
  }
  std::string url_for(const std::string &path) const override {
    return "http://flaky" + path;
  }
  std::atomic<int> calls{0};

private:
  unsigned rng_roll() {
    thread_local std::mt19937 rng(std::random_device{}());
    return static_cast<unsigned>(rng());
  }
};

class CaptureWriter final : public IResponseWriter {
public:
  bool write(const char *data, std::size_t len) override {
    out.append(data, len);
    return true;
  }
  std::string out;
};
} // namespace

TEST_CASE("chaos churn never exposes a partial entry", "[chaos]") {
  const auto root = (fs::temp_directory_path() /
                     ("revcache_chaos_" + std::to_string(::getpid())))
                        .string();
  fs::remove_all(root);

  ProxyConfig cfg;
  cfg.local_root = root;
  cfg.redirect_invalid_to = "https://example.org/";
  cfg.file_duration = std::chrono::seconds(30);
  DiskConfig dcfg;
  dcfg.root = root;
  dcfg.file_duration = cfg.file_duration;
  dcfg.fsync = false;
  DiskStore store(dcfg);
  REQUIRE(store.init());
  FetchCoordinator fetches;
  FlakyUpstream upstream;
  Proxy proxy(cfg, store, fetches, upstream);

  std::atomic<int> bad_bodies{0};
  std::atomic<bool> stop{false};
  std::thread sweeper([&] {
    while (!stop) {
      store.erase_expired(Clock::now() + std::chrono::seconds(20));
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
  });

  std::vector<std::thread> workers;
  for (int t = 0; t < 8; ++t) {
    workers.emplace_back([&, t] {
      std::mt19937 rng(static_cast<unsigned>(t) * 7919u + 1u);
      for (int i = 0; i < 300; ++i) {
        const std::string path = "/pool/f" + std::to_string(rng() % 16) + ".bin";
        const auto skew = std::chrono::seconds(rng() % 60);
        HttpRequest req;
        req.method = rng() % 5 == 0 ? "HEAD" : "GET";
        req.path = path;
        req.target = path;
        req.version = "HTTP/1.1";
        CaptureWriter w;
        const auto rec = proxy.handle(req, w, Clock::now() + skew);
        if (rec.status != 200 || req.method == "HEAD" ||
            rec.outcome == "upstream_error")
          continue;
        const auto end = w.out.find("\r\n\r\n");
        if (end == std::string::npos || w.out.substr(end + 4) != body_for(path))
          ++bad_bodies;
      }
    });
  }
  for (auto &w : workers)
    w.join();
  stop = true;
  sweeper.join();

  REQUIRE(bad_bodies == 0);
  REQUIRE(fetches.in_flight() == 0);
  REQUIRE(store.remove_temp_files() == 0);
  for (const auto &e : fs::recursive_directory_iterator(root)) {
    if (!e.is_regular_file())
      continue;
    const std::string key = "/" + e.path().lexically_relative(root).string();
    auto entry = store.lookup(key);
    REQUIRE(entry.has_value());
    REQUIRE(std::string(entry->body.begin(), entry->body.end()) == body_for(key));
  }
  fs::remove_all(root);
}
