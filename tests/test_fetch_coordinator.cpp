#include <catch2/catch.hpp>

#include "revcache/fetch_coordinator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace revcache;

namespace {
// Holds a fetch open until release() so tests can pile up joiners.
class Gate {
public:
  void wait() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [&] { return open_; });
  }
  void release() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      open_ = true;
    }
    cv_.notify_all();
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool open_{false};
};

FetchResult ok_result(const std::string &body) {
  FetchResult r;
  r.status = FetchStatus::Ok;
  r.upstream_status = 200;
  r.body = std::make_shared<const Bytes>(body.begin(), body.end());
  return r;
}

void wait_for_waiters(const FetchCoordinator &fc, const std::string &key,
                      std::size_t n) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (fc.waiters(key) < n && std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
}
} // namespace

TEST_CASE("concurrent callers for one key share a single fetch", "[fetch]") {
  FetchCoordinator fc;
  Gate gate;
  std::atomic<int> calls{0};
  std::atomic<bool> started{false};
  const FetchFn fetch = [&] {
    ++calls;
    started = true;
    gate.wait();
    return ok_result("shared body");
  };

  constexpr int kCallers = 8;
  std::vector<FetchResult> results(kCallers);
  std::vector<std::thread> threads;
  threads.emplace_back([&] { results[0] = fc.fetch_or_join("/k", fetch); });
  while (!started)
    std::this_thread::yield();
  for (int i = 1; i < kCallers; ++i)
    threads.emplace_back([&, i] { results[i] = fc.fetch_or_join("/k", fetch); });
  wait_for_waiters(fc, "/k", kCallers - 1);
  REQUIRE(fc.waiters("/k") == kCallers - 1);
  REQUIRE(fc.in_flight() == 1);
  gate.release();
  for (auto &t : threads)
    t.join();

  REQUIRE(calls == 1);
  int joined = 0;
  for (const auto &r : results) {
    REQUIRE(r.ok());
    REQUIRE(r.body == results[0].body);
    REQUIRE(std::string(r.body->begin(), r.body->end()) == "shared body");
    joined += r.joined ? 1 : 0;
  }
  REQUIRE(joined == kCallers - 1);
  REQUIRE(fc.in_flight() == 0);
  REQUIRE(fc.waiters("/k") == 0);
  const auto s = fc.stats();
  REQUIRE(s.started == 1);
  REQUIRE(s.joined == kCallers - 1);
  REQUIRE(s.failed == 0);
}

TEST_CASE("a failure reaches every joined caller", "[fetch]") {
  FetchCoordinator fc;
  Gate gate;
  std::atomic<bool> started{false};
  const FetchFn fetch = [&] {
    started = true;
    gate.wait();
    FetchResult r;
    r.status = FetchStatus::Failed;
    r.upstream_status = 404;
    r.error = "upstream status 404";
    return r;
  };

  FetchResult first, second;
  std::thread a([&] { first = fc.fetch_or_join("/missing.bin", fetch); });
  while (!started)
    std::this_thread::yield();
  std::thread b([&] { second = fc.fetch_or_join("/missing.bin", fetch); });
  wait_for_waiters(fc, "/missing.bin", 1);
  gate.release();
  a.join();
  b.join();

  REQUIRE_FALSE(first.ok());
  REQUIRE_FALSE(second.ok());
  REQUIRE(second.joined);
  REQUIRE(second.error == "upstream status 404");
  REQUIRE(second.upstream_status == 404);
  REQUIRE(fc.stats().failed == 1);
  REQUIRE(fc.in_flight() == 0);
}

TEST_CASE("the next caller after completion starts a fresh fetch", "[fetch]") {
  FetchCoordinator fc;
  int calls = 0;
  const FetchFn fetch = [&] {
    ++calls;
    return ok_result("v" + std::to_string(calls));
  };
  auto r1 = fc.fetch_or_join("/k", fetch);
  auto r2 = fc.fetch_or_join("/k", fetch);
  REQUIRE(calls == 2);
  REQUIRE_FALSE(r1.joined);
  REQUIRE_FALSE(r2.joined);
  REQUIRE(std::string(r2.body->begin(), r2.body->end()) == "v2");
}

TEST_CASE("different keys fetch in parallel", "[fetch]") {
  FetchCoordinator fc;
  Gate gate;
  std::atomic<int> running{0};
  const FetchFn fetch = [&] {
    ++running;
    gate.wait();
    return ok_result("x");
  };
  std::thread a([&] { fc.fetch_or_join("/a.bin", fetch); });
  std::thread b([&] { fc.fetch_or_join("/b.bin", fetch); });
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (running < 2 && std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  REQUIRE(running == 2);
  REQUIRE(fc.in_flight() == 2);
  gate.release();
  a.join();
  b.join();
  REQUIRE(fc.stats().started == 2);
  REQUIRE(fc.stats().joined == 0);
}

TEST_CASE("a bounded join reports must-wait", "[fetch]") {
  FetchCoordinator fc;
  Gate gate;
  std::atomic<bool> started{false};
  const FetchFn fetch = [&] {
    started = true;
    gate.wait();
    return ok_result("slow");
  };
  FetchResult initiator;
  std::thread a([&] { initiator = fc.fetch_or_join("/slow.iso", fetch); });
  while (!started)
    std::this_thread::yield();

  const auto r = fc.fetch_or_join("/slow.iso", fetch, std::chrono::milliseconds(20));
  REQUIRE(r.status == FetchStatus::MustWait);
  REQUIRE(r.joined);
  REQUIRE(fc.stats().join_timeouts == 1);
  REQUIRE(fc.in_flight() == 1);
  REQUIRE(fc.waiters("/slow.iso") == 0);

  gate.release();
  a.join();
  REQUIRE(initiator.ok());
  REQUIRE(fc.in_flight() == 0);
}

TEST_CASE("an exception from the fetch becomes a failure", "[fetch]") {
  FetchCoordinator fc;
  const auto r = fc.fetch_or_join("/boom.bin", [] () -> FetchResult {
    throw std::runtime_error("disk on fire");
  });
  REQUIRE(r.status == FetchStatus::Failed);
  REQUIRE(r.error.find("disk on fire") != std::string::npos);
  REQUIRE(fc.in_flight() == 0);
  REQUIRE(fc.stats().failed == 1);

  // The key is usable again afterwards.
  const auto again = fc.fetch_or_join("/boom.bin", [] { return ok_result("ok"); });
  REQUIRE(again.ok());
}
