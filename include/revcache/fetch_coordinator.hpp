#pragma once

#include "revcache/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace revcache {

enum class FetchStatus { Ok, Failed, MustWait };

struct FetchResult {
  FetchStatus status{FetchStatus::Failed};
  // Null on success when the body was installed in the store; joiners read
  // it from there.
  std::shared_ptr<const Bytes> body;
  int upstream_status{0};
  std::string error;
  bool joined{false};

  bool ok() const { return status == FetchStatus::Ok; }
};

using FetchFn = std::function<FetchResult()>;

struct FetchStats {
  std::uint64_t started{0};
  std::uint64_t joined{0};
  std::uint64_t failed{0};
  std::uint64_t join_timeouts{0};
};

// Runs at most one fetch per key at a time. Callers arriving while a fetch
// for the same key is in flight wait for it and share its result.
class FetchCoordinator {
public:
  FetchResult fetch_or_join(
      const std::string &key, const FetchFn &fetch,
      std::optional<std::chrono::milliseconds> join_wait = std::nullopt);

  std::size_t in_flight() const;
  std::size_t waiters(const std::string &key) const;
  FetchStats stats() const;

private:
  struct InFlightFetch {
    std::shared_future<FetchResult> done;
    std::size_t waiters{0};
  };

  mutable std::mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<InFlightFetch>> table_;
  FetchStats stats_;
};

} // namespace revcache
