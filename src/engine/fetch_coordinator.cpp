#include "revcache/fetch_coordinator.hpp"

#include "revcache/log.hpp"

#include <exception>
#include <utility>

namespace revcache {

FetchResult FetchCoordinator::fetch_or_join(
    const std::string &key, const FetchFn &fetch,
    std::optional<std::chrono::milliseconds> join_wait) {
  std::promise<FetchResult> promise;
  std::shared_future<FetchResult> done;
  std::shared_ptr<InFlightFetch> joined;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = table_.find(key);
    if (it != table_.end()) {
      joined = it->second;
      ++joined->waiters;
      ++stats_.joined;
      done = joined->done;
    } else {
      auto f = std::make_shared<InFlightFetch>();
      f->done = promise.get_future().share();
      table_.emplace(key, f);
      ++stats_.started;
    }
  }

  if (done.valid()) {
    if (join_wait.has_value() &&
        done.wait_for(*join_wait) != std::future_status::ready) {
      std::lock_guard<std::mutex> lk(mu_);
      --joined->waiters;
      ++stats_.join_timeouts;
      FetchResult r;
      r.status = FetchStatus::MustWait;
      r.joined = true;
      return r;
    }
    FetchResult r = done.get();
    r.joined = true;
    return r;
  }

  FetchResult result;
  try {
    result = fetch();
  } catch (const std::exception &e) {
    result = FetchResult{};
    result.status = FetchStatus::Failed;
    result.error = std::string("fetch raised: ") + e.what();
    log_error("fetch for " + key + " raised: " + e.what());
  }
  if (result.status == FetchStatus::MustWait)
    result.status = FetchStatus::Failed;

  {
    std::lock_guard<std::mutex> lk(mu_);
    table_.erase(key);
    if (!result.ok())
      ++stats_.failed;
  }
  promise.set_value(result);
  return result;
}

std::size_t FetchCoordinator::in_flight() const {
  std::lock_guard<std::mutex> lk(mu_);
  return table_.size();
}

std::size_t FetchCoordinator::waiters(const std::string &key) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = table_.find(key);
  return it == table_.end() ? 0 : it->second->waiters;
}

FetchStats FetchCoordinator::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  return stats_;
}

} // namespace revcache
