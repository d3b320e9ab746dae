#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace revcache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Bytes = std::vector<std::uint8_t>;

struct CacheEntry {
  std::string key;
  Bytes body;
  TimePoint stored_at{};
  std::size_t size_bytes{0};
};

} // namespace revcache
