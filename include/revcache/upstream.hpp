#pragma once

#include "revcache/config.hpp"
#include "revcache/http.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace revcache {

// Receives a successful upstream response as it arrives. Returning false
// from either callback aborts the transfer.
class IBodySink {
public:
  virtual ~IBodySink() = default;
  virtual bool on_head(const HttpResponseHead &head) = 0;
  virtual bool on_data(const char *data, std::size_t len) = 0;
};

struct UpstreamResult {
  bool ok{false};
  int status{0};
  std::uint64_t bytes{0};
  std::string error;
};

class IUpstream {
public:
  virtual ~IUpstream() = default;
  // Issues GET for `path` below the backend prefix. Non-2xx statuses,
  // timeouts, connection errors and short bodies are failures; the sink only
  // sees 2xx responses.
  virtual UpstreamResult get(const std::string &path, IBodySink &sink) = 0;
  virtual std::string url_for(const std::string &path) const = 0;
};

class HttpUpstream final : public IUpstream {
public:
  HttpUpstream(BackendAddress backend, std::chrono::seconds timeout);

  UpstreamResult get(const std::string &path, IBodySink &sink) override;
  std::string url_for(const std::string &path) const override;

private:
  int connect_backend(std::string *err) const;

  BackendAddress backend_;
  std::chrono::seconds timeout_;
};

} // namespace revcache
