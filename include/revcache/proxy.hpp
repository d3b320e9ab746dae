#pragma once

#include "revcache/config.hpp"
#include "revcache/disk_store.hpp"
#include "revcache/fetch_coordinator.hpp"
#include "revcache/http.hpp"
#include "revcache/router.hpp"
#include "revcache/types.hpp"
#include "revcache/upstream.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace revcache {

class IResponseWriter {
public:
  virtual ~IResponseWriter() = default;
  // Returns false once the client can no longer be written to.
  virtual bool write(const char *data, std::size_t len) = 0;
};

// Writes to a client socket. With a positive write timeout a client that
// stops reading is dropped instead of stalling the writer.
class SocketWriter final : public IResponseWriter {
public:
  explicit SocketWriter(int fd, std::chrono::milliseconds write_timeout =
                                    std::chrono::milliseconds(0));
  bool write(const char *data, std::size_t len) override;
  bool gone() const { return gone_; }

private:
  int fd_;
  bool gone_{false};
};

struct RequestRecord {
  std::string outcome;
  int status{0};
  std::uint64_t bytes{0};
  std::string detail;
};

class Proxy {
public:
  Proxy(const ProxyConfig &cfg, DiskStore &store, FetchCoordinator &fetches,
        IUpstream &upstream);

  RequestRecord handle(const HttpRequest &req, IResponseWriter &out,
                       TimePoint now = Clock::now());

  const Router &router() const { return router_; }

private:
  RequestRecord serve_proxy(const HttpRequest &req, const CacheKey &key,
                            IResponseWriter &out, TimePoint now);
  RequestRecord serve_file(EntryFile &file, const CacheKey &key,
                           bool head_only, const char *cache_state,
                           IResponseWriter &out);
  RequestRecord serve_body(const Bytes &body, const CacheKey &key,
                           bool head_only, IResponseWriter &out);

  const ProxyConfig &cfg_;
  DiskStore &store_;
  FetchCoordinator &fetches_;
  IUpstream &upstream_;
  Router router_;
};

std::string content_type_for(const CacheKey &key);
std::string access_line(const HttpRequest &req, const RequestRecord &rec);

} // namespace revcache
