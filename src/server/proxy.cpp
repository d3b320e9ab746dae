#include "revcache/proxy.hpp"

#include "revcache/log.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <sys/socket.h>
#include <sys/time.h>

namespace revcache {
namespace {

constexpr std::size_t kServeChunk = 64 * 1024;

bool write_string(IResponseWriter &out, const std::string &s) {
  return out.write(s.data(), s.size());
}

RequestRecord record(const char *outcome, int status, std::uint64_t bytes = 0,
                     std::string detail = {}) {
  RequestRecord r;
  r.outcome = outcome;
  r.status = status;
  r.bytes = bytes;
  r.detail = std::move(detail);
  return r;
}

std::string hex_size(std::size_t n) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  do {
    out.insert(out.begin(), digits[n & 0xf]);
    n >>= 4;
  } while (n != 0);
  return out;
}

std::string retry_location(const HttpRequest &req) {
  std::string location = req.path;
  if (!req.query.empty())
    location += "?" + req.query;
  return location;
}

// Streams a miss to the initiating client while staging it on disk. The
// body is only held in memory when staging failed, so that callers joined on
// the same fetch can still be answered.
class CacheFillSink final : public IBodySink {
public:
  CacheFillSink(DiskStore &store, const CacheKey &key, IResponseWriter &client,
                bool head_only)
      : store_(store), key_(key), client_(client), head_only_(head_only) {}

  bool on_head(const HttpResponseHead &head) override {
    std::string err;
    staged_ = store_.begin(key_.key, &err);
    if (!staged_) {
      store_.record_put(false, 0);
      log_warn("not caching " + key_.key + ": " + err);
      buffering_ = true;
    }
    HeaderList headers{{"Content-Type", content_type_for(key_)},
                       {"X-Cache", "MISS"}};
    std::optional<std::uint64_t> length;
    if (!head.chunked())
      length = head.content_length();
    if (length) {
      headers.emplace_back("Content-Length", std::to_string(*length));
    } else {
      headers.emplace_back("Transfer-Encoding", "chunked");
      chunked_out_ = true;
    }
    send(http_head(200, headers));
    head_sent_ = true;
    return true;
  }

  bool on_data(const char *data, std::size_t len) override {
    if (staged_) {
      std::string err;
      if (!staged_->append(data, len, &err)) {
        log_warn("cache write for " + key_.key + " failed: " + err);
        fall_back_to_memory();
      }
    }
    if (buffering_)
      body_.insert(body_.end(), reinterpret_cast<const std::uint8_t *>(data),
                   reinterpret_cast<const std::uint8_t *>(data) + len);
    if (!head_only_) {
      if (chunked_out_) {
        send(hex_size(len) + "\r\n");
        send(data, len);
        send(std::string("\r\n"));
      } else {
        send(data, len);
      }
      if (client_alive_)
        client_bytes_ += len;
    }
    return true;
  }

  // Installs the staged body. Returns false if nothing was installed.
  bool commit(TimePoint stored_at) {
    if (!staged_)
      return false;
    std::string err;
    const std::size_t bytes = staged_->bytes_written();
    const bool ok = staged_->commit(stored_at, &err);
    store_.record_put(ok, bytes);
    if (!ok)
      log_warn("cache install for " + key_.key + " failed: " + err);
    staged_.reset();
    return ok;
  }

  // Terminates a chunked response. Only called after a complete transfer,
  // so a failed one never looks finished to the client.
  void finish() {
    if (chunked_out_ && !head_only_)
      send(std::string("0\r\n\r\n"));
  }

  std::shared_ptr<const Bytes> shared_body() {
    if (!buffering_)
      return nullptr;
    return std::make_shared<const Bytes>(std::move(body_));
  }

  bool head_sent() const { return head_sent_; }
  bool client_alive() const { return client_alive_; }
  std::uint64_t client_bytes() const { return client_bytes_; }

private:
  // Recovers what was staged so far and keeps the rest in memory.
  void fall_back_to_memory() {
    store_.record_put(false, 0);
    const std::size_t staged_bytes = staged_->bytes_written();
    std::ifstream in(staged_->temp_path(), std::ios::binary);
    body_.resize(staged_bytes);
    if (staged_bytes > 0)
      in.read(reinterpret_cast<char *>(body_.data()),
              static_cast<std::streamsize>(staged_bytes));
    if (in) {
      buffering_ = true;
    } else {
      log_warn("cannot recover staged bytes of " + key_.key +
               ", joined callers will retry");
      body_.clear();
    }
    staged_.reset();
  }

  void send(const std::string &s) { send(s.data(), s.size()); }
  void send(const char *data, std::size_t len) {
    if (!client_alive_)
      return;
    if (!client_.write(data, len)) {
      client_alive_ = false;
      log_info("client went away during " + key_.key +
               ", upstream fetch continues");
    }
  }

  DiskStore &store_;
  const CacheKey &key_;
  IResponseWriter &client_;
  bool head_only_;
  std::optional<StagedWrite> staged_;
  Bytes body_;
  bool buffering_{false};
  bool chunked_out_{false};
  bool head_sent_{false};
  bool client_alive_{true};
  std::uint64_t client_bytes_{0};
};

} // namespace

SocketWriter::SocketWriter(int fd, std::chrono::milliseconds write_timeout)
    : fd_(fd) {
  if (write_timeout.count() > 0) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(write_timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((write_timeout.count() % 1000) * 1000);
    ::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  }
}

bool SocketWriter::write(const char *data, std::size_t len) {
  if (gone_)
    return false;
  std::size_t off = 0;
  while (off < len) {
    ssize_t w = ::send(fd_, data + off, len - off, MSG_NOSIGNAL);
    if (w < 0) {
      if (errno == EINTR)
        continue;
      gone_ = true;
      return false;
    }
    off += static_cast<std::size_t>(w);
  }
  return true;
}

std::string content_type_for(const CacheKey &key) {
  return key.index ? "application/json" : "application/octet-stream";
}

std::string access_line(const HttpRequest &req, const RequestRecord &rec) {
  std::string line = req.method + " " + req.target + " host=" + req.host() +
                     " -> " + rec.outcome + " " + std::to_string(rec.status) +
                     " bytes=" + std::to_string(rec.bytes);
  if (!rec.detail.empty())
    line += " (" + rec.detail + ")";
  return line;
}

Proxy::Proxy(const ProxyConfig &cfg, DiskStore &store, FetchCoordinator &fetches,
             IUpstream &upstream)
    : cfg_(cfg), store_(store), fetches_(fetches), upstream_(upstream),
      router_(cfg) {}

RequestRecord Proxy::handle(const HttpRequest &req, IResponseWriter &out,
                            TimePoint now) {
  const Route route = router_.classify(req, [&](const std::string &key) {
    return store_.contains_fresh(key, now);
  });

  switch (route.kind) {
  case RouteKind::Disallowed:
  case RouteKind::Normalize:
  case RouteKind::StaticHandoff:
    write_string(out, http_redirect(route.status, route.location));
    return record(route_name(route.kind), route.status, 0, route.location);
  case RouteKind::BadRequest:
    write_string(out, http_error(400, "bad request path"));
    return record(route_name(route.kind), 400);
  case RouteKind::MethodNotAllowed: {
    const std::string body = "method not allowed\n";
    write_string(out, http_head(405, {{"Allow", "GET, HEAD"},
                                      {"Content-Type", "text/plain"},
                                      {"Content-Length",
                                       std::to_string(body.size())}}) +
                          body);
    return record(route_name(route.kind), 405);
  }
  case RouteKind::StaticLocal: {
    auto file = store_.open(route.key.key);
    if (!file) {
      write_string(out, http_error(404, "not cached"));
      return record(route_name(route.kind), 404);
    }
    return serve_file(*file, route.key, req.method == "HEAD", "LOCAL", out);
  }
  case RouteKind::Proxy:
    break;
  }
  return serve_proxy(req, route.key, out, now);
}

RequestRecord Proxy::serve_proxy(const HttpRequest &req, const CacheKey &key,
                                 IResponseWriter &out, TimePoint now) {
  const bool head_only = req.method == "HEAD";
  if (auto file = store_.open(key.key)) {
    if (store_.is_fresh(key.key, file->stored_at(), now))
      return serve_file(*file, key, head_only, "HIT", out);
  }

  CacheFillSink sink(store_, key, out, head_only);
  bool initiated = false;
  std::optional<std::chrono::milliseconds> join_wait;
  if (cfg_.join_wait.count() > 0)
    join_wait = std::chrono::duration_cast<std::chrono::milliseconds>(
        cfg_.join_wait);

  const auto started = std::chrono::steady_clock::now();
  FetchResult result = fetches_.fetch_or_join(
      key.key,
      [&]() {
        initiated = true;
        FetchResult r;
        const UpstreamResult up = upstream_.get(key.upstream_path, sink);
        r.upstream_status = up.status;
        if (!up.ok) {
          r.status = FetchStatus::Failed;
          r.error = upstream_.url_for(key.upstream_path) + ": " + up.error;
          return r;
        }
        // Freshness starts when the body is complete, not when it was asked for.
        const TimePoint stored_at =
            now + std::chrono::duration_cast<Clock::duration>(
                      std::chrono::steady_clock::now() - started);
        r.status = FetchStatus::Ok;
        if (!sink.commit(stored_at))
          r.body = sink.shared_body();
        return r;
      },
      join_wait);

  if (initiated) {
    if (result.ok()) {
      sink.finish();
      return record("miss", 200, sink.client_bytes(),
                    sink.client_alive() ? "" : "client gone");
    }
    log_warn("upstream failure: " + result.error);
    if (!sink.head_sent()) {
      write_string(out, http_error(502, "upstream fetch failed"));
      return record("upstream_error", 502, 0, result.error);
    }
    return record("upstream_error", 200, sink.client_bytes(),
                  "truncated: " + result.error);
  }

  if (result.status == FetchStatus::MustWait) {
    const std::string location = retry_location(req);
    write_string(out, http_redirect(307, location));
    return record("must_wait", 307, 0, location);
  }
  if (!result.ok()) {
    write_string(out, http_error(502, "upstream fetch failed"));
    return record("upstream_error", 502, 0, result.error);
  }
  if (result.body)
    return serve_body(*result.body, key, head_only, out);
  if (auto file = store_.open(key.key))
    return serve_file(*file, key, head_only, "JOIN", out);

  // The fetch succeeded but its entry is gone (install failure or sweep).
  const std::string location = retry_location(req);
  write_string(out, http_redirect(307, location));
  return record("must_wait", 307, 0, "entry vanished, " + location);
}

RequestRecord Proxy::serve_file(EntryFile &file, const CacheKey &key,
                                bool head_only, const char *cache_state,
                                IResponseWriter &out) {
  std::string outcome = cache_state;
  std::transform(outcome.begin(), outcome.end(), outcome.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  const std::string head =
      http_head(200, {{"Content-Type", content_type_for(key)},
                      {"Content-Length", std::to_string(file.size_bytes())},
                      {"X-Cache", cache_state}});
  if (!write_string(out, head))
    return record(outcome.c_str(), 200, 0, "client gone");
  if (head_only)
    return record(outcome.c_str(), 200, 0);

  std::uint64_t sent = 0;
  std::vector<char> buf(kServeChunk);
  while (true) {
    ssize_t r = file.read(buf.data(), buf.size());
    if (r < 0) {
      log_warn("read of cached " + key.key + " failed mid-stream");
      return record(outcome.c_str(), 200, sent, "truncated read");
    }
    if (r == 0)
      break;
    if (!out.write(buf.data(), static_cast<std::size_t>(r)))
      return record(outcome.c_str(), 200, sent, "client gone");
    sent += static_cast<std::uint64_t>(r);
  }
  return record(outcome.c_str(), 200, sent);
}

RequestRecord Proxy::serve_body(const Bytes &body, const CacheKey &key,
                                bool head_only, IResponseWriter &out) {
  const std::string head =
      http_head(200, {{"Content-Type", content_type_for(key)},
                      {"Content-Length", std::to_string(body.size())},
                      {"X-Cache", "JOIN"}});
  if (!write_string(out, head))
    return record("join", 200, 0, "client gone");
  if (head_only || body.empty())
    return record("join", 200, 0);
  if (!out.write(reinterpret_cast<const char *>(body.data()), body.size()))
    return record("join", 200, 0, "client gone");
  return record("join", 200, body.size());
}

} // namespace revcache
