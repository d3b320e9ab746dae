#pragma once

#include "revcache/config.hpp"
#include "revcache/http.hpp"

#include <functional>
#include <string>
#include <vector>

namespace revcache {

enum class RouteKind {
  Disallowed,
  BadRequest,
  MethodNotAllowed,
  Normalize,
  StaticLocal,
  StaticHandoff,
  Proxy
};

struct Route {
  RouteKind kind{RouteKind::Proxy};
  int status{0};
  std::string location;
  CacheKey key;
};

// Answers whether a fresh entry for a cache key is on disk.
using FreshProbe = std::function<bool(const std::string &key)>;

// Stateless request classifier. Rules are evaluated in a fixed order:
// disallowed host or root, malformed path, non-normalized path, static
// hand-off, and finally proxying.
class Router {
public:
  explicit Router(const ProxyConfig &cfg);

  Route classify(const HttpRequest &req, const FreshProbe &fresh) const;

  bool host_allowed(const std::string &host) const;
  bool handoff_enabled() const { return !static_prefix_.empty(); }

private:
  Route redirect(RouteKind kind, int status, std::string location) const;

  std::vector<std::string> allowed_hosts_;
  std::string allowed_root_;
  std::string static_prefix_;
  std::string fallback_;
};

const char *route_name(RouteKind kind);

} // namespace revcache
