#include "revcache/router.hpp"

#include <algorithm>

namespace revcache {
namespace {

bool under_prefix(const std::string &path, const std::string &prefix) {
  if (prefix.empty())
    return false;
  if (path == prefix)
    return true;
  return path.size() > prefix.size() && path.compare(0, prefix.size(), prefix) == 0 &&
         path[prefix.size()] == '/';
}

std::string first_component(const std::string &path) {
  const auto start = path.find_first_not_of('/');
  if (start == std::string::npos)
    return {};
  const auto end = path.find('/', start);
  return path.substr(start, end == std::string::npos ? std::string::npos
                                                     : end - start);
}

} // namespace

Router::Router(const ProxyConfig &cfg)
    : allowed_hosts_(cfg.allowed_hosts), allowed_root_(cfg.allowed_root),
      static_prefix_(cfg.redirect_static_prefix == "/"
                         ? std::string()
                         : cfg.redirect_static_prefix),
      fallback_(cfg.redirect_invalid_to) {}

bool Router::host_allowed(const std::string &host) const {
  if (allowed_hosts_.empty())
    return true;
  return std::find(allowed_hosts_.begin(), allowed_hosts_.end(), host) !=
         allowed_hosts_.end();
}

Route Router::redirect(RouteKind kind, int status, std::string location) const {
  Route r;
  r.kind = kind;
  r.status = status;
  r.location = std::move(location);
  return r;
}

Route Router::classify(const HttpRequest &req, const FreshProbe &fresh) const {
  if (!host_allowed(req.host()))
    return redirect(RouteKind::Disallowed, 302, fallback_);

  if (req.method != "GET" && req.method != "HEAD") {
    Route r;
    r.kind = RouteKind::MethodNotAllowed;
    r.status = 405;
    return r;
  }

  const auto normalized = normalize_path(req.path);
  if (!normalized) {
    Route r;
    r.kind = RouteKind::BadRequest;
    r.status = 400;
    return r;
  }

  const bool local = under_prefix(*normalized, static_prefix_);
  std::string logical = *normalized;
  if (local) {
    logical = normalized->substr(static_prefix_.size());
    if (logical.empty())
      logical = "/";
  }

  if (!allowed_root_.empty() && first_component(logical) != allowed_root_)
    return redirect(RouteKind::Disallowed, 302, fallback_);

  if (*normalized != req.path) {
    std::string location = *normalized;
    if (!req.query.empty())
      location += "?" + req.query;
    return redirect(RouteKind::Normalize, 301, location);
  }

  auto key = make_cache_key(req.method, logical);
  Route r;
  r.key = *key;
  if (local) {
    r.kind = RouteKind::StaticLocal;
    return r;
  }
  if (handoff_enabled() && !r.key.index && fresh && fresh(r.key.key)) {
    r.kind = RouteKind::StaticHandoff;
    r.status = 302;
    r.location = static_prefix_ + logical;
    return r;
  }
  r.kind = RouteKind::Proxy;
  return r;
}

const char *route_name(RouteKind kind) {
  switch (kind) {
  case RouteKind::Disallowed:
    return "disallowed";
  case RouteKind::BadRequest:
    return "bad_request";
  case RouteKind::MethodNotAllowed:
    return "method_not_allowed";
  case RouteKind::Normalize:
    return "normalize";
  case RouteKind::StaticLocal:
    return "static_local";
  case RouteKind::StaticHandoff:
    return "static_handoff";
  case RouteKind::Proxy:
    return "proxy";
  }
  return "proxy";
}

} // namespace revcache
