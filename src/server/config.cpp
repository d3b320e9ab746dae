#include "revcache/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <stdexcept>

extern char **environ;

namespace revcache {
namespace {

bool parse_u64(const std::string &s, std::uint64_t &out) {
  if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0])))
    return false;
  try {
    std::size_t idx = 0;
    out = std::stoull(s, &idx);
    return idx == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

std::string trim(const std::string &s) {
  const auto b = s.find_first_not_of(" \t");
  if (b == std::string::npos)
    return {};
  const auto e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

std::vector<std::string> split_list(const std::string &s) {
  std::vector<std::string> out;
  std::string item;
  std::istringstream in(s);
  while (std::getline(in, item, ',')) {
    item = trim(item);
    std::transform(item.begin(), item.end(), item.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (!item.empty())
      out.push_back(item);
  }
  return out;
}

class EnvReader {
public:
  EnvReader(const EnvMap &env, std::vector<std::string> *errors)
      : env_(env), errors_(errors) {}

  const std::string *find(const std::string &name) const {
    auto it = env_.find(kEnvPrefix + name);
    if (it == env_.end())
      return nullptr;
    return &it->second;
  }

  void required(const std::string &name, std::string &out) {
    const auto *v = find(name);
    if (v == nullptr || v->empty()) {
      errors_->push_back(std::string(kEnvPrefix) + name +
                         " must be set and it is missing");
      return;
    }
    out = *v;
  }

  void optional(const std::string &name, std::string &out) {
    if (const auto *v = find(name))
      out = *v;
  }

  void seconds(const std::string &name, std::chrono::seconds &out) {
    std::uint64_t u = 0;
    if (integer(name, u))
      out = std::chrono::seconds(static_cast<std::int64_t>(u));
  }

  bool integer(const std::string &name, std::uint64_t &out) {
    const auto *v = find(name);
    if (v == nullptr)
      return false;
    if (!parse_u64(*v, out)) {
      errors_->push_back(std::string(kEnvPrefix) + name +
                         " must be a non-negative integer");
      return false;
    }
    return true;
  }

  void error(const std::string &msg) { errors_->push_back(msg); }

private:
  const EnvMap &env_;
  std::vector<std::string> *errors_;
};

} // namespace

bool parse_backend_prefix(const std::string &prefix, BackendAddress *out,
                          std::string *err) {
  const std::string scheme = "http://";
  if (prefix.rfind(scheme, 0) != 0) {
    if (err)
      *err = "backend prefix must start with http://";
    return false;
  }
  std::string rest = prefix.substr(scheme.size());
  std::string authority = rest;
  std::string path;
  const auto slash = rest.find('/');
  if (slash != std::string::npos) {
    authority = rest.substr(0, slash);
    path = rest.substr(slash);
  }
  while (!path.empty() && path.back() == '/')
    path.pop_back();
  if (authority.empty()) {
    if (err)
      *err = "backend prefix has no host";
    return false;
  }
  BackendAddress addr;
  const auto colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    std::uint64_t port = 0;
    if (!parse_u64(authority.substr(colon + 1), port) || port == 0 ||
        port > 65535) {
      if (err)
        *err = "backend prefix has an invalid port";
      return false;
    }
    addr.host = authority.substr(0, colon);
    addr.port = static_cast<int>(port);
  } else {
    addr.host = authority;
  }
  if (addr.host.empty()) {
    if (err)
      *err = "backend prefix has no host";
    return false;
  }
  addr.base_path = path;
  *out = std::move(addr);
  return true;
}

bool load_config(const EnvMap &env, ProxyConfig *out,
                 std::vector<std::string> *errors) {
  const std::size_t errors_before = errors->size();
  EnvReader r(env, errors);
  ProxyConfig cfg;

  r.required("BACKEND_PREFIX", cfg.backend_prefix);
  r.required("LOCAL_ROOT", cfg.local_root);
  r.required("REDIRECT_INVALID_TO", cfg.redirect_invalid_to);
  r.optional("REDIRECT_STATIC_PREFIX", cfg.redirect_static_prefix);
  r.optional("ALLOWED_ROOT", cfg.allowed_root);
  r.optional("HOST", cfg.host);

  std::string hosts;
  r.optional("ALLOWED_HOSTS", hosts);
  cfg.allowed_hosts = split_list(hosts);

  r.seconds("CACHE_FILE_DURATION", cfg.file_duration);
  r.seconds("CACHE_INDEX_DURATION", cfg.index_duration);
  r.seconds("CACHE_CLEAN_INTERVAL", cfg.clean_interval);
  r.seconds("HTTP_TIMEOUT_SEC", cfg.http_timeout);
  r.seconds("JOIN_WAIT_SEC", cfg.join_wait);

  std::uint64_t u = 0;
  if (r.integer("MAX_CONNECTIONS", u)) {
    if (u == 0)
      r.error(std::string(kEnvPrefix) + "MAX_CONNECTIONS must be positive");
    else
      cfg.max_connections = static_cast<std::size_t>(u);
  }
  if (r.integer("PORT", u)) {
    if (u == 0 || u > 65535)
      r.error(std::string(kEnvPrefix) + "PORT must be in 1..65535");
    else
      cfg.port = static_cast<int>(u);
  }

  if (cfg.file_duration.count() == 0)
    r.error(std::string(kEnvPrefix) + "CACHE_FILE_DURATION must be positive");
  if (cfg.http_timeout.count() == 0)
    r.error(std::string(kEnvPrefix) + "HTTP_TIMEOUT_SEC must be positive");

  if (!cfg.backend_prefix.empty()) {
    std::string err;
    if (!parse_backend_prefix(cfg.backend_prefix, &cfg.backend, &err))
      r.error(std::string(kEnvPrefix) + "BACKEND_PREFIX: " + err);
  }

  while (cfg.redirect_static_prefix.size() > 1 &&
         cfg.redirect_static_prefix.back() == '/')
    cfg.redirect_static_prefix.pop_back();
  if (!cfg.redirect_static_prefix.empty() &&
      cfg.redirect_static_prefix.front() != '/')
    r.error(std::string(kEnvPrefix) +
            "REDIRECT_STATIC_PREFIX must be an absolute path");
  if (cfg.allowed_root.find('/') != std::string::npos)
    r.error(std::string(kEnvPrefix) +
            "ALLOWED_ROOT must be a single path component");

  if (errors->size() != errors_before)
    return false;
  *out = std::move(cfg);
  return true;
}

EnvMap environ_map() {
  EnvMap env;
  for (char **e = environ; e != nullptr && *e != nullptr; ++e) {
    const std::string kv = *e;
    const auto eq = kv.find('=');
    if (eq == std::string::npos)
      continue;
    env.emplace(kv.substr(0, eq), kv.substr(eq + 1));
  }
  return env;
}

std::string describe(const ProxyConfig &cfg) {
  std::ostringstream os;
  std::string hosts;
  for (const auto &h : cfg.allowed_hosts)
    hosts += (hosts.empty() ? "" : ",") + h;
  os << "backend_prefix:" << cfg.backend_prefix << "\n"
     << "local_root:" << cfg.local_root << "\n"
     << "redirect_invalid_to:" << cfg.redirect_invalid_to << "\n"
     << "redirect_static_prefix:" << cfg.redirect_static_prefix << "\n"
     << "allowed_hosts:" << hosts << "\n"
     << "allowed_root:" << cfg.allowed_root << "\n"
     << "cache_file_duration:" << cfg.file_duration.count() << "\n"
     << "cache_index_duration:" << cfg.index_duration.count() << "\n"
     << "cache_clean_interval:" << cfg.clean_interval.count() << "\n"
     << "http_timeout_sec:" << cfg.http_timeout.count() << "\n"
     << "join_wait_sec:" << cfg.join_wait.count() << "\n"
     << "max_connections:" << cfg.max_connections << "\n"
     << "listen:" << cfg.host << ":" << cfg.port << "\n";
  return os.str();
}

} // namespace revcache
