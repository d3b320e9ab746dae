#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace revcache {

// Parsed form of BACKEND_PREFIX. Only plain http is supported upstream.
struct BackendAddress {
  std::string host;
  int port{80};
  std::string base_path;
};

struct ProxyConfig {
  std::string backend_prefix;
  BackendAddress backend;
  std::string local_root;
  std::string redirect_invalid_to;
  std::string redirect_static_prefix;
  std::vector<std::string> allowed_hosts;
  std::string allowed_root;
  std::chrono::seconds file_duration{1209600};
  std::chrono::seconds index_duration{60};
  std::chrono::seconds clean_interval{60};
  std::chrono::seconds http_timeout{300};
  std::chrono::seconds join_wait{0};
  std::size_t max_connections{512};
  std::string host{"0.0.0.0"};
  int port{8181};
};

using EnvMap = std::unordered_map<std::string, std::string>;

inline constexpr const char *kEnvPrefix = "REVPROXY_";

bool parse_backend_prefix(const std::string &prefix, BackendAddress *out,
                          std::string *err = nullptr);

// Fills `out` from REVPROXY_* keys of `env`. Every problem is appended to
// `errors`; returns false if there was at least one.
bool load_config(const EnvMap &env, ProxyConfig *out,
                 std::vector<std::string> *errors);

EnvMap environ_map();

std::string describe(const ProxyConfig &cfg);

} // namespace revcache
