#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace revcache {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
  std::string method;
  std::string target;
  std::string path;
  std::string query;
  std::string version;
  HeaderList headers; // names lowercased

  const std::string *header(const std::string &name) const;
  // Host header without port, lowercased. Empty if absent.
  std::string host() const;
};

enum class ParseState { Incomplete, Complete, Malformed };

class HttpRequestParser {
public:
  void feed(const char *data, std::size_t len);
  ParseState parse(HttpRequest *out, std::string *err = nullptr);
  std::size_t buffered() const { return buffer_.size(); }

private:
  std::string buffer_;
};

struct HttpResponseHead {
  int status{0};
  std::string reason;
  HeaderList headers; // names lowercased

  const std::string *header(const std::string &name) const;
  std::optional<std::uint64_t> content_length() const;
  bool chunked() const;
};

// Parses "HTTP/1.x NNN reason\r\nheaders..." up to (not including) the
// blank line.
bool parse_response_head(const std::string &head, HttpResponseHead *out,
                         std::string *err = nullptr);

// Incremental decoder for Transfer-Encoding: chunked bodies.
class ChunkedDecoder {
public:
  // Appends decoded bytes to `out`. Returns false on malformed framing.
  bool feed(const char *data, std::size_t len, std::string *out);
  bool done() const { return state_ == State::Done; }

private:
  enum class State { Size, Data, DataCrlf, Trailer, Done };
  State state_{State::Size};
  std::string line_;
  std::uint64_t remaining_{0};
};

const char *reason_phrase(int status);
std::string http_head(int status, const HeaderList &headers);
std::string http_redirect(int status, const std::string &location);
std::string http_error(int status, const std::string &message);

// Collapses duplicate slashes and "." segments. Returns nullopt for ".."
// segments, encoded dots or slashes, or a path not starting with '/'.
std::optional<std::string> normalize_path(const std::string &path);

struct CacheKey {
  std::string key;
  std::string upstream_path;
  bool index{false};
};

// GET and HEAD share one key; other methods are not cacheable. A path whose
// last component has no '.' is a directory index stored as index.json.
std::optional<CacheKey> make_cache_key(const std::string &method,
                                       const std::string &normalized_path);

} // namespace revcache
