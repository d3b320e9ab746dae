#include "revcache/http.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace revcache {
namespace {

constexpr std::size_t kMaxHeadBytes = 16 * 1024;

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string trim(const std::string &s) {
  const auto b = s.find_first_not_of(" \t");
  if (b == std::string::npos)
    return {};
  const auto e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

const std::string *find_header(const HeaderList &headers,
                               const std::string &name) {
  for (const auto &[k, v] : headers)
    if (k == name)
      return &v;
  return nullptr;
}

bool parse_header_lines(const std::string &block, std::size_t pos,
                        HeaderList *out) {
  while (pos < block.size()) {
    auto eol = block.find("\r\n", pos);
    if (eol == std::string::npos)
      eol = block.size();
    const std::string line = block.substr(pos, eol - pos);
    pos = eol + 2;
    if (line.empty())
      continue;
    const auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0)
      return false;
    out->emplace_back(lower(trim(line.substr(0, colon))),
                      trim(line.substr(colon + 1)));
  }
  return true;
}

bool parse_hex(const std::string &s, std::uint64_t &out) {
  if (s.empty() || s.size() > 15)
    return false;
  out = 0;
  for (char c : s) {
    int v;
    if (c >= '0' && c <= '9')
      v = c - '0';
    else if (c >= 'a' && c <= 'f')
      v = c - 'a' + 10;
    else if (c >= 'A' && c <= 'F')
      v = c - 'A' + 10;
    else
      return false;
    out = out * 16 + static_cast<std::uint64_t>(v);
  }
  return true;
}

} // namespace

const std::string *HttpRequest::header(const std::string &name) const {
  return find_header(headers, name);
}

std::string HttpRequest::host() const {
  const auto *h = header("host");
  if (h == nullptr)
    return {};
  std::string host = lower(*h);
  if (!host.empty() && host[0] == '[') {
    const auto close = host.find(']');
    return close == std::string::npos ? host : host.substr(0, close + 1);
  }
  const auto colon = host.find(':');
  if (colon != std::string::npos)
    host.erase(colon);
  return host;
}

void HttpRequestParser::feed(const char *data, std::size_t len) {
  buffer_.append(data, len);
}

ParseState HttpRequestParser::parse(HttpRequest *out, std::string *err) {
  const auto end = buffer_.find("\r\n\r\n");
  if (end == std::string::npos) {
    if (buffer_.size() > kMaxHeadBytes) {
      if (err)
        *err = "request head too large";
      return ParseState::Malformed;
    }
    return ParseState::Incomplete;
  }
  const std::string head = buffer_.substr(0, end + 2);
  buffer_.erase(0, end + 4);

  const auto eol = head.find("\r\n");
  const std::string line = head.substr(0, eol);
  const auto sp1 = line.find(' ');
  const auto sp2 = line.rfind(' ');
  if (sp1 == std::string::npos || sp1 == sp2) {
    if (err)
      *err = "malformed request line";
    return ParseState::Malformed;
  }
  HttpRequest req;
  req.method = line.substr(0, sp1);
  req.target = line.substr(sp1 + 1, sp2 - sp1 - 1);
  req.version = line.substr(sp2 + 1);
  if (req.method.empty() || req.target.empty() ||
      req.version.rfind("HTTP/1.", 0) != 0) {
    if (err)
      *err = "malformed request line";
    return ParseState::Malformed;
  }
  if (!parse_header_lines(head, eol + 2, &req.headers)) {
    if (err)
      *err = "malformed header";
    return ParseState::Malformed;
  }

  std::string target = req.target;
  const std::string scheme = "http://";
  if (lower(target.substr(0, scheme.size())) == scheme) {
    const auto slash = target.find('/', scheme.size());
    const std::string authority =
        target.substr(scheme.size(), slash == std::string::npos
                                         ? std::string::npos
                                         : slash - scheme.size());
    target = slash == std::string::npos ? "/" : target.substr(slash);
    auto it = std::find_if(req.headers.begin(), req.headers.end(),
                           [](const auto &h) { return h.first == "host"; });
    if (it != req.headers.end())
      it->second = authority;
    else
      req.headers.emplace_back("host", authority);
  }
  const auto q = target.find('?');
  req.path = target.substr(0, q);
  if (q != std::string::npos)
    req.query = target.substr(q + 1);
  const auto frag = req.path.find('#');
  if (frag != std::string::npos)
    req.path.erase(frag);
  *out = std::move(req);
  return ParseState::Complete;
}

const std::string *HttpResponseHead::header(const std::string &name) const {
  return find_header(headers, name);
}

std::optional<std::uint64_t> HttpResponseHead::content_length() const {
  const auto *v = header("content-length");
  if (v == nullptr || v->empty() ||
      !std::all_of(v->begin(), v->end(),
                   [](unsigned char c) { return std::isdigit(c); }))
    return std::nullopt;
  try {
    return static_cast<std::uint64_t>(std::stoull(*v));
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

bool HttpResponseHead::chunked() const {
  const auto *v = header("transfer-encoding");
  return v != nullptr && lower(*v).find("chunked") != std::string::npos;
}

bool parse_response_head(const std::string &head, HttpResponseHead *out,
                         std::string *err) {
  auto eol = head.find("\r\n");
  if (eol == std::string::npos)
    eol = head.size();
  const std::string line = head.substr(0, eol);
  if (line.rfind("HTTP/1.", 0) != 0 || line.size() < 12 || line[8] != ' ') {
    if (err)
      *err = "malformed status line";
    return false;
  }
  const std::string code = line.substr(9, 3);
  if (!std::all_of(code.begin(), code.end(),
                   [](unsigned char c) { return std::isdigit(c); })) {
    if (err)
      *err = "malformed status code";
    return false;
  }
  HttpResponseHead h;
  h.status = std::stoi(code);
  h.reason = line.size() > 13 ? line.substr(13) : "";
  if (eol + 2 < head.size() && !parse_header_lines(head, eol + 2, &h.headers)) {
    if (err)
      *err = "malformed response header";
    return false;
  }
  *out = std::move(h);
  return true;
}

bool ChunkedDecoder::feed(const char *data, std::size_t len, std::string *out) {
  std::size_t i = 0;
  while (i < len && state_ != State::Done) {
    switch (state_) {
    case State::Size:
    case State::Trailer: {
      const char c = data[i++];
      if (c != '\n') {
        line_.push_back(c);
        if (line_.size() > 1024)
          return false;
        break;
      }
      if (!line_.empty() && line_.back() == '\r')
        line_.pop_back();
      if (state_ == State::Trailer) {
        if (line_.empty())
          state_ = State::Done;
        line_.clear();
        break;
      }
      const auto semi = line_.find(';');
      if (!parse_hex(trim(line_.substr(0, semi)), remaining_))
        return false;
      line_.clear();
      state_ = remaining_ == 0 ? State::Trailer : State::Data;
      break;
    }
    case State::Data: {
      const std::size_t n =
          static_cast<std::size_t>(std::min<std::uint64_t>(remaining_, len - i));
      out->append(data + i, n);
      i += n;
      remaining_ -= n;
      if (remaining_ == 0)
        state_ = State::DataCrlf;
      break;
    }
    case State::DataCrlf: {
      const char c = data[i++];
      if (c == '\r')
        break;
      if (c != '\n')
        return false;
      state_ = State::Size;
      break;
    }
    case State::Done:
      break;
    }
  }
  return true;
}

const char *reason_phrase(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 301:
    return "Moved Permanently";
  case 302:
    return "Found";
  case 307:
    return "Temporary Redirect";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 500:
    return "Internal Server Error";
  case 502:
    return "Bad Gateway";
  case 503:
    return "Service Unavailable";
  case 504:
    return "Gateway Timeout";
  default:
    return "Unknown";
  }
}

std::string http_head(int status, const HeaderList &headers) {
  std::string out = "HTTP/1.1 " + std::to_string(status) + " " +
                    reason_phrase(status) + "\r\n";
  for (const auto &[k, v] : headers)
    out += k + ": " + v + "\r\n";
  out += "Connection: close\r\n\r\n";
  return out;
}

std::string http_redirect(int status, const std::string &location) {
  return http_head(status, {{"Location", location},
                            {"Cache-Control", "no-store"},
                            {"Content-Length", "0"}});
}

std::string http_error(int status, const std::string &message) {
  const std::string body = message + "\n";
  return http_head(status, {{"Content-Type", "text/plain"},
                            {"Content-Length", std::to_string(body.size())}}) +
         body;
}

std::optional<std::string> normalize_path(const std::string &path) {
  if (path.empty() || path[0] != '/')
    return std::nullopt;
  const std::string l = lower(path);
  if (l.find("%2e") != std::string::npos ||
      l.find("%2f") != std::string::npos ||
      l.find("%5c") != std::string::npos ||
      l.find("%00") != std::string::npos)
    return std::nullopt;
  std::vector<std::string> parts;
  std::size_t pos = 0;
  while (pos < path.size()) {
    auto next = path.find('/', pos);
    if (next == std::string::npos)
      next = path.size();
    std::string part = path.substr(pos, next - pos);
    pos = next + 1;
    if (part.empty() || part == ".")
      continue;
    if (part == "..")
      return std::nullopt;
    parts.push_back(std::move(part));
  }
  std::string out;
  for (const auto &p : parts)
    out += "/" + p;
  return out.empty() ? std::string("/") : out;
}

std::optional<CacheKey> make_cache_key(const std::string &method,
                                       const std::string &normalized_path) {
  if (method != "GET" && method != "HEAD")
    return std::nullopt;
  if (normalized_path.empty() || normalized_path[0] != '/')
    return std::nullopt;
  CacheKey k;
  const auto last = normalized_path.substr(normalized_path.rfind('/') + 1);
  if (last.find('.') == std::string::npos) {
    k.index = true;
    k.upstream_path = normalized_path == "/" ? "/" : normalized_path + "/";
    k.key = (normalized_path == "/" ? "" : normalized_path) + "/index.json";
  } else {
    k.key = normalized_path;
    k.upstream_path = normalized_path;
  }
  return k;
}

} // namespace revcache
