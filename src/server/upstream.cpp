#include "revcache/upstream.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <optional>
#include <utility>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace revcache {
namespace {

constexpr std::size_t kMaxResponseHead = 64 * 1024;
constexpr std::size_t kReadChunk = 32 * 1024;

struct SocketGuard {
  int fd{-1};
  ~SocketGuard() {
    if (fd >= 0)
      ::close(fd);
  }
};

bool send_all(int fd, const std::string &data) {
  std::size_t off = 0;
  while (off < data.size()) {
    ssize_t w = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
    if (w < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    off += static_cast<std::size_t>(w);
  }
  return true;
}

std::string recv_error() {
  if (errno == EAGAIN || errno == EWOULDBLOCK)
    return "upstream read timeout";
  return std::string("upstream read failed: ") + std::strerror(errno);
}

bool connect_with_timeout(int fd, const sockaddr *addr, socklen_t len,
                          std::chrono::seconds timeout, std::string *err) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    *err = std::string("fcntl: ") + std::strerror(errno);
    return false;
  }
  int rc = ::connect(fd, addr, len);
  if (rc != 0 && errno != EINPROGRESS) {
    *err = std::string("connect: ") + std::strerror(errno);
    return false;
  }
  if (rc != 0) {
    pollfd pfd{fd, POLLOUT, 0};
    const int ms = static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count());
    do {
      rc = ::poll(&pfd, 1, ms);
    } while (rc < 0 && errno == EINTR);
    if (rc == 0) {
      *err = "connect timeout";
      return false;
    }
    if (rc < 0) {
      *err = std::string("poll: ") + std::strerror(errno);
      return false;
    }
    int so_error = 0;
    socklen_t so_len = sizeof(so_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) != 0 ||
        so_error != 0) {
      *err = std::string("connect: ") +
             std::strerror(so_error != 0 ? so_error : errno);
      return false;
    }
  }
  if (::fcntl(fd, F_SETFL, flags) < 0) {
    *err = std::string("fcntl: ") + std::strerror(errno);
    return false;
  }
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count());
  ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  return true;
}

} // namespace

HttpUpstream::HttpUpstream(BackendAddress backend, std::chrono::seconds timeout)
    : backend_(std::move(backend)), timeout_(timeout) {}

std::string HttpUpstream::url_for(const std::string &path) const {
  std::string url = "http://" + backend_.host;
  if (backend_.port != 80)
    url += ":" + std::to_string(backend_.port);
  return url + backend_.base_path + path;
}

int HttpUpstream::connect_backend(std::string *err) const {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *res = nullptr;
  const std::string port = std::to_string(backend_.port);
  const int rc = ::getaddrinfo(backend_.host.c_str(), port.c_str(), &hints, &res);
  if (rc != 0) {
    *err = "resolve " + backend_.host + ": " + ::gai_strerror(rc);
    return -1;
  }
  int fd = -1;
  for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) {
      *err = std::string("socket: ") + std::strerror(errno);
      continue;
    }
    if (connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen, timeout_, err))
      break;
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(res);
  return fd;
}

UpstreamResult HttpUpstream::get(const std::string &path, IBodySink &sink) {
  UpstreamResult result;
  SocketGuard sock;
  sock.fd = connect_backend(&result.error);
  if (sock.fd < 0)
    return result;

  std::string host = backend_.host;
  if (backend_.port != 80)
    host += ":" + std::to_string(backend_.port);
  const std::string request = "GET " + backend_.base_path + path +
                              " HTTP/1.1\r\nHost: " + host +
                              "\r\nUser-Agent: revcache\r\n"
                              "Accept-Encoding: identity\r\n"
                              "Connection: close\r\n\r\n";
  if (!send_all(sock.fd, request)) {
    result.error = std::string("upstream send failed: ") + std::strerror(errno);
    return result;
  }

  std::string buf;
  char chunk[kReadChunk];
  std::size_t head_end = std::string::npos;
  while (head_end == std::string::npos) {
    ssize_t r = ::recv(sock.fd, chunk, sizeof(chunk), 0);
    if (r < 0 && errno == EINTR)
      continue;
    if (r < 0) {
      result.error = recv_error();
      return result;
    }
    if (r == 0) {
      result.error = "upstream closed before response head";
      return result;
    }
    buf.append(chunk, static_cast<std::size_t>(r));
    head_end = buf.find("\r\n\r\n");
    if (head_end == std::string::npos && buf.size() > kMaxResponseHead) {
      result.error = "upstream response head too large";
      return result;
    }
  }

  HttpResponseHead head;
  if (!parse_response_head(buf.substr(0, head_end), &head, &result.error))
    return result;
  result.status = head.status;
  if (head.status < 200 || head.status > 299) {
    result.error = "upstream status " + std::to_string(head.status);
    return result;
  }
  if (!sink.on_head(head)) {
    result.error = "aborted by receiver";
    return result;
  }

  const bool chunked = head.chunked();
  std::optional<std::uint64_t> length;
  if (!chunked)
    length = head.content_length();
  ChunkedDecoder decoder;
  std::string decoded;

  auto deliver = [&](const char *data, std::size_t len) -> bool {
    if (chunked) {
      decoded.clear();
      if (!decoder.feed(data, len, &decoded)) {
        result.error = "malformed chunked body";
        return false;
      }
      data = decoded.data();
      len = decoded.size();
    } else if (length.has_value()) {
      len = static_cast<std::size_t>(
          std::min<std::uint64_t>(len, *length - result.bytes));
    }
    if (len == 0)
      return true;
    result.bytes += len;
    if (!sink.on_data(data, len)) {
      result.error = "aborted by receiver";
      return false;
    }
    return true;
  };
  auto complete = [&]() {
    if (chunked)
      return decoder.done();
    return length.has_value() && result.bytes >= *length;
  };

  const std::string rest = buf.substr(head_end + 4);
  if (!rest.empty() && !deliver(rest.data(), rest.size()))
    return result;

  while (!complete()) {
    ssize_t r = ::recv(sock.fd, chunk, sizeof(chunk), 0);
    if (r < 0 && errno == EINTR)
      continue;
    if (r < 0) {
      result.error = recv_error();
      return result;
    }
    if (r == 0) {
      if (chunked || length.has_value()) {
        result.error = "upstream closed mid-body after " +
                       std::to_string(result.bytes) + " bytes";
        return result;
      }
      break;
    }
    if (!deliver(chunk, static_cast<std::size_t>(r)))
      return result;
  }
  result.ok = true;
  return result;
}

} // namespace revcache
