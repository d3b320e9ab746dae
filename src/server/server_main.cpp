#include "revcache/config.hpp"
#include "revcache/disk_store.hpp"
#include "revcache/fetch_coordinator.hpp"
#include "revcache/http.hpp"
#include "revcache/log.hpp"
#include "revcache/proxy.hpp"
#include "revcache/upstream.hpp"

#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/time.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {
volatile std::sig_atomic_t running = 1;
void on_signal(int) { running = 0; }

constexpr int kClientReadTimeoutSec = 30;
constexpr std::chrono::milliseconds kClientWriteTimeout{30000};

struct ServerState {
  revcache::ProxyConfig cfg;
  std::unique_ptr<revcache::DiskStore> store;
  revcache::FetchCoordinator fetches;
  std::unique_ptr<revcache::HttpUpstream> upstream;
  std::unique_ptr<revcache::Proxy> proxy;
  std::atomic<std::size_t> active{0};
  std::atomic<std::uint64_t> rejected{0};
};

int listen_on(const std::string &host, int port, std::string *err) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;
  addrinfo *res = nullptr;
  const std::string port_s = std::to_string(port);
  const int rc = getaddrinfo(host.empty() ? nullptr : host.c_str(),
                             port_s.c_str(), &hints, &res);
  if (rc != 0) {
    *err = std::string("resolve listen address: ") + gai_strerror(rc);
    return -1;
  }
  int fd = -1;
  for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next) {
    fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0)
      continue;
    int one = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    if (bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && listen(fd, 128) == 0)
      break;
    *err = std::string("bind/listen: ") + std::strerror(errno);
    close(fd);
    fd = -1;
  }
  freeaddrinfo(res);
  return fd;
}

bool parse_port(const std::string &s, int *out) {
  if (s.empty() || s.size() > 5 ||
      s.find_first_not_of("0123456789") != std::string::npos)
    return false;
  const int port = std::stoi(s);
  if (port < 1 || port > 65535)
    return false;
  *out = port;
  return true;
}

void send_and_close(int fd, const std::string &msg) {
  send(fd, msg.data(), msg.size(), MSG_NOSIGNAL);
  close(fd);
}

void handle_connection(std::shared_ptr<ServerState> state, int fd) {
  timeval tv{kClientReadTimeoutSec, 0};
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  revcache::HttpRequestParser parser;
  revcache::HttpRequest req;
  std::string err;
  revcache::ParseState ps = revcache::ParseState::Incomplete;
  char buf[4096];
  while (ps == revcache::ParseState::Incomplete) {
    ssize_t r = recv(fd, buf, sizeof(buf), 0);
    if (r < 0 && errno == EINTR)
      continue;
    if (r <= 0)
      break;
    parser.feed(buf, static_cast<std::size_t>(r));
    ps = parser.parse(&req, &err);
  }

  if (ps == revcache::ParseState::Malformed) {
    ++state->rejected;
    revcache::log_warn("rejected malformed request: " + err);
    send_and_close(fd, revcache::http_error(400, "malformed request"));
  } else if (ps == revcache::ParseState::Complete) {
    revcache::SocketWriter out(fd, kClientWriteTimeout);
    const auto rec = state->proxy->handle(req, out);
    revcache::log_info(revcache::access_line(req, rec));
    shutdown(fd, SHUT_WR);
    close(fd);
  } else {
    close(fd);
  }
  --state->active;
}

void sweep_loop(std::shared_ptr<ServerState> state, std::mutex &mu,
                std::condition_variable &cv, const bool &stop) {
  const auto interval = state->cfg.clean_interval;
  std::unique_lock<std::mutex> lk(mu);
  while (!stop) {
    if (cv.wait_for(lk, interval, [&] { return stop; }))
      break;
    lk.unlock();
    const auto r = state->store->erase_expired(revcache::Clock::now());
    const auto fs = state->fetches.stats();
    const auto ds = state->store->stats();
    std::ostringstream os;
    os << "cache: " << r.bytes_used << " bytes used, cleanup freed "
       << r.bytes_freed << " bytes in " << r.files_removed << " files; hits:"
       << ds.hits << " misses:" << ds.misses << " corrupt:" << ds.corrupt
       << " puts:" << ds.puts << " put_failures:" << ds.put_failures
       << " fetches:" << fs.started << " joins:" << fs.joined
       << " fetch_failures:" << fs.failed << " active:" << state->active;
    revcache::log_info(os.str());
    lk.lock();
  }
}

} // namespace

int main(int argc, char **argv) {
  std::string host_override;
  int port_override = 0;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--port" && i + 1 < argc) {
      if (!parse_port(argv[++i], &port_override)) {
        std::cerr << "ERROR: --port expects 1..65535, got '" << argv[i] << "'\n";
        return 1;
      }
    } else if (a == "--host" && i + 1 < argc) {
      host_override = argv[++i];
    } else if (a == "--quiet") {
      revcache::set_log_quiet(true);
    }
  }

  auto state = std::make_shared<ServerState>();
  std::vector<std::string> errors;
  if (!revcache::load_config(revcache::environ_map(), &state->cfg, &errors)) {
    for (const auto &e : errors)
      std::cerr << "ERROR in configuration: " << e << "\n";
    std::cerr << "ABORTING due to configuration errors, check the environment\n";
    return 1;
  }
  if (port_override > 0)
    state->cfg.port = port_override;
  if (!host_override.empty())
    state->cfg.host = host_override;
  std::istringstream described(revcache::describe(state->cfg));
  for (std::string line; std::getline(described, line);)
    revcache::log_info("configuration: " + line);

  revcache::DiskConfig dcfg;
  dcfg.root = state->cfg.local_root;
  dcfg.file_duration = state->cfg.file_duration;
  dcfg.index_duration = state->cfg.index_duration;
  state->store = std::make_unique<revcache::DiskStore>(dcfg);
  std::string err;
  if (!state->store->init(&err)) {
    std::cerr << "ERROR: " << err << "\n";
    return 1;
  }
  state->upstream = std::make_unique<revcache::HttpUpstream>(
      state->cfg.backend, state->cfg.http_timeout);
  state->proxy = std::make_unique<revcache::Proxy>(
      state->cfg, *state->store, state->fetches, *state->upstream);

  int server_fd = listen_on(state->cfg.host, state->cfg.port, &err);
  if (server_fd < 0) {
    std::cerr << "ERROR: " << err << "\n";
    return 1;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  std::signal(SIGPIPE, SIG_IGN);

  std::mutex sweep_mu;
  std::condition_variable sweep_cv;
  bool sweep_stop = false;
  std::thread sweeper;
  if (state->cfg.clean_interval.count() > 0)
    sweeper = std::thread(sweep_loop, state, std::ref(sweep_mu),
                          std::ref(sweep_cv), std::cref(sweep_stop));

  revcache::log_info("revcache_server listening on " + state->cfg.host + ":" +
                     std::to_string(state->cfg.port));

  while (running) {
    pollfd pfd{server_fd, POLLIN, 0};
    int n = poll(&pfd, 1, 200);
    if (n <= 0)
      continue;
    int cfd = accept4(server_fd, nullptr, nullptr, SOCK_CLOEXEC);
    if (cfd < 0)
      continue;
    if (state->active >= state->cfg.max_connections) {
      ++state->rejected;
      send_and_close(cfd, revcache::http_error(503, "connection limit reached"));
      continue;
    }
    ++state->active;
    try {
      std::thread(handle_connection, state, cfd).detach();
    } catch (const std::system_error &e) {
      --state->active;
      revcache::log_error(std::string("cannot start connection thread: ") +
                          e.what());
      send_and_close(cfd, revcache::http_error(503, "server busy"));
    }
  }

  revcache::log_info("shutting down");
  close(server_fd);
  {
    std::lock_guard<std::mutex> lk(sweep_mu);
    sweep_stop = true;
  }
  sweep_cv.notify_all();
  if (sweeper.joinable())
    sweeper.join();

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (state->active > 0 && std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  if (state->active > 0) {
    revcache::log_warn(std::to_string(state->active.load()) +
                       " connections still open at exit");
    // Detached connection threads may still log; skip static destruction.
    std::cout.flush();
    std::cerr.flush();
    _exit(0);
  }
  return 0;
}
