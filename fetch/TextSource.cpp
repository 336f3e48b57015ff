#include "TextSource.hpp"
#include "core/Log.hpp"

#include <promscope/promscope.hpp>

#include <charconv>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace promscope {

namespace {

struct FdGuard {
  int fd = -1;
  ~FdGuard() { if (fd >= 0) ::close(fd); }
};

static bool fail(std::string& err, std::string msg) {
  log::Get()->error("fetch failed: {}", msg);
  err = std::move(msg);
  return false;
}

static void setTimeouts(int sock, int timeout_ms) {
  if (timeout_ms <= 0) return;
  timeval tv{};
  tv.tv_sec = timeout_ms / 1000;
  tv.tv_usec = (timeout_ms % 1000) * 1000;
  ::setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  ::setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

static int connectTo(const Endpoint& ep, std::string& why) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  const auto port = std::to_string(ep.port);
  if (int rc = ::getaddrinfo(ep.host.c_str(), port.c_str(), &hints, &res); rc != 0) {
    why = "resolve " + ep.host + ": " + ::gai_strerror(rc);
    return -1;
  }
  std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(res, &::freeaddrinfo);
  why = "no usable address for " + ep.host;
  for (auto* ai = res; ai != nullptr; ai = ai->ai_next) {
    int s = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (s < 0) { why = std::strerror(errno); continue; }
    setTimeouts(s, ep.timeout_ms);
    if (::connect(s, ai->ai_addr, ai->ai_addrlen) == 0) return s;
    why = "connect " + ep.host + ":" + port + ": " + std::strerror(errno);
    ::close(s);
  }
  return -1;
}

} // namespace

Endpoint EndpointFromConfig(const Config& cfg) {
  Endpoint ep;
  ep.host = cfg.host;
  ep.port = cfg.port;
  ep.path = cfg.path.empty() ? "/metrics" : cfg.path;
  ep.timeout_ms = cfg.timeout_ms;
  return ep;
}

bool ParseHttpResponse(const std::string& resp, std::string& body, std::string& err) {
  std::string_view sv(resp);
  if (!sv.starts_with("HTTP/")) { err = "malformed HTTP response"; return false; }
  auto sp = sv.find(' ');
  if (sp == std::string_view::npos || sp + 4 > sv.size()) { err = "malformed HTTP status line"; return false; }
  int code = 0;
  auto cs = sv.substr(sp + 1, 3);
  auto [ptr, ec] = std::from_chars(cs.data(), cs.data() + cs.size(), code);
  if (ec != std::errc{} || ptr != cs.data() + cs.size()) { err = "malformed HTTP status line"; return false; }
  if (code < 200 || code > 299) { err = "HTTP status " + std::to_string(code); return false; }
  auto hdr_end = sv.find("\r\n\r\n");
  if (hdr_end == std::string_view::npos) { err = "truncated HTTP headers"; return false; }
  body.assign(sv.substr(hdr_end + 4));
  return true;
}

std::string HttpSource::Describe() const {
  return "http://" + ep_.host + ":" + std::to_string(ep_.port) + ep_.path;
}

bool HttpSource::Fetch(std::string& body, std::string& err) {
  log::Get()->debug("GET {}", Describe());
  std::string why;
  FdGuard sock{connectTo(ep_, why)};
  if (sock.fd < 0) return fail(err, why);

  const std::string req = "GET " + ep_.path + " HTTP/1.0\r\nHost: " + ep_.host +
                          "\r\nAccept: text/plain\r\nConnection: close\r\n\r\n";
  size_t off = 0;
  while (off < req.size()) {
    ssize_t n = ::send(sock.fd, req.data() + off, req.size() - off, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return fail(err, std::string("send: ") + std::strerror(errno));
    }
    off += static_cast<size_t>(n);
  }

  std::string resp;
  char buf[4096];
  while (true) {
    ssize_t n = ::recv(sock.fd, buf, sizeof(buf), 0);
    if (n == 0) break;
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) return fail(err, "recv: timed out");
      return fail(err, std::string("recv: ") + std::strerror(errno));
    }
    resp.append(buf, buf + n);
  }

  std::string why_status;
  if (!ParseHttpResponse(resp, body, why_status)) return fail(err, Describe() + ": " + why_status);
  log::Get()->debug("fetched {} bytes from {}", body.size(), Describe());
  return true;
}

bool FileSource::Fetch(std::string& body, std::string& err) {
  std::ifstream ifs(path_, std::ios::binary);
  if (!ifs) return fail(err, "cannot open " + path_);
  std::ostringstream ss;
  ss << ifs.rdbuf();
  if (ifs.bad()) return fail(err, "read error on " + path_);
  body = ss.str();
  log::Get()->debug("read {} bytes from {}", body.size(), path_);
  return true;
}

} // namespace promscope
