#pragma once

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <sys/types.h>
#include <tuple>
#include <unistd.h>
#include <utility>
#include <vector>

namespace oocsi {

/// Default broker endpoint when no --uri/--host/--port is given.
constexpr std::string_view kDefaultURI = "tcp://localhost:4444";
constexpr int kDefaultPort = 4444;
constexpr std::string_view kDefaultHandle = "OOCSIClient_####";

/// Extract the scheme from a transport URI.
inline std::string scheme(std::string_view uri) {
  auto pos = uri.find("://");
  return pos != std::string_view::npos ? std::string(uri.substr(0, pos))
                                       : std::string(uri);
}

/// Parsed broker URI.
struct parsed_uri {
  std::string raw;
  std::string scheme;
  std::string host;
  int port = 0;
};

inline std::tuple<std::string, int> split_host_port(const std::string &addr,
                                                     int default_port) {
  if (addr.empty())
    return {"localhost", default_port};

  auto pos = addr.rfind(':');
  if (pos == std::string::npos)
    return {addr, default_port};

  std::string host = addr.substr(0, pos);
  if (host.empty())
    host = "localhost";
  std::string port_text = addr.substr(pos + 1);
  int port = default_port;
  if (!port_text.empty()) {
    try {
      port = std::stoi(port_text);
    } catch (const std::exception &) {
      throw std::invalid_argument("invalid port: " + port_text);
    }
  }
  if (port <= 0 || port > 65535)
    throw std::invalid_argument("port out of range: " + port_text);
  return {host, port};
}

inline parsed_uri parse_uri(const std::string &uri) {
  std::string s = scheme(uri);

  if (s == "tcp") {
    if (uri.rfind("tcp://", 0) != 0)
      throw std::invalid_argument("invalid tcp URI: " + uri);
    auto rest = uri.substr(6);
    auto slash = rest.find('/');
    if (slash != std::string::npos)
      rest = rest.substr(0, slash);
    auto [host, port] = split_host_port(rest, kDefaultPort);
    return {uri, "tcp", host, port};
  }

  throw std::invalid_argument("unsupported transport URI: " + uri);
}

/// Client settings gathered from the command line.
struct client_config {
  std::string uri = std::string(kDefaultURI);
  std::string handle = std::string(kDefaultHandle);
};

/// Parse --uri, --host, --port and --handle from command-line args.
/// --host/--port override the corresponding part of --uri.
inline client_config parse_flags(const std::vector<std::string> &args) {
  client_config cfg;
  std::string host;
  std::string port;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i + 1 >= args.size())
      break;
    if (args[i] == "--uri")
      cfg.uri = args[++i];
    else if (args[i] == "--host")
      host = args[++i];
    else if (args[i] == "--port")
      port = args[++i];
    else if (args[i] == "--handle")
      cfg.handle = args[++i];
  }

  if (!host.empty() || !port.empty()) {
    auto parsed = parse_uri(cfg.uri);
    cfg.uri = "tcp://" + (host.empty() ? parsed.host : host) + ":" +
              (port.empty() ? std::to_string(parsed.port) : port);
  }
  return cfg;
}

/// A duplex byte stream to the broker.
struct connection {
  int fd = -1;
  std::string scheme;
  bool owns_fd = true;
};

inline bool is_open(const connection &conn) { return conn.fd >= 0; }

inline void close_connection(connection &conn) {
  if (conn.owns_fd && conn.fd >= 0)
    ::close(conn.fd);
  conn.fd = -1;
}

inline std::string errno_text(int err) { return std::string(std::strerror(err)); }

inline void set_nonblocking(const connection &conn, bool enabled = true) {
  int flags = ::fcntl(conn.fd, F_GETFL, 0);
  if (flags < 0)
    throw std::runtime_error("fcntl(F_GETFL) failed: " + errno_text(errno));
  flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  if (::fcntl(conn.fd, F_SETFL, flags) < 0)
    throw std::runtime_error("fcntl(F_SETFL) failed: " + errno_text(errno));
}

/// Wait until the connection has bytes to read (or has been closed by the
/// peer). Returns false on timeout. A negative timeout waits forever.
inline bool wait_readable(const connection &conn, int timeout_ms) {
  if (conn.fd < 0)
    return false;
  pollfd pfd{};
  pfd.fd = conn.fd;
  pfd.events = POLLIN;
  for (;;) {
    int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc < 0 && errno == EINTR)
      continue;
    if (rc < 0)
      throw std::runtime_error("poll() failed: " + errno_text(errno));
    return rc > 0;
  }
}

inline bool wait_writable(const connection &conn, int timeout_ms) {
  if (conn.fd < 0)
    return false;
  pollfd pfd{};
  pfd.fd = conn.fd;
  pfd.events = POLLOUT;
  for (;;) {
    int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc < 0 && errno == EINTR)
      continue;
    if (rc < 0)
      return false;
    return rc > 0;
  }
}

/// Open a TCP connection to host:port. Names are resolved with getaddrinfo;
/// each resolved address gets a connect attempt bounded by timeout_ms.
inline connection dial_tcp(const std::string &host, int port,
                           int timeout_ms = 10000) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  addrinfo *result = nullptr;
  auto service = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
  if (rc != 0) {
    throw std::runtime_error("getaddrinfo(" + host + ") failed: " +
                             std::string(::gai_strerror(rc)));
  }

  std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(result,
                                                             ::freeaddrinfo);
  std::string last_error = "no address for " + host;
  for (addrinfo *ai = result; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_error = "socket() failed: " + errno_text(errno);
      continue;
    }

    connection conn{fd, "tcp", true};
    try {
      set_nonblocking(conn, true);
    } catch (const std::runtime_error &) {
      close_connection(conn);
      throw;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0) {
      if (errno != EINPROGRESS) {
        last_error = "connect() failed: " + errno_text(errno);
        close_connection(conn);
        continue;
      }
      if (!wait_writable(conn, timeout_ms)) {
        last_error = "connect() timed out";
        close_connection(conn);
        continue;
      }
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
      if (so_error != 0) {
        last_error = "connect() failed: " + errno_text(so_error);
        close_connection(conn);
        continue;
      }
    }

    try {
      set_nonblocking(conn, false);
    } catch (const std::runtime_error &) {
      close_connection(conn);
      throw;
    }
    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return conn;
  }

  throw std::runtime_error(last_error);
}

/// Two connected in-process endpoints. The first is meant for the client,
/// the second for whatever plays the broker.
inline std::pair<connection, connection> socket_pair() {
  int fds[2] = {-1, -1};
  if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
    throw std::runtime_error("mem socketpair() failed: " + errno_text(errno));
  }
  return {connection{fds[0], "mem", true}, connection{fds[1], "mem", true}};
}

enum class read_status { data, would_block, closed, error };

struct read_result {
  read_status status = read_status::error;
  size_t bytes = 0;
  int error = 0;
};

inline read_result conn_read(const connection &conn, void *buf, size_t n) {
  if (conn.fd < 0)
    return {read_status::error, 0, EBADF};
  for (;;) {
    ssize_t got = ::recv(conn.fd, buf, n, 0);
    if (got > 0)
      return {read_status::data, static_cast<size_t>(got), 0};
    if (got == 0)
      return {read_status::closed, 0, 0};
    if (errno == EINTR)
      continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK)
      return {read_status::would_block, 0, errno};
    return {read_status::error, 0, errno};
  }
}

/// Write the whole buffer. Short writes are continued; a full non-blocking
/// socket is waited on for at most timeout_ms per stall.
inline bool write_all(const connection &conn, const void *data, size_t size,
                      int timeout_ms = 1000) {
  if (conn.fd < 0)
    return false;
  const auto *ptr = static_cast<const uint8_t *>(data);
  size_t sent = 0;
  while (sent < size) {
    ssize_t n = ::send(conn.fd, ptr + sent, size - sent, MSG_NOSIGNAL);
    if (n > 0) {
      sent += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR)
      continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      if (!wait_writable(conn, timeout_ms))
        return false;
      continue;
    }
    return false;
  }
  return true;
}

inline bool write_all(const connection &conn, const std::string &text,
                      int timeout_ms = 1000) {
  return write_all(conn, text.data(), text.size(), timeout_ms);
}

} // namespace oocsi
