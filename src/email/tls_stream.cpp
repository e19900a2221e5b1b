#include "postbox/email/tls_stream.hpp"

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <limits>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace postbox::email {

namespace {

constexpr std::chrono::seconds::rep kMaxPollSeconds = std::numeric_limits<int>::max() / 1000;

std::string openssl_error(const std::string &prefix) {
  const unsigned long code = ERR_get_error();
  if (code == 0) {
    return prefix;
  }
  std::array<char, 256> buffer{};
  ERR_error_string_n(code, buffer.data(), buffer.size());
  return prefix + ": " + buffer.data();
}

common::Result<int> connect_socket(const std::string &host, const std::uint16_t port,
                                   const std::chrono::seconds timeout) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *results = nullptr;
  const std::string service = std::to_string(port);
  const int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
  if (rc != 0) {
    return common::Result<int>::failure(common::ErrorKind::Connect,
                                        "failed to resolve " + host + ": " + gai_strerror(rc));
  }

  std::string last_error = "no usable address for " + host;
  // poll takes an int; a negative value would wait forever.
  const auto timeout_ms = static_cast<int>(
      std::min<std::chrono::seconds::rep>(timeout.count(), kMaxPollSeconds) * 1000);
  for (addrinfo *ai = results; ai != nullptr; ai = ai->ai_next) {
    const int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_error = std::string("failed to create socket: ") + std::strerror(errno);
      continue;
    }

    const int flags = fcntl(fd, F_GETFL, 0);
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    int result = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (result != 0 && errno == EINPROGRESS) {
      pollfd pfd{.fd = fd, .events = POLLOUT, .revents = 0};
      const int ready = poll(&pfd, 1, timeout_ms);
      if (ready == 0) {
        ::close(fd);
        last_error = "timed out connecting to " + host + ":" + service;
        continue;
      }
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      (void)getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
      result = (ready > 0 && so_error == 0) ? 0 : -1;
      if (result != 0) {
        errno = so_error != 0 ? so_error : errno;
      }
    }
    if (result != 0) {
      last_error = "connect to " + host + ":" + service + " failed: " + std::strerror(errno);
      ::close(fd);
      continue;
    }

    (void)fcntl(fd, F_SETFL, flags);
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count());
    (void)setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    (void)setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    freeaddrinfo(results);
    return common::Result<int>::success(fd);
  }

  freeaddrinfo(results);
  return common::Result<int>::failure(common::ErrorKind::Connect, last_error);
}

} // namespace

TlsStream::TlsStream(const int fd, SSL_CTX *ctx, SSL *ssl) : fd_(fd), ctx_(ctx), ssl_(ssl) {}

TlsStream::~TlsStream() { close(); }

common::Result<std::unique_ptr<TlsStream>>
TlsStream::connect(const std::string &host, const std::uint16_t port,
                   const ConnectionOptions &options) {
  using R = common::Result<std::unique_ptr<TlsStream>>;

  auto fd = connect_socket(host, port, options.timeout);
  if (!fd.ok()) {
    return R::failure(fd.status());
  }

  SSL_CTX *ctx = SSL_CTX_new(TLS_client_method());
  if (ctx == nullptr) {
    ::close(fd.value());
    return R::failure(common::ErrorKind::Connect, openssl_error("failed to create TLS context"));
  }
  SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
  if (options.verify_tls) {
    if (SSL_CTX_set_default_verify_paths(ctx) != 1) {
      SSL_CTX_free(ctx);
      ::close(fd.value());
      return R::failure(common::ErrorKind::Connect,
                        openssl_error("failed to load system trust store"));
    }
    SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
  } else {
    SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
  }

  SSL *ssl = SSL_new(ctx);
  if (ssl == nullptr) {
    SSL_CTX_free(ctx);
    ::close(fd.value());
    return R::failure(common::ErrorKind::Connect, openssl_error("failed to create TLS session"));
  }
  SSL_set_fd(ssl, fd.value());
  SSL_set_tlsext_host_name(ssl, host.c_str());
  if (options.verify_tls) {
    SSL_set1_host(ssl, host.c_str());
  }

  // Wrap before the handshake so every failure path below releases through close().
  std::unique_ptr<TlsStream> stream(new TlsStream(fd.value(), ctx, ssl));
  if (SSL_connect(ssl) != 1) {
    std::string message = openssl_error("TLS handshake with " + host + " failed");
    const long verify = SSL_get_verify_result(ssl);
    if (options.verify_tls && verify != X509_V_OK) {
      message += std::string(" (") + X509_verify_cert_error_string(verify) + ")";
    }
    return R::failure(common::ErrorKind::Connect, message);
  }
  return R::success(std::move(stream));
}

common::Status TlsStream::write_all(const std::string_view data) {
  if (ssl_ == nullptr) {
    return common::Status::error(common::ErrorKind::Connect, "connection is closed");
  }
  std::size_t sent = 0;
  while (sent < data.size()) {
    const int n = SSL_write(ssl_, data.data() + sent, static_cast<int>(data.size() - sent));
    if (n <= 0) {
      const bool timed_out = errno == EAGAIN || errno == EWOULDBLOCK;
      return common::Status::error(common::ErrorKind::Connect,
                                   timed_out ? "timed out writing to server"
                                             : openssl_error("write to server failed"));
    }
    sent += static_cast<std::size_t>(n);
  }
  return common::Status::success();
}

common::Result<std::size_t> TlsStream::read_some(char *buffer, const std::size_t size) {
  if (ssl_ == nullptr) {
    return common::Result<std::size_t>::failure(common::ErrorKind::Connect,
                                                "connection is closed");
  }
  const int n = SSL_read(ssl_, buffer, static_cast<int>(size));
  if (n > 0) {
    return common::Result<std::size_t>::success(static_cast<std::size_t>(n));
  }
  const int error = SSL_get_error(ssl_, n);
  if (error == SSL_ERROR_ZERO_RETURN) {
    return common::Result<std::size_t>::success(0);
  }
  if (error == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK)) {
    return common::Result<std::size_t>::failure(common::ErrorKind::Connect,
                                                "timed out waiting for server");
  }
  if (error == SSL_ERROR_SYSCALL && n == 0) {
    return common::Result<std::size_t>::success(0);
  }
  return common::Result<std::size_t>::failure(common::ErrorKind::Connect,
                                              openssl_error("read from server failed"));
}

void TlsStream::close() noexcept {
  if (ssl_ != nullptr) {
    if (SSL_is_init_finished(ssl_) == 1) {
      SSL_shutdown(ssl_);
    }
    SSL_free(ssl_);
    ssl_ = nullptr;
  }
  if (ctx_ != nullptr) {
    SSL_CTX_free(ctx_);
    ctx_ = nullptr;
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

} // namespace postbox::email
