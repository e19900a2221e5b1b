#pragma once

#include "postbox/common/result.hpp"
#include "postbox/email/credential.hpp"
#include "postbox/email/imap_protocol.hpp"

#include <openssl/ssl.h>

#include <cstdint>
#include <memory>
#include <string>

namespace postbox::email {

/// Client TCP connection wrapped in TLS from the first byte (implicit TLS).
class TlsStream final : public IByteStream {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<TlsStream>>
  connect(const std::string &host, std::uint16_t port, const ConnectionOptions &options);

  ~TlsStream() override;

  TlsStream(const TlsStream &) = delete;
  TlsStream &operator=(const TlsStream &) = delete;

  [[nodiscard]] common::Status write_all(std::string_view data) override;
  [[nodiscard]] common::Result<std::size_t> read_some(char *buffer, std::size_t size) override;
  void close() noexcept override;

private:
  TlsStream(int fd, SSL_CTX *ctx, SSL *ssl);

  int fd_ = -1;
  SSL_CTX *ctx_ = nullptr;
  SSL *ssl_ = nullptr;
};

} // namespace postbox::email
