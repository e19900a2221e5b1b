#pragma once

#include "postbox/email/credential.hpp"
#include "postbox/email/session.hpp"

#include <curl/curl.h>

#include <memory>
#include <string>

namespace postbox::email {

/// `smtps://` for implicit TLS (port 465 or configured), otherwise `smtp://` with STARTTLS.
[[nodiscard]] std::string smtp_url(const Credential &credential);

/// Kind of a libcurl failure while opening the session (Connect or Auth) or while
/// submitting (always Send).
[[nodiscard]] common::ErrorKind classify_smtp_error(CURLcode code, bool during_submit);

/// One libcurl easy handle kept alive for the whole session so that the submission
/// reuses the connection authenticated at open time.
class CurlSendSession final : public ISendSession {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<ISendSession>>
  open(const Credential &credential, const ConnectionOptions &options);

  ~CurlSendSession() override;

  CurlSendSession(const CurlSendSession &) = delete;
  CurlSendSession &operator=(const CurlSendSession &) = delete;

  [[nodiscard]] common::Status submit(const OutgoingMessage &message) override;
  void close() noexcept override;

private:
  explicit CurlSendSession(CURL *curl);

  CURL *curl_ = nullptr;
  std::string error_buffer_;
};

} // namespace postbox::email
