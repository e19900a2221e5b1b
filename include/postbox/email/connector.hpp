#pragma once

#include "postbox/email/credential.hpp"
#include "postbox/email/session.hpp"

namespace postbox::email {

/// Production connector: IMAP over implicit TLS for reads, SMTP through libcurl for sends.
/// Holds the credential by reference; it must outlive the connector.
class MailConnector final : public IMailConnector {
public:
  MailConnector(const Credential &credential, ConnectionOptions options);

  [[nodiscard]] common::Result<std::unique_ptr<IReadSession>>
  open_read_session(const std::string &folder) override;
  [[nodiscard]] common::Result<std::unique_ptr<ISendSession>> open_send_session() override;

private:
  const Credential &credential_;
  ConnectionOptions options_;
};

} // namespace postbox::email
