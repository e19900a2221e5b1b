#include "postbox/email/connector.hpp"

#include "postbox/email/imap_session.hpp"
#include "postbox/email/smtp_session.hpp"
#include "postbox/email/tls_stream.hpp"
#include "postbox/observability/global.hpp"

namespace postbox::email {

MailConnector::MailConnector(const Credential &credential, ConnectionOptions options)
    : credential_(credential), options_(options) {}

common::Result<std::unique_ptr<IReadSession>>
MailConnector::open_read_session(const std::string &folder) {
  auto stream = TlsStream::connect(credential_.imap_host, credential_.imap_port, options_);
  if (!stream.ok()) {
    observability::record_error("imap", stream.error());
    return common::Result<std::unique_ptr<IReadSession>>::failure(stream.status());
  }
  auto session = open_imap_read_session(std::move(stream.value()), credential_, folder);
  if (!session.ok()) {
    observability::record_error("imap", session.error());
  }
  return session;
}

common::Result<std::unique_ptr<ISendSession>> MailConnector::open_send_session() {
  auto session = CurlSendSession::open(credential_, options_);
  if (!session.ok()) {
    observability::record_error("smtp", session.error());
  }
  return session;
}

} // namespace postbox::email
