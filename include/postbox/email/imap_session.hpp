#pragma once

#include "postbox/email/credential.hpp"
#include "postbox/email/imap_protocol.hpp"
#include "postbox/email/session.hpp"

#include <memory>
#include <string>

namespace postbox::email {

/// Read session over an authenticated IMAP connection with one folder opened read-only.
class ImapReadSession final : public IReadSession {
public:
  explicit ImapReadSession(std::unique_ptr<ImapConnection> connection);
  ~ImapReadSession() override;

  [[nodiscard]] common::Result<std::vector<std::uint32_t>>
  search(const ProtocolQuery &query) override;
  [[nodiscard]] common::Result<std::vector<RawMessage>>
  fetch(const std::vector<std::uint32_t> &ids) override;
  void close() noexcept override;

private:
  std::unique_ptr<ImapConnection> connection_;
};

/// Greeting, LOGIN, then EXAMINE on an already connected stream.
/// Rejected credentials fail with ErrorKind::Auth, an unusable folder with ErrorKind::Folder.
[[nodiscard]] common::Result<std::unique_ptr<IReadSession>>
open_imap_read_session(std::unique_ptr<IByteStream> stream, const Credential &credential,
                       const std::string &folder);

} // namespace postbox::email
