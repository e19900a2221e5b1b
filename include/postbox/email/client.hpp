#pragma once

#include "postbox/common/result.hpp"
#include "postbox/email/credential.hpp"
#include "postbox/email/message.hpp"
#include "postbox/email/session.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace postbox::email {

struct ClientOptions {
  std::size_t preview_length = 300;
  std::string default_folder = "INBOX";
  /// Injected for deterministic Date headers in tests.
  std::function<std::chrono::system_clock::time_point()> clock = std::chrono::system_clock::now;
};

/// The four mailbox operations. Every call opens its own session and closes it before
/// returning, on every path.
class EmailClient {
public:
  EmailClient(IMailConnector &connector, const Credential &credential, ClientOptions options);

  /// Most recent `count` messages, newest first.
  [[nodiscard]] common::Result<std::vector<Message>> read(const ReadRequest &request);
  /// Every message matching all set criteria, newest first.
  [[nodiscard]] common::Result<std::vector<Message>> filter(const FilterCriteria &criteria);
  /// Validation failures and every transport failure come back as ErrorKind::Send.
  [[nodiscard]] common::Result<SendReceipt> send(const SendRequest &request);
  [[nodiscard]] common::Result<std::size_t> unread_count(const UnreadCountRequest &request);

  [[nodiscard]] const ClientOptions &options() const { return options_; }

private:
  [[nodiscard]] std::string resolve_folder(const std::string &folder) const;

  IMailConnector &connector_;
  const Credential &credential_;
  ClientOptions options_;
};

} // namespace postbox::email
