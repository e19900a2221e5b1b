#pragma once

#include "postbox/email/message.hpp"

#include <string>

namespace postbox::email {

/// A single composite IMAP SEARCH criteria string. The folder is not part of it;
/// folders are resolved by the session.
struct ProtocolQuery {
  std::string criteria = "ALL";
  /// Empty unless the criteria carries non-ASCII literals.
  std::string charset;

  /// Full command text, e.g. `SEARCH CHARSET UTF-8 FROM {4}\r\n...`.
  [[nodiscard]] std::string command() const;
};

[[nodiscard]] ProtocolQuery translate(const FilterCriteria &criteria);
[[nodiscard]] ProtocolQuery match_all_query();
[[nodiscard]] ProtocolQuery unread_query();

} // namespace postbox::email
