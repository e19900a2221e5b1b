#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace postbox::email {

/// One email as exposed to callers. Built once per fetch from raw protocol bytes.
struct Message {
  /// Per-session sequence number; meaningless outside the session that produced it.
  std::string id;
  std::string subject;
  std::string from;
  std::string to;
  std::string date;
  /// Primary text content, preview-truncated.
  std::string body;
  /// Flag snapshot taken at fetch time.
  bool is_unread = false;
};

/// Search request. Every field that is set must match (logical AND).
struct FilterCriteria {
  std::optional<std::string> sender;
  std::optional<std::string> subject;
  std::optional<bool> is_unread;
  std::string folder = "INBOX";
};

struct ReadRequest {
  std::size_t count = 10;
  std::string folder = "INBOX";
};

struct SendRequest {
  std::string to;
  std::string subject;
  std::string body;
  std::optional<std::string> cc;
};

struct UnreadCountRequest {
  std::string folder = "INBOX";
};

struct SendReceipt {
  std::vector<std::string> recipients;
  std::string message_id;
  std::string sent_at;
};

/// Message as the server handed it over, before decoding.
struct RawMessage {
  std::uint32_t id = 0;
  std::vector<std::string> flags;
  std::string content;
};

[[nodiscard]] bool has_seen_flag(const std::vector<std::string> &flags);

} // namespace postbox::email
