#pragma once

#include "postbox/common/result.hpp"
#include "postbox/email/client.hpp"
#include "postbox/email/message.hpp"
#include "postbox/tools/tool.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace postbox::tools {

enum class EmailOperation {
  ReadEmails,
  FilterEmails,
  SendEmail,
  GetUnreadCount,
};

/// Canonical names and their short aliases (`read`, `filter`, `send`, `unread_count`).
[[nodiscard]] std::optional<EmailOperation> parse_operation(std::string_view name);
[[nodiscard]] std::string_view operation_name(EmailOperation operation);

using OperationRequest = std::variant<email::ReadRequest, email::FilterCriteria,
                                      email::SendRequest, email::UnreadCountRequest>;

struct RequestDefaults {
  std::size_t read_count = 10;
  std::string folder = "INBOX";
};

/// Typed request for `operation` from the flat argument map. Bad values fail with
/// ErrorKind::InvalidArgument; nothing touches the network.
[[nodiscard]] common::Result<OperationRequest>
parse_request(EmailOperation operation, const ToolArgs &args, const RequestDefaults &defaults);

[[nodiscard]] std::vector<ToolSpec> email_tool_specs();

/// Fixed operation surface over one EmailClient. Failures are rendered into the
/// result text with `success = false`; nothing is thrown.
class EmailToolDispatcher {
public:
  EmailToolDispatcher(email::EmailClient &client, RequestDefaults defaults);

  [[nodiscard]] ToolResult execute(std::string_view operation, const ToolArgs &args);

private:
  [[nodiscard]] ToolResult run(const email::ReadRequest &request);
  [[nodiscard]] ToolResult run(const email::FilterCriteria &criteria);
  [[nodiscard]] ToolResult run(const email::SendRequest &request);
  [[nodiscard]] ToolResult run(const email::UnreadCountRequest &request);

  email::EmailClient &client_;
  RequestDefaults defaults_;
};

} // namespace postbox::tools
