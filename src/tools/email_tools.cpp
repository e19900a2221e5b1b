#include "postbox/tools/email_tools.hpp"

#include "postbox/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace postbox::tools {

namespace {

using Parsed = common::Result<OperationRequest>;

std::optional<std::string> arg(const ToolArgs &args, const std::string &key) {
  const auto it = args.find(key);
  if (it == args.end()) {
    return std::nullopt;
  }
  const std::string value = common::trim(it->second);
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

common::Result<std::optional<bool>> parse_bool_arg(const ToolArgs &args, const std::string &key) {
  using R = common::Result<std::optional<bool>>;
  const auto value = arg(args, key);
  if (!value.has_value()) {
    return R::success(std::nullopt);
  }
  const std::string lower = common::to_lower(*value);
  if (lower == "1" || lower == "true" || lower == "yes") {
    return R::success(true);
  }
  if (lower == "0" || lower == "false" || lower == "no") {
    return R::success(false);
  }
  return R::failure(common::ErrorKind::InvalidArgument,
                    key + " must be true or false, got '" + *value + "'");
}

common::Result<std::size_t> parse_count(const std::optional<std::string> &value,
                                        const std::size_t fallback) {
  using R = common::Result<std::size_t>;
  if (!value.has_value()) {
    return R::success(fallback);
  }
  // Agents often send JSON numbers, which arrive as "5" or "5.0".
  std::string digits = *value;
  if (const auto dot = digits.find('.'); dot != std::string::npos &&
                                         digits.find_first_not_of('0', dot + 1) == std::string::npos) {
    digits.resize(dot);
  }
  std::size_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), parsed);
  if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size()) {
    return R::failure(common::ErrorKind::InvalidArgument,
                      "count must be a positive integer, got '" + *value + "'");
  }
  if (parsed == 0) {
    return R::failure(common::ErrorKind::InvalidArgument, "count must be at least 1");
  }
  return R::success(parsed);
}

std::string failure_phrase(const EmailOperation operation) {
  switch (operation) {
  case EmailOperation::ReadEmails:
    return "read emails";
  case EmailOperation::FilterEmails:
    return "filter emails";
  case EmailOperation::SendEmail:
    return "send email";
  case EmailOperation::GetUnreadCount:
    return "get unread count";
  }
  return "process request";
}

ToolResult failure_result(const EmailOperation operation, const common::Status &status) {
  ToolResult out;
  out.success = false;
  out.output = "Error: Failed to " + failure_phrase(operation) + ": " + status.error();
  out.metadata["operation"] = std::string(operation_name(operation));
  out.metadata["error_kind"] = std::string(common::error_kind_name(status.kind()));
  return out;
}

void append_messages(std::ostringstream &out, const std::vector<email::Message> &messages) {
  std::size_t index = 1;
  for (const auto &message : messages) {
    out << index++ << ". **From:** " << message.from << "\n";
    out << "   **Subject:** " << message.subject << "\n";
    out << "   **Date:** " << message.date << "\n";
    out << "   **Preview:** " << message.body << "\n\n";
  }
}

std::string describe_filters(const email::FilterCriteria &criteria) {
  std::vector<std::string> filters;
  if (criteria.sender.has_value()) {
    filters.push_back("sender: " + *criteria.sender);
  }
  if (criteria.subject.has_value()) {
    filters.push_back("subject contains: " + *criteria.subject);
  }
  if (criteria.is_unread.has_value()) {
    filters.push_back(std::string("unread: ") + (*criteria.is_unread ? "true" : "false"));
  }
  if (filters.empty()) {
    return "no filters";
  }
  std::string out;
  for (std::size_t i = 0; i < filters.size(); ++i) {
    out += (i == 0 ? "" : ", ") + filters[i];
  }
  return out;
}

} // namespace

std::optional<EmailOperation> parse_operation(const std::string_view name) {
  const std::string normalized = common::to_lower(common::trim(std::string(name)));
  if (normalized == "read_emails" || normalized == "read") {
    return EmailOperation::ReadEmails;
  }
  if (normalized == "filter_emails" || normalized == "filter") {
    return EmailOperation::FilterEmails;
  }
  if (normalized == "send_email" || normalized == "send") {
    return EmailOperation::SendEmail;
  }
  if (normalized == "get_unread_count" || normalized == "unread_count") {
    return EmailOperation::GetUnreadCount;
  }
  return std::nullopt;
}

std::string_view operation_name(const EmailOperation operation) {
  switch (operation) {
  case EmailOperation::ReadEmails:
    return "read_emails";
  case EmailOperation::FilterEmails:
    return "filter_emails";
  case EmailOperation::SendEmail:
    return "send_email";
  case EmailOperation::GetUnreadCount:
    return "get_unread_count";
  }
  return "unknown";
}

common::Result<OperationRequest> parse_request(const EmailOperation operation,
                                               const ToolArgs &args,
                                               const RequestDefaults &defaults) {
  const std::string folder = arg(args, "folder").value_or(defaults.folder);

  switch (operation) {
  case EmailOperation::ReadEmails: {
    auto count = parse_count(arg(args, "count"), defaults.read_count);
    if (!count.ok()) {
      return Parsed::failure(count.status());
    }
    return Parsed::success(email::ReadRequest{.count = count.value(), .folder = folder});
  }
  case EmailOperation::FilterEmails: {
    auto unread = parse_bool_arg(args, "is_unread");
    if (!unread.ok()) {
      return Parsed::failure(unread.status());
    }
    return Parsed::success(email::FilterCriteria{
        .sender = arg(args, "sender"),
        .subject = arg(args, "subject"),
        .is_unread = unread.value(),
        .folder = folder,
    });
  }
  case EmailOperation::SendEmail: {
    const auto raw = [&](const std::string &key) {
      const auto it = args.find(key);
      return it == args.end() ? std::string() : it->second;
    };
    return Parsed::success(email::SendRequest{
        .to = common::trim(raw("to")),
        .subject = common::trim(raw("subject")),
        .body = raw("body"),
        .cc = arg(args, "cc"),
    });
  }
  case EmailOperation::GetUnreadCount:
    return Parsed::success(email::UnreadCountRequest{.folder = folder});
  }
  return Parsed::failure(common::ErrorKind::InvalidArgument, "unsupported operation");
}

std::vector<ToolSpec> email_tool_specs() {
  return {
      ToolSpec{
          .name = "read_emails",
          .description = "Read recent emails from inbox or specified folder. Returns a list of "
                         "emails with subject, sender, date, and preview.",
          .parameters_json =
              R"json({"type":"object","properties":{"count":{"type":"number","description":"Number of emails to retrieve (default: 10)","default":10},"folder":{"type":"string","description":"Email folder to read from (default: INBOX)","default":"INBOX"}}})json",
      },
      ToolSpec{
          .name = "filter_emails",
          .description = "Search and filter emails by sender, subject, or unread status.",
          .parameters_json =
              R"json({"type":"object","properties":{"sender":{"type":"string","description":"Filter by sender email address (optional)"},"subject":{"type":"string","description":"Filter by subject substring (optional)"},"is_unread":{"type":"boolean","description":"Filter by unread status (optional)"},"folder":{"type":"string","description":"Email folder to search in (default: INBOX)","default":"INBOX"}}})json",
      },
      ToolSpec{
          .name = "send_email",
          .description = "Send an email to a recipient with subject and body. Can optionally "
                         "include CC.",
          .parameters_json =
              R"json({"type":"object","properties":{"to":{"type":"string","description":"Recipient email address"},"subject":{"type":"string","description":"Email subject line"},"body":{"type":"string","description":"Email body content (plain text)"},"cc":{"type":"string","description":"CC recipient email address (optional)"}},"required":["to","subject","body"]})json",
      },
      ToolSpec{
          .name = "get_unread_count",
          .description = "Get the count of unread emails in inbox or specified folder.",
          .parameters_json =
              R"json({"type":"object","properties":{"folder":{"type":"string","description":"Email folder to check (default: INBOX)","default":"INBOX"}}})json",
      },
  };
}

EmailToolDispatcher::EmailToolDispatcher(email::EmailClient &client, RequestDefaults defaults)
    : client_(client), defaults_(std::move(defaults)) {}

ToolResult EmailToolDispatcher::execute(const std::string_view operation, const ToolArgs &args) {
  const auto parsed_operation = parse_operation(operation);
  if (!parsed_operation.has_value()) {
    ToolResult out;
    out.success = false;
    out.output = "Error: Unknown tool: " + std::string(operation);
    out.metadata["error_kind"] =
        std::string(common::error_kind_name(common::ErrorKind::InvalidArgument));
    return out;
  }

  auto request = parse_request(*parsed_operation, args, defaults_);
  if (!request.ok()) {
    return failure_result(*parsed_operation, request.status());
  }
  return std::visit([this](const auto &typed) { return run(typed); }, request.value());
}

ToolResult EmailToolDispatcher::run(const email::ReadRequest &request) {
  auto messages = client_.read(request);
  if (!messages.ok()) {
    return failure_result(EmailOperation::ReadEmails, messages.status());
  }

  std::ostringstream out;
  if (messages.value().empty()) {
    out << "No emails found in " << request.folder << ".";
  } else {
    out << "Found " << messages.value().size() << " email(s) in " << request.folder << ":\n\n";
    append_messages(out, messages.value());
  }
  ToolResult result;
  result.output = out.str();
  result.metadata["operation"] = "read_emails";
  result.metadata["count"] = std::to_string(messages.value().size());
  return result;
}

ToolResult EmailToolDispatcher::run(const email::FilterCriteria &criteria) {
  auto messages = client_.filter(criteria);
  if (!messages.ok()) {
    return failure_result(EmailOperation::FilterEmails, messages.status());
  }

  const std::string filters = describe_filters(criteria);
  std::ostringstream out;
  if (messages.value().empty()) {
    out << "No emails found matching criteria (" << filters << ").";
  } else {
    out << "Found " << messages.value().size() << " email(s) matching criteria (" << filters
        << "):\n\n";
    append_messages(out, messages.value());
  }
  ToolResult result;
  result.output = out.str();
  result.metadata["operation"] = "filter_emails";
  result.metadata["count"] = std::to_string(messages.value().size());
  return result;
}

ToolResult EmailToolDispatcher::run(const email::SendRequest &request) {
  auto receipt = client_.send(request);
  if (!receipt.ok()) {
    return failure_result(EmailOperation::SendEmail, receipt.status());
  }

  std::ostringstream out;
  out << "Email sent successfully!\n\n";
  out << "**To:** " << request.to << "\n";
  if (request.cc.has_value()) {
    out << "**CC:** " << *request.cc << "\n";
  }
  out << "**Subject:** " << request.subject << "\n";
  out << "**Sent at:** " << receipt.value().sent_at;

  ToolResult result;
  result.output = out.str();
  result.metadata["operation"] = "send_email";
  result.metadata["message_id"] = receipt.value().message_id;
  result.metadata["recipients"] = std::to_string(receipt.value().recipients.size());
  return result;
}

ToolResult EmailToolDispatcher::run(const email::UnreadCountRequest &request) {
  auto count = client_.unread_count(request);
  if (!count.ok()) {
    return failure_result(EmailOperation::GetUnreadCount, count.status());
  }

  ToolResult result;
  result.output = "You have **" + std::to_string(count.value()) + "** unread email(s) in " +
                  request.folder + ".";
  result.metadata["operation"] = "get_unread_count";
  result.metadata["count"] = std::to_string(count.value());
  return result;
}

} // namespace postbox::tools
