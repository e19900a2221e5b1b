#include "test_framework.hpp"

#include "postbox/tools/email_tools.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

using postbox::testing::FakeConnector;
using postbox::testing::FakeMessage;

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

// Connector, client and dispatcher wired together the way the CLI does it.
struct ToolHarness {
  FakeConnector connector;
  postbox::email::Credential credential = postbox::testing::mock_credential();
  postbox::email::EmailClient client{connector, credential, {}};
  postbox::tools::EmailToolDispatcher dispatcher{client, {}};
};

} // namespace

void register_tools_tests(std::vector<postbox::tests::TestCase> &tests) {
  using postbox::tests::require;
  namespace tools = postbox::tools;
  namespace email = postbox::email;
  namespace common = postbox::common;

  tests.push_back({"tools_parse_operation_names", [] {
                     require(tools::parse_operation("read_emails") == tools::EmailOperation::ReadEmails,
                             "read_emails should parse");
                     require(tools::parse_operation(" Filter ") == tools::EmailOperation::FilterEmails,
                             "alias should parse case-insensitively");
                     require(tools::parse_operation("send") == tools::EmailOperation::SendEmail,
                             "send alias should parse");
                     require(tools::parse_operation("unread_count") ==
                                 tools::EmailOperation::GetUnreadCount,
                             "unread alias should parse");
                     require(!tools::parse_operation("delete_emails").has_value(),
                             "unknown operation should not parse");
                     require(tools::operation_name(tools::EmailOperation::SendEmail) == "send_email",
                             "canonical name mismatch");
                   }});

  tests.push_back({"tools_parse_request_count", [] {
                     const tools::RequestDefaults defaults{.read_count = 7, .folder = "INBOX"};
                     auto parsed = tools::parse_request(tools::EmailOperation::ReadEmails, {}, defaults);
                     require(parsed.ok(), parsed.error());
                     require(std::get<email::ReadRequest>(parsed.value()).count == 7,
                             "default count should apply");

                     parsed = tools::parse_request(tools::EmailOperation::ReadEmails,
                                                   {{"count", "5.0"}, {"folder", "Sent"}}, defaults);
                     require(parsed.ok(), parsed.error());
                     const auto &read = std::get<email::ReadRequest>(parsed.value());
                     require(read.count == 5, "5.0 should be accepted as 5");
                     require(read.folder == "Sent", "folder should apply");

                     const auto bad = tools::parse_request(tools::EmailOperation::ReadEmails,
                                                           {{"count", "many"}}, defaults);
                     require(!bad.ok(), "non-numeric count should fail");
                     require(bad.kind() == common::ErrorKind::InvalidArgument,
                             "kind should be invalid argument");
                     require(contains(bad.error(), "'many'"), "error should quote the value");

                     require(!tools::parse_request(tools::EmailOperation::ReadEmails, {{"count", "0"}},
                                                   defaults)
                                  .ok(),
                             "zero count should fail");
                     require(!tools::parse_request(tools::EmailOperation::ReadEmails, {{"count", "-3"}},
                                                   defaults)
                                  .ok(),
                             "negative count should fail");
                   }});

  tests.push_back({"tools_parse_request_filter_flags", [] {
                     const tools::RequestDefaults defaults;
                     auto parsed = tools::parse_request(tools::EmailOperation::FilterEmails,
                                                        {{"is_unread", "Yes"}, {"sender", " a@x.com "}},
                                                        defaults);
                     require(parsed.ok(), parsed.error());
                     const auto &criteria = std::get<email::FilterCriteria>(parsed.value());
                     require(criteria.is_unread == true, "yes should mean true");
                     require(criteria.sender == std::string("a@x.com"), "sender should be trimmed");
                     require(!criteria.subject.has_value(), "subject should be unset");
                     require(criteria.folder == "INBOX", "default folder should apply");

                     const auto bad = tools::parse_request(tools::EmailOperation::FilterEmails,
                                                           {{"is_unread", "maybe"}}, defaults);
                     require(!bad.ok(), "unknown boolean should fail");
                     require(contains(bad.error(), "is_unread"), "error should name the argument");
                   }});

  tests.push_back({"tools_specs_describe_four_operations", [] {
                     const auto specs = tools::email_tool_specs();
                     require(specs.size() == 4, "four tools expected");
                     const auto json = tools::specs_to_json(specs);
                     require(json.front() == '[' && json.back() == ']', "json should be an array");
                     require(contains(json, "\"name\":\"read_emails\""), "read_emails missing");
                     require(contains(json, "\"name\":\"get_unread_count\""), "get_unread_count missing");
                     require(contains(json, "\"required\":[\"to\",\"subject\",\"body\"]"),
                             "send_email should require to, subject and body");
                     require(contains(specs[0].parameters_json,
                                      "\"description\":\"Number of emails to retrieve (default: 10)\""),
                             "parenthesised descriptions should survive: " + specs[0].parameters_json);
                     require(contains(specs[1].parameters_json, "(optional)\"},\"is_unread\""),
                             "filter schema should be complete: " + specs[1].parameters_json);
                     for (const auto &spec : specs) {
                       require(spec.parameters_json.front() == '{' && spec.parameters_json.back() == '}',
                               "schema should be a json object: " + spec.name);
                     }
                   }});

  tests.push_back({"tools_unknown_operation", [] {
                     ToolHarness harness;
                     const auto result = harness.dispatcher.execute("archive_emails", {});
                     require(!result.success, "unknown tool should fail");
                     require(result.output == "Error: Unknown tool: archive_emails", "output mismatch");
                     require(harness.connector.state().read_opens == 0, "nothing should connect");
                   }});

  tests.push_back({"tools_read_output", [] {
                     ToolHarness harness;
                     harness.connector.add_message("INBOX", FakeMessage{.from = "a@x.com",
                                                                        .subject = "Older",
                                                                        .body = "old body",
                                                                        .seen = true,
                                                                        .raw = {}});
                     harness.connector.add_message("INBOX", FakeMessage{.from = "b@y.com",
                                                                        .subject = "Newer",
                                                                        .body = "new body",
                                                                        .seen = false,
                                                                        .raw = {}});
                     const auto result = harness.dispatcher.execute("read_emails", {{"count", "5"}});
                     require(result.success, result.output);
                     require(result.output.rfind("Found 2 email(s) in INBOX:\n\n", 0) == 0,
                             "header mismatch: " + result.output);
                     require(contains(result.output, "1. **From:** b@y.com\n   **Subject:** Newer\n"),
                             "newest should be listed first: " + result.output);
                     require(contains(result.output, "   **Preview:** old body\n"), "preview missing");
                     require(result.metadata.at("count") == "2", "count metadata mismatch");
                   }});

  tests.push_back({"tools_read_empty_folder", [] {
                     ToolHarness harness;
                     const auto result = harness.dispatcher.execute("read", {});
                     require(result.success, result.output);
                     require(result.output == "No emails found in INBOX.", "output mismatch: " + result.output);
                   }});

  tests.push_back({"tools_invalid_count_is_reported_without_connecting", [] {
                     ToolHarness harness;
                     const auto result = harness.dispatcher.execute("read_emails", {{"count", "abc"}});
                     require(!result.success, "invalid count should fail");
                     require(result.output.rfind("Error: Failed to read emails: ", 0) == 0,
                             "output mismatch: " + result.output);
                     require(result.metadata.at("error_kind") == "invalid_argument", "error kind mismatch");
                     require(harness.connector.state().read_opens == 0, "nothing should connect");
                   }});

  tests.push_back({"tools_filter_output", [] {
                     ToolHarness harness;
                     harness.connector.add_message("INBOX", FakeMessage{.from = "a@x.com",
                                                                        .subject = "Invoice 1",
                                                                        .body = "pay",
                                                                        .seen = false,
                                                                        .raw = {}});
                     const auto result = harness.dispatcher.execute(
                         "filter_emails", {{"sender", "a@x.com"}, {"is_unread", "true"}});
                     require(result.success, result.output);
                     require(result.output.rfind("Found 1 email(s) matching criteria (sender: a@x.com, "
                                                 "unread: true):\n\n",
                                                 0) == 0,
                             "header mismatch: " + result.output);

                     const auto none = harness.dispatcher.execute("filter_emails", {{"subject", "Receipt"}});
                     require(none.success, none.output);
                     require(none.output == "No emails found matching criteria (subject contains: Receipt).",
                             "empty output mismatch: " + none.output);

                     const auto all = harness.dispatcher.execute("filter_emails", {});
                     require(contains(all.output, "(no filters)"), "filterless summary mismatch");
                   }});

  tests.push_back({"tools_send_output", [] {
                     ToolHarness harness;
                     const auto result = harness.dispatcher.execute(
                         "send_email",
                         {{"to", "ann@x.com"}, {"subject", "Hello"}, {"body", "Hi Ann"}, {"cc", "bob@y.com"}});
                     require(result.success, result.output);
                     require(result.output.rfind("Email sent successfully!\n\n**To:** ann@x.com\n**CC:** "
                                                 "bob@y.com\n**Subject:** Hello\n**Sent at:** ",
                                                 0) == 0,
                             "output mismatch: " + result.output);
                     require(result.metadata.at("recipients") == "2", "recipient count mismatch");
                     require(harness.connector.state().submitted.size() == 1, "one submission expected");
                   }});

  tests.push_back({"tools_send_failure_output", [] {
                     ToolHarness harness;
                     const auto result = harness.dispatcher.execute(
                         "send_email", {{"to", "bad-address"}, {"subject", "Hello"}, {"body", "Hi"}});
                     require(!result.success, "invalid address should fail");
                     require(result.output ==
                                 "Error: Failed to send email: invalid recipient address 'bad-address'",
                             "output mismatch: " + result.output);
                     require(result.metadata.at("error_kind") == "send_error", "error kind mismatch");
                     require(harness.connector.state().send_opens == 0, "nothing should connect");
                   }});

  tests.push_back({"tools_unread_count_output", [] {
                     ToolHarness harness;
                     for (int i = 0; i < 4; ++i) {
                       harness.connector.add_message("INBOX", FakeMessage{.from = "a@x.com",
                                                                          .subject = "s",
                                                                          .body = "b",
                                                                          .seen = i == 0,
                                                                          .raw = {}});
                     }
                     const auto result = harness.dispatcher.execute("get_unread_count", {});
                     require(result.success, result.output);
                     require(result.output == "You have **3** unread email(s) in INBOX.",
                             "output mismatch: " + result.output);
                     require(result.metadata.at("count") == "3", "count metadata mismatch");
                   }});

  tests.push_back({"tools_connection_failure_output", [] {
                     ToolHarness harness;
                     harness.connector.state().open_read_error =
                         common::Status::error(common::ErrorKind::Connect, "connection refused");
                     const auto result = harness.dispatcher.execute("get_unread_count", {});
                     require(!result.success, "connect failure should fail");
                     require(result.output == "Error: Failed to get unread count: connection refused",
                             "output mismatch: " + result.output);
                     require(result.metadata.at("error_kind") == "connect_error", "error kind mismatch");
                   }});
}
