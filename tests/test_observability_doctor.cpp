#include "test_framework.hpp"

#include "postbox/doctor/diagnostics.hpp"
#include "postbox/email/client.hpp"
#include "postbox/observability/factory.hpp"
#include "postbox/observability/global.hpp"
#include "postbox/observability/log_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>
#include <sstream>

namespace {

using postbox::testing::FakeConnector;
using postbox::testing::FakeMessage;

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

// Routes the global observer into a string for the lifetime of the guard.
struct CapturedLog {
  std::ostringstream out;

  explicit CapturedLog(postbox::observability::LogLevel level) {
    postbox::observability::set_global_observer(
        std::make_unique<postbox::observability::LogObserver>(out, level));
  }
  ~CapturedLog() { postbox::observability::set_global_observer(nullptr); }

  CapturedLog(const CapturedLog &) = delete;
  CapturedLog &operator=(const CapturedLog &) = delete;
};

std::unique_ptr<postbox::email::IMailConnector> stocked_connector() {
  auto connector = std::make_unique<FakeConnector>();
  connector->add_message("INBOX", FakeMessage{.from = "a@x.com",
                                              .subject = "Welcome",
                                              .body = "hello",
                                              .seen = false,
                                              .raw = {}});
  connector->add_message("INBOX", FakeMessage{.from = "b@y.com",
                                              .subject = "Latest news",
                                              .body = "news",
                                              .seen = true,
                                              .raw = {}});
  return connector;
}

} // namespace

void register_observability_doctor_tests(std::vector<postbox::tests::TestCase> &tests) {
  using postbox::tests::require;
  namespace obs = postbox::observability;
  namespace doctor = postbox::doctor;
  namespace email = postbox::email;
  namespace common = postbox::common;

  tests.push_back({"log_observer_formats_events", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out, obs::LogLevel::Debug);
                     observer.record_event(obs::OperationStartEvent{.operation = "read", .folder = "INBOX"});
                     observer.record_event(obs::OperationEndEvent{
                         .operation = "read", .duration = std::chrono::milliseconds(12), .success = true});
                     observer.record_event(obs::MessageSkippedEvent{.message_id = "4", .reason = "bad"});
                     observer.record_event(obs::ErrorEvent{.component = "imap", .message = "boom"});
                     observer.record_metric(obs::MessagesFetchedMetric{.count = 2});

                     const auto text = out.str();
                     require(contains(text, "[DEBUG] operation.start name=read folder=INBOX\n"),
                             "start line mismatch: " + text);
                     require(contains(text, "[INFO] operation.end name=read success=true duration_ms=12\n"),
                             "end line mismatch: " + text);
                     require(contains(text, "[WARN] fetch.skip id=4 reason=bad\n"), "skip line mismatch");
                     require(contains(text, "[ERROR] imap: boom\n"), "error line mismatch");
                     require(contains(text, "metric.messages_fetched=2"), "metric line mismatch");
                   }});

  tests.push_back({"log_observer_respects_min_level", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out, obs::LogLevel::Warn);
                     observer.record_event(obs::OperationEndEvent{
                         .operation = "send", .duration = std::chrono::milliseconds(1), .success = true});
                     observer.record_event(obs::SessionEvent{.protocol = "smtp", .action = "open", .detail = ""});
                     require(out.str().empty(), "info and debug lines should be dropped");
                     observer.record_event(obs::OperationEndEvent{
                         .operation = "send", .duration = std::chrono::milliseconds(1), .success = false});
                     require(contains(out.str(), "[WARN] operation.end name=send success=false"),
                             "failed operations log at warn");
                   }});

  tests.push_back({"observer_factory_and_levels", [] {
                     auto config = postbox::testing::mock_config();
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none should be noop");
                     config.observability.backend = "log";
                     require(obs::create_observer(config)->name() == "log", "log backend expected");
                     require(obs::parse_log_level("WARNING") == obs::LogLevel::Warn, "warning alias");
                     require(obs::parse_log_level("debug") == obs::LogLevel::Debug, "debug level");
                     require(obs::parse_log_level("whatever") == obs::LogLevel::Info, "fallback to info");
                   }});

  tests.push_back({"client_operations_are_observed", [] {
                     const CapturedLog log(obs::LogLevel::Debug);
                     FakeConnector connector;
                     connector.add_message("INBOX", FakeMessage{.from = "a@x.com",
                                                                .subject = "s",
                                                                .body = "b",
                                                                .seen = false,
                                                                .raw = {}});
                     const auto credential = postbox::testing::mock_credential();
                     email::EmailClient client(connector, credential, {});

                     const auto messages = client.read({.count = 3, .folder = "INBOX"});
                     require(messages.ok(), messages.error());
                     const auto failed = client.read({.count = 3, .folder = "Missing"});
                     require(!failed.ok(), "missing folder should fail");

                     const auto text = log.out.str();
                     require(contains(text, "operation.start name=read folder=INBOX"), "start missing: " + text);
                     require(contains(text, "operation.end name=read success=true"), "end missing");
                     require(contains(text, "metric.messages_fetched=1"), "fetched metric missing");
                     require(contains(text, "[ERROR] read: cannot open folder 'Missing'"),
                             "failure should be logged: " + text);
                     require(contains(text, "operation.end name=read success=false"), "failed end missing");
                     require(!contains(text, "app-password"), "secrets must never be logged");
                   }});

  tests.push_back({"doctor_all_checks_pass", [] {
                     const auto config = postbox::testing::mock_config();
                     const auto report = doctor::run_diagnostics(
                         config, [](const email::Credential &, const email::ConnectionOptions &) {
                           return stocked_connector();
                         });
                     require(report.failed == 0, "no failures expected");
                     require(report.passed == 5, "five passing checks expected, got " +
                                                     std::to_string(report.passed));

                     std::ostringstream out;
                     doctor::print_diagnostics_report(report, out);
                     const auto text = out.str();
                     require(contains(text, "[PASS] Config: valid\n"), "config line mismatch: " + text);
                     require(contains(text, "[PASS] Unread count: 1 unread in INBOX"), "unread line mismatch");
                     require(contains(text, "newest from b@y.com: Latest news"), "read line mismatch");
                     require(contains(text, "[PASS] SMTP session: authenticated to smtp.example.com"),
                             "smtp line mismatch");
                     require(contains(text, "Summary: 5 passed, 0 failed, 0 warnings\n"), "summary mismatch");
                   }});

  tests.push_back({"doctor_missing_credentials_stops_early", [] {
                     auto config = postbox::testing::mock_config();
                     config.mail.account.password.clear();
                     auto calls = std::make_shared<int>(0);
                     const auto report = doctor::run_diagnostics(
                         config, [calls](const email::Credential &, const email::ConnectionOptions &) {
                           ++*calls;
                           return stocked_connector();
                         });
                     require(*calls == 0, "no connector should be built");
                     require(report.checks.size() == 2, "config and account checks only");
                     require(report.failed == 2, "both checks should fail");
                   }});

  tests.push_back({"doctor_reports_server_failures", [] {
                     const auto config = postbox::testing::mock_config();
                     const auto report = doctor::run_diagnostics(
                         config, [](const email::Credential &, const email::ConnectionOptions &)
                                     -> std::unique_ptr<email::IMailConnector> {
                           auto connector = std::make_unique<FakeConnector>();
                           connector->state().open_read_error =
                               common::Status::error(common::ErrorKind::Connect, "connection refused");
                           connector->state().open_send_error =
                               common::Status::error(common::ErrorKind::Auth, "535 bad login");
                           return connector;
                         });
                     require(report.failed == 3, "three live checks should fail");

                     std::ostringstream out;
                     doctor::print_diagnostics_report(report, out);
                     const auto text = out.str();
                     require(contains(text, "[FAIL] Unread count: connect_error: connection refused"),
                             "unread failure mismatch: " + text);
                     require(contains(text, "[FAIL] SMTP session: auth_error: 535 bad login"),
                             "smtp failure mismatch");
                   }});

  tests.push_back({"doctor_empty_folder_warns", [] {
                     const auto config = postbox::testing::mock_config();
                     const auto report = doctor::run_diagnostics(
                         config, [](const email::Credential &, const email::ConnectionOptions &)
                                     -> std::unique_ptr<email::IMailConnector> {
                           return std::make_unique<FakeConnector>();
                         });
                     require(report.failed == 0, "empty folder is not a failure");
                     require(report.warnings == 1, "empty folder should warn");
                   }});
}
