#include "postbox/doctor/diagnostics.hpp"

#include "postbox/common/fs.hpp"
#include "postbox/config/config.hpp"
#include "postbox/email/client.hpp"

#include <ostream>

namespace postbox::doctor {

namespace {

constexpr std::size_t kRecentSample = 3;

void add_check(DiagnosticsReport &report, DiagnosticCheck check) {
  switch (check.status) {
  case CheckStatus::Pass:
    ++report.passed;
    break;
  case CheckStatus::Fail:
    ++report.failed;
    break;
  case CheckStatus::Warn:
    ++report.warnings;
    break;
  }
  report.checks.push_back(std::move(check));
}

DiagnosticCheck check_config(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "Config";
  auto validation = config::validate_config(config);
  if (!validation.ok()) {
    check.status = CheckStatus::Fail;
    check.message = validation.error();
    return check;
  }

  if (!validation.value().empty()) {
    check.status = CheckStatus::Warn;
    check.message = validation.value().front();
    return check;
  }

  check.status = CheckStatus::Pass;
  check.message = "valid";
  return check;
}

template <typename Fn> DiagnosticCheck timed_check(std::string name, Fn &&fn) {
  DiagnosticCheck check;
  check.name = std::move(name);
  const auto started = std::chrono::steady_clock::now();
  fn(check);
  check.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  return check;
}

} // namespace

DiagnosticsReport run_diagnostics(const config::Config &config,
                                  const ConnectorFactory &make_connector) {
  DiagnosticsReport report;
  add_check(report, check_config(config));

  auto credential = email::credential_from_config(config);
  if (!credential.ok()) {
    add_check(report, DiagnosticCheck{.name = "Account",
                                      .status = CheckStatus::Fail,
                                      .message = credential.error(),
                                      .latency = std::nullopt});
    return report;
  }
  add_check(report, DiagnosticCheck{.name = "Account",
                                    .status = CheckStatus::Pass,
                                    .message = credential.value().username + " via " +
                                               credential.value().imap_host + " / " +
                                               credential.value().smtp_host,
                                    .latency = std::nullopt});

  auto connector =
      make_connector(credential.value(), email::connection_options_from_config(config));
  email::EmailClient client(*connector, credential.value(),
                            email::ClientOptions{
                                .preview_length = config.mail.preview_length,
                                .default_folder = config.mail.default_folder,
                            });
  const std::string folder = config.mail.default_folder;

  add_check(report, timed_check("Unread count", [&](DiagnosticCheck &check) {
              auto count = client.unread_count(email::UnreadCountRequest{.folder = folder});
              if (!count.ok()) {
                check.status = CheckStatus::Fail;
                check.message = std::string(common::error_kind_name(count.kind())) + ": " +
                                count.error();
                return;
              }
              check.message = std::to_string(count.value()) + " unread in " + folder;
            }));

  add_check(report, timed_check("Read recent", [&](DiagnosticCheck &check) {
              auto messages =
                  client.read(email::ReadRequest{.count = kRecentSample, .folder = folder});
              if (!messages.ok()) {
                check.status = CheckStatus::Fail;
                check.message = std::string(common::error_kind_name(messages.kind())) + ": " +
                                messages.error();
                return;
              }
              if (messages.value().empty()) {
                check.status = CheckStatus::Warn;
                check.message = folder + " is empty";
                return;
              }
              const auto &newest = messages.value().front();
              check.message = std::to_string(messages.value().size()) + " fetched; newest from " +
                              newest.from + ": " + newest.subject;
            }));

  add_check(report, timed_check("SMTP session", [&](DiagnosticCheck &check) {
              auto session = connector->open_send_session();
              if (!session.ok()) {
                check.status = CheckStatus::Fail;
                check.message = std::string(common::error_kind_name(session.kind())) + ": " +
                                session.error();
                return;
              }
              email::ScopedSession<email::ISendSession> scoped(std::move(session.value()));
              check.message = "authenticated to " + credential.value().smtp_host;
            }));

  return report;
}

void print_diagnostics_report(const DiagnosticsReport &report, std::ostream &out) {
  auto status_prefix = [](CheckStatus status) -> const char * {
    switch (status) {
    case CheckStatus::Pass:
      return "[PASS]";
    case CheckStatus::Fail:
      return "[FAIL]";
    case CheckStatus::Warn:
      return "[WARN]";
    }
    return "[INFO]";
  };

  for (const auto &check : report.checks) {
    out << status_prefix(check.status) << " " << check.name << ": " << check.message;
    if (check.latency.has_value()) {
      out << " (" << check.latency->count() << "ms)";
    }
    out << "\n";
  }

  out << "Summary: " << report.passed << " passed, " << report.failed << " failed, "
      << report.warnings << " warnings\n";
}

} // namespace postbox::doctor
