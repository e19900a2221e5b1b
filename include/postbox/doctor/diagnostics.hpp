#pragma once

#include "postbox/config/schema.hpp"
#include "postbox/email/credential.hpp"
#include "postbox/email/session.hpp"

#include <chrono>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace postbox::doctor {

enum class CheckStatus {
  Pass,
  Fail,
  Warn,
};

struct DiagnosticCheck {
  std::string name;
  CheckStatus status = CheckStatus::Pass;
  std::string message;
  std::optional<std::chrono::milliseconds> latency;
};

struct DiagnosticsReport {
  std::vector<DiagnosticCheck> checks;
  int passed = 0;
  int failed = 0;
  int warnings = 0;
};

using ConnectorFactory = std::function<std::unique_ptr<email::IMailConnector>(
    const email::Credential &, const email::ConnectionOptions &)>;

/// Config check, then live checks against both servers through `make_connector`.
[[nodiscard]] DiagnosticsReport run_diagnostics(const config::Config &config,
                                                const ConnectorFactory &make_connector);
void print_diagnostics_report(const DiagnosticsReport &report, std::ostream &out);

} // namespace postbox::doctor
