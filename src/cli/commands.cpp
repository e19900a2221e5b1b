#include "postbox/cli/commands.hpp"

#include "postbox/common/fs.hpp"
#include "postbox/config/config.hpp"
#include "postbox/doctor/diagnostics.hpp"
#include "postbox/email/client.hpp"
#include "postbox/email/connector.hpp"
#include "postbox/observability/factory.hpp"
#include "postbox/observability/global.hpp"
#include "postbox/tools/email_tools.hpp"

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace postbox::cli {

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitConfig = 2;

std::string version_string() {
#ifdef POSTBOX_VERSION
  return std::string("postbox ") + POSTBOX_VERSION;
#else
  return "postbox 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

// Copies `--flag value` into `key` when present.
void move_option(std::vector<std::string> &args, const std::string &flag, const std::string &key,
                 tools::ToolArgs &out) {
  std::string value;
  if (take_option(args, flag, "", value)) {
    out[key] = value;
  }
}

bool reject_leftovers(const std::vector<std::string> &args, const std::string &command) {
  if (args.empty()) {
    return false;
  }
  std::cerr << "unexpected argument for " << command << ": " << args.front() << "\n";
  return true;
}

// Loads and validates configuration and installs the global observer.
common::Result<config::Config> load_runtime_config() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return loaded;
  }
  auto validation = config::validate_config(loaded.value());
  if (!validation.ok()) {
    return common::Result<config::Config>::failure(validation.status());
  }
  observability::set_global_observer(observability::create_observer(loaded.value()));
  for (const auto &warning : validation.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  return loaded;
}

int run_tool(const std::string &operation, const tools::ToolArgs &args) {
  auto loaded = load_runtime_config();
  if (!loaded.ok()) {
    std::cerr << "configuration error: " << loaded.error() << "\n";
    return kExitConfig;
  }
  const auto &config = loaded.value();
  auto credential = email::credential_from_config(config);
  if (!credential.ok()) {
    std::cerr << "configuration error: " << credential.error() << "\n";
    return kExitConfig;
  }

  email::MailConnector connector(credential.value(),
                                 email::connection_options_from_config(config));
  email::EmailClient client(connector, credential.value(),
                            email::ClientOptions{
                                .preview_length = config.mail.preview_length,
                                .default_folder = config.mail.default_folder,
                            });
  tools::EmailToolDispatcher dispatcher(
      client, tools::RequestDefaults{.read_count = config.mail.default_read_count,
                                     .folder = config.mail.default_folder});

  const auto result = dispatcher.execute(operation, args);
  std::cout << result.output << "\n";
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return result.success ? 0 : kExitFailure;
}

int run_read(std::vector<std::string> args) {
  tools::ToolArgs tool_args;
  move_option(args, "--count", "count", tool_args);
  move_option(args, "--folder", "folder", tool_args);
  if (reject_leftovers(args, "read")) {
    return kExitFailure;
  }
  return run_tool("read_emails", tool_args);
}

int run_filter(std::vector<std::string> args) {
  tools::ToolArgs tool_args;
  move_option(args, "--sender", "sender", tool_args);
  move_option(args, "--subject", "subject", tool_args);
  move_option(args, "--unread", "is_unread", tool_args);
  move_option(args, "--folder", "folder", tool_args);
  if (reject_leftovers(args, "filter")) {
    return kExitFailure;
  }
  return run_tool("filter_emails", tool_args);
}

int run_send(std::vector<std::string> args) {
  tools::ToolArgs tool_args;
  move_option(args, "--to", "to", tool_args);
  move_option(args, "--subject", "subject", tool_args);
  move_option(args, "--cc", "cc", tool_args);
  move_option(args, "--body", "body", tool_args);
  if (take_flag(args, "--body-stdin")) {
    tool_args["body"] = read_stdin_all();
  }
  if (reject_leftovers(args, "send")) {
    return kExitFailure;
  }
  return run_tool("send_email", tool_args);
}

int run_unread_count(std::vector<std::string> args) {
  tools::ToolArgs tool_args;
  move_option(args, "--folder", "folder", tool_args);
  if (reject_leftovers(args, "unread-count")) {
    return kExitFailure;
  }
  return run_tool("get_unread_count", tool_args);
}

// `call NAME key=value...`: the agent-facing surface, one argument per pair.
int run_call(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: postbox call <operation> [key=value ...]\n";
    return kExitFailure;
  }
  const std::string operation = args.front();
  tools::ToolArgs tool_args;
  for (std::size_t i = 1; i < args.size(); ++i) {
    const auto eq = args[i].find('=');
    if (eq == std::string::npos || eq == 0) {
      std::cerr << "expected key=value, got: " << args[i] << "\n";
      return kExitFailure;
    }
    tool_args[args[i].substr(0, eq)] = args[i].substr(eq + 1);
  }
  if (!tools::parse_operation(operation).has_value()) {
    std::cout << "Error: Unknown tool: " << operation << "\n";
    return kExitFailure;
  }
  return run_tool(operation, tool_args);
}

int run_doctor() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    std::cerr << "configuration error: " << loaded.error() << "\n";
    return kExitConfig;
  }
  observability::set_global_observer(observability::create_observer(loaded.value()));

  const auto report = doctor::run_diagnostics(
      loaded.value(), [](const email::Credential &credential,
                         const email::ConnectionOptions &options)
                          -> std::unique_ptr<email::IMailConnector> {
        return std::make_unique<email::MailConnector>(credential, options);
      });
  doctor::print_diagnostics_report(report, std::cout);
  return report.failed == 0 ? 0 : kExitFailure;
}

int run_config_show() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    std::cerr << "configuration error: " << loaded.error() << "\n";
    return kExitConfig;
  }
  std::cout << config::describe_config(loaded.value());
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: postbox [--config PATH] <command> [options]\n\n";
  std::cout << "Mailbox commands:\n";
  std::cout << "  read [--count N] [--folder F]              Most recent messages, newest first\n";
  std::cout << "  filter [--sender S] [--subject S] [--unread true|false] [--folder F]\n";
  std::cout << "                                             Messages matching every criterion\n";
  std::cout << "  send --to T --subject S (--body B | --body-stdin) [--cc C]\n";
  std::cout << "                                             Send a plain-text message\n";
  std::cout << "  unread-count [--folder F]                  Number of unread messages\n";
  std::cout << "  call <operation> [key=value ...]           Run a tool operation by name\n\n";
  std::cout << "Other commands:\n";
  std::cout << "  tools                                      Tool definitions as JSON\n";
  std::cout << "  doctor                                     Check configuration and servers\n";
  std::cout << "  config                                     Show effective configuration\n";
  std::cout << "  config-path                                Print the config file location\n";
  std::cout << "  version                                    Print version\n";
  std::cout << "  help                                       Show this help\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argc > 0 ? argv + 1 : argv);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return kExitFailure;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return kExitFailure;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "config") {
    return run_config_show();
  }
  if (subcommand == "tools") {
    std::cout << tools::specs_to_json(tools::email_tool_specs()) << "\n";
    return 0;
  }
  if (subcommand == "read") {
    return run_read(std::move(args));
  }
  if (subcommand == "filter") {
    return run_filter(std::move(args));
  }
  if (subcommand == "send") {
    return run_send(std::move(args));
  }
  if (subcommand == "unread-count" || subcommand == "unread_count") {
    return run_unread_count(std::move(args));
  }
  if (subcommand == "call") {
    return run_call(std::move(args));
  }
  if (subcommand == "doctor") {
    return run_doctor();
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return kExitFailure;
}

} // namespace postbox::cli
