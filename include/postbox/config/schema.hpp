#pragma once

#include <cstdint>
#include <string>

namespace postbox::config {

struct AccountConfig {
  std::string username;
  std::string password;
  std::string display_name;
};

struct ImapConfig {
  std::string host;
  std::uint16_t port = 993;
};

struct SmtpConfig {
  std::string host;
  std::uint16_t port = 587;
  bool implicit_tls = false;
};

struct MailConfig {
  AccountConfig account;
  ImapConfig imap;
  SmtpConfig smtp;
  std::string default_folder = "INBOX";
  std::uint32_t default_read_count = 10;
  std::size_t preview_length = 300;
  std::uint32_t timeout_secs = 30;
  bool verify_tls = true;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "info";
};

struct Config {
  MailConfig mail;
  ObservabilityConfig observability;
};

} // namespace postbox::config
