#pragma once

#include "postbox/common/result.hpp"
#include "postbox/config/schema.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace postbox::email {

/// Account identity, secret, and both server endpoints. Built once at startup and
/// passed by reference; never logged.
struct Credential {
  std::string username;
  std::string password;
  std::string display_name;
  std::string imap_host;
  std::uint16_t imap_port = 993;
  std::string smtp_host;
  std::uint16_t smtp_port = 587;
  bool smtp_implicit_tls = false;
};

struct ConnectionOptions {
  std::chrono::seconds timeout{30};
  bool verify_tls = true;
};

[[nodiscard]] common::Result<Credential> credential_from_config(const config::Config &config);
[[nodiscard]] ConnectionOptions connection_options_from_config(const config::Config &config);

} // namespace postbox::email
