#include "postbox/email/credential.hpp"

#include "postbox/common/fs.hpp"

namespace postbox::email {

common::Result<Credential> credential_from_config(const config::Config &config) {
  const auto &mail = config.mail;
  const std::string username = common::trim(mail.account.username);
  if (username.empty() || mail.account.password.empty()) {
    return common::Result<Credential>::failure(
        common::ErrorKind::Config, "email username and password are required");
  }
  if (common::trim(mail.imap.host).empty() || common::trim(mail.smtp.host).empty()) {
    return common::Result<Credential>::failure(common::ErrorKind::Config,
                                               "imap and smtp hosts are required");
  }

  return common::Result<Credential>::success(Credential{
      .username = username,
      .password = mail.account.password,
      .display_name = common::trim(mail.account.display_name),
      .imap_host = common::trim(mail.imap.host),
      .imap_port = mail.imap.port,
      .smtp_host = common::trim(mail.smtp.host),
      .smtp_port = mail.smtp.port,
      .smtp_implicit_tls = mail.smtp.implicit_tls,
  });
}

ConnectionOptions connection_options_from_config(const config::Config &config) {
  return ConnectionOptions{
      .timeout = std::chrono::seconds(config.mail.timeout_secs),
      .verify_tls = config.mail.verify_tls,
  };
}

} // namespace postbox::email
