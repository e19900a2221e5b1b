#include "postbox/config/config.hpp"

#include "postbox/common/fs.hpp"
#include "postbox/common/toml.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <vector>

namespace postbox::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".postbox";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr std::uint32_t MAX_TIMEOUT_SECS = 3600;
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("POSTBOX_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(ch);
        break;
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    const std::string value = strip_env_quotes(trimmed.substr(eq + 1));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, value);
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("POSTBOX_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  // Config dir .env wins over the working directory one (first writer keeps the value)
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

// Out-of-range values become 0 so validation reports them instead of silently
// keeping the default.
std::uint16_t to_port(const std::uint64_t value) {
  if (value > std::numeric_limits<std::uint16_t>::max()) {
    return 0;
  }
  return static_cast<std::uint16_t>(value);
}

std::optional<std::uint64_t> parse_env_number(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  const std::string value = common::trim(raw);
  std::uint64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return 0;
  }
  return parsed;
}

std::optional<std::string> env_string(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  return std::string(raw);
}

void load_mail_config(MailConfig &mail, const common::TomlDocument &doc) {
  mail.account.username =
      expand_config_value(doc.get_string("mail.account.username", mail.account.username));
  mail.account.password =
      expand_config_value(doc.get_string("mail.account.password", mail.account.password));
  mail.account.display_name = doc.get_string("mail.account.display_name", mail.account.display_name);

  mail.imap.host = doc.get_string("mail.imap.host", mail.imap.host);
  mail.imap.port = to_port(doc.get_u64("mail.imap.port", mail.imap.port));

  mail.smtp.host = doc.get_string("mail.smtp.host", mail.smtp.host);
  mail.smtp.port = to_port(doc.get_u64("mail.smtp.port", mail.smtp.port));
  mail.smtp.implicit_tls = doc.get_bool("mail.smtp.implicit_tls", mail.smtp.implicit_tls);

  mail.default_folder = doc.get_string("mail.default_folder", mail.default_folder);
  mail.default_read_count = static_cast<std::uint32_t>(
      doc.get_u64("mail.default_read_count", mail.default_read_count));
  mail.preview_length =
      static_cast<std::size_t>(doc.get_u64("mail.preview_length", mail.preview_length));
  mail.timeout_secs =
      static_cast<std::uint32_t>(doc.get_u64("mail.timeout_secs", mail.timeout_secs));
  mail.verify_tls = doc.get_bool("mail.verify_tls", mail.verify_tls);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorKind::Config, "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.status());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  auto &mail = config.mail;
  if (auto user = env_string("EMAIL_USER"); user.has_value()) {
    mail.account.username = *user;
  }
  if (auto pass = env_string("EMAIL_PASS"); pass.has_value()) {
    mail.account.password = *pass;
  }
  if (auto host = env_string("IMAP_SERVER"); host.has_value()) {
    mail.imap.host = *host;
  }
  if (auto host = env_string("SMTP_SERVER"); host.has_value()) {
    mail.smtp.host = *host;
  }
  if (auto port = parse_env_number("IMAP_PORT"); port.has_value()) {
    mail.imap.port = to_port(*port);
  }
  if (auto port = parse_env_number("SMTP_PORT"); port.has_value()) {
    mail.smtp.port = to_port(*port);
  }
  if (auto length = parse_env_number("POSTBOX_PREVIEW_LENGTH"); length.has_value()) {
    mail.preview_length = static_cast<std::size_t>(*length);
  }
  if (auto timeout = parse_env_number("POSTBOX_TIMEOUT_SECS"); timeout.has_value()) {
    mail.timeout_secs = static_cast<std::uint32_t>(*timeout);
  }
}

common::Result<Config> load_config() {
  load_dotenv_files();

  Config config;

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.status());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure(common::ErrorKind::Config,
                                           "Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  const auto parsed = common::parse_toml(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(common::ErrorKind::Config,
                                           path.string() + ": " + parsed.error());
  }

  const auto &doc = parsed.value();
  load_mail_config(config.mail, doc);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.level = doc.get_string("observability.level", config.observability.level);

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Out = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;
  const auto &mail = config.mail;

  if (common::trim(mail.account.username).empty() || mail.account.password.empty()) {
    return Out::failure(common::ErrorKind::Config,
                        "EMAIL_USER and EMAIL_PASS (or [mail.account] username/password) "
                        "must be set");
  }
  if (common::trim(mail.imap.host).empty()) {
    return Out::failure(common::ErrorKind::Config,
                        "IMAP_SERVER (or mail.imap.host) must be set");
  }
  if (common::trim(mail.smtp.host).empty()) {
    return Out::failure(common::ErrorKind::Config,
                        "SMTP_SERVER (or mail.smtp.host) must be set");
  }
  if (mail.imap.port == 0) {
    return Out::failure(common::ErrorKind::Config, "mail.imap.port must be 1-65535");
  }
  if (mail.smtp.port == 0) {
    return Out::failure(common::ErrorKind::Config, "mail.smtp.port must be 1-65535");
  }
  if (mail.preview_length == 0) {
    return Out::failure(common::ErrorKind::Config, "mail.preview_length must be > 0");
  }
  if (mail.timeout_secs == 0 || mail.timeout_secs > MAX_TIMEOUT_SECS) {
    return Out::failure(common::ErrorKind::Config, "mail.timeout_secs must be 1-" +
                                                       std::to_string(MAX_TIMEOUT_SECS));
  }
  if (mail.default_read_count == 0) {
    return Out::failure(common::ErrorKind::Config, "mail.default_read_count must be > 0");
  }
  if (common::trim(mail.default_folder).empty()) {
    return Out::failure(common::ErrorKind::Config, "mail.default_folder must not be empty");
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend != "log" && backend != "none" && backend != "noop") {
    return Out::failure(common::ErrorKind::Config,
                        "Invalid observability.backend: " + config.observability.backend);
  }
  const std::string level = common::to_lower(common::trim(config.observability.level));
  if (level != "debug" && level != "info" && level != "warn" && level != "error") {
    return Out::failure(common::ErrorKind::Config,
                        "Invalid observability.level: " + config.observability.level);
  }

  if (!mail.verify_tls) {
    warnings.push_back("mail.verify_tls is disabled; server certificates are not checked");
  }
  if (mail.smtp.port == 465 && !mail.smtp.implicit_tls) {
    warnings.push_back("mail.smtp.port is 465; implicit TLS will be used");
  }
  if (mail.account.username.find('@') == std::string::npos) {
    warnings.push_back("mail.account.username is not an email address; it is also used as "
                       "the From address");
  }

  return Out::success(std::move(warnings));
}

std::string describe_config(const Config &config) {
  const auto &mail = config.mail;
  std::ostringstream out;
  out << "[mail.account]\n";
  out << "username = " << mail.account.username << "\n";
  out << "password = " << (mail.account.password.empty() ? "(unset)" : "(redacted)") << "\n";
  if (!mail.account.display_name.empty()) {
    out << "display_name = " << mail.account.display_name << "\n";
  }
  out << "[mail.imap]\n";
  out << "host = " << mail.imap.host << "\nport = " << mail.imap.port << "\n";
  out << "[mail.smtp]\n";
  out << "host = " << mail.smtp.host << "\nport = " << mail.smtp.port << "\n";
  out << "implicit_tls = " << (mail.smtp.implicit_tls ? "true" : "false") << "\n";
  out << "[mail]\n";
  out << "default_folder = " << mail.default_folder << "\n";
  out << "default_read_count = " << mail.default_read_count << "\n";
  out << "preview_length = " << mail.preview_length << "\n";
  out << "timeout_secs = " << mail.timeout_secs << "\n";
  out << "verify_tls = " << (mail.verify_tls ? "true" : "false") << "\n";
  out << "[observability]\n";
  out << "backend = " << config.observability.backend << "\n";
  out << "level = " << config.observability.level << "\n";
  return out.str();
}

} // namespace postbox::config
