#include "postbox/email/compose.hpp"

#include "postbox/common/fs.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace postbox::email {

namespace {

constexpr std::size_t kMaxPlainLineLength = 998;
constexpr std::size_t kQuotedPrintableLineLength = 76;
constexpr std::size_t kMaxEncodedWordLength = 75;
// "=?UTF-8?B?" plus "?=" leaves 63 characters, i.e. 15 base64 quanta of 3 bytes.
constexpr std::size_t kEncodedWordPayloadBytes = (kMaxEncodedWordLength - 12) / 4 * 3;
constexpr std::array<const char *, 7> kDays = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
constexpr std::array<const char *, 12> kMonths = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                  "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

std::string single_line(const std::string &value) {
  std::string out = value;
  for (auto &ch : out) {
    if (ch == '\r' || ch == '\n') {
      ch = ' ';
    }
  }
  return common::trim(out);
}

bool is_atext(const char ch) {
  if (std::isalnum(static_cast<unsigned char>(ch)) != 0) {
    return true;
  }
  return std::string_view("!#$%&'*+-/=?^_`{|}~.").find(ch) != std::string_view::npos;
}

// Splits on commas outside quotes and angle brackets.
std::vector<std::string> split_addresses(const std::string &value) {
  std::vector<std::string> out;
  std::string current;
  bool quoted = false;
  bool in_angle = false;
  for (const char ch : value) {
    if (ch == '"') {
      quoted = !quoted;
    } else if (!quoted && ch == '<') {
      in_angle = true;
    } else if (!quoted && ch == '>') {
      in_angle = false;
    } else if (!quoted && !in_angle && ch == ',') {
      out.push_back(common::trim(current));
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  out.push_back(common::trim(current));
  return out;
}

std::string bare_address(const std::string &entry) {
  const auto open = entry.rfind('<');
  const auto close = entry.rfind('>');
  if (open != std::string::npos && close != std::string::npos && close > open) {
    return common::trim(entry.substr(open + 1, close - open - 1));
  }
  return entry;
}

std::string base64(const std::string &bytes) {
  std::string out(4 * ((bytes.size() + 2) / 3), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                  reinterpret_cast<const unsigned char *>(bytes.data()),
                  static_cast<int>(bytes.size()));
  return out;
}

std::string random_hex(const std::size_t bytes) {
  std::random_device rd;
  std::ostringstream out;
  for (std::size_t i = 0; i < bytes; ++i) {
    out << std::hex << std::setw(2) << std::setfill('0') << (rd() & 0xFF);
  }
  return out.str();
}

std::tm utc_time(const std::chrono::system_clock::time_point when) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
  std::tm tm{};
  gmtime_r(&seconds, &tm);
  return tm;
}

std::string domain_of(const std::string &address) {
  const auto at = address.rfind('@');
  return at == std::string::npos ? "localhost" : address.substr(at + 1);
}

std::string format_mailbox(const std::string &display_name, const std::string &address) {
  const std::string name = single_line(display_name);
  if (name.empty()) {
    return address;
  }
  if (!common::is_ascii(name)) {
    return encode_header_word(name) + " <" + address + ">";
  }
  std::string quoted = "\"";
  for (const char ch : name) {
    if (ch == '"' || ch == '\\') {
      quoted.push_back('\\');
    }
    quoted.push_back(ch);
  }
  return quoted + "\" <" + address + ">";
}

std::vector<std::string> crlf_lines(const std::string &body) {
  std::vector<std::string> lines;
  std::string current;
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (body[i] == '\r' || body[i] == '\n') {
      if (body[i] == '\r' && i + 1 < body.size() && body[i + 1] == '\n') {
        ++i;
      }
      lines.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(body[i]);
  }
  lines.push_back(std::move(current));
  return lines;
}

bool needs_quoted_printable(const std::vector<std::string> &lines) {
  for (const auto &line : lines) {
    if (line.size() > kMaxPlainLineLength || !common::is_ascii(line) ||
        line.find('\0') != std::string::npos) {
      return true;
    }
  }
  return false;
}

std::string quoted_printable_line(const std::string &line) {
  static constexpr std::string_view kHex = "0123456789ABCDEF";
  std::string out;
  std::size_t column = 0;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const auto byte = static_cast<unsigned char>(line[i]);
    const bool last = i + 1 == line.size();
    std::string token;
    if ((byte >= 33 && byte <= 126 && byte != '=') || ((byte == ' ' || byte == '\t') && !last)) {
      token.push_back(static_cast<char>(byte));
    } else {
      token = {'=', kHex[byte >> 4], kHex[byte & 0x0F]};
    }
    if (column + token.size() > kQuotedPrintableLineLength - 1) {
      out += "=\r\n";
      column = 0;
    }
    out += token;
    column += token.size();
  }
  return out;
}

} // namespace

bool is_valid_address(const std::string &address) {
  const auto at = address.rfind('@');
  if (at == std::string::npos || at == 0 || at + 1 >= address.size()) {
    return false;
  }
  const std::string local = address.substr(0, at);
  const std::string domain = address.substr(at + 1);

  if (local.front() == '.' || local.back() == '.' || local.find("..") != std::string::npos) {
    return false;
  }
  for (const char ch : local) {
    if (!is_atext(ch)) {
      return false;
    }
  }

  for (const auto &label : common::split(domain, '.')) {
    if (label.empty() || label.size() > 63 || label.front() == '-' || label.back() == '-') {
      return false;
    }
    for (const char ch : label) {
      if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '-') {
        return false;
      }
    }
  }
  return true;
}

common::Result<std::vector<std::string>> parse_address_list(const std::string &value) {
  using R = common::Result<std::vector<std::string>>;
  std::vector<std::string> addresses;
  for (const auto &entry : split_addresses(single_line(value))) {
    if (entry.empty()) {
      continue;
    }
    const std::string address = bare_address(entry);
    if (!is_valid_address(address)) {
      return R::failure(common::ErrorKind::Send, "invalid recipient address '" + entry + "'");
    }
    addresses.push_back(address);
  }
  if (addresses.empty()) {
    return R::failure(common::ErrorKind::Send, "no recipient address given");
  }
  return R::success(std::move(addresses));
}

std::string encode_header_word(const std::string &value) {
  if (common::is_ascii(value)) {
    return value;
  }
  // Split on code point boundaries; each word stays within kMaxEncodedWordLength.
  std::string out;
  std::size_t start = 0;
  while (start < value.size()) {
    std::size_t end = std::min(value.size(), start + kEncodedWordPayloadBytes);
    while (end < value.size() && end > start + 1 &&
           (static_cast<unsigned char>(value[end]) & 0xC0) == 0x80) {
      --end;
    }
    if (!out.empty()) {
      out += "\r\n ";
    }
    out += "=?UTF-8?B?" + base64(value.substr(start, end - start)) + "?=";
    start = end;
  }
  return out;
}

std::string format_rfc5322_date(const std::chrono::system_clock::time_point when) {
  const std::tm tm = utc_time(when);
  std::ostringstream out;
  out << kDays[static_cast<std::size_t>(tm.tm_wday)] << ", " << std::setw(2)
      << std::setfill('0') << tm.tm_mday << " " << kMonths[static_cast<std::size_t>(tm.tm_mon)]
      << " " << (tm.tm_year + 1900) << " " << std::setw(2) << tm.tm_hour << ":" << std::setw(2)
      << tm.tm_min << ":" << std::setw(2) << tm.tm_sec << " +0000";
  return out.str();
}

std::string format_iso8601(const std::chrono::system_clock::time_point when) {
  const std::tm tm = utc_time(when);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

common::Status validate_send_request(const SendRequest &request) {
  if (common::trim(request.to).empty()) {
    return common::Status::error(common::ErrorKind::Send, "recipient (to) is required");
  }
  if (common::trim(request.subject).empty()) {
    return common::Status::error(common::ErrorKind::Send, "subject is required");
  }
  if (common::trim(request.body).empty()) {
    return common::Status::error(common::ErrorKind::Send, "body is required");
  }
  auto to = parse_address_list(request.to);
  if (!to.ok()) {
    return to.status();
  }
  if (request.cc.has_value() && !common::trim(*request.cc).empty()) {
    auto cc = parse_address_list(*request.cc);
    if (!cc.ok()) {
      return cc.status();
    }
  }
  return common::Status::success();
}

common::Result<OutgoingMessage> compose_message(const Credential &credential,
                                                const SendRequest &request,
                                                const std::chrono::system_clock::time_point now) {
  using R = common::Result<OutgoingMessage>;
  if (auto valid = validate_send_request(request); !valid.ok()) {
    return R::failure(valid);
  }

  OutgoingMessage message;
  message.sender = credential.username;
  auto to_list = parse_address_list(request.to);
  message.recipients = std::move(to_list.value());
  const bool has_cc = request.cc.has_value() && !common::trim(*request.cc).empty();
  if (has_cc) {
    auto cc_list = parse_address_list(*request.cc);
    for (auto &address : cc_list.value()) {
      message.recipients.push_back(std::move(address));
    }
  }
  message.message_id = "<" + random_hex(16) + "@" + domain_of(credential.username) + ">";

  const auto lines = crlf_lines(request.body);
  const bool quoted_printable = needs_quoted_printable(lines);

  std::ostringstream out;
  out << "From: " << format_mailbox(credential.display_name, credential.username) << "\r\n";
  out << "To: " << single_line(request.to) << "\r\n";
  if (has_cc) {
    out << "Cc: " << single_line(*request.cc) << "\r\n";
  }
  out << "Subject: " << encode_header_word(single_line(request.subject)) << "\r\n";
  out << "Date: " << format_rfc5322_date(now) << "\r\n";
  out << "Message-ID: " << message.message_id << "\r\n";
  out << "MIME-Version: 1.0\r\n";
  out << "Content-Type: text/plain; charset=utf-8\r\n";
  out << "Content-Transfer-Encoding: " << (quoted_printable ? "quoted-printable" : "7bit")
      << "\r\n";
  out << "\r\n";
  for (const auto &line : lines) {
    out << (quoted_printable ? quoted_printable_line(line) : line) << "\r\n";
  }
  message.payload = out.str();
  return R::success(std::move(message));
}

} // namespace postbox::email
