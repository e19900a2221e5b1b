#include "postbox/email/imap_protocol.hpp"

#include "postbox/common/fs.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <optional>

namespace postbox::email {

namespace {

constexpr std::size_t kReadChunk = 16 * 1024;
constexpr std::size_t kMaxLineBytes = 1024 * 1024;
constexpr std::size_t kMaxLiteralBytes = 64 * 1024 * 1024;
constexpr std::string_view kModifiedBase64 =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+,";

struct LiteralMarker {
  std::size_t open = std::string::npos;
  std::size_t close = std::string::npos;
  std::size_t length = 0;
};

// Parses `{N}` ending exactly at `close`.
bool parse_marker_before(const std::string &text, const std::size_t close, LiteralMarker &out) {
  if (close == 0 || close >= text.size() || text[close] != '}') {
    return false;
  }
  std::size_t digits_begin = close;
  while (digits_begin > 0 && std::isdigit(static_cast<unsigned char>(text[digits_begin - 1])) != 0) {
    --digits_begin;
  }
  if (digits_begin == close || digits_begin == 0 || text[digits_begin - 1] != '{') {
    return false;
  }
  std::size_t length = 0;
  const auto [ptr, ec] = std::from_chars(text.data() + digits_begin, text.data() + close, length);
  if (ec != std::errc() || ptr != text.data() + close) {
    return false;
  }
  out.open = digits_begin - 1;
  out.close = close;
  out.length = length;
  return true;
}

// Next `{N}\r\n` in an outgoing command, starting the search at `from`.
std::optional<LiteralMarker> find_command_literal(const std::string &command, std::size_t from) {
  while (true) {
    const auto pos = command.find("}\r\n", from);
    if (pos == std::string::npos) {
      return std::nullopt;
    }
    LiteralMarker marker;
    if (parse_marker_before(command, pos, marker)) {
      return marker;
    }
    from = pos + 1;
  }
}

std::vector<char32_t> decode_utf8_lossy(const std::string &input) {
  std::vector<char32_t> out;
  out.reserve(input.size());
  std::size_t i = 0;
  while (i < input.size()) {
    const auto lead = static_cast<unsigned char>(input[i]);
    std::size_t extra = 0;
    char32_t cp = 0;
    if (lead < 0x80) {
      cp = lead;
    } else if ((lead & 0xE0) == 0xC0) {
      extra = 1;
      cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      extra = 2;
      cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      extra = 3;
      cp = lead & 0x07;
    } else {
      out.push_back(0xFFFD);
      ++i;
      continue;
    }
    if (i + extra >= input.size()) {
      out.push_back(0xFFFD);
      break;
    }
    bool valid = true;
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto cont = static_cast<unsigned char>(input[i + k]);
      if ((cont & 0xC0) != 0x80) {
        valid = false;
        break;
      }
      cp = (cp << 6) | (cont & 0x3F);
    }
    if (!valid) {
      out.push_back(0xFFFD);
      ++i;
      continue;
    }
    out.push_back(cp);
    i += extra + 1;
  }
  return out;
}

std::string modified_base64(const std::vector<std::uint16_t> &units) {
  std::string bytes;
  bytes.reserve(units.size() * 2);
  for (const auto unit : units) {
    bytes.push_back(static_cast<char>((unit >> 8) & 0xFF));
    bytes.push_back(static_cast<char>(unit & 0xFF));
  }

  std::string out;
  std::size_t i = 0;
  while (i + 3 <= bytes.size()) {
    const std::uint32_t chunk = (static_cast<unsigned char>(bytes[i]) << 16) |
                                (static_cast<unsigned char>(bytes[i + 1]) << 8) |
                                static_cast<unsigned char>(bytes[i + 2]);
    out.push_back(kModifiedBase64[(chunk >> 18) & 0x3F]);
    out.push_back(kModifiedBase64[(chunk >> 12) & 0x3F]);
    out.push_back(kModifiedBase64[(chunk >> 6) & 0x3F]);
    out.push_back(kModifiedBase64[chunk & 0x3F]);
    i += 3;
  }
  const std::size_t rest = bytes.size() - i;
  if (rest == 1) {
    const std::uint32_t chunk = static_cast<unsigned char>(bytes[i]) << 16;
    out.push_back(kModifiedBase64[(chunk >> 18) & 0x3F]);
    out.push_back(kModifiedBase64[(chunk >> 12) & 0x3F]);
  } else if (rest == 2) {
    const std::uint32_t chunk = (static_cast<unsigned char>(bytes[i]) << 16) |
                                (static_cast<unsigned char>(bytes[i + 1]) << 8);
    out.push_back(kModifiedBase64[(chunk >> 18) & 0x3F]);
    out.push_back(kModifiedBase64[(chunk >> 12) & 0x3F]);
    out.push_back(kModifiedBase64[(chunk >> 6) & 0x3F]);
  }
  return out;
}

std::string unquote_imap(const std::string &text, std::size_t pos) {
  std::string out;
  for (++pos; pos < text.size(); ++pos) {
    const char ch = text[pos];
    if (ch == '\\' && pos + 1 < text.size()) {
      out.push_back(text[++pos]);
      continue;
    }
    if (ch == '"') {
      break;
    }
    out.push_back(ch);
  }
  return out;
}

std::size_t ifind(const std::string &haystack, const std::string_view needle,
                  const std::size_t from = 0) {
  if (needle.size() > haystack.size()) {
    return std::string::npos;
  }
  for (std::size_t i = from; i + needle.size() <= haystack.size(); ++i) {
    if (common::iequals(std::string_view(haystack).substr(i, needle.size()), needle)) {
      return i;
    }
  }
  return std::string::npos;
}

} // namespace

std::string imap_astring(const std::string &value) {
  const bool quotable = common::is_ascii(value) && value.size() < 1024 &&
                        value.find_first_of(std::string("\r\n\0", 3)) == std::string::npos;
  if (!quotable) {
    return "{" + std::to_string(value.size()) + "}\r\n" + value;
  }
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  out.push_back('"');
  return out;
}

std::string encode_mailbox_name(const std::string &utf8_name) {
  std::string encoded;
  std::vector<std::uint16_t> pending;
  const auto flush = [&]() {
    if (pending.empty()) {
      return;
    }
    encoded.push_back('&');
    encoded += modified_base64(pending);
    encoded.push_back('-');
    pending.clear();
  };

  for (const char32_t cp : decode_utf8_lossy(utf8_name)) {
    if (cp >= 0x20 && cp <= 0x7E) {
      flush();
      if (cp == U'&') {
        encoded += "&-";
      } else {
        encoded.push_back(static_cast<char>(cp));
      }
      continue;
    }
    if (cp >= 0x10000) {
      const char32_t v = cp - 0x10000;
      pending.push_back(static_cast<std::uint16_t>(0xD800 + (v >> 10)));
      pending.push_back(static_cast<std::uint16_t>(0xDC00 + (v & 0x3FF)));
    } else {
      pending.push_back(static_cast<std::uint16_t>(cp));
    }
  }
  flush();
  return imap_astring(encoded);
}

std::string sequence_set(const std::vector<std::uint32_t> &ids) {
  std::vector<std::uint32_t> sorted = ids;
  std::sort(sorted.begin(), sorted.end());
  sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

  std::string out;
  std::size_t i = 0;
  while (i < sorted.size()) {
    std::size_t j = i;
    while (j + 1 < sorted.size() && sorted[j + 1] == sorted[j] + 1) {
      ++j;
    }
    if (!out.empty()) {
      out.push_back(',');
    }
    out += std::to_string(sorted[i]);
    if (j > i) {
      out += ":" + std::to_string(sorted[j]);
    }
    i = j + 1;
  }
  return out;
}

ImapConnection::ImapConnection(std::unique_ptr<IByteStream> stream) : stream_(std::move(stream)) {}

ImapConnection::~ImapConnection() { close(); }

void ImapConnection::close() noexcept {
  if (stream_ != nullptr) {
    stream_->close();
    stream_.reset();
  }
  buffer_.clear();
}

common::Status ImapConnection::fill_buffer() {
  if (stream_ == nullptr) {
    return common::Status::error(common::ErrorKind::Connect, "connection is closed");
  }
  std::array<char, kReadChunk> chunk{};
  auto read = stream_->read_some(chunk.data(), chunk.size());
  if (!read.ok()) {
    return read.status();
  }
  if (read.value() == 0) {
    return common::Status::error(common::ErrorKind::Connect, "server closed the connection");
  }
  buffer_.append(chunk.data(), read.value());
  return common::Status::success();
}

common::Result<std::string> ImapConnection::read_line() {
  while (true) {
    const auto newline = buffer_.find('\n');
    if (newline != std::string::npos) {
      std::string line = buffer_.substr(0, newline);
      buffer_.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      return common::Result<std::string>::success(std::move(line));
    }
    if (buffer_.size() > kMaxLineBytes) {
      return common::Result<std::string>::failure(common::ErrorKind::Connect,
                                                  "server response line too long");
    }
    if (auto filled = fill_buffer(); !filled.ok()) {
      return common::Result<std::string>::failure(filled);
    }
  }
}

common::Result<std::string> ImapConnection::read_exact(const std::size_t size) {
  while (buffer_.size() < size) {
    if (auto filled = fill_buffer(); !filled.ok()) {
      return common::Result<std::string>::failure(filled);
    }
  }
  std::string out = buffer_.substr(0, size);
  buffer_.erase(0, size);
  return common::Result<std::string>::success(std::move(out));
}

common::Result<ImapResponseLine> ImapConnection::read_response_line() {
  ImapResponseLine response;
  auto first = read_line();
  if (!first.ok()) {
    return common::Result<ImapResponseLine>::failure(first.status());
  }
  response.text = std::move(first.value());

  LiteralMarker marker;
  while (!response.text.empty() &&
         parse_marker_before(response.text, response.text.size() - 1, marker)) {
    if (marker.length > kMaxLiteralBytes) {
      return common::Result<ImapResponseLine>::failure(common::ErrorKind::Fetch,
                                                       "server literal exceeds size limit");
    }
    auto literal = read_exact(marker.length);
    if (!literal.ok()) {
      return common::Result<ImapResponseLine>::failure(literal.status());
    }
    response.literals.push_back(std::move(literal.value()));
    response.literal_offsets.push_back(response.text.size());

    auto rest = read_line();
    if (!rest.ok()) {
      return common::Result<ImapResponseLine>::failure(rest.status());
    }
    response.text += rest.value();
  }
  return common::Result<ImapResponseLine>::success(std::move(response));
}

common::Result<ImapResponseLine> ImapConnection::read_greeting() {
  return read_response_line();
}

common::Result<ImapResponse> ImapConnection::execute(const std::string &command) {
  if (stream_ == nullptr) {
    return common::Result<ImapResponse>::failure(common::ErrorKind::Connect,
                                                 "connection is closed");
  }

  const std::string tag = "A" + std::to_string(next_tag_++);
  const std::string full = tag + " " + command;
  const std::string tag_prefix = tag + " ";
  ImapResponse response;

  const auto complete = [&](const std::string &line) {
    const std::string rest = line.substr(tag_prefix.size());
    const auto space = rest.find(' ');
    response.status = rest.substr(0, space);
    for (auto &ch : response.status) {
      ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    response.text = space == std::string::npos ? "" : common::trim(rest.substr(space + 1));
  };

  std::size_t segment_start = 0;
  std::size_t search_from = 0;
  while (auto marker = find_command_literal(full, search_from)) {
    const std::size_t header_end = marker->close + 3;
    auto sent = stream_->write_all(
        std::string_view(full).substr(segment_start, header_end - segment_start));
    if (!sent.ok()) {
      return common::Result<ImapResponse>::failure(sent);
    }

    // Wait for the continuation request before sending literal bytes.
    while (true) {
      auto line = read_response_line();
      if (!line.ok()) {
        return common::Result<ImapResponse>::failure(line.status());
      }
      if (common::starts_with(line.value().text, "+")) {
        break;
      }
      if (common::starts_with(line.value().text, tag_prefix)) {
        complete(line.value().text);
        return common::Result<ImapResponse>::success(std::move(response));
      }
      response.untagged.push_back(std::move(line.value()));
    }

    segment_start = header_end;
    search_from = header_end + marker->length;
  }

  auto sent = stream_->write_all(std::string_view(full).substr(segment_start));
  if (sent.ok()) {
    sent = stream_->write_all("\r\n");
  }
  if (!sent.ok()) {
    return common::Result<ImapResponse>::failure(sent);
  }

  while (true) {
    auto line = read_response_line();
    if (!line.ok()) {
      return common::Result<ImapResponse>::failure(line.status());
    }
    if (common::starts_with(line.value().text, tag_prefix)) {
      complete(line.value().text);
      return common::Result<ImapResponse>::success(std::move(response));
    }
    response.untagged.push_back(std::move(line.value()));
  }
}

std::vector<std::uint32_t> parse_search_ids(const ImapResponse &response) {
  std::vector<std::uint32_t> ids;
  for (const auto &line : response.untagged) {
    if (!common::iequals(std::string_view(line.text).substr(0, 8), "* SEARCH")) {
      continue;
    }
    for (const auto &token : common::split(line.text.substr(8), ' ')) {
      const std::string trimmed = common::trim(token);
      std::uint32_t id = 0;
      const auto [ptr, ec] =
          std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), id);
      if (!trimmed.empty() && ec == std::errc() && ptr == trimmed.data() + trimmed.size()) {
        ids.push_back(id);
      }
    }
  }
  return ids;
}

std::vector<RawMessage> parse_fetch_messages(const ImapResponse &response) {
  std::vector<RawMessage> messages;
  for (const auto &line : response.untagged) {
    const std::string &text = line.text;
    if (!common::starts_with(text, "* ")) {
      continue;
    }
    const auto fetch_pos = ifind(text, " FETCH ");
    if (fetch_pos == std::string::npos) {
      continue;
    }
    std::uint32_t id = 0;
    const auto [ptr, ec] = std::from_chars(text.data() + 2, text.data() + fetch_pos, id);
    if (ec != std::errc() || ptr != text.data() + fetch_pos) {
      continue;
    }

    auto existing = std::find_if(messages.begin(), messages.end(),
                                 [id](const RawMessage &m) { return m.id == id; });
    if (existing == messages.end()) {
      messages.push_back(RawMessage{.id = id, .flags = {}, .content = {}});
      existing = messages.end() - 1;
    }

    if (const auto flags_pos = ifind(text, "FLAGS ("); flags_pos != std::string::npos) {
      const auto open = flags_pos + 6;
      const auto close = text.find(')', open);
      if (close != std::string::npos) {
        existing->flags.clear();
        for (const auto &flag : common::split(text.substr(open + 1, close - open - 1), ' ')) {
          if (!common::trim(flag).empty()) {
            existing->flags.push_back(common::trim(flag));
          }
        }
      }
    }

    const auto body_pos = ifind(text, "BODY[]");
    if (body_pos == std::string::npos) {
      continue;
    }
    std::size_t value_pos = body_pos + 6;
    while (value_pos < text.size() && text[value_pos] == ' ') {
      ++value_pos;
    }
    if (value_pos < text.size() && text[value_pos] == '{') {
      for (std::size_t k = 0; k < line.literal_offsets.size(); ++k) {
        if (line.literal_offsets[k] > value_pos) {
          existing->content = line.literals[k];
          break;
        }
      }
    } else if (value_pos < text.size() && text[value_pos] == '"') {
      existing->content = unquote_imap(text, value_pos);
    }
  }
  return messages;
}

bool has_seen_flag(const std::vector<std::string> &flags) {
  return std::any_of(flags.begin(), flags.end(),
                     [](const std::string &flag) { return common::iequals(flag, "\\Seen"); });
}

} // namespace postbox::email
