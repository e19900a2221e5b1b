#include "postbox/email/mime.hpp"

#include "postbox/common/fs.hpp"

#include <gmime/gmime.h>

#include <cctype>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace postbox::email {

namespace {

constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

struct GObjectUnref {
  void operator()(gpointer object) const noexcept {
    if (object != nullptr) {
      g_object_unref(object);
    }
  }
};

template <typename T> using GObjectPtr = std::unique_ptr<T, GObjectUnref>;

struct GFree {
  void operator()(gpointer memory) const noexcept { g_free(memory); }
};

using GCharPtr = std::unique_ptr<char, GFree>;

// gmime keeps process-wide charset tables; they live until exit.
void ensure_gmime() {
  static std::once_flag once;
  std::call_once(once, [] { g_mime_init(); });
}

// Length of a well-formed UTF-8 sequence starting at `i`, or 0.
std::size_t utf8_sequence_length(const std::string &text, const std::size_t i) {
  const auto lead = static_cast<unsigned char>(text[i]);
  std::size_t length = 0;
  if (lead < 0x80) {
    return 1;
  }
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
  } else {
    return 0;
  }
  if (i + length > text.size()) {
    return 0;
  }
  for (std::size_t k = 1; k < length; ++k) {
    if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) {
      return 0;
    }
  }
  return length;
}

std::string sanitize_utf8(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    const std::size_t length = utf8_sequence_length(text, i);
    if (length == 0) {
      out += kReplacementChar;
      ++i;
      continue;
    }
    out.append(text, i, length);
    i += length;
  }
  return out;
}

bool is_utf8_family(const std::string &charset) {
  return charset.empty() || charset == "utf-8" || charset == "utf8" || charset == "us-ascii" ||
         charset == "ascii";
}

bool is_line_space(const char ch) {
  return ch == '\r' || ch == '\n' || ch == ' ' || ch == '\t';
}

// Each line break, with the blanks around it, becomes one space.
std::string collapse_line_breaks(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (text[i] != '\r' && text[i] != '\n') {
      out.push_back(text[i++]);
      continue;
    }
    while (!out.empty() && (out.back() == ' ' || out.back() == '\t')) {
      out.pop_back();
    }
    while (i < text.size() && is_line_space(text[i])) {
      ++i;
    }
    out.push_back(' ');
  }
  return out;
}

std::string read_stream(GMimeStream *stream) {
  std::string out;
  std::string buffer(4096, '\0');
  g_mime_stream_reset(stream);
  ssize_t count = 0;
  while ((count = g_mime_stream_read(stream, buffer.data(), buffer.size())) > 0) {
    out.append(buffer.data(), static_cast<std::size_t>(count));
  }
  return out;
}

// Strips whitespace and restores missing padding; nullopt when the text is not base64.
std::optional<std::string> normalize_base64(const std::string &raw) {
  std::string clean;
  clean.reserve(raw.size());
  for (const char ch : raw) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      continue;
    }
    if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '+' && ch != '/' &&
        ch != '=') {
      return std::nullopt;
    }
    clean.push_back(ch);
  }
  while (!clean.empty() && clean.back() == '=') {
    clean.pop_back();
  }
  if (clean.find('=') != std::string::npos || clean.size() % 4 == 1) {
    return std::nullopt;
  }
  clean.append((4 - clean.size() % 4) % 4, '=');
  return clean;
}

std::string run_decoder(const GMimeContentEncoding encoding, const std::string &data) {
  GMimeEncoding decoder;
  g_mime_encoding_init_decode(&decoder, encoding);
  std::string out(g_mime_encoding_outlen(&decoder, data.size()), '\0');
  const std::size_t written =
      g_mime_encoding_step(&decoder, data.data(), data.size(), out.data());
  out.resize(written);
  return out;
}

common::Result<std::string> decode_part_content(GMimePart *part) {
  using R = common::Result<std::string>;

  GMimeDataWrapper *content = g_mime_part_get_content(part);
  if (content == nullptr) {
    return R::success("");
  }
  GMimeStream *stream = g_mime_data_wrapper_get_stream(content);
  if (stream == nullptr) {
    return R::success("");
  }
  const std::string raw = read_stream(stream);

  std::string bytes;
  const GMimeContentEncoding encoding = g_mime_part_get_content_encoding(part);
  switch (encoding) {
  case GMIME_CONTENT_ENCODING_BASE64: {
    const auto normalized = normalize_base64(raw);
    if (!normalized.has_value()) {
      return R::failure(common::ErrorKind::Fetch, "corrupt base64 body");
    }
    bytes = run_decoder(encoding, *normalized);
    break;
  }
  case GMIME_CONTENT_ENCODING_QUOTEDPRINTABLE:
  case GMIME_CONTENT_ENCODING_UUENCODE:
    bytes = run_decoder(encoding, raw);
    break;
  default:
    bytes = raw;
    break;
  }

  const char *charset = g_mime_object_get_content_type_parameter(GMIME_OBJECT(part), "charset");
  return R::success(to_utf8(bytes, charset != nullptr ? charset : ""));
}

void collect_leaf(GMimeObject *, GMimeObject *part, gpointer user_data) {
  if (GMIME_IS_PART(part)) {
    static_cast<std::vector<GMimePart *> *>(user_data)->push_back(GMIME_PART(part));
  }
}

// First inline text/plain leaf in depth-first order, else the first leaf.
GMimePart *select_body_part(GMimeMessage *message) {
  if (g_mime_message_get_mime_part(message) == nullptr) {
    return nullptr;
  }
  std::vector<GMimePart *> leaves;
  g_mime_message_foreach(message, collect_leaf, &leaves);
  for (GMimePart *leaf : leaves) {
    GMimeContentType *type = g_mime_object_get_content_type(GMIME_OBJECT(leaf));
    if (type != nullptr && g_mime_content_type_is_type(type, "text", "plain") &&
        !g_mime_part_is_attachment(leaf)) {
      return leaf;
    }
  }
  return leaves.empty() ? nullptr : leaves.front();
}

std::string header_text(GMimeObject *object, const char *name) {
  const char *value = g_mime_object_get_header(object, name);
  if (value == nullptr) {
    return "";
  }
  return common::trim(decode_encoded_words(value));
}

} // namespace

std::string to_utf8(const std::string &bytes, const std::string &charset) {
  const std::string normalized = common::to_lower(common::trim(charset));
  if (is_utf8_family(normalized)) {
    return sanitize_utf8(bytes);
  }

  ensure_gmime();
  iconv_t cd = g_mime_iconv_open("UTF-8", normalized.c_str());
  if (cd == reinterpret_cast<iconv_t>(-1)) {
    return sanitize_utf8(bytes);
  }
  GCharPtr converted(g_mime_iconv_strndup(cd, bytes.data(), bytes.size()));
  g_mime_iconv_close(cd);
  if (converted == nullptr) {
    return sanitize_utf8(bytes);
  }
  return sanitize_utf8(converted.get());
}

std::string decode_encoded_words(const std::string &value) {
  ensure_gmime();
  GCharPtr decoded(g_mime_utils_header_decode_text(nullptr, value.c_str()));
  if (decoded == nullptr) {
    return sanitize_utf8(value);
  }
  return sanitize_utf8(decoded.get());
}

std::string truncate_preview(const std::string &text, const std::size_t max_code_points) {
  const std::string normalized = common::trim(collapse_line_breaks(text));
  std::size_t count = 0;
  std::size_t i = 0;
  while (i < normalized.size()) {
    if (count == max_code_points) {
      return common::trim(normalized.substr(0, i)) + "...";
    }
    const std::size_t length = utf8_sequence_length(normalized, i);
    i += length == 0 ? 1 : length;
    ++count;
  }
  return normalized;
}

common::Result<DecodedMessage> parse_message(const std::string &raw,
                                             const std::size_t preview_length) {
  using R = common::Result<DecodedMessage>;
  if (common::trim(raw).empty()) {
    return R::failure(common::ErrorKind::Fetch, "empty message");
  }

  ensure_gmime();
  GObjectPtr<GMimeStream> stream(g_mime_stream_mem_new_with_buffer(raw.data(), raw.size()));
  if (stream == nullptr) {
    return R::failure(common::ErrorKind::Fetch, "failed to buffer message");
  }
  GObjectPtr<GMimeParser> parser(g_mime_parser_new_with_stream(stream.get()));
  if (parser == nullptr) {
    return R::failure(common::ErrorKind::Fetch, "failed to create message parser");
  }
  GObjectPtr<GMimeMessage> message(g_mime_parser_construct_message(parser.get(), nullptr));
  if (message == nullptr) {
    return R::failure(common::ErrorKind::Fetch, "message could not be parsed");
  }

  std::string body;
  if (GMimePart *part = select_body_part(message.get()); part != nullptr) {
    auto decoded = decode_part_content(part);
    if (!decoded.ok()) {
      return R::failure(decoded.status());
    }
    body = std::move(decoded.value());
  }

  auto *object = GMIME_OBJECT(message.get());
  const char *subject = g_mime_message_get_subject(message.get());
  return R::success(DecodedMessage{
      .subject = subject != nullptr ? common::trim(sanitize_utf8(subject)) : "",
      .from = header_text(object, "From"),
      .to = header_text(object, "To"),
      .date = header_text(object, "Date"),
      .body = truncate_preview(body, preview_length),
  });
}

} // namespace postbox::email
