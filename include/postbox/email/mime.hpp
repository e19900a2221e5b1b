#pragma once

#include "postbox/common/result.hpp"

#include <cstddef>
#include <string>

namespace postbox::email {

struct DecodedMessage {
  std::string subject;
  std::string from;
  std::string to;
  std::string date;
  std::string body;
};

/// RFC 2047 `=?charset?B|Q?...?=` words to UTF-8. Unknown charsets degrade lossily.
[[nodiscard]] std::string decode_encoded_words(const std::string &value);

/// Converts `bytes` in `charset` to valid UTF-8, replacing what cannot be converted.
[[nodiscard]] std::string to_utf8(const std::string &bytes, const std::string &charset);

/// Collapses line breaks to single spaces, then cuts to at most `max_code_points`
/// code points and appends `...` when text was cut.
[[nodiscard]] std::string truncate_preview(const std::string &text, std::size_t max_code_points);

/// Headers and primary text body of one RFC 5322 message, parsed with gmime.
/// Fails with ErrorKind::Fetch when the message cannot be decoded.
[[nodiscard]] common::Result<DecodedMessage> parse_message(const std::string &raw,
                                                           std::size_t preview_length);

} // namespace postbox::email
