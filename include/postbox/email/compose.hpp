#pragma once

#include "postbox/common/result.hpp"
#include "postbox/email/credential.hpp"
#include "postbox/email/message.hpp"
#include "postbox/email/session.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace postbox::email {

/// Bare `local@domain` addr-spec check.
[[nodiscard]] bool is_valid_address(const std::string &address);

/// Comma separated list of `addr` or `Name <addr>` entries; returns the bare addresses.
/// An invalid entry fails with ErrorKind::Send naming the entry.
[[nodiscard]] common::Result<std::vector<std::string>>
parse_address_list(const std::string &value);

/// Value unchanged when ASCII, otherwise RFC 2047 `B` encoded words of at most 75
/// characters, folded with CRLF SP.
[[nodiscard]] std::string encode_header_word(const std::string &value);

[[nodiscard]] std::string format_rfc5322_date(std::chrono::system_clock::time_point when);
[[nodiscard]] std::string format_iso8601(std::chrono::system_clock::time_point when);

/// Field presence and address syntax. Runs before any session is opened.
[[nodiscard]] common::Status validate_send_request(const SendRequest &request);

/// Validated request as an RFC 5322 message with CRLF line endings plus its envelope.
[[nodiscard]] common::Result<OutgoingMessage>
compose_message(const Credential &credential, const SendRequest &request,
                std::chrono::system_clock::time_point now);

} // namespace postbox::email
