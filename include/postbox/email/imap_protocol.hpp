#pragma once

#include "postbox/common/result.hpp"
#include "postbox/email/message.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace postbox::email {

/// Bidirectional byte pipe under a protocol session (TLS socket in production,
/// scripted transcripts in tests). Failures carry ErrorKind::Connect.
class IByteStream {
public:
  virtual ~IByteStream() = default;

  [[nodiscard]] virtual common::Status write_all(std::string_view data) = 0;
  /// Blocks until at least one byte arrives; zero bytes means the peer closed.
  [[nodiscard]] virtual common::Result<std::size_t> read_some(char *buffer, std::size_t size) = 0;
  virtual void close() noexcept = 0;
};

/// Quoted string, or a synchronizing literal when quoting is not allowed.
[[nodiscard]] std::string imap_astring(const std::string &value);

/// Mailbox name in IMAP modified UTF-7, ready to be placed in a command.
[[nodiscard]] std::string encode_mailbox_name(const std::string &utf8_name);

/// Comma separated ids with ascending runs collapsed to `a:b`.
[[nodiscard]] std::string sequence_set(const std::vector<std::uint32_t> &ids);

struct ImapResponseLine {
  std::string text;
  std::vector<std::string> literals;
  /// Offset in `text` right after each literal's `{N}` marker.
  std::vector<std::size_t> literal_offsets;
};

struct ImapResponse {
  std::string status;
  std::string text;
  std::vector<ImapResponseLine> untagged;

  [[nodiscard]] bool ok() const { return status == "OK"; }
};

class ImapConnection {
public:
  explicit ImapConnection(std::unique_ptr<IByteStream> stream);
  ~ImapConnection();

  ImapConnection(const ImapConnection &) = delete;
  ImapConnection &operator=(const ImapConnection &) = delete;

  [[nodiscard]] common::Result<ImapResponseLine> read_greeting();

  /// Sends one tagged command (literals included) and collects everything up to its
  /// tagged completion. A NO/BAD completion is a successful Result; only transport
  /// failures fail.
  [[nodiscard]] common::Result<ImapResponse> execute(const std::string &command);

  void close() noexcept;
  [[nodiscard]] bool is_open() const { return stream_ != nullptr; }

private:
  [[nodiscard]] common::Result<std::string> read_line();
  [[nodiscard]] common::Result<std::string> read_exact(std::size_t size);
  [[nodiscard]] common::Result<ImapResponseLine> read_response_line();
  [[nodiscard]] common::Status fill_buffer();

  std::unique_ptr<IByteStream> stream_;
  std::string buffer_;
  std::uint32_t next_tag_ = 1;
};

[[nodiscard]] std::vector<std::uint32_t> parse_search_ids(const ImapResponse &response);
[[nodiscard]] std::vector<RawMessage> parse_fetch_messages(const ImapResponse &response);

} // namespace postbox::email
