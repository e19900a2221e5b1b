#include "postbox/email/imap_session.hpp"

#include "postbox/common/fs.hpp"
#include "postbox/observability/global.hpp"

#include <exception>

namespace postbox::email {

namespace {

std::string server_reason(const ImapResponse &response, const std::string &fallback) {
  std::string text = common::trim(response.text);
  return text.empty() ? fallback : text;
}

} // namespace

ImapReadSession::ImapReadSession(std::unique_ptr<ImapConnection> connection)
    : connection_(std::move(connection)) {}

ImapReadSession::~ImapReadSession() { close(); }

common::Result<std::vector<std::uint32_t>> ImapReadSession::search(const ProtocolQuery &query) {
  using R = common::Result<std::vector<std::uint32_t>>;
  if (connection_ == nullptr || !connection_->is_open()) {
    return R::failure(common::ErrorKind::Fetch, "session is closed");
  }

  auto response = connection_->execute(query.command());
  if (!response.ok()) {
    return R::failure(common::ErrorKind::Fetch, "search failed: " + response.error());
  }
  if (!response.value().ok()) {
    return R::failure(common::ErrorKind::Fetch,
                      "search rejected: " + server_reason(response.value(), "no reason given"));
  }
  return R::success(parse_search_ids(response.value()));
}

common::Result<std::vector<RawMessage>>
ImapReadSession::fetch(const std::vector<std::uint32_t> &ids) {
  using R = common::Result<std::vector<RawMessage>>;
  if (ids.empty()) {
    return R::success({});
  }
  if (connection_ == nullptr || !connection_->is_open()) {
    return R::failure(common::ErrorKind::Fetch, "session is closed");
  }

  auto response = connection_->execute("FETCH " + sequence_set(ids) + " (FLAGS BODY.PEEK[])");
  if (!response.ok()) {
    return R::failure(common::ErrorKind::Fetch, "fetch failed: " + response.error());
  }
  if (!response.value().ok()) {
    return R::failure(common::ErrorKind::Fetch,
                      "fetch rejected: " + server_reason(response.value(), "no reason given"));
  }
  return R::success(parse_fetch_messages(response.value()));
}

void ImapReadSession::close() noexcept {
  if (connection_ == nullptr) {
    return;
  }
  try {
    if (connection_->is_open()) {
      auto logout = connection_->execute("LOGOUT");
      if (!logout.ok()) {
        observability::record_error("imap", "logout failed: " + logout.error());
      }
    }
  } catch (const std::exception &ex) {
    observability::record_error("imap", std::string("logout failed: ") + ex.what());
  }
  connection_->close();
  connection_.reset();
  observability::record_session("imap", "close");
}

common::Result<std::unique_ptr<IReadSession>>
open_imap_read_session(std::unique_ptr<IByteStream> stream, const Credential &credential,
                       const std::string &folder) {
  using R = common::Result<std::unique_ptr<IReadSession>>;
  auto connection = std::make_unique<ImapConnection>(std::move(stream));

  auto greeting = connection->read_greeting();
  if (!greeting.ok()) {
    return R::failure(common::ErrorKind::Connect,
                      "no greeting from server: " + greeting.error());
  }
  const std::string &hello = greeting.value().text;
  if (common::starts_with(common::to_lower(hello), "* bye")) {
    return R::failure(common::ErrorKind::Connect, "server refused connection: " + hello);
  }
  const bool preauth = common::starts_with(common::to_lower(hello), "* preauth");
  if (!preauth && !common::starts_with(common::to_lower(hello), "* ok")) {
    return R::failure(common::ErrorKind::Connect, "unexpected server greeting: " + hello);
  }

  if (!preauth) {
    auto login = connection->execute("LOGIN " + imap_astring(credential.username) + " " +
                                      imap_astring(credential.password));
    if (!login.ok()) {
      return R::failure(login.status());
    }
    if (!login.value().ok()) {
      return R::failure(common::ErrorKind::Auth,
                        server_reason(login.value(), "authentication failed"));
    }
  }

  auto examine = connection->execute("EXAMINE " + encode_mailbox_name(folder));
  if (!examine.ok()) {
    return R::failure(examine.status());
  }
  if (!examine.value().ok()) {
    auto logout = connection->execute("LOGOUT");
    if (!logout.ok()) {
      observability::record_error("imap", "logout failed: " + logout.error());
    }
    return R::failure(common::ErrorKind::Folder,
                      "cannot open folder '" + folder +
                          "': " + server_reason(examine.value(), "folder not found"));
  }

  observability::record_session("imap", "open", folder);
  return R::success(std::make_unique<ImapReadSession>(std::move(connection)));
}

} // namespace postbox::email
