#include "postbox/email/client.hpp"

#include "postbox/common/fs.hpp"
#include "postbox/email/compose.hpp"
#include "postbox/email/fetch.hpp"
#include "postbox/email/query.hpp"
#include "postbox/observability/global.hpp"

namespace postbox::email {

namespace {

// Emits operation start/end around one client call.
class OperationScope {
public:
  OperationScope(std::string operation, const std::string &folder)
      : operation_(std::move(operation)), started_(std::chrono::steady_clock::now()) {
    observability::record_operation_start(operation_, folder);
  }

  ~OperationScope() {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
    observability::record_operation_end(operation_, elapsed, success_);
  }

  OperationScope(const OperationScope &) = delete;
  OperationScope &operator=(const OperationScope &) = delete;

  template <typename T> T finish(T outcome) {
    success_ = outcome.ok();
    if (!success_) {
      observability::record_error(operation_, outcome.error());
    }
    return outcome;
  }

private:
  std::string operation_;
  std::chrono::steady_clock::time_point started_;
  bool success_ = false;
};

std::string send_failure_reason(const common::Status &status) {
  switch (status.kind()) {
  case common::ErrorKind::Auth:
    return "authentication failed: " + status.error();
  case common::ErrorKind::Connect:
    return "connection failed: " + status.error();
  default:
    return status.error();
  }
}

} // namespace

EmailClient::EmailClient(IMailConnector &connector, const Credential &credential,
                         ClientOptions options)
    : connector_(connector), credential_(credential), options_(std::move(options)) {}

std::string EmailClient::resolve_folder(const std::string &folder) const {
  const std::string trimmed = common::trim(folder);
  return trimmed.empty() ? options_.default_folder : trimmed;
}

common::Result<std::vector<Message>> EmailClient::read(const ReadRequest &request) {
  using R = common::Result<std::vector<Message>>;
  const std::string folder = resolve_folder(request.folder);
  OperationScope scope("read", folder);
  if (request.count == 0) {
    return scope.finish(
        R::failure(common::ErrorKind::InvalidArgument, "count must be at least 1"));
  }

  auto opened = connector_.open_read_session(folder);
  if (!opened.ok()) {
    return scope.finish(R::failure(opened.status()));
  }
  ScopedSession<IReadSession> session(std::move(opened.value()));
  return scope.finish(fetch_messages(*session, match_all_query(), request.count,
                                     FetchOptions{.preview_length = options_.preview_length}));
}

common::Result<std::vector<Message>> EmailClient::filter(const FilterCriteria &criteria) {
  using R = common::Result<std::vector<Message>>;
  const std::string folder = resolve_folder(criteria.folder);
  OperationScope scope("filter", folder);

  auto opened = connector_.open_read_session(folder);
  if (!opened.ok()) {
    return scope.finish(R::failure(opened.status()));
  }
  ScopedSession<IReadSession> session(std::move(opened.value()));
  return scope.finish(fetch_messages(*session, translate(criteria), std::nullopt,
                                     FetchOptions{.preview_length = options_.preview_length}));
}

common::Result<SendReceipt> EmailClient::send(const SendRequest &request) {
  using R = common::Result<SendReceipt>;
  OperationScope scope("send", "");

  const auto now = options_.clock();
  auto composed = compose_message(credential_, request, now);
  if (!composed.ok()) {
    return scope.finish(R::failure(common::ErrorKind::Send, composed.error()));
  }

  auto opened = connector_.open_send_session();
  if (!opened.ok()) {
    return scope.finish(R::failure(common::ErrorKind::Send, send_failure_reason(opened.status())));
  }
  ScopedSession<ISendSession> session(std::move(opened.value()));
  auto submitted = session->submit(composed.value());
  if (!submitted.ok()) {
    return scope.finish(R::failure(common::ErrorKind::Send, send_failure_reason(submitted)));
  }

  return scope.finish(R::success(SendReceipt{
      .recipients = composed.value().recipients,
      .message_id = composed.value().message_id,
      .sent_at = format_iso8601(now),
  }));
}

common::Result<std::size_t> EmailClient::unread_count(const UnreadCountRequest &request) {
  using R = common::Result<std::size_t>;
  const std::string folder = resolve_folder(request.folder);
  OperationScope scope("unread_count", folder);

  auto opened = connector_.open_read_session(folder);
  if (!opened.ok()) {
    return scope.finish(R::failure(opened.status()));
  }
  ScopedSession<IReadSession> session(std::move(opened.value()));
  auto ids = session->search(unread_query());
  if (!ids.ok()) {
    return scope.finish(R::failure(common::ErrorKind::Fetch, ids.error()));
  }
  return scope.finish(R::success(ids.value().size()));
}

} // namespace postbox::email
