#include "postbox/email/smtp_session.hpp"

#include "postbox/observability/global.hpp"

#include <algorithm>
#include <cstring>

namespace postbox::email {

namespace {

constexpr std::uint16_t kImplicitTlsPort = 465;

struct UploadPayload {
  const std::string *data = nullptr;
  std::size_t offset = 0;
};

std::size_t upload_callback(char *buffer, std::size_t size, std::size_t nitems, void *userdata) {
  auto *payload = static_cast<UploadPayload *>(userdata);
  const std::size_t capacity = size * nitems;
  if (payload == nullptr || payload->data == nullptr || capacity == 0 ||
      payload->offset >= payload->data->size()) {
    return 0;
  }

  const std::size_t remaining = payload->data->size() - payload->offset;
  const std::size_t to_copy = std::min(remaining, capacity);
  std::memcpy(buffer, payload->data->data() + payload->offset, to_copy);
  payload->offset += to_copy;
  return to_copy;
}

std::size_t discard_callback(char *, std::size_t size, std::size_t nmemb, void *) {
  return size * nmemb;
}

std::string describe_failure(const CURLcode code, const std::string &detail) {
  std::string message = curl_easy_strerror(code);
  const std::string extra(detail.c_str());
  if (!extra.empty() && extra != message) {
    message += " (" + extra + ")";
  }
  return message;
}

} // namespace

std::string smtp_url(const Credential &credential) {
  const bool implicit = credential.smtp_implicit_tls || credential.smtp_port == kImplicitTlsPort;
  return std::string(implicit ? "smtps://" : "smtp://") + credential.smtp_host + ":" +
         std::to_string(credential.smtp_port);
}

common::ErrorKind classify_smtp_error(const CURLcode code, const bool during_submit) {
  if (during_submit) {
    return common::ErrorKind::Send;
  }
  switch (code) {
  case CURLE_LOGIN_DENIED:
  case CURLE_AUTH_ERROR:
    return common::ErrorKind::Auth;
  default:
    return common::ErrorKind::Connect;
  }
}

CurlSendSession::CurlSendSession(CURL *curl) : curl_(curl), error_buffer_(CURL_ERROR_SIZE, '\0') {
  curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, error_buffer_.data());
}

CurlSendSession::~CurlSendSession() { close(); }

common::Result<std::unique_ptr<ISendSession>>
CurlSendSession::open(const Credential &credential, const ConnectionOptions &options) {
  using R = common::Result<std::unique_ptr<ISendSession>>;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    return R::failure(common::ErrorKind::Connect, "failed to initialize curl for smtp");
  }
  std::unique_ptr<CurlSendSession> session(new CurlSendSession(curl));

  const std::string url = smtp_url(credential);
  const long timeout_ms = static_cast<long>(options.timeout.count()) * 1000L;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_USERNAME, credential.username.c_str());
  curl_easy_setopt(curl, CURLOPT_PASSWORD, credential.password.c_str());
  curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.verify_tls ? 1L : 0L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.verify_tls ? 2L : 0L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_callback);

  // A bare NOOP forces connect, STARTTLS and AUTH now instead of at submission time.
  curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "NOOP");
  const CURLcode code = curl_easy_perform(curl);
  curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, nullptr);
  if (code != CURLE_OK) {
    return R::failure(classify_smtp_error(code, false),
                      "smtp session to " + credential.smtp_host + " failed: " +
                          describe_failure(code, session->error_buffer_));
  }

  observability::record_session("smtp", "open", credential.smtp_host);
  return R::success(std::move(session));
}

common::Status CurlSendSession::submit(const OutgoingMessage &message) {
  if (curl_ == nullptr) {
    return common::Status::error(common::ErrorKind::Send, "session is closed");
  }
  if (message.recipients.empty()) {
    return common::Status::error(common::ErrorKind::Send, "no recipients");
  }

  UploadPayload payload{.data = &message.payload, .offset = 0};
  const std::string mail_from = "<" + message.sender + ">";
  struct curl_slist *recipients = nullptr;
  for (const auto &recipient : message.recipients) {
    recipients = curl_slist_append(recipients, ("<" + recipient + ">").c_str());
  }

  error_buffer_.assign(CURL_ERROR_SIZE, '\0');
  curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, error_buffer_.data());
  curl_easy_setopt(curl_, CURLOPT_MAIL_FROM, mail_from.c_str());
  curl_easy_setopt(curl_, CURLOPT_MAIL_RCPT, recipients);
  curl_easy_setopt(curl_, CURLOPT_READFUNCTION, upload_callback);
  curl_easy_setopt(curl_, CURLOPT_READDATA, &payload);
  curl_easy_setopt(curl_, CURLOPT_INFILESIZE_LARGE,
                   static_cast<curl_off_t>(message.payload.size()));
  curl_easy_setopt(curl_, CURLOPT_UPLOAD, 1L);

  const CURLcode code = curl_easy_perform(curl_);
  long status = 0;
  curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
  curl_easy_setopt(curl_, CURLOPT_MAIL_RCPT, nullptr);
  curl_easy_setopt(curl_, CURLOPT_READDATA, nullptr);
  curl_easy_setopt(curl_, CURLOPT_UPLOAD, 0L);
  curl_slist_free_all(recipients);

  if (code != CURLE_OK) {
    return common::Status::error(classify_smtp_error(code, true),
                                 "smtp submission failed: " +
                                     describe_failure(code, error_buffer_));
  }
  if (status >= 400) {
    return common::Status::error(common::ErrorKind::Send,
                                 "smtp server rejected message with status " +
                                     std::to_string(status));
  }
  return common::Status::success();
}

void CurlSendSession::close() noexcept {
  if (curl_ == nullptr) {
    return;
  }
  // Cleanup sends QUIT on the live connection.
  curl_easy_cleanup(curl_);
  curl_ = nullptr;
  observability::record_session("smtp", "close");
}

} // namespace postbox::email
