#include "test_framework.hpp"

#include "postbox/email/smtp_session.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

void register_smtp_tests(std::vector<postbox::tests::TestCase> &tests) {
  using postbox::tests::require;
  namespace email = postbox::email;
  namespace common = postbox::common;

  tests.push_back({"smtp_url_uses_starttls_by_default", [] {
                     auto credential = postbox::testing::mock_credential();
                     require(email::smtp_url(credential) == "smtp://smtp.example.com:587",
                             "submission port should use starttls: " + email::smtp_url(credential));
                     credential.smtp_port = 2525;
                     require(email::smtp_url(credential) == "smtp://smtp.example.com:2525",
                             "custom port should keep starttls");
                   }});

  tests.push_back({"smtp_url_uses_implicit_tls", [] {
                     auto credential = postbox::testing::mock_credential();
                     credential.smtp_port = 465;
                     require(email::smtp_url(credential) == "smtps://smtp.example.com:465",
                             "port 465 implies smtps: " + email::smtp_url(credential));
                     credential.smtp_port = 2465;
                     credential.smtp_implicit_tls = true;
                     require(email::smtp_url(credential) == "smtps://smtp.example.com:2465",
                             "implicit_tls should force smtps");
                   }});

  tests.push_back({"smtp_open_errors_are_classified", [] {
                     require(email::classify_smtp_error(CURLE_LOGIN_DENIED, false) ==
                                 common::ErrorKind::Auth,
                             "login denied is an auth error");
                     require(email::classify_smtp_error(CURLE_AUTH_ERROR, false) ==
                                 common::ErrorKind::Auth,
                             "auth error is an auth error");
                     require(email::classify_smtp_error(CURLE_COULDNT_CONNECT, false) ==
                                 common::ErrorKind::Connect,
                             "refused connection is a connect error");
                     require(email::classify_smtp_error(CURLE_OPERATION_TIMEDOUT, false) ==
                                 common::ErrorKind::Connect,
                             "timeout is a connect error");
                   }});

  tests.push_back({"smtp_submit_errors_are_send_errors", [] {
                     for (const CURLcode code : {CURLE_LOGIN_DENIED, CURLE_COULDNT_CONNECT,
                                                 CURLE_SEND_ERROR, CURLE_RECV_ERROR}) {
                       require(email::classify_smtp_error(code, true) == common::ErrorKind::Send,
                               std::string("submit failure should be a send error: ") +
                                   curl_easy_strerror(code));
                     }
                   }});

  tests.push_back({"smtp_open_reports_unreachable_server", [] {
                     auto credential = postbox::testing::mock_credential();
                     credential.smtp_host = "127.0.0.1";
                     credential.smtp_port = 1;
                     const email::ConnectionOptions options{.timeout = std::chrono::seconds(2),
                                                            .verify_tls = true};
                     const auto session = email::CurlSendSession::open(credential, options);
                     require(!session.ok(), "closed port should fail to open");
                     require(session.kind() == common::ErrorKind::Connect,
                             "kind should be connect: " + session.error());
                     require(contains(session.error(), "smtp session to 127.0.0.1 failed"),
                             "error should name the host: " + session.error());
                     require(!contains(session.error(), "app-password"), "secret must not leak");
                   }});
}
