#include "test_framework.hpp"

#include "postbox/email/client.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <stdexcept>

namespace {

using postbox::testing::FakeConnector;
using postbox::testing::FakeMessage;

postbox::email::ClientOptions fixed_clock_options() {
  postbox::email::ClientOptions options;
  options.clock = [] { return std::chrono::system_clock::from_time_t(1704164645); };
  return options;
}

void fill_inbox(FakeConnector &connector, const int total, const int unread_every = 0) {
  for (int i = 1; i <= total; ++i) {
    connector.add_message("INBOX", FakeMessage{
                                       .from = "sender" + std::to_string(i) + "@example.com",
                                       .subject = "Message " + std::to_string(i),
                                       .body = "Body " + std::to_string(i),
                                       .seen = unread_every == 0 || i % unread_every != 0,
                                       .raw = {},
                                   });
  }
}

} // namespace

void register_client_tests(std::vector<postbox::tests::TestCase> &tests) {
  using postbox::tests::require;
  namespace email = postbox::email;
  namespace common = postbox::common;

  tests.push_back({"client_unread_count_counts_unseen", [] {
                     FakeConnector connector;
                     fill_inbox(connector, 12, 4);
                     const auto credential = postbox::testing::mock_credential();
                     email::EmailClient client(connector, credential, {});

                     const auto count = client.unread_count({});
                     require(count.ok(), count.error());
                     require(count.value() == 3, "expected 3 unread, got " + std::to_string(count.value()));
                     require(connector.state().read_opens == 1, "one session expected");
                     require(connector.state().read_closes == 1, "session should be closed");
                     require(connector.state().fetches.empty(), "count must not fetch content");
                   }});

  tests.push_back({"client_read_returns_newest_first", [] {
                     FakeConnector connector;
                     fill_inbox(connector, 20);
                     const auto credential = postbox::testing::mock_credential();
                     email::EmailClient client(connector, credential, {});

                     const auto messages = client.read({.count = 5, .folder = "INBOX"});
                     require(messages.ok(), messages.error());
                     require(messages.value().size() == 5, "five messages expected");
                     for (std::size_t i = 0; i < 5; ++i) {
                       const std::string expected = "Message " + std::to_string(20 - i);
                       require(messages.value()[i].subject == expected,
                               "order mismatch at " + std::to_string(i) + ": " +
                                   messages.value()[i].subject);
                     }
                     require(messages.value()[0].id == "20", "newest id should be 20");
                     require(messages.value()[0].body == "Body 20", "body preview mismatch");
                     require(!messages.value()[0].is_unread, "seen message should be read");
                     require(connector.state().fetches.size() == 1, "one fetch round-trip expected");
                     require(connector.state().fetches[0].size() == 5, "only five ids should be fetched");
                     require(connector.state().read_closes == 1, "session should be closed");
                   }});

  tests.push_back({"client_read_fewer_than_requested", [] {
                     FakeConnector connector;
                     fill_inbox(connector, 2);
                     const auto credential = postbox::testing::mock_credential();
                     email::EmailClient client(connector, credential, {});
                     const auto messages = client.read({.count = 10, .folder = "INBOX"});
                     require(messages.ok(), messages.error());
                     require(messages.value().size() == 2, "all available messages expected");
                   }});

  tests.push_back({"client_read_empty_folder", [] {
                     FakeConnector connector;
                     const auto credential = postbox::testing::mock_credential();
                     email::EmailClient client(connector, credential, {});
                     const auto messages = client.read({.count = 10, .folder = "INBOX"});
                     require(messages.ok(), messages.error());
                     require(messages.value().empty(), "empty folder gives empty list");
                     require(connector.state().fetches.empty(), "nothing to fetch");
                     require(connector.state().read_closes == 1, "session should be closed");
                   }});

  tests.push_back({"client_read_zero_count_is_rejected_before_connecting", [] {
                     FakeConnector connector;
                     const auto credential = postbox::testing::mock_credential();
                     email::EmailClient client(connector, credential, {});
                     const auto messages = client.read({.count = 0, .folder = "INBOX"});
                     require(!messages.ok(), "zero count should fail");
                     require(messages.kind() == common::ErrorKind::InvalidArgument,
                             "kind should be invalid argument");
                     require(connector.state().read_opens == 0, "no session should be opened");
                   }});

  tests.push_back({"client_blank_folder_uses_default", [] {
                     FakeConnector connector;
                     connector.add_message("Archive", FakeMessage{.from = "a@x.com",
                                                                  .subject = "Old",
                                                                  .body = "b",
                                                                  .seen = false,
                                                                  .raw = {}});
                     const auto credential = postbox::testing::mock_credential();
                     email::ClientOptions options;
                     options.default_folder = "Archive";
                     email::EmailClient client(connector, credential, options);
                     const auto count = client.unread_count({.folder = "  "});
                     require(count.ok(), count.error());
                     require(count.value() == 1, "default folder should be used");
                   }});

  tests.push_back({"client_filter_combines_criteria", [] {
                     FakeConnector connector;
                     connector.add_message("INBOX", FakeMessage{.from = "A <a@x.com>",
                                                                .subject = "first",
                                                                .body = "1",
                                                                .seen = false,
                                                                .raw = {}});
                     connector.add_message("INBOX", FakeMessage{.from = "a@x.com",
                                                                .subject = "second",
                                                                .body = "2",
                                                                .seen = true,
                                                                .raw = {}});
                     connector.add_message("INBOX", FakeMessage{.from = "b@y.com",
                                                                .subject = "third",
                                                                .body = "3",
                                                                .seen = false,
                                                                .raw = {}});
                     const auto credential = postbox::testing::mock_credential();
                     email::EmailClient client(connector, credential, {});

                     email::FilterCriteria criteria;
                     criteria.sender = "a@x.com";
                     criteria.is_unread = true;
                     const auto messages = client.filter(criteria);
                     require(messages.ok(), messages.error());
                     require(messages.value().size() == 1, "exactly one match expected");
                     require(messages.value()[0].subject == "first", "wrong message matched");
                     require(messages.value()[0].is_unread, "match should be unread");
                     require(connector.state().searches.size() == 1, "one search expected");
                     require(connector.state().searches[0] == "SEARCH UNSEEN FROM \"a@x.com\"",
                             "criteria should be combined server-side: " + connector.state().searches[0]);
                   }});

  tests.push_back({"client_filter_returns_all_matches_newest_first", [] {
                     FakeConnector connector;
                     fill_inbox(connector, 15);
                     const auto credential = postbox::testing::mock_credential();
                     email::EmailClient client(connector, credential, {});

                     email::FilterCriteria criteria;
                     criteria.subject = "message";
                     const auto messages = client.filter(criteria);
                     require(messages.ok(), messages.error());
                     require(messages.value().size() == 15, "filter must not cap results");
                     require(messages.value().front().subject == "Message 15", "newest should be first");
                     require(messages.value().back().subject == "Message 1", "oldest should be last");
                   }});

  tests.push_back({"client_peek_leaves_read_state_untouched", [] {
                     FakeConnector connector;
                     fill_inbox(connector, 6, 2);
                     const auto credential = postbox::testing::mock_credential();
                     email::EmailClient client(connector, credential, {});

                     email::FilterCriteria criteria;
                     criteria.is_unread = true;
                     const auto first = client.filter(criteria);
                     const auto second = client.filter(criteria);
                     require(first.ok() && second.ok(), "filters should succeed");
                     require(first.value().size() == 3, "three unread expected");
                     require(second.value().size() == first.value().size(),
                             "fetching must not mark messages read");
                     const auto count = client.unread_count({});
                     require(count.ok() && count.value() == 3, "unread count should be unchanged");
                     require(connector.state().read_opens == 3, "each call opens its own session");
                     require(connector.state().read_closes == 3, "each session is closed");
                   }});

  tests.push_back({"client_fault_mid_fetch_still_closes_session", [] {
                     FakeConnector connector;
                     fill_inbox(connector, 4);
                     connector.state().throw_on_fetch = true;
                     const auto credential = postbox::testing::mock_credential();
                     email::EmailClient client(connector, credential, {});

                     bool threw = false;
                     try {
                       const auto messages = client.read({.count = 2, .folder = "INBOX"});
                       require(false, "read should not return");
                     } catch (const std::runtime_error &ex) {
                       threw = std::string(ex.what()).find("connection reset") != std::string::npos;
                     }
                     require(threw, "fetch fault should propagate");
                     require(connector.state().read_closes == 1, "session must be closed exactly once");
                   }});

  tests.push_back({"client_search_failure_is_fetch_error", [] {
                     FakeConnector connector;
                     fill_inbox(connector, 3);
                     connector.state().search_error =
                         common::Status::error(common::ErrorKind::Fetch, "search rejected: busy");
                     const auto credential = postbox::testing::mock_credential();
                     email::EmailClient client(connector, credential, {});

                     const auto messages = client.read({.count = 2, .folder = "INBOX"});
                     require(!messages.ok(), "search failure should fail");
                     require(messages.kind() == common::ErrorKind::Fetch, "kind should be fetch");
                     const auto count = client.unread_count({});
                     require(!count.ok() && count.kind() == common::ErrorKind::Fetch,
                             "count should fail with fetch error");
                     require(connector.state().read_closes == 2, "sessions should be closed");
                   }});

  tests.push_back({"client_open_failures_keep_their_kind", [] {
                     FakeConnector connector;
                     connector.state().open_read_error =
                         common::Status::error(common::ErrorKind::Auth, "Invalid credentials");
                     const auto credential = postbox::testing::mock_credential();
                     email::EmailClient client(connector, credential, {});
                     const auto messages = client.read({.count = 2, .folder = "INBOX"});
                     require(!messages.ok() && messages.kind() == common::ErrorKind::Auth,
                             "auth failure should stay auth");

                     FakeConnector no_folder;
                     email::EmailClient folder_client(no_folder, credential, {});
                     const auto missing = folder_client.read({.count = 2, .folder = "Nowhere"});
                     require(!missing.ok() && missing.kind() == common::ErrorKind::Folder,
                             "missing folder should be a folder error");
                   }});

  tests.push_back({"client_undecodable_message_is_skipped", [] {
                     FakeConnector connector;
                     fill_inbox(connector, 3);
                     connector.state().folders["INBOX"][1].raw =
                         "Subject: broken\r\nContent-Transfer-Encoding: base64\r\n\r\n@@@@\r\n";
                     const auto credential = postbox::testing::mock_credential();
                     email::EmailClient client(connector, credential, {});
                     const auto messages = client.read({.count = 3, .folder = "INBOX"});
                     require(messages.ok(), messages.error());
                     require(messages.value().size() == 2, "broken message should be skipped");
                     require(messages.value()[0].id == "3" && messages.value()[1].id == "1",
                             "remaining messages keep their order");
                   }});

  tests.push_back({"client_send_success", [] {
                     FakeConnector connector;
                     const auto credential = postbox::testing::mock_credential();
                     email::EmailClient client(connector, credential, fixed_clock_options());

                     const auto receipt = client.send({.to = "ann@x.com",
                                                       .subject = "Hi",
                                                       .body = "Hello Ann",
                                                       .cc = std::string("bob@y.com")});
                     require(receipt.ok(), receipt.error());
                     require(receipt.value().sent_at == "2024-01-02T03:04:05Z", "sent_at mismatch");
                     require(receipt.value().recipients ==
                                 std::vector<std::string>({"ann@x.com", "bob@y.com"}),
                             "recipients mismatch");
                     require(connector.state().submitted.size() == 1, "one submission expected");
                     const auto &submitted = connector.state().submitted[0];
                     require(submitted.message_id == receipt.value().message_id, "message id mismatch");
                     require(submitted.payload.find("Subject: Hi\r\n") != std::string::npos,
                             "payload subject mismatch");
                     require(submitted.payload.find("Date: Tue, 02 Jan 2024 03:04:05 +0000") !=
                                 std::string::npos,
                             "date should come from the injected clock");
                     require(connector.state().send_opens == 1 && connector.state().send_closes == 1,
                             "send session should be opened and closed once");
                   }});

  tests.push_back({"client_send_invalid_address_never_connects", [] {
                     FakeConnector connector;
                     const auto credential = postbox::testing::mock_credential();
                     email::EmailClient client(connector, credential, {});

                     const auto receipt =
                         client.send({.to = "bad-address", .subject = "Hi", .body = "b", .cc = {}});
                     require(!receipt.ok(), "invalid address should fail");
                     require(receipt.kind() == common::ErrorKind::Send, "kind should be send");
                     require(receipt.error().find("bad-address") != std::string::npos,
                             "error should name the address");
                     require(connector.state().send_opens == 0, "no session should be opened");
                     require(connector.state().submitted.empty(), "nothing should be submitted");
                   }});

  tests.push_back({"client_send_missing_fields_never_connect", [] {
                     FakeConnector connector;
                     const auto credential = postbox::testing::mock_credential();
                     email::EmailClient client(connector, credential, {});

                     require(!client.send({.to = "", .subject = "s", .body = "b", .cc = {}}).ok(),
                             "missing to should fail");
                     require(!client.send({.to = "a@x.com", .subject = "", .body = "b", .cc = {}}).ok(),
                             "missing subject should fail");
                     require(!client.send({.to = "a@x.com", .subject = "s", .body = " ", .cc = {}}).ok(),
                             "missing body should fail");
                     require(connector.state().send_opens == 0, "no session should be opened");
                   }});

  tests.push_back({"client_send_transport_failures_are_send_errors", [] {
                     FakeConnector connector;
                     connector.state().open_send_error =
                         common::Status::error(common::ErrorKind::Auth, "535 bad login");
                     const auto credential = postbox::testing::mock_credential();
                     email::EmailClient client(connector, credential, {});
                     const email::SendRequest request{.to = "a@x.com", .subject = "s", .body = "b", .cc = {}};

                     const auto auth = client.send(request);
                     require(!auth.ok() && auth.kind() == common::ErrorKind::Send,
                             "auth failure should surface as send error");
                     require(auth.error().find("authentication failed") != std::string::npos,
                             "auth cause should be described: " + auth.error());

                     connector.state().open_send_error.reset();
                     connector.state().submit_error =
                         common::Status::error(common::ErrorKind::Send, "550 mailbox unavailable");
                     const auto rejected = client.send(request);
                     require(!rejected.ok() && rejected.kind() == common::ErrorKind::Send,
                             "rejected submission should be a send error");
                     require(rejected.error().find("550") != std::string::npos, "server reply should be kept");
                     require(connector.state().send_closes == 1, "session should be closed after rejection");
                   }});
}
