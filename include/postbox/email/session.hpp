#pragma once

#include "postbox/common/result.hpp"
#include "postbox/email/message.hpp"
#include "postbox/email/query.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace postbox::email {

/// Authenticated read-only view of one folder on the read/search server.
class IReadSession {
public:
  virtual ~IReadSession() = default;

  /// Matching ids in server order (ascending arrival).
  [[nodiscard]] virtual common::Result<std::vector<std::uint32_t>>
  search(const ProtocolQuery &query) = 0;

  /// Raw content and flags without altering any flag. Missing ids are simply absent.
  [[nodiscard]] virtual common::Result<std::vector<RawMessage>>
  fetch(const std::vector<std::uint32_t> &ids) = 0;

  /// Idempotent; never throws, even if the connection is already gone.
  virtual void close() noexcept = 0;
};

struct OutgoingMessage {
  std::string sender;
  std::vector<std::string> recipients;
  std::string message_id;
  std::string payload;
};

/// Authenticated submission channel on the send server.
class ISendSession {
public:
  virtual ~ISendSession() = default;

  [[nodiscard]] virtual common::Status submit(const OutgoingMessage &message) = 0;
  virtual void close() noexcept = 0;
};

/// Opens one fresh session per call. Exactly one attempt; never retries.
class IMailConnector {
public:
  virtual ~IMailConnector() = default;

  [[nodiscard]] virtual common::Result<std::unique_ptr<IReadSession>>
  open_read_session(const std::string &folder) = 0;
  [[nodiscard]] virtual common::Result<std::unique_ptr<ISendSession>> open_send_session() = 0;
};

/// Closes the held session exactly once when the scope ends, whatever the exit path.
template <typename Session> class ScopedSession {
public:
  explicit ScopedSession(std::unique_ptr<Session> session) : session_(std::move(session)) {}
  ~ScopedSession() { release(); }

  ScopedSession(const ScopedSession &) = delete;
  ScopedSession &operator=(const ScopedSession &) = delete;

  Session &operator*() const { return *session_; }
  Session *operator->() const { return session_.get(); }

  void release() noexcept {
    if (session_ != nullptr) {
      session_->close();
      session_.reset();
    }
  }

private:
  std::unique_ptr<Session> session_;
};

} // namespace postbox::email
