#pragma once

#include "postbox/common/result.hpp"
#include "postbox/email/message.hpp"
#include "postbox/email/query.hpp"
#include "postbox/email/session.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace postbox::email {

struct FetchOptions {
  std::size_t preview_length = 300;
};

/// The last `limit` ids (all when unset), newest first.
[[nodiscard]] std::vector<std::uint32_t> select_newest(const std::vector<std::uint32_t> &ids,
                                                       std::optional<std::size_t> limit);

/// Search, then one peek-fetch of the selected ids, then decode. Messages that fail to
/// decode are skipped and logged; search or fetch failures abort with ErrorKind::Fetch.
[[nodiscard]] common::Result<std::vector<Message>>
fetch_messages(IReadSession &session, const ProtocolQuery &query,
               std::optional<std::size_t> limit, const FetchOptions &options);

} // namespace postbox::email
