#include "postbox/email/fetch.hpp"

#include "postbox/email/mime.hpp"
#include "postbox/observability/global.hpp"

#include <algorithm>
#include <unordered_map>

namespace postbox::email {

std::vector<std::uint32_t> select_newest(const std::vector<std::uint32_t> &ids,
                                         const std::optional<std::size_t> limit) {
  const std::size_t take = limit.has_value() ? std::min(*limit, ids.size()) : ids.size();
  std::vector<std::uint32_t> selected(ids.end() - static_cast<std::ptrdiff_t>(take), ids.end());
  std::reverse(selected.begin(), selected.end());
  return selected;
}

common::Result<std::vector<Message>> fetch_messages(IReadSession &session,
                                                    const ProtocolQuery &query,
                                                    const std::optional<std::size_t> limit,
                                                    const FetchOptions &options) {
  using R = common::Result<std::vector<Message>>;

  auto ids = session.search(query);
  if (!ids.ok()) {
    return R::failure(common::ErrorKind::Fetch, ids.error());
  }
  const auto selected = select_newest(ids.value(), limit);
  if (selected.empty()) {
    return R::success({});
  }

  auto raw = session.fetch(selected);
  if (!raw.ok()) {
    return R::failure(common::ErrorKind::Fetch, raw.error());
  }

  std::unordered_map<std::uint32_t, const RawMessage *> by_id;
  for (const auto &message : raw.value()) {
    by_id.emplace(message.id, &message);
  }

  std::vector<Message> messages;
  messages.reserve(selected.size());
  for (const auto id : selected) {
    const auto it = by_id.find(id);
    if (it == by_id.end()) {
      observability::record_message_skipped(std::to_string(id), "not returned by server");
      continue;
    }
    auto decoded = parse_message(it->second->content, options.preview_length);
    if (!decoded.ok()) {
      observability::record_message_skipped(std::to_string(id), decoded.error());
      continue;
    }
    auto &value = decoded.value();
    messages.push_back(Message{
        .id = std::to_string(id),
        .subject = std::move(value.subject),
        .from = std::move(value.from),
        .to = std::move(value.to),
        .date = std::move(value.date),
        .body = std::move(value.body),
        .is_unread = !has_seen_flag(it->second->flags),
    });
  }

  observability::record_messages_fetched(messages.size());
  return R::success(std::move(messages));
}

} // namespace postbox::email
