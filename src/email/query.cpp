#include "postbox/email/query.hpp"

#include "postbox/common/fs.hpp"
#include "postbox/email/imap_protocol.hpp"

#include <algorithm>
#include <optional>
#include <vector>

namespace postbox::email {

namespace {

std::optional<std::string> search_value(const std::optional<std::string> &value) {
  if (!value.has_value()) {
    return std::nullopt;
  }
  std::string cleaned = *value;
  std::replace(cleaned.begin(), cleaned.end(), '\r', ' ');
  std::replace(cleaned.begin(), cleaned.end(), '\n', ' ');
  cleaned = common::trim(cleaned);
  if (cleaned.empty()) {
    return std::nullopt;
  }
  return cleaned;
}

} // namespace

std::string ProtocolQuery::command() const {
  if (charset.empty()) {
    return "SEARCH " + criteria;
  }
  return "SEARCH CHARSET " + charset + " " + criteria;
}

ProtocolQuery translate(const FilterCriteria &criteria) {
  std::vector<std::string> terms;
  bool needs_utf8 = false;

  if (criteria.is_unread.has_value()) {
    terms.emplace_back(*criteria.is_unread ? "UNSEEN" : "SEEN");
  }
  if (const auto sender = search_value(criteria.sender); sender.has_value()) {
    needs_utf8 = needs_utf8 || !common::is_ascii(*sender);
    terms.push_back("FROM " + imap_astring(*sender));
  }
  if (const auto subject = search_value(criteria.subject); subject.has_value()) {
    needs_utf8 = needs_utf8 || !common::is_ascii(*subject);
    terms.push_back("SUBJECT " + imap_astring(*subject));
  }

  if (terms.empty()) {
    return match_all_query();
  }

  ProtocolQuery query;
  query.criteria.clear();
  for (std::size_t i = 0; i < terms.size(); ++i) {
    if (i > 0) {
      query.criteria.push_back(' ');
    }
    query.criteria += terms[i];
  }
  if (needs_utf8) {
    query.charset = "UTF-8";
  }
  return query;
}

ProtocolQuery match_all_query() { return ProtocolQuery{}; }

ProtocolQuery unread_query() {
  FilterCriteria criteria;
  criteria.is_unread = true;
  return translate(criteria);
}

} // namespace postbox::email
