// toolxml/codec/escape_codec.cpp - Escape codec implementation
//
#include "toolxml/codec/escape_codec.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "toolxml/basic/error.hpp"

namespace toolxml
{

namespace
{

void replace_all(std::string & s, std::string_view from, std::string_view to)
{
  if (from.empty()) {
    return;
  }

  std::string out;
  out.reserve(s.size());

  std::size_t pos = 0;
  while (true) {
    const std::size_t hit = s.find(from.data(), pos, from.size());
    if (hit == std::string::npos) {
      break;
    }
    out.append(s, pos, hit - pos);
    out.append(to);
    pos = hit + from.size();
  }
  out.append(s, pos, std::string::npos);
  s = std::move(out);
}

}  // namespace

std::string escape_text(std::string_view text)
{
  std::string s(text);
  for (const auto & rule : k_escape_table) {
    replace_all(s, std::string_view(&rule.character, 1), rule.token);
  }
  return s;
}

std::string unescape_text(std::string_view text)
{
  std::string s(text);
  for (const auto & rule : k_escape_table) {
    replace_all(s, rule.token, std::string_view(&rule.character, 1));
  }
  return s;
}

std::string_view sentinel_token(ScalarKind kind)
{
  for (const auto & rule : k_sentinel_table) {
    if (rule.kind == kind) {
      return rule.token;
    }
  }
  throw UnsupportedValueError(std::string(to_string(kind)));
}

std::string encode(const ScalarValue & value)
{
  if (value.is_text()) {
    return escape_text(value.as_text());
  }
  return std::string(sentinel_token(value.kind()));
}

ScalarValue decode(std::string_view encoded)
{
  for (const auto & rule : k_sentinel_table) {
    if (rule.token == encoded) {
      switch (rule.kind) {
        case ScalarKind::Absent:
          return ScalarValue::make_absent();
        case ScalarKind::True:
          return ScalarValue::make_bool(true);
        case ScalarKind::False:
          return ScalarValue::make_bool(false);
        case ScalarKind::Text:
          break;
      }
    }
  }

  return ScalarValue::make_text(unescape_text(encoded));
}

std::vector<std::pair<std::string_view, std::string_view>> find_overlapping_tokens()
{
  std::vector<std::pair<std::string_view, std::string_view>> overlaps;

  for (std::size_t i = 0; i < k_escape_table.size(); ++i) {
    for (std::size_t j = 0; j < k_escape_table.size(); ++j) {
      if (i == j) {
        continue;
      }
      const std::string_view outer = k_escape_table[i].token;
      const std::string_view inner = k_escape_table[j].token;
      if (outer.find(inner) != std::string_view::npos) {
        overlaps.emplace_back(outer, inner);
      }
    }
  }

  // Sentinel tokens must not contain an escapable character, so
  // escape_text() leaves them untouched.
  for (const auto & sentinel : k_sentinel_table) {
    for (const auto & rule : k_escape_table) {
      if (sentinel.token.find(rule.character) != std::string_view::npos) {
        overlaps.emplace_back(sentinel.token, std::string_view(&rule.character, 1));
      }
    }
  }

  return overlaps;
}

}  // namespace toolxml
