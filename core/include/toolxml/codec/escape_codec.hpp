// toolxml/codec/escape_codec.hpp - Reversible escaping of tool parameter values
//
// Maps characters that the Galaxy command/template layer cannot carry
// verbatim to placeholder tokens (galaxy.util:mapped_chars), and maps the
// absent/true/false sentinels to fixed literal tokens.
//
#pragma once

#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "toolxml/codec/scalar_value.hpp"

namespace toolxml
{

/**
 * One row of the character escape table.
 */
struct EscapeRule
{
  char character;
  std::string_view token;
};

/**
 * One row of the sentinel table.
 */
struct SentinelRule
{
  ScalarKind kind;
  std::string_view token;
};

/// Character escape table. Substitution is applied in this order, both ways.
inline constexpr std::array<EscapeRule, 14> k_escape_table = {{
  {'[', "__ob__"},
  {']', "__cb__"},
  {'>', "__gt__"},
  {'<', "__lt__"},
  {'\'', "__sq__"},
  {'"', "__dq__"},
  {'{', "__oc__"},
  {'}', "__cc__"},
  {'@', "__at__"},
  {'\n', "__cn__"},
  {'\r', "__cr__"},
  {'\t', "__tc__"},
  {'#', "__pd__"},
  // keeps <test/> params from being split into multiple values
  {',', "__comma__"},
}};

/// Sentinel tokens for the non-text scalars.
inline constexpr std::array<SentinelRule, 3> k_sentinel_table = {{
  {ScalarKind::Absent, "__q2galaxy__::literal::None"},
  {ScalarKind::True, "__q2galaxy__::literal::True"},
  {ScalarKind::False, "__q2galaxy__::literal::False"},
}};

/**
 * Encode a scalar for embedding in a tool document.
 *
 * Text runs through the escape table in order; sentinels map to their
 * literal token without touching the table.
 */
[[nodiscard]] std::string encode(const ScalarValue & value);

/**
 * Decode a token or escaped text back into a scalar.
 *
 * A whole-string sentinel match wins; anything else is unescaped with the
 * same table order used by encode().
 */
[[nodiscard]] ScalarValue decode(std::string_view encoded);

/// Escape text only (never yields a sentinel).
[[nodiscard]] std::string escape_text(std::string_view text);

/// Reverse escape_text(). Sentinel tokens are not interpreted.
[[nodiscard]] std::string unescape_text(std::string_view text);

/// Sentinel token for a non-text kind. Throws UnsupportedValueError for Text.
[[nodiscard]] std::string_view sentinel_token(ScalarKind kind);

/**
 * Report pairs of escape tokens where one token occurs inside another.
 *
 * Reversibility of the table depends on the chosen tokens; an empty result
 * means no decode step can consume part of another rule's token.
 */
[[nodiscard]] std::vector<std::pair<std::string_view, std::string_view>>
find_overlapping_tokens();

}  // namespace toolxml
