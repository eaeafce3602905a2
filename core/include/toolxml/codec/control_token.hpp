// toolxml/codec/control_token.hpp - Placeholders bound to tool form controls
//
// These tokens are generated one way only; the escape codec never decodes
// them.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace toolxml
{

/// `__q2galaxy__::control::<value>` for a control that carries a direct value.
[[nodiscard]] std::string control_value_token(std::string_view value);

/**
 * `__q2galaxy__GUI__<tag>__<name>__` for a control identified by its path.
 * Missing components are left out of the path.
 */
[[nodiscard]] std::string control_path_token(
  const std::optional<std::string> & tag, const std::optional<std::string> & name);

/**
 * Dispatch between the two forms: a present value wins over tag/name.
 */
[[nodiscard]] std::string ui_control_token(
  const std::optional<std::string> & value, const std::optional<std::string> & tag,
  const std::optional<std::string> & name);

}  // namespace toolxml
