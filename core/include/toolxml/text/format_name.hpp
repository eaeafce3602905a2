// toolxml/text/format_name.hpp - Display names for format classes
#pragma once

#include <string>
#include <string_view>

namespace toolxml
{

/**
 * Turn a CamelCase format class name into spaced words.
 *
 * "TSVTaxonomyFmt" -> "TSV Taxonomy Format". The tokens "Fmt" and "Dir"
 * are spelled out as "Format" and "Directory".
 */
[[nodiscard]] std::string pretty_format_name(std::string_view class_name);

}  // namespace toolxml
