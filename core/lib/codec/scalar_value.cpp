// toolxml/codec/scalar_value.cpp
//
#include "toolxml/codec/scalar_value.hpp"

namespace toolxml
{

std::string_view to_string(ScalarKind kind)
{
  switch (kind) {
    case ScalarKind::Absent:
      return "absent";
    case ScalarKind::True:
      return "true";
    case ScalarKind::False:
      return "false";
    case ScalarKind::Text:
      return "text";
  }
  return "unknown";
}

}  // namespace toolxml
