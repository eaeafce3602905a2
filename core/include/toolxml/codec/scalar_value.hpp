// toolxml/codec/scalar_value.hpp - Values accepted by the escape codec
//
// A scalar is either text or one of three sentinels (absent, true, false).
// The kind is carried structurally, so the text "None" and the absent
// sentinel can never be confused.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace toolxml
{

// ============================================================================
// Scalar Kind
// ============================================================================

enum class ScalarKind : uint8_t {
  Absent,  ///< No value (None)
  True,    ///< Boolean true
  False,   ///< Boolean false
  Text,    ///< Arbitrary string content
};

[[nodiscard]] std::string_view to_string(ScalarKind kind);

// ============================================================================
// Scalar Value
// ============================================================================

class ScalarValue
{
public:
  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  /// Create the absent sentinel
  static ScalarValue make_absent()
  {
    ScalarValue v;
    v.kind_ = ScalarKind::Absent;
    return v;
  }

  /// Create a boolean sentinel
  static ScalarValue make_bool(bool value)
  {
    ScalarValue v;
    v.kind_ = value ? ScalarKind::True : ScalarKind::False;
    return v;
  }

  /// Create a text value
  static ScalarValue make_text(std::string value)
  {
    ScalarValue v;
    v.kind_ = ScalarKind::Text;
    v.text_ = std::move(value);
    return v;
  }

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  [[nodiscard]] ScalarKind kind() const noexcept { return kind_; }

  [[nodiscard]] bool is_absent() const noexcept { return kind_ == ScalarKind::Absent; }
  [[nodiscard]] bool is_bool() const noexcept
  {
    return kind_ == ScalarKind::True || kind_ == ScalarKind::False;
  }
  [[nodiscard]] bool is_text() const noexcept { return kind_ == ScalarKind::Text; }

  // ===========================================================================
  // Value Accessors
  // ===========================================================================

  /// Boolean payload (only meaningful if is_bool())
  [[nodiscard]] bool as_bool() const noexcept { return kind_ == ScalarKind::True; }

  /// Text payload (empty unless is_text())
  [[nodiscard]] const std::string & as_text() const noexcept { return text_; }

  friend bool operator==(const ScalarValue & a, const ScalarValue & b)
  {
    return a.kind_ == b.kind_ && a.text_ == b.text_;
  }
  friend bool operator!=(const ScalarValue & a, const ScalarValue & b) { return !(a == b); }

private:
  ScalarValue() = default;

  ScalarKind kind_ = ScalarKind::Absent;
  std::string text_;
};

}  // namespace toolxml
