// toolxml/basic/diagnostic.hpp - Diagnostics reported by the generation driver
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace toolxml
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
};

/// Stable codes for the failure kinds the driver reports.
namespace diag_code
{
inline constexpr const char * k_unsupported_value = "G001";
inline constexpr const char * k_unknown_section = "G002";
inline constexpr const char * k_output_failure = "G003";
inline constexpr const char * k_malformed_tree = "G004";
inline constexpr const char * k_config_error = "G005";
}  // namespace diag_code

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;                 // e.g., "G002"
  std::string message;              // main message
  std::optional<std::string> file;  // file the diagnostic refers to
  std::optional<std::string> help_message;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and adds it to the bag on destruction (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_file(std::string file);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  // Builder Starters
  DiagnosticBuilder report_error(std::string message);
  DiagnosticBuilder report_warning(std::string message);
  DiagnosticBuilder report_info(std::string message);

  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] bool has_errors() const;

  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace toolxml
