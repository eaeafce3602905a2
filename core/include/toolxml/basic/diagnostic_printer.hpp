// toolxml/basic/diagnostic_printer.hpp
//
// Prints driver diagnostics in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "toolxml/basic/diagnostic.hpp"

namespace toolxml
{

/**
 * Produces output like:
 *   error[G002]: unknown tool section tag 'foobar'
 *     --> tools/align.json
 *     = help: tool section tags must be one of: description, macros, ...
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag);

  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_help(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace toolxml
