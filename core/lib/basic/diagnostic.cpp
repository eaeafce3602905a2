// toolxml/basic/diagnostic.cpp
//
#include "toolxml/basic/diagnostic.hpp"

#include <algorithm>
#include <utility>

namespace toolxml
{

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_file(std::string file)
{
  diagnostic_.file = std::move(file);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

namespace
{

Diagnostic make_diag(Severity severity, std::string message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  return d;
}

}  // namespace

DiagnosticBuilder DiagnosticBag::report_error(std::string message)
{
  return {*this, make_diag(Severity::Error, std::move(message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(std::string message)
{
  return {*this, make_diag(Severity::Warning, std::move(message))};
}

DiagnosticBuilder DiagnosticBag::report_info(std::string message)
{
  return {*this, make_diag(Severity::Info, std::move(message))};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

}  // namespace toolxml
