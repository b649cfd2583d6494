// xaml_bridge/basic/diagnostic.cpp - Diagnostic implementation
#include "xaml_bridge/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace xaml_bridge
{

std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

const Label * Diagnostic::primary_label() const noexcept
{
  for (const auto & l : labels) {
    if (l.style == LabelStyle::Primary) {
      return &l;
    }
  }
  if (!labels.empty()) {
    return &labels.front();
  }
  return nullptr;
}

SourceRange Diagnostic::primary_range() const noexcept
{
  const Label * l = primary_label();
  if (l == nullptr) {
    return {};
  }
  return l->range;
}

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

DiagnosticBuilder & DiagnosticBuilder::with_file(std::string file_path)
{
  if (!file_path.empty()) {
    diagnostic_.file_path = std::move(file_path);
  }
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::at(uint32_t line, uint32_t column)
{
  diagnostic_.line = line;
  diagnostic_.column = column;
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_label(
  SourceRange range, std::string msg, LabelStyle style)
{
  diagnostic_.labels.push_back(Label{range, std::move(msg), style});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(SourceRange range, std::string msg)
{
  return with_label(range, std::move(msg), LabelStyle::Secondary);
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

Diagnostic make_diagnostic(
  Severity severity, std::string code, std::string message, std::optional<std::string> file_path,
  uint32_t line, uint32_t column)
{
  Diagnostic d;
  d.severity = severity;
  d.code = std::move(code);
  d.message = std::move(message);
  if (file_path && !file_path->empty()) {
    d.file_path = std::move(file_path);
  }
  d.line = line;
  d.column = column;
  return d;
}

}  // namespace

DiagnosticBuilder DiagnosticBag::report_error(std::string code, std::string message)
{
  return {
    *this,
    make_diagnostic(Severity::Error, std::move(code), std::move(message), std::nullopt, 0, 0)};
}

DiagnosticBuilder DiagnosticBag::report_warning(std::string code, std::string message)
{
  return {
    *this,
    make_diagnostic(Severity::Warning, std::move(code), std::move(message), std::nullopt, 0, 0)};
}

DiagnosticBuilder DiagnosticBag::report_info(std::string code, std::string message)
{
  return {
    *this,
    make_diagnostic(Severity::Info, std::move(code), std::move(message), std::nullopt, 0, 0)};
}

DiagnosticBuilder DiagnosticBag::report_hint(std::string code, std::string message)
{
  return {
    *this,
    make_diagnostic(Severity::Hint, std::move(code), std::move(message), std::nullopt, 0, 0)};
}

void DiagnosticBag::add_error(
  std::string code, std::string message, std::optional<std::string> file_path, uint32_t line,
  uint32_t column)
{
  add(make_diagnostic(
    Severity::Error, std::move(code), std::move(message), std::move(file_path), line, column));
}

void DiagnosticBag::add_warning(
  std::string code, std::string message, std::optional<std::string> file_path, uint32_t line,
  uint32_t column)
{
  add(make_diagnostic(
    Severity::Warning, std::move(code), std::move(message), std::move(file_path), line, column));
}

void DiagnosticBag::add_info(
  std::string code, std::string message, std::optional<std::string> file_path, uint32_t line,
  uint32_t column)
{
  add(make_diagnostic(
    Severity::Info, std::move(code), std::move(message), std::move(file_path), line, column));
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::by_severity(Severity severity) const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [severity](const Diagnostic & d) { return d.severity == severity; });
  return result;
}

std::vector<Diagnostic> DiagnosticBag::for_file(std::string_view file_path) const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [file_path](const Diagnostic & d) { return d.file_path && *d.file_path == file_path; });
  return result;
}

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

bool DiagnosticBag::has_warnings() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Warning;
  });
}

bool DiagnosticBag::has_code(std::string_view code) const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [code](const Diagnostic & d) {
    return d.code == code;
  });
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

// ============================================================================
// ConcurrentDiagnosticSink
// ============================================================================

void ConcurrentDiagnosticSink::add(const Diagnostic & diag)
{
  const std::lock_guard<std::mutex> lock(mutex_);
  bag_.add(diag);
}

void ConcurrentDiagnosticSink::merge(const DiagnosticBag & bag)
{
  const std::lock_guard<std::mutex> lock(mutex_);
  bag_.merge(bag);
}

DiagnosticBag ConcurrentDiagnosticSink::snapshot() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return bag_;
}

size_t ConcurrentDiagnosticSink::size() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return bag_.size();
}

}  // namespace xaml_bridge
