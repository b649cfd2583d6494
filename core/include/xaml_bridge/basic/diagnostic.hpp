// xaml_bridge/basic/diagnostic.hpp - Diagnostic types for parsing/transformation
#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "xaml_bridge/basic/source_index.hpp"

namespace xaml_bridge
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
  Hint,
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

enum class LabelStyle {
  Primary,    // Direct cause
  Secondary,  // Related context
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;     // e.g., "TYPE_MAPPING_NOT_FOUND"
  std::string message;  // Main message

  std::optional<std::string> file_path;
  uint32_t line = 0;    ///< 1-indexed (0 = unknown)
  uint32_t column = 0;  ///< 1-indexed (0 = unknown)

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] bool has_location() const noexcept { return line > 0; }
  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic with a fluent interface and registers it with the bag
 * on destruction (RAII).
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

  DiagnosticBuilder & with_file(std::string file_path);

  DiagnosticBuilder & at(uint32_t line, uint32_t column);

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

/**
 * Append-only collection of diagnostics for one document or pipeline run.
 *
 * Not synchronized. Pipelines running on several documents at once keep one
 * bag per document and merge afterwards, or share a ConcurrentDiagnosticSink.
 */
class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(std::string code, std::string message);
  DiagnosticBuilder report_warning(std::string code, std::string message);
  DiagnosticBuilder report_info(std::string code, std::string message);
  DiagnosticBuilder report_hint(std::string code, std::string message);

  // Sink contract
  void add_error(
    std::string code, std::string message, std::optional<std::string> file_path = std::nullopt,
    uint32_t line = 0, uint32_t column = 0);
  void add_warning(
    std::string code, std::string message, std::optional<std::string> file_path = std::nullopt,
    uint32_t line = 0, uint32_t column = 0);
  void add_info(
    std::string code, std::string message, std::optional<std::string> file_path = std::nullopt,
    uint32_t line = 0, uint32_t column = 0);

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> by_severity(Severity severity) const;
  [[nodiscard]] std::vector<Diagnostic> errors() const { return by_severity(Severity::Error); }
  [[nodiscard]] std::vector<Diagnostic> warnings() const
  {
    return by_severity(Severity::Warning);
  }
  [[nodiscard]] std::vector<Diagnostic> infos() const { return by_severity(Severity::Info); }
  [[nodiscard]] std::vector<Diagnostic> for_file(std::string_view file_path) const;

  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;
  [[nodiscard]] bool has_code(std::string_view code) const;

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);
  void clear() { diagnostics_.clear(); }

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

// ============================================================================
// ConcurrentDiagnosticSink
// ============================================================================

/**
 * Mutex-guarded append-only sink shared by per-document pipelines.
 */
class ConcurrentDiagnosticSink
{
public:
  void add(const Diagnostic & diag);
  void merge(const DiagnosticBag & bag);

  /// Copy of everything appended so far
  [[nodiscard]] DiagnosticBag snapshot() const;

  [[nodiscard]] size_t size() const;

private:
  mutable std::mutex mutex_;
  DiagnosticBag bag_;
};

}  // namespace xaml_bridge
