// xaml_bridge/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "xaml_bridge/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace xaml_bridge
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceIndex * source)
{
  const std::string filename = diag.file_path.value_or("<input>");

  // === Header line: warning[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> file:line:col ===
  if (diag.has_location()) {
    fmt::print(
      os_, "{} {}\n", gutter_arrow(),
      fmt::format("{}:{}:{}", filename, diag.line, std::max<uint32_t>(diag.column, 1)));
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  if (source != nullptr && diag.has_location()) {
    const Label * label = diag.primary_label();
    print_source_line(
      *source, diag.line, std::max<uint32_t>(diag.column, 1),
      label != nullptr ? label->style : LabelStyle::Primary,
      label != nullptr ? std::string_view(label->message) : std::string_view{});
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceIndex * source)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return a.line < b.line;
    });

  for (const auto & d : sorted_diags) {
    print(d, source);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  const size_t errors = diags.errors().size();
  const size_t warnings = diags.warnings().size();
  const size_t infos = diags.infos().size();

  const std::string text = fmt::format(
    "{} error{}, {} warning{}, {} info", errors, errors == 1 ? "" : "s", warnings,
    warnings == 1 ? "" : "s", infos);

  if (use_color_) {
    os_ << rang::style::bold << (errors > 0 ? rang::fg::red : rang::fg::green) << text
        << rang::fg::reset << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}\n", text);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view severity_str = to_string(diag.severity);
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Info:
        os_ << rang::fg::cyan;
        break;
      case Severity::Hint:
        os_ << rang::fg::green;
        break;
    }
    os_ << severity_str;
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
  } else {
    if (!diag.code.empty()) {
      fmt::print(os_, "{}[{}]: {}\n", severity_str, diag.code, diag.message);
    } else {
      fmt::print(os_, "{}: {}\n", severity_str, diag.message);
    }
  }
}

void DiagnosticPrinter::print_source_line(
  const SourceIndex & source, uint32_t line, uint32_t column, LabelStyle style,
  std::string_view label_message)
{
  const std::string_view text = source.line_text(line);
  if (text.empty()) {
    return;
  }

  // Build cleaned line (tabs -> spaces)
  std::string cleaned_line;
  cleaned_line.reserve(text.size());
  for (const char c : text) {
    if (c == '\t') {
      cleaned_line += "    ";
    } else {
      cleaned_line += c;
    }
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  fmt::print(os_, "      {} ", gutter_pipe_only());

  std::string marker_prefix;
  uint32_t visual_col = 1;
  for (size_t i = 0; visual_col < column && i < text.size(); ++i) {
    if (text[i] == '\t') {
      marker_prefix += "    ";
    } else {
      marker_prefix += ' ';
    }
    ++visual_col;
  }
  fmt::print(os_, "{}", marker_prefix);

  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';
  if (use_color_) {
    if (style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  fmt::print(os_, "{}", marker_char);
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  if (use_color_) {
    return fmt::format("{}|{}", "\033[1;36m", "\033[0m");
  }
  return "|";
}

}  // namespace xaml_bridge
