// qualsim/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "qualsim/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <tuple>
#include <vector>

namespace qualsim
{

namespace
{

std::string display_path(const std::string & file)
{
  if (file.empty()) {
    return "<unknown>";
  }
  std::error_code ec;
  const std::filesystem::path p(file);
  if (!p.is_absolute()) {
    return file;
  }
  auto rel = std::filesystem::relative(p, std::filesystem::current_path(), ec);
  return ec || rel.empty() ? file : rel.string();
}

// 0-based line lookup; returns false past the end of the text
bool find_line(std::string_view text, uint32_t index, std::string_view & out)
{
  size_t start = 0;
  for (uint32_t i = 0; i < index; ++i) {
    const size_t nl = text.find('\n', start);
    if (nl == std::string_view::npos) {
      return false;
    }
    start = nl + 1;
  }
  if (start > text.size()) {
    return false;
  }
  size_t end = text.find('\n', start);
  if (end == std::string_view::npos) {
    end = text.size();
  }
  out = text.substr(start, end - start);
  return true;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceTexts & sources)
{
  const KbLocation primary = diag.primary_location();
  const std::string filename = display_path(primary.file);

  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> file:line:col ===
  if (primary.is_valid()) {
    fmt::print(
      os_, "{} {}\n", gutter_arrow(),
      fmt::format("{}:{}:{}", filename, primary.line, primary.column));
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    print_label_context(label, sources);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceTexts & sources)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      const KbLocation la = a.primary_location();
      const KbLocation lb = b.primary_location();
      return std::tie(la.file, la.line, la.column) < std::tie(lb.file, lb.line, lb.column);
    });

  for (const auto & d : sorted_diags) {
    print(d, sources);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  std::string severity_str;
  switch (diag.severity) {
    case Severity::Error:
      severity_str = "error";
      break;
    case Severity::Warning:
      severity_str = "warning";
      break;
    case Severity::Info:
      severity_str = "info";
      break;
  }

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
    }
    os_ << severity_str;
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", severity_str, diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", severity_str, diag.message);
  }
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceTexts & sources)
{
  std::string_view line;
  const auto it = sources.find(label.location.file);
  const bool has_snippet = label.location.is_valid() && it != sources.end() &&
                           find_line(it->second, label.location.line - 1, line) && !line.empty();

  if (!has_snippet) {
    if (!label.message.empty()) {
      print_note(label.message);
    }
    return;
  }

  print_source_line(line, label.location.line, label.location.column, label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  std::string_view line, uint32_t line_num, uint32_t column, LabelStyle style,
  std::string_view label_message)
{
  std::string cleaned_line;
  cleaned_line.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      cleaned_line += "    ";
    } else if (c != '\r') {
      cleaned_line += c;
    }
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  fmt::print(os_, "      {} ", gutter_pipe_only());

  // YAML marks point at the start of a scalar; underline up to the next blank
  std::string marker_prefix;
  uint32_t visual_col = 1;
  size_t char_idx = 0;
  for (; visual_col < column && char_idx < line.size(); ++char_idx) {
    if (line[char_idx] == '\t') {
      marker_prefix += "    ";
      visual_col += 4;
    } else {
      marker_prefix += ' ';
      visual_col++;
    }
  }
  size_t marker_len = 0;
  while (char_idx + marker_len < line.size() && line[char_idx + marker_len] != ' ' &&
         line[char_idx + marker_len] != '\r') {
    ++marker_len;
  }
  marker_len = std::max<size_t>(marker_len, 1);

  fmt::print(os_, "{}", marker_prefix);

  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';
  if (use_color_) {
    if (style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  fmt::print(os_, "{}", std::string(marker_len, marker_char));
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

void DiagnosticPrinter::print_note(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "   = note: {}\n", message);
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

}  // namespace qualsim
