#include "diagnostics.h"

#include <sstream>
#include <string>
#include <utility>

namespace ffibridge::frontend::internal {

std::string FormatDiagnostic(const Diagnostic& diag) {
  std::ostringstream oss;
  const char* sev = "error";
  if (diag.severity == DiagnosticSeverity::kWarning) {
    sev = "warning";
  } else if (diag.severity == DiagnosticSeverity::kNote) {
    sev = "note";
  }

  oss << sev;
  if (!diag.code.empty()) {
    oss << "[" << diag.code << "]";
  }
  oss << ": ";

  if (!diag.file.empty()) {
    oss << diag.file;
    if (diag.line > 0) {
      oss << ":" << diag.line;
      if (diag.column > 0) {
        oss << ":" << diag.column;
      }
    }
    oss << ": ";
  }

  oss << (diag.qualified_name.empty() ? "<unknown>" : diag.qualified_name) << ": ";
  oss << diag.message;
  if (!diag.remediation.empty()) {
    oss << "\nhelp: " << diag.remediation;
  }
  return oss.str();
}

void DiagnosticsCollector::Report(Diagnostic diag) {
  diagnostics_.push_back(std::move(diag));
}

void DiagnosticsCollector::Report(std::string_view code, DiagnosticSeverity severity,
                                  std::string_view qualified_name, const SourceLocation& loc,
                                  std::string message, std::string remediation) {
  Diagnostic diag;
  diag.code = std::string(code);
  diag.severity = severity;
  diag.qualified_name = std::string(qualified_name);
  diag.file = loc.file;
  diag.line = loc.line;
  diag.column = loc.column;
  diag.message = std::move(message);
  diag.remediation = std::move(remediation);
  diagnostics_.push_back(std::move(diag));
}

void DiagnosticsCollector::Append(const DiagnosticsCollector& other) {
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

std::size_t DiagnosticsCollector::ErrorCount() const {
  std::size_t count = 0;
  for (const Diagnostic& diag : diagnostics_) {
    if (diag.severity == DiagnosticSeverity::kError) {
      ++count;
    }
  }
  return count;
}

std::size_t DiagnosticsCollector::CountWithCode(std::string_view code) const {
  std::size_t count = 0;
  for (const Diagnostic& diag : diagnostics_) {
    if (diag.code == code) {
      ++count;
    }
  }
  return count;
}

}  // namespace ffibridge::frontend::internal
