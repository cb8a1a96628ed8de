#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ffibridge::frontend::internal {

enum class DiagnosticSeverity {
  kError,
  kWarning,
  kNote,
};

struct SourceLocation {
  std::string file;
  int line = 0;
  int column = 0;
};

// Diagnostic codes. FB1xxx expander, FB2xxx symbols and resolution,
// FB3xxx type mapping, FB4xxx layout.
namespace codes {
inline constexpr std::string_view kUnsupportedConstruct = "FB1001";
inline constexpr std::string_view kMalformedMacro = "FB1002";
inline constexpr std::string_view kNameCollision = "FB2001";
inline constexpr std::string_view kUnresolvedReference = "FB2002";
inline constexpr std::string_view kInfiniteSize = "FB2003";
inline constexpr std::string_view kConstEval = "FB2004";
inline constexpr std::string_view kMappingError = "FB3001";
inline constexpr std::string_view kLayoutMismatch = "FB4001";
}  // namespace codes

struct Diagnostic {
  std::string code;
  DiagnosticSeverity severity = DiagnosticSeverity::kError;
  std::string qualified_name;
  std::string file;
  int line = 0;
  int column = 0;
  std::string message;
  std::string remediation;
};

std::string FormatDiagnostic(const Diagnostic& diag);

// Accumulates per-item failures. Not thread-safe: every worker owns one and
// the pipeline merges them in input order.
class DiagnosticsCollector {
 public:
  void Report(Diagnostic diag);
  void Report(std::string_view code, DiagnosticSeverity severity,
              std::string_view qualified_name, const SourceLocation& loc,
              std::string message, std::string remediation = "");

  void Append(const DiagnosticsCollector& other);

  const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }
  std::size_t ErrorCount() const;
  std::size_t CountWithCode(std::string_view code) const;

 private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace ffibridge::frontend::internal
