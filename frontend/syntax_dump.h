#pragma once

#include <string>
#include <string_view>

#include "syntax.h"

namespace ffibridge::frontend::internal {

// Text hand-off format produced by the external front end: one node per
// line, two spaces of indentation per depth, "kind: text", an optional
// " @line:column" suffix. Lines starting with '#' are comments. Newlines and
// backslashes inside text are escaped as \n and \\.
struct SyntaxReadResult {
  bool ok = false;
  SourceFile file;
  std::string message;
};

SyntaxReadResult ReadSyntaxDump(std::string_view text, std::string_view filename);
std::string WriteSyntaxDump(const SyntaxNode& root);

}  // namespace ffibridge::frontend::internal
