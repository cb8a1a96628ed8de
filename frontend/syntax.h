#pragma once

#include <string>
#include <utility>
#include <vector>

namespace ffibridge::frontend::internal {

// Node of the syntax tree handed over by the external front end. One tree
// per source file; the root has kind "File" and the module path as text.
struct SyntaxNode {
  SyntaxNode() = default;

  SyntaxNode(std::string in_kind, std::string in_text, std::vector<SyntaxNode> in_children)
      : kind(std::move(in_kind)),
        text(std::move(in_text)),
        children(std::move(in_children)) {}

  std::string kind;
  std::string text;
  std::vector<SyntaxNode> children;
  int line = 0;
  int column = 0;
};

struct SourceFile {
  std::string path;
  SyntaxNode root;
};

}  // namespace ffibridge::frontend::internal
