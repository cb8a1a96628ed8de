#include "syntax_dump.h"

#include <cctype>
#include <cstdlib>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace ffibridge::frontend::internal {

namespace {

std::string Unescape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\\' && i + 1 < text.size()) {
      const char next = text[i + 1];
      if (next == 'n') {
        out.push_back('\n');
        ++i;
        continue;
      }
      if (next == '\\') {
        out.push_back('\\');
        ++i;
        continue;
      }
    }
    out.push_back(text[i]);
  }
  return out;
}

std::string Escape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == '\n') {
      out += "\\n";
    } else if (c == '\\') {
      out += "\\\\";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

bool AllDigits(std::string_view text) {
  if (text.empty()) {
    return false;
  }
  for (char c : text) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
  }
  return true;
}

// Splits a trailing " @line:column" marker off the node text.
void SplitLocation(std::string* text, int* line, int* column) {
  const std::size_t at = text->rfind(" @");
  if (at == std::string::npos) {
    return;
  }
  const std::string marker = text->substr(at + 2);
  const std::size_t colon = marker.find(':');
  if (colon == std::string::npos) {
    return;
  }
  const std::string line_text = marker.substr(0, colon);
  const std::string column_text = marker.substr(colon + 1);
  if (!AllDigits(line_text) || !AllDigits(column_text)) {
    return;
  }
  *line = std::atoi(line_text.c_str());
  *column = std::atoi(column_text.c_str());
  text->erase(at);
}

void WriteNode(const SyntaxNode& node, int depth, std::ostringstream& out) {
  out << std::string(static_cast<std::size_t>(depth) * 2, ' ') << node.kind;
  if (!node.text.empty()) {
    out << ": " << Escape(node.text);
  }
  if (node.line > 0) {
    out << " @" << node.line << ":" << node.column;
  }
  out << "\n";
  for (const SyntaxNode& child : node.children) {
    WriteNode(child, depth + 1, out);
  }
}

}  // namespace

SyntaxReadResult ReadSyntaxDump(std::string_view text, std::string_view filename) {
  SyntaxReadResult result;
  result.file.path = std::string(filename);

  // Path from the root to the node most recently appended at each depth.
  std::vector<SyntaxNode*> stack;
  bool have_root = false;

  std::istringstream input{std::string(text)};
  std::string raw;
  int line_no = 0;
  while (std::getline(input, raw)) {
    ++line_no;
    if (!raw.empty() && raw.back() == '\r') {
      raw.pop_back();
    }
    std::size_t indent = 0;
    while (indent < raw.size() && raw[indent] == ' ') {
      ++indent;
    }
    if (indent == raw.size() || raw[indent] == '#') {
      continue;
    }
    const std::string where = std::string(filename) + ":" + std::to_string(line_no);
    if (indent % 2 != 0) {
      result.message = where + ": indentation must be a multiple of two spaces";
      return result;
    }
    const std::size_t depth = indent / 2;

    std::string body = raw.substr(indent);
    SyntaxNode node;
    SplitLocation(&body, &node.line, &node.column);
    const std::size_t sep = body.find(": ");
    if (sep == std::string::npos) {
      node.kind = body;
    } else {
      node.kind = body.substr(0, sep);
      node.text = Unescape(body.substr(sep + 2));
    }
    if (node.kind.empty() || node.kind.find(' ') != std::string::npos) {
      result.message = where + ": malformed node kind: " + body;
      return result;
    }

    if (depth == 0) {
      if (have_root) {
        result.message = where + ": more than one root node";
        return result;
      }
      result.file.root = std::move(node);
      have_root = true;
      stack.assign(1, &result.file.root);
      continue;
    }
    if (!have_root || depth > stack.size()) {
      result.message = where + ": node is indented deeper than its parent";
      return result;
    }
    stack.resize(depth);
    SyntaxNode* parent = stack.back();
    parent->children.push_back(std::move(node));
    stack.push_back(&parent->children.back());
  }

  if (!have_root) {
    result.message = std::string(filename) + ": empty syntax dump";
    return result;
  }
  if (result.file.root.kind != "File") {
    result.message = std::string(filename) + ": root node must be File, got " +
                     result.file.root.kind;
    return result;
  }
  result.ok = true;
  return result;
}

std::string WriteSyntaxDump(const SyntaxNode& root) {
  std::ostringstream out;
  WriteNode(root, 0, out);
  return out.str();
}

}  // namespace ffibridge::frontend::internal
