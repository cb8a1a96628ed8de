#include "expander.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ffibridge::frontend::internal {

namespace {

using Node = SyntaxNode;

std::string TrimCopy(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.substr(0, prefix.size()) == prefix;
}

bool EndsWith(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

bool IsIdentifier(std::string_view text) {
  if (text.empty()) {
    return false;
  }
  if (std::isalpha(static_cast<unsigned char>(text[0])) == 0 && text[0] != '_') {
    return false;
  }
  return std::all_of(text.begin(), text.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
  });
}

const Node* FindChildByKind(const Node& node, std::string_view kind) {
  const auto it = std::find_if(node.children.begin(), node.children.end(),
                               [&](const Node& child) { return child.kind == kind; });
  return it == node.children.end() ? nullptr : &*it;
}

std::vector<const Node*> ChildrenByKind(const Node& node, std::string_view kind) {
  std::vector<const Node*> out;
  for (const Node& child : node.children) {
    if (child.kind == kind) {
      out.push_back(&child);
    }
  }
  return out;
}

// Children that are neither attributes nor item metadata.
std::vector<const Node*> PayloadChildren(const Node& node) {
  std::vector<const Node*> out;
  for (const Node& child : node.children) {
    if (child.kind != "Attr") {
      out.push_back(&child);
    }
  }
  return out;
}

// Splits on `sep` outside of parentheses, braces and string literals.
std::vector<std::string> SplitTopLevel(std::string_view text, char sep) {
  std::vector<std::string> parts;
  int depth = 0;
  bool in_string = false;
  std::string current;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (in_string) {
      current.push_back(c);
      if (c == '\\' && i + 1 < text.size()) {
        current.push_back(text[++i]);
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    if (c == '"') {
      in_string = true;
    } else if (c == '(' || c == '{' || c == '[') {
      ++depth;
    } else if (c == ')' || c == '}' || c == ']') {
      --depth;
    } else if (c == sep && depth == 0) {
      parts.push_back(TrimCopy(current));
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  const std::string last = TrimCopy(current);
  if (!last.empty() || !parts.empty()) {
    parts.push_back(last);
  }
  return parts;
}

// "name(args)" -> {"name", "args"}; "name" -> {"name", ""}.
bool SplitCall(std::string_view text, std::string* name, std::string* args) {
  const std::string trimmed = TrimCopy(text);
  const std::size_t open = trimmed.find('(');
  if (open == std::string::npos) {
    *name = trimmed;
    args->clear();
    return true;
  }
  if (trimmed.back() != ')') {
    return false;
  }
  *name = TrimCopy(trimmed.substr(0, open));
  *args = trimmed.substr(open + 1, trimmed.size() - open - 2);
  return true;
}

// `key = "value"` -> value. Returns false when `text` has another shape.
bool ParseKeyValue(std::string_view text, std::string* key, std::string* value) {
  const std::size_t eq = text.find('=');
  if (eq == std::string_view::npos) {
    return false;
  }
  *key = TrimCopy(text.substr(0, eq));
  std::string raw = TrimCopy(text.substr(eq + 1));
  if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') {
    return false;
  }
  *value = raw.substr(1, raw.size() - 2);
  return true;
}

// Largest alignment a repr may request.
constexpr unsigned long kMaxReprAlign = 1UL << 29;

// Decimal argument of packed(N) or align(N).
bool ParseReprArgument(const std::string& text, unsigned* out) {
  if (text.empty() || text.size() > 10 ||
      !std::all_of(text.begin(), text.end(),
                   [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
    return false;
  }
  const unsigned long value = std::strtoul(text.c_str(), nullptr, 10);
  if (value > kMaxReprAlign) {
    return false;
  }
  *out = static_cast<unsigned>(value);
  return true;
}

const std::vector<std::string>& IntegerSuffixes() {
  static const std::vector<std::string> kSuffixes = {
      "usize", "isize", "u128", "i128", "u16", "u32", "u64", "i16", "i32", "i64", "u8", "i8",
  };
  return kSuffixes;
}

bool ParseIntLiteral(std::string_view raw, IRExpr* out, std::string* error) {
  std::string text;
  for (char c : raw) {
    if (c != '_') {
      text.push_back(c);
    }
  }
  std::string suffix;
  for (const std::string& candidate : IntegerSuffixes()) {
    if (text.size() > candidate.size() && EndsWith(text, candidate)) {
      suffix = candidate;
      text.resize(text.size() - candidate.size());
      break;
    }
  }

  std::string digits = text;
  int radix = 10;
  if (StartsWith(text, "0x") || StartsWith(text, "0X")) {
    radix = 16;
    digits = text.substr(2);
  } else if (StartsWith(text, "0o")) {
    radix = 8;
    digits = text.substr(2);
  } else if (StartsWith(text, "0b")) {
    radix = 2;
    digits = text.substr(2);
  }
  if (digits.empty()) {
    *error = "malformed integer literal: " + std::string(raw);
    return false;
  }
  for (char c : digits) {
    const bool ok = radix == 16   ? std::isxdigit(static_cast<unsigned char>(c)) != 0
                    : radix == 10 ? std::isdigit(static_cast<unsigned char>(c)) != 0
                    : radix == 8  ? (c >= '0' && c <= '7')
                                  : (c == '0' || c == '1');
    if (!ok) {
      *error = "malformed integer literal: " + std::string(raw);
      return false;
    }
  }
  *out = MakeIntExpr(text, suffix);
  return true;
}

struct UseTreeParser {
  std::string_view text;
  std::size_t pos = 0;

  void SkipSpace() {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
      ++pos;
    }
  }

  bool Consume(std::string_view token) {
    SkipSpace();
    if (text.substr(pos, token.size()) == token) {
      pos += token.size();
      return true;
    }
    return false;
  }

  std::string Ident() {
    SkipSpace();
    const std::size_t start = pos;
    while (pos < text.size() &&
           (std::isalnum(static_cast<unsigned char>(text[pos])) != 0 || text[pos] == '_')) {
      ++pos;
    }
    return std::string(text.substr(start, pos - start));
  }

  bool Tree(const std::string& prefix, std::vector<IRImport>* out, std::string* error) {
    if (Consume("{")) {
      while (true) {
        if (Consume("}")) {
          return true;
        }
        if (!Tree(prefix, out, error)) {
          return false;
        }
        if (Consume(",")) {
          continue;
        }
        if (Consume("}")) {
          return true;
        }
        *error = "expected ',' or '}' in use tree";
        return false;
      }
    }
    if (Consume("*")) {
      IRImport import;
      import.target = prefix;
      import.is_glob = true;
      out->push_back(std::move(import));
      return true;
    }

    const std::string ident = Ident();
    if (ident.empty()) {
      *error = "expected identifier in use tree";
      return false;
    }
    if (Consume("::")) {
      return Tree(JoinPath(prefix, ident), out, error);
    }

    IRImport import;
    if (ident == "self") {
      import.target = prefix;
      import.local_name = LastSegment(prefix);
    } else {
      import.target = JoinPath(prefix, ident);
      import.local_name = ident;
    }
    SkipSpace();
    if (text.substr(pos, 2) == "as") {
      pos += 2;
      import.local_name = Ident();
      if (import.local_name.empty()) {
        *error = "expected identifier after 'as'";
        return false;
      }
    }
    if (import.target.empty()) {
      *error = "empty use path";
      return false;
    }
    out->push_back(std::move(import));
    return true;
  }
};

struct CfgParser {
  std::string_view text;
  const ExpandOptions& options;
  std::size_t pos = 0;

  void SkipSpace() {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
      ++pos;
    }
  }

  bool Peek(char c) {
    SkipSpace();
    return pos < text.size() && text[pos] == c;
  }

  std::string Ident() {
    SkipSpace();
    const std::size_t start = pos;
    while (pos < text.size() &&
           (std::isalnum(static_cast<unsigned char>(text[pos])) != 0 || text[pos] == '_')) {
      ++pos;
    }
    return std::string(text.substr(start, pos - start));
  }

  bool StringLit(std::string* out) {
    SkipSpace();
    if (pos >= text.size() || text[pos] != '"') {
      return false;
    }
    const std::size_t end = text.find('"', pos + 1);
    if (end == std::string_view::npos) {
      return false;
    }
    *out = std::string(text.substr(pos + 1, end - pos - 1));
    pos = end + 1;
    return true;
  }

  bool List(std::vector<bool>* values, std::string* error) {
    if (!Peek('(')) {
      *error = "expected '(' in cfg predicate";
      return false;
    }
    ++pos;
    while (!Peek(')')) {
      bool value = false;
      if (!Predicate(&value, error)) {
        return false;
      }
      values->push_back(value);
      if (Peek(',')) {
        ++pos;
      } else if (!Peek(')')) {
        *error = "expected ',' or ')' in cfg predicate";
        return false;
      }
    }
    ++pos;
    return true;
  }

  bool KeyMatches(const std::string& key, const std::string& value) const {
    if (key == "target_arch") {
      return value == options.target_arch;
    }
    if (key == "target_os") {
      return value == options.target_os;
    }
    if (key == "target_env") {
      return value == options.target_env;
    }
    if (key == "target_pointer_width") {
      return value == std::to_string(options.pointer_width);
    }
    if (key == "feature") {
      return options.all_features || options.features.count(value) != 0;
    }
    return false;
  }

  bool Predicate(bool* value, std::string* error) {
    const std::string ident = Ident();
    if (ident.empty()) {
      *error = "expected identifier in cfg predicate";
      return false;
    }
    if (ident == "all" || ident == "any" || ident == "not") {
      std::vector<bool> values;
      if (!List(&values, error)) {
        return false;
      }
      if (ident == "not") {
        if (values.size() != 1) {
          *error = "cfg not() takes exactly one predicate";
          return false;
        }
        *value = !values[0];
      } else if (ident == "all") {
        *value = std::all_of(values.begin(), values.end(), [](bool v) { return v; });
      } else {
        *value = std::any_of(values.begin(), values.end(), [](bool v) { return v; });
      }
      return true;
    }
    if (Peek('=')) {
      ++pos;
      std::string literal;
      if (!StringLit(&literal)) {
        *error = "expected string literal after '=' in cfg predicate";
        return false;
      }
      *value = KeyMatches(ident, literal);
      return true;
    }
    if (ident == "windows") {
      *value = options.target_os == "windows";
    } else if (ident == "unix") {
      *value = options.target_os != "windows";
    } else {
      // Unknown configuration names are unset, as in rustc.
      *value = false;
    }
    return true;
  }
};

class Expander {
 public:
  Expander(const SourceFile& file, const ExpandOptions& options, DiagnosticsCollector* diags)
      : file_(file), options_(options), diags_(diags) {}

  std::vector<IRModule> Run() {
    std::string module_path = TrimCopy(file_.root.text);
    if (module_path.empty()) {
      module_path = ModulePathFromFile(file_.path);
    }
    std::vector<IRModule> modules;
    ExpandModule(file_.root, module_path, &modules);
    return modules;
  }

 private:
  SourceLocation Loc(const Node& node) const {
    return SourceLocation{file_.path, node.line, node.column};
  }

  static std::string ModulePathFromFile(std::string_view path) {
    std::string p(path);
    const std::size_t dot = p.find_last_of('.');
    const std::size_t slash = p.find_last_of("/\\");
    if (dot != std::string::npos && (slash == std::string::npos || dot > slash)) {
      p.resize(dot);
    }
    std::string out;
    for (char c : p) {
      if (c == '/' || c == '\\') {
        if (!out.empty()) {
          out += "::";
        }
      } else {
        out.push_back(c);
      }
    }
    return out;
  }

  void Unsupported(std::string_view qualified_name, const Node& node, std::string message) {
    diags_->Report(codes::kUnsupportedConstruct, DiagnosticSeverity::kError, qualified_name,
                   Loc(node), std::move(message), "item skipped");
  }

  void Malformed(std::string_view qualified_name, const Node& node, std::string message) {
    diags_->Report(codes::kMalformedMacro, DiagnosticSeverity::kError, qualified_name,
                   Loc(node), std::move(message), "item skipped");
  }

  static bool IsPublic(const Node& item) {
    for (const Node* attr : ChildrenByKind(item, "Attr")) {
      if (attr->text == "pub" || StartsWith(attr->text, "pub(")) {
        return true;
      }
    }
    return false;
  }

  // Returns false when a cfg attribute disables the item. Malformed cfg
  // predicates are reported and also disable it.
  bool CfgEnabled(const Node& item, std::string_view qualified_name) {
    for (const Node* attr : ChildrenByKind(item, "Attr")) {
      std::string name;
      std::string args;
      if (!SplitCall(attr->text, &name, &args) || name != "cfg") {
        continue;
      }
      bool value = false;
      std::string error;
      if (!EvaluateCfg(args, options_, &value, &error)) {
        Unsupported(qualified_name, *attr, "unsupported cfg predicate: " + error);
        return false;
      }
      if (!value) {
        return false;
      }
    }
    return true;
  }

  void WarnUnknownAttributes(const Node& item, std::string_view qualified_name) {
    static const std::vector<std::string> kKnown = {
        "pub", "repr", "cfg", "link", "link_name", "doc", "allow", "derive", "inline",
        "deprecated", "must_use", "non_exhaustive",
    };
    for (const Node* attr : ChildrenByKind(item, "Attr")) {
      std::string name;
      std::string args;
      SplitCall(attr->text, &name, &args);
      const std::size_t eq = name.find('=');
      if (eq != std::string::npos) {
        name = TrimCopy(name.substr(0, eq));
      }
      if (StartsWith(name, "pub")) {
        continue;
      }
      if (std::find(kKnown.begin(), kKnown.end(), name) == kKnown.end()) {
        diags_->Report(codes::kUnsupportedConstruct, DiagnosticSeverity::kWarning,
                       qualified_name, Loc(*attr), "attribute ignored: #[" + attr->text + "]");
      }
    }
  }

  // Folds every repr(...) attribute of `item` into `layout`. Integer reprs
  // are returned through `int_repr` for enums.
  void ParseRepr(const Node& item, LayoutSpec* layout, std::string* int_repr) {
    bool saw_c = false;
    bool saw_transparent = false;
    std::vector<unsigned> packs;
    std::vector<unsigned> aligns;
    std::vector<std::string> unknown;
    std::vector<std::string> malformed;

    for (const Node* attr : ChildrenByKind(item, "Attr")) {
      std::string name;
      std::string args;
      if (!SplitCall(attr->text, &name, &args) || name != "repr") {
        continue;
      }
      for (const std::string& arg : SplitTopLevel(args, ',')) {
        std::string arg_name;
        std::string arg_value;
        if (!SplitCall(arg, &arg_name, &arg_value)) {
          unknown.push_back(arg);
          continue;
        }
        if (arg_name == "C") {
          saw_c = true;
        } else if (arg_name == "Rust") {
          continue;
        } else if (arg_name == "transparent") {
          saw_transparent = true;
        } else if (arg_name == "packed") {
          const std::string value = TrimCopy(arg_value);
          unsigned pack = 1;
          if (!value.empty() && !ParseReprArgument(value, &pack)) {
            malformed.push_back(TrimCopy(arg));
            continue;
          }
          packs.push_back(pack);
        } else if (arg_name == "align") {
          unsigned align = 0;
          if (!ParseReprArgument(TrimCopy(arg_value), &align)) {
            malformed.push_back(TrimCopy(arg));
            continue;
          }
          aligns.push_back(align);
        } else if (std::find(IntegerSuffixes().begin(), IntegerSuffixes().end(), arg_name) !=
                   IntegerSuffixes().end()) {
          if (int_repr != nullptr) {
            *int_repr = arg_name;
          } else {
            unknown.push_back(arg);
          }
        } else {
          unknown.push_back(arg);
        }
      }
    }

    auto add_ambiguity = [&](const std::string& why) {
      layout->ambiguous = true;
      if (!layout->ambiguity.empty()) {
        layout->ambiguity += "; ";
      }
      layout->ambiguity += why;
    };

    if (saw_c || saw_transparent || !packs.empty() || !aligns.empty() || !malformed.empty() ||
        (int_repr != nullptr && !int_repr->empty())) {
      layout->explicit_native = true;
    }
    if (saw_c && layout->mode == LayoutMode::kDefault) {
      layout->mode = LayoutMode::kCCompatible;
    }
    if (saw_transparent) {
      if (saw_c || !packs.empty() || !aligns.empty()) {
        add_ambiguity("transparent combined with other layout attributes");
      }
      layout->mode = LayoutMode::kTransparent;
    }
    for (unsigned align : aligns) {
      if (align == 0 || (align & (align - 1)) != 0) {
        add_ambiguity("align(" + std::to_string(align) + ") is not a power of two");
        continue;
      }
      if (layout->align != 0 && layout->align != align) {
        add_ambiguity("conflicting align values");
      }
      layout->align = std::max(layout->align, align);
      if (layout->mode != LayoutMode::kTransparent) {
        layout->mode = LayoutMode::kAligned;
      }
    }
    for (unsigned pack : packs) {
      if (pack == 0 || (pack & (pack - 1)) != 0) {
        add_ambiguity("packed(" + std::to_string(pack) + ") is not a power of two");
        continue;
      }
      if (layout->pack != 0 && layout->pack != pack) {
        add_ambiguity("conflicting packed values");
      }
      layout->pack = layout->pack == 0 ? pack : std::min(layout->pack, pack);
      if (layout->mode != LayoutMode::kTransparent) {
        layout->mode = LayoutMode::kPacked;
      }
    }
    if (layout->pack != 0 && layout->align != 0) {
      add_ambiguity("packed combined with align");
    }
    for (const std::string& arg : unknown) {
      add_ambiguity("unknown repr argument '" + arg + "'");
    }
    for (const std::string& arg : malformed) {
      add_ambiguity("malformed repr argument '" + arg + "'");
    }
  }

  bool ConvertExpr(const Node& node, IRExpr* out, std::string* error) {
    if (node.kind == "IntLit" || node.kind == "Lit") {
      if (node.text == "true" || node.text == "false") {
        out->kind = IRExpr::Kind::kBool;
        out->text = node.text;
        return true;
      }
      if (!node.text.empty() && (node.text.find('.') != std::string::npos ||
                                 EndsWith(node.text, "f32") || EndsWith(node.text, "f64")) &&
          !StartsWith(node.text, "0x")) {
        return ConvertFloat(node.text, out);
      }
      return ParseIntLiteral(node.text, out, error);
    }
    if (node.kind == "FloatLit") {
      return ConvertFloat(node.text, out);
    }
    if (node.kind == "BoolLit") {
      if (node.text != "true" && node.text != "false") {
        *error = "malformed bool literal: " + node.text;
        return false;
      }
      out->kind = IRExpr::Kind::kBool;
      out->text = node.text;
      return true;
    }
    if (node.kind == "StrLit") {
      out->kind = IRExpr::Kind::kString;
      out->text = node.text;
      return true;
    }
    if (node.kind == "PathExpr") {
      if (node.text.empty()) {
        *error = "empty path expression";
        return false;
      }
      out->kind = IRExpr::Kind::kPath;
      out->text = node.text;
      return true;
    }
    if (node.kind == "Paren") {
      if (node.children.size() != 1) {
        *error = "parenthesized expression needs exactly one operand";
        return false;
      }
      return ConvertExpr(node.children[0], out, error);
    }
    if (node.kind == "Unary") {
      if (node.children.size() != 1 || (node.text != "-" && node.text != "!")) {
        *error = "unsupported unary expression '" + node.text + "'";
        return false;
      }
      out->kind = IRExpr::Kind::kUnary;
      out->text = node.text;
      out->children.resize(1);
      return ConvertExpr(node.children[0], &out->children[0], error);
    }
    if (node.kind == "Binary") {
      static const std::vector<std::string> kOps = {"|", "&", "^", "<<", ">>", "+",
                                                    "-", "*", "/", "%"};
      if (node.children.size() != 2 ||
          std::find(kOps.begin(), kOps.end(), node.text) == kOps.end()) {
        *error = "unsupported binary expression '" + node.text + "'";
        return false;
      }
      out->kind = IRExpr::Kind::kBinary;
      out->text = node.text;
      out->children.resize(2);
      return ConvertExpr(node.children[0], &out->children[0], error) &&
             ConvertExpr(node.children[1], &out->children[1], error);
    }
    if (node.kind == "Cast") {
      if (node.children.size() != 2) {
        *error = "cast needs an operand and a type";
        return false;
      }
      out->kind = IRExpr::Kind::kCast;
      out->children.resize(1);
      out->cast_type.resize(1);
      return ConvertExpr(node.children[0], &out->children[0], error) &&
             ConvertType(node.children[1], &out->cast_type[0], error);
    }
    if (node.kind == "ArrayLit") {
      out->kind = IRExpr::Kind::kArray;
      for (const Node& child : node.children) {
        IRExpr element;
        if (!ConvertExpr(child, &element, error)) {
          return false;
        }
        out->children.push_back(std::move(element));
      }
      return true;
    }
    if (node.kind == "StructLit") {
      out->kind = IRExpr::Kind::kStruct;
      out->text = node.text;
      for (const Node& child : node.children) {
        if (child.kind != "FieldInit" || child.children.size() != 1) {
          *error = "struct literal expects FieldInit children";
          return false;
        }
        IRExpr value;
        if (!ConvertExpr(child.children[0], &value, error)) {
          return false;
        }
        out->field_names.push_back(child.text);
        out->children.push_back(std::move(value));
      }
      return true;
    }
    *error = "unsupported expression node " + node.kind;
    return false;
  }

  static bool ConvertFloat(const std::string& text, IRExpr* out) {
    std::string value;
    for (char c : text) {
      if (c != '_') {
        value.push_back(c);
      }
    }
    if (EndsWith(value, "f32") || EndsWith(value, "f64")) {
      out->suffix = value.substr(value.size() - 3);
      value.resize(value.size() - 3);
    }
    out->kind = IRExpr::Kind::kFloat;
    out->text = value;
    return true;
  }

  bool ConvertFnPtr(const Node& node, IRType* out, std::string* error) {
    out->kind = IRType::Kind::kFunctionPointer;
    out->calling_convention = node.text.empty() ? "Rust" : TrimCopy(node.text);
    IRType ret = MakePrimitive(PrimitiveKind::kVoid);
    if (const Node* ret_node = FindChildByKind(node, "Return")) {
      if (ret_node->children.size() != 1) {
        *error = "return clause needs exactly one type";
        return false;
      }
      if (!ConvertType(ret_node->children[0], &ret, error)) {
        return false;
      }
    }
    out->children.push_back(std::move(ret));
    std::size_t index = 0;
    for (const Node* param : ChildrenByKind(node, "Param")) {
      if (param->children.size() != 1) {
        *error = "parameter " + param->text + " needs exactly one type";
        return false;
      }
      IRType param_type;
      if (!ConvertType(param->children[0], &param_type, error)) {
        return false;
      }
      out->param_names.push_back(ParamName(param->text, index));
      out->children.push_back(std::move(param_type));
      ++index;
    }
    out->is_variadic = FindChildByKind(node, "Variadic") != nullptr;
    return true;
  }

  static std::string ParamName(const std::string& text, std::size_t index) {
    const std::string name = TrimCopy(text);
    if (name.empty() || name == "_") {
      return "arg" + std::to_string(index);
    }
    return name;
  }

  bool ConvertType(const Node& node, IRType* out, std::string* error) {
    if (node.kind == "Path") {
      const std::string path = TrimCopy(node.text);
      const std::vector<const Node*> generics = ChildrenByKind(node, "GenericArg");
      if (generics.empty()) {
        if (path == "char" || path == "str") {
          *error = "type '" + path + "' has no FFI-safe representation";
          return false;
        }
        if (LookupBuiltinPrimitive(path, out)) {
          return true;
        }
        *out = MakePath(path);
        return true;
      }
      std::vector<IRType> args;
      for (const Node* generic : generics) {
        if (generic->children.size() != 1) {
          *error = "generic argument needs exactly one type";
          return false;
        }
        IRType arg;
        if (!ConvertType(generic->children[0], &arg, error)) {
          return false;
        }
        args.push_back(std::move(arg));
      }
      if (LastSegment(path) == "Option" && args.size() == 1) {
        if (args[0].kind == IRType::Kind::kFunctionPointer) {
          *out = std::move(args[0]);
          out->is_nullable = true;
          return true;
        }
        if (args[0].kind == IRType::Kind::kPointer) {
          *out = std::move(args[0]);
          return true;
        }
      }
      *out = MakePath(path);
      out->children = std::move(args);
      return true;
    }
    if (node.kind == "Ptr") {
      if (node.children.size() != 1 || (node.text != "mut" && node.text != "const")) {
        *error = "raw pointer needs 'mut' or 'const' and one pointee";
        return false;
      }
      IRType pointee;
      if (!ConvertType(node.children[0], &pointee, error)) {
        return false;
      }
      *out = MakePointer(std::move(pointee), node.text == "mut");
      return true;
    }
    if (node.kind == "Array") {
      if (node.children.size() != 2) {
        *error = "array type needs an element type and a length";
        return false;
      }
      IRType element;
      IRExpr length;
      if (!ConvertType(node.children[0], &element, error) ||
          !ConvertExpr(node.children[1], &length, error)) {
        return false;
      }
      *out = MakeArray(std::move(element), std::move(length));
      return true;
    }
    if (node.kind == "FnPtr") {
      return ConvertFnPtr(node, out, error);
    }
    if (node.kind == "Tuple") {
      if (!node.children.empty()) {
        *error = "tuple types have no FFI-safe representation";
        return false;
      }
      *out = MakePrimitive(PrimitiveKind::kVoid);
      return true;
    }
    if (node.kind == "Ref") {
      *error = "references are not FFI declarations; use a raw pointer";
      return false;
    }
    *error = "unsupported type node " + node.kind;
    return false;
  }

  void ExpandModule(const Node& container, const std::string& module_path,
                    std::vector<IRModule>* out) {
    const std::size_t index = out->size();
    out->emplace_back();
    (*out)[index].path = module_path;
    (*out)[index].file = file_.path;
    (*out)[index].location = Loc(container);

    for (const Node& item : container.children) {
      if (item.kind == "Attr") {
        continue;
      }
      // Nested modules append to `out`, so the module is re-fetched by index.
      ExpandItem(item, index, out);
    }
  }

  IRModule& ModuleAt(std::vector<IRModule>* modules, std::size_t index) {
    return (*modules)[index];
  }

  void ExpandItem(const Node& item, std::size_t module_index, std::vector<IRModule>* modules) {
    const std::string module_path = ModuleAt(modules, module_index).path;
    const std::string qualified =
        item.text.empty() || item.kind == "Use" || item.kind == "ForeignMod"
            ? ""
            : JoinPath(module_path, item.kind == "Macro" ? MacroItemName(item) : item.text);
    if (!CfgEnabled(item, qualified)) {
      return;
    }
    WarnUnknownAttributes(item, qualified);

    std::vector<IRDecl> decls;
    if (item.kind == "Struct" || item.kind == "Union") {
      IRDecl decl;
      if (ExpandAggregate(item, module_path, item.kind == "Struct" ? "struct" : "union", false,
                          &decl)) {
        decls.push_back(std::move(decl));
      }
    } else if (item.kind == "Enum") {
      IRDecl decl;
      if (ExpandEnum(item, module_path, false, &decl)) {
        decls.push_back(std::move(decl));
      }
    } else if (item.kind == "Const") {
      IRDecl decl;
      if (ExpandConst(item, module_path, &decl)) {
        decls.push_back(std::move(decl));
      }
    } else if (item.kind == "TypeAlias") {
      IRDecl decl;
      if (ExpandTypeAlias(item, module_path, &decl)) {
        decls.push_back(std::move(decl));
      }
    } else if (item.kind == "ForeignMod") {
      ExpandForeignMod(item, module_path, &decls);
    } else if (item.kind == "Use") {
      ExpandUse(item, &ModuleAt(modules, module_index));
    } else if (item.kind == "Mod") {
      const std::string name = TrimCopy(item.text);
      if (!IsIdentifier(name)) {
        Unsupported(qualified, item, "module item without a valid name");
        return;
      }
      IRDecl decl;
      decl.kind = IRDecl::Kind::kModule;
      decl.module_path = module_path;
      decl.name = name;
      decl.is_public = IsPublic(item);
      decl.location = Loc(item);
      decl.origin = "mod";
      decls.push_back(std::move(decl));
      ModuleAt(modules, module_index).child_modules.push_back(JoinPath(module_path, name));
      if (!PayloadChildren(item).empty()) {
        ExpandModule(item, JoinPath(module_path, name), modules);
      }
    } else if (item.kind == "Macro") {
      ExpandMacro(item, module_path, &decls);
    } else if (item.kind == "Fn") {
      Unsupported(qualified, item, "function definitions with bodies are not translated");
    } else if (item.kind == "Static" || item.kind == "ForeignStatic") {
      Unsupported(qualified, item, "static items are not translated");
    } else {
      Unsupported(qualified, item, "unsupported item kind " + item.kind);
    }

    IRModule& module = ModuleAt(modules, module_index);
    for (IRDecl& decl : decls) {
      std::string error;
      if (!ValidateDecl(decl, &error)) {
        Unsupported(decl.QualifiedName(), item, "invalid declaration: " + error);
        continue;
      }
      module.decls.push_back(std::move(decl));
    }
  }

  static std::string MacroItemName(const Node& item) {
    for (const Node& child : item.children) {
      if (child.kind == "Ident") {
        return child.text;
      }
      if ((child.kind == "Struct" || child.kind == "Union" || child.kind == "Enum") &&
          !child.text.empty()) {
        return child.text;
      }
    }
    return "";
  }

  bool ExpandAggregate(const Node& item, const std::string& module_path,
                       std::string_view origin, bool from_macro, IRDecl* decl) {
    decl->kind = item.kind == "Union" ? IRDecl::Kind::kUnion : IRDecl::Kind::kStruct;
    decl->module_path = module_path;
    decl->name = TrimCopy(item.text);
    decl->is_public = from_macro || IsPublic(item);
    decl->location = Loc(item);
    decl->origin = std::string(origin);
    const std::string qualified = decl->QualifiedName();

    if (FindChildByKind(item, "Generic") != nullptr) {
      Unsupported(qualified, item,
                  "generic " + std::string(origin) + " declarations are not FFI types");
      return false;
    }

    ParseRepr(item, &decl->layout, nullptr);
    if (from_macro) {
      decl->layout.explicit_native = true;
      if (decl->layout.mode == LayoutMode::kDefault) {
        decl->layout.mode = LayoutMode::kCCompatible;
      }
    }

    std::size_t index = 0;
    for (const Node* field_node : ChildrenByKind(item, "Field")) {
      if (field_node->children.size() != 1) {
        Malformed(qualified, *field_node, "field " + field_node->text + " needs exactly one type");
        return false;
      }
      IRField field;
      field.name = TrimCopy(field_node->text);
      if (field.name.empty()) {
        field.name = std::to_string(index);
      }
      field.location = Loc(*field_node);
      std::string error;
      if (!ConvertType(field_node->children[0], &field.type, &error)) {
        Unsupported(qualified, *field_node, "field " + field.name + ": " + error);
        return false;
      }
      decl->fields.push_back(std::move(field));
      ++index;
    }

    if (decl->fields.empty() && decl->kind == IRDecl::Kind::kStruct) {
      decl->is_opaque = true;
    }
    if (decl->layout.mode == LayoutMode::kTransparent && decl->fields.size() != 1) {
      decl->layout.ambiguous = true;
      decl->layout.ambiguity = "transparent requires exactly one field";
    }
    return true;
  }

  bool ExpandEnum(const Node& item, const std::string& module_path, bool c_like, IRDecl* decl) {
    decl->module_path = module_path;
    decl->name = TrimCopy(item.text);
    decl->is_public = c_like || IsPublic(item);
    decl->location = Loc(item);
    const std::string qualified = decl->QualifiedName();

    const std::vector<const Node*> variants = ChildrenByKind(item, "Variant");
    if (variants.empty() && !c_like) {
      // `enum X {}` is the classic opaque FFI type.
      decl->kind = IRDecl::Kind::kStruct;
      decl->origin = "enum {}";
      decl->is_opaque = true;
      return true;
    }

    decl->kind = IRDecl::Kind::kEnum;
    decl->enum_style = c_like ? IRDecl::EnumStyle::kCLike : IRDecl::EnumStyle::kTagged;
    decl->origin = c_like ? "ENUM!" : "enum";

    std::string int_repr;
    ParseRepr(item, &decl->layout, &int_repr);
    if (decl->layout.mode != LayoutMode::kDefault &&
        decl->layout.mode != LayoutMode::kCCompatible) {
      decl->layout.ambiguous = true;
      decl->layout.ambiguity = "layout attributes other than an integer repr on an enum";
    }
    if (!int_repr.empty()) {
      LookupBuiltinPrimitive(int_repr, &decl->discriminant_type);
    } else if (c_like) {
      decl->discriminant_type = MakePrimitive(PrimitiveKind::kInt, 32, false);
      decl->layout.explicit_native = true;
    } else {
      // repr(C) and the unannotated case both use the C `int` width.
      decl->discriminant_type = MakePrimitive(PrimitiveKind::kInt, 32, true);
    }

    for (const Node* variant_node : variants) {
      if (FindChildByKind(*variant_node, "Field") != nullptr) {
        Unsupported(qualified, *variant_node,
                    "enum variant " + variant_node->text + " carries data; only fieldless enums "
                    "have a C representation");
        return false;
      }
      IRVariant variant;
      variant.name = TrimCopy(variant_node->text);
      const std::vector<const Node*> payload = PayloadChildren(*variant_node);
      if (!payload.empty()) {
        std::string error;
        if (!ConvertExpr(*payload[0], &variant.value, &error)) {
          Unsupported(qualified, *variant_node, "variant " + variant.name + ": " + error);
          return false;
        }
        variant.has_value = true;
      }
      decl->variants.push_back(std::move(variant));
    }
    return true;
  }

  bool ExpandConst(const Node& item, const std::string& module_path, IRDecl* decl) {
    decl->kind = IRDecl::Kind::kConstant;
    decl->module_path = module_path;
    decl->name = TrimCopy(item.text);
    decl->is_public = IsPublic(item);
    decl->location = Loc(item);
    decl->origin = "const";
    const std::string qualified = decl->QualifiedName();

    const std::vector<const Node*> payload = PayloadChildren(item);
    if (payload.size() != 2) {
      Malformed(qualified, item, "const item needs a type and a value");
      return false;
    }
    std::string error;
    if (!ConvertType(*payload[0], &decl->const_type, &error)) {
      Unsupported(qualified, item, error);
      return false;
    }
    if (!ConvertExpr(*payload[1], &decl->value, &error)) {
      Unsupported(qualified, item, error);
      return false;
    }
    return true;
  }

  bool ExpandTypeAlias(const Node& item, const std::string& module_path, IRDecl* decl) {
    decl->kind = IRDecl::Kind::kTypeAlias;
    decl->module_path = module_path;
    decl->name = TrimCopy(item.text);
    decl->is_public = IsPublic(item);
    decl->location = Loc(item);
    decl->origin = "type";
    const std::string qualified = decl->QualifiedName();

    if (FindChildByKind(item, "Generic") != nullptr) {
      Unsupported(qualified, item, "generic type aliases are not FFI types");
      return false;
    }
    const std::vector<const Node*> payload = PayloadChildren(item);
    if (payload.size() != 1) {
      Malformed(qualified, item, "type alias needs exactly one aliased type");
      return false;
    }
    std::string error;
    if (!ConvertType(*payload[0], &decl->aliased, &error)) {
      Unsupported(qualified, item, error);
      return false;
    }
    return true;
  }

  void ExpandForeignMod(const Node& item, const std::string& module_path,
                        std::vector<IRDecl>* decls) {
    const std::string abi = TrimCopy(item.text).empty() ? "C" : TrimCopy(item.text);
    std::string library = options_.default_library;
    for (const Node* attr : ChildrenByKind(item, "Attr")) {
      std::string name;
      std::string args;
      if (!SplitCall(attr->text, &name, &args) || name != "link") {
        continue;
      }
      for (const std::string& arg : SplitTopLevel(args, ',')) {
        std::string key;
        std::string value;
        if (ParseKeyValue(arg, &key, &value) && key == "name") {
          library = value;
        }
      }
    }

    for (const Node& child : item.children) {
      if (child.kind == "Attr") {
        continue;
      }
      const std::string qualified = JoinPath(module_path, child.text);
      if (!CfgEnabled(child, qualified)) {
        continue;
      }
      if (child.kind != "ForeignFn") {
        Unsupported(qualified, child, "unsupported foreign item " + child.kind);
        continue;
      }
      WarnUnknownAttributes(child, qualified);

      IRDecl decl;
      decl.kind = IRDecl::Kind::kFunction;
      decl.module_path = module_path;
      decl.name = TrimCopy(child.text);
      decl.is_public = IsPublic(child);
      decl.location = Loc(child);
      decl.origin = "extern";
      decl.calling_convention = abi;
      decl.library = library;
      decl.linkage_name = decl.name;
      for (const Node* attr : ChildrenByKind(child, "Attr")) {
        std::string key;
        std::string value;
        if (ParseKeyValue(attr->text, &key, &value) && key == "link_name") {
          decl.linkage_name = value;
        }
      }

      IRType fn_type;
      std::string error;
      if (!ConvertFnPtr(child, &fn_type, &error)) {
        Unsupported(qualified, child, error);
        continue;
      }
      decl.return_type = fn_type.children[0];
      for (std::size_t i = 1; i < fn_type.children.size(); ++i) {
        IRField param;
        param.name = fn_type.param_names[i - 1];
        param.type = fn_type.children[i];
        decl.params.push_back(std::move(param));
      }
      decl.is_variadic = fn_type.is_variadic;
      decls->push_back(std::move(decl));
    }
  }

  void ExpandUse(const Node& item, IRModule* module) {
    std::vector<IRImport> imports;
    std::string error;
    if (!ExpandUseTree(item.text, module->path, &imports, &error)) {
      Unsupported("", item, "use " + item.text + ": " + error);
      return;
    }
    const bool is_public = IsPublic(item);
    for (IRImport& import : imports) {
      import.is_public = is_public;
      import.location = Loc(item);
      module->imports.push_back(std::move(import));
    }
  }

  std::vector<const Node*> MacroIdents(const Node& item) {
    return ChildrenByKind(item, "Ident");
  }

  void ExpandMacro(const Node& item, const std::string& module_path,
                   std::vector<IRDecl>* decls) {
    const std::string macro = TrimCopy(item.text);
    const std::string name = MacroItemName(item);
    const std::string qualified = name.empty() ? "" : JoinPath(module_path, name);

    if (macro == "STRUCT" || macro == "UNION") {
      const Node* body = FindChildByKind(item, macro == "STRUCT" ? "Struct" : "Union");
      if (body == nullptr) {
        Malformed(qualified, item, macro + "! body is not a " +
                                       (macro == "STRUCT" ? "struct" : "union") + " item");
        return;
      }
      IRDecl decl;
      if (ExpandAggregate(*body, module_path, macro + "!", true, &decl)) {
        decls->push_back(std::move(decl));
      }
      return;
    }

    if (macro == "ENUM") {
      const Node* body = FindChildByKind(item, "Enum");
      if (body == nullptr || ChildrenByKind(*body, "Variant").empty()) {
        Malformed(qualified, item, "ENUM! body is not an enum with variants");
        return;
      }
      IRDecl decl;
      if (ExpandEnum(*body, module_path, true, &decl)) {
        decls->push_back(std::move(decl));
      }
      return;
    }

    if (macro == "DEFINE_GUID") {
      ExpandGuid(item, module_path, qualified, decls);
      return;
    }

    if (macro == "DECLARE_HANDLE") {
      const std::vector<const Node*> idents = MacroIdents(item);
      if (idents.size() != 2 || !IsIdentifier(idents[0]->text) ||
          !IsIdentifier(idents[1]->text)) {
        Malformed(qualified, item, "DECLARE_HANDLE! expects a handle name and an opaque name");
        return;
      }
      IRDecl opaque;
      opaque.kind = IRDecl::Kind::kStruct;
      opaque.module_path = module_path;
      opaque.name = idents[1]->text;
      opaque.is_public = true;
      opaque.location = Loc(*idents[1]);
      opaque.origin = "DECLARE_HANDLE!";
      opaque.is_opaque = true;
      opaque.layout.mode = LayoutMode::kCCompatible;
      opaque.layout.explicit_native = true;

      IRDecl handle;
      handle.kind = IRDecl::Kind::kTypeAlias;
      handle.module_path = module_path;
      handle.name = idents[0]->text;
      handle.is_public = true;
      handle.location = Loc(*idents[0]);
      handle.origin = "DECLARE_HANDLE!";
      handle.aliased = MakePointer(MakePath(opaque.name), true);

      decls->push_back(std::move(opaque));
      decls->push_back(std::move(handle));
      return;
    }

    if (macro == "FN") {
      const std::vector<const Node*> idents = MacroIdents(item);
      const Node* fn = FindChildByKind(item, "FnPtr");
      if (idents.size() != 1 || fn == nullptr) {
        Malformed(qualified, item, "FN! expects a name and a function signature");
        return;
      }
      IRDecl decl;
      decl.kind = IRDecl::Kind::kTypeAlias;
      decl.module_path = module_path;
      decl.name = idents[0]->text;
      decl.is_public = true;
      decl.location = Loc(item);
      decl.origin = "FN!";
      std::string error;
      if (!ConvertFnPtr(*fn, &decl.aliased, &error)) {
        Unsupported(qualified, item, error);
        return;
      }
      decl.aliased.is_nullable = true;
      decls->push_back(std::move(decl));
      return;
    }

    if (macro == "BITFLAGS") {
      ExpandBitflags(item, module_path, qualified, decls);
      return;
    }

    Unsupported(qualified, item, "unrecognized declaration macro " + macro + "!");
  }

  void ExpandGuid(const Node& item, const std::string& module_path, const std::string& qualified,
                  std::vector<IRDecl>* decls) {
    const std::vector<const Node*> payload = PayloadChildren(item);
    if (payload.size() != 12 || payload[0]->kind != "Ident") {
      Malformed(qualified, item,
                "DEFINE_GUID! expects a name followed by 11 integer components, got " +
                    std::to_string(payload.empty() ? 0 : payload.size() - 1));
      return;
    }
    std::vector<IRExpr> parts;
    for (std::size_t i = 1; i < payload.size(); ++i) {
      IRExpr part;
      std::string error;
      if (!ConvertExpr(*payload[i], &part, &error) || part.kind != IRExpr::Kind::kInt) {
        Malformed(qualified, *payload[i], "DEFINE_GUID! component " + std::to_string(i) +
                                              " is not an integer literal");
        return;
      }
      parts.push_back(std::move(part));
    }

    IRExpr data4;
    data4.kind = IRExpr::Kind::kArray;
    for (std::size_t i = 3; i < parts.size(); ++i) {
      data4.children.push_back(parts[i]);
    }

    IRDecl decl;
    decl.kind = IRDecl::Kind::kConstant;
    decl.module_path = module_path;
    decl.name = payload[0]->text;
    decl.is_public = true;
    decl.location = Loc(item);
    decl.origin = "DEFINE_GUID!";
    decl.is_guid = true;
    decl.const_type = MakePath("GUID");
    decl.value.kind = IRExpr::Kind::kStruct;
    decl.value.text = "GUID";
    decl.value.field_names = {"Data1", "Data2", "Data3", "Data4"};
    decl.value.children = {parts[0], parts[1], parts[2], std::move(data4)};
    decls->push_back(std::move(decl));
  }

  void ExpandBitflags(const Node& item, const std::string& module_path,
                      const std::string& qualified, std::vector<IRDecl>* decls) {
    const std::vector<const Node*> payload = PayloadChildren(item);
    if (payload.size() < 2 || payload[0]->kind != "Ident") {
      Malformed(qualified, item, "BITFLAGS! expects a name, a backing type and flags");
      return;
    }
    IRDecl decl;
    decl.kind = IRDecl::Kind::kStruct;
    decl.module_path = module_path;
    decl.name = payload[0]->text;
    decl.is_public = true;
    decl.location = Loc(item);
    decl.origin = "BITFLAGS!";
    decl.is_bitflags = true;
    decl.layout.mode = LayoutMode::kCCompatible;
    decl.layout.explicit_native = true;

    IRField bits;
    bits.name = "bits";
    bits.location = Loc(*payload[1]);
    std::string error;
    if (!ConvertType(*payload[1], &bits.type, &error)) {
      Unsupported(qualified, *payload[1], "backing type: " + error);
      return;
    }
    // Named types are checked once they resolve.
    const bool integer_backing =
        bits.type.kind == IRType::Kind::kPath ||
        (bits.type.kind == IRType::Kind::kPrimitive &&
         (bits.type.primitive == PrimitiveKind::kInt ||
          bits.type.primitive == PrimitiveKind::kPointerSizedInt));
    if (!integer_backing) {
      Unsupported(qualified, *payload[1],
                  "BITFLAGS! backing type '" + DumpType(bits.type) + "' is not an integer");
      return;
    }
    decl.fields.push_back(std::move(bits));

    for (std::size_t i = 2; i < payload.size(); ++i) {
      const Node& flag = *payload[i];
      if (flag.kind != "Flag" || flag.children.size() != 1) {
        Malformed(qualified, flag, "BITFLAGS! entries must be Flag nodes with one value");
        return;
      }
      IRAssociatedConst assoc;
      assoc.name = TrimCopy(flag.text);
      if (!ConvertExpr(flag.children[0], &assoc.value, &error)) {
        Unsupported(qualified, flag, "flag " + assoc.name + ": " + error);
        return;
      }
      decl.associated.push_back(std::move(assoc));
    }
    decls->push_back(std::move(decl));
  }

  const SourceFile& file_;
  const ExpandOptions& options_;
  DiagnosticsCollector* diags_;
};

}  // namespace

std::vector<IRModule> ExpandSourceFile(const SourceFile& file, const ExpandOptions& options,
                                       DiagnosticsCollector* diags) {
  Expander expander(file, options, diags);
  return expander.Run();
}

bool ExpandUseTree(std::string_view tree, std::string_view module_path,
                   std::vector<IRImport>* out, std::string* error) {
  UseTreeParser parser{tree};
  std::vector<IRImport> imports;
  if (!parser.Tree("", &imports, error)) {
    return false;
  }
  parser.SkipSpace();
  if (parser.pos != tree.size()) {
    *error = "trailing text in use tree";
    return false;
  }

  for (IRImport& import : imports) {
    std::vector<std::string> segments = SplitPath(import.target);
    std::string base;
    std::size_t first = 0;
    if (!segments.empty() && segments[0] == "crate") {
      first = 1;
    } else if (!segments.empty() && segments[0] == "self") {
      base = std::string(module_path);
      first = 1;
    } else {
      base = std::string(module_path);
      bool relative = false;
      while (first < segments.size() && segments[first] == "super") {
        base = ParentPath(base);
        relative = true;
        ++first;
      }
      if (!relative) {
        base.clear();
      }
    }
    std::string target = base;
    for (std::size_t i = first; i < segments.size(); ++i) {
      target = JoinPath(target, segments[i]);
    }
    if (target.empty()) {
      *error = "use path resolves to the crate root";
      return false;
    }
    import.target = target;
    if (import.local_name.empty() && !import.is_glob) {
      import.local_name = LastSegment(target);
    }
    out->push_back(std::move(import));
  }
  return true;
}

bool EvaluateCfg(std::string_view predicate, const ExpandOptions& options, bool* value,
                 std::string* error) {
  CfgParser parser{predicate, options};
  if (!parser.Predicate(value, error)) {
    return false;
  }
  parser.SkipSpace();
  if (parser.pos != predicate.size()) {
    *error = "trailing text in cfg predicate";
    return false;
  }
  return true;
}

}  // namespace ffibridge::frontend::internal
