#include "decl_ir.h"

#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace ffibridge::frontend::internal {

namespace {

std::string PrimitiveName(const IRType& type) {
  switch (type.primitive) {
    case PrimitiveKind::kInt:
      return std::string(type.is_signed ? "i" : "u") + std::to_string(type.bits);
    case PrimitiveKind::kPointerSizedInt:
      return type.is_signed ? "isize" : "usize";
    case PrimitiveKind::kFloat:
      return "f" + std::to_string(type.bits);
    case PrimitiveKind::kBool:
      return "bool";
    case PrimitiveKind::kVoid:
      return "void";
  }
  return "?";
}

void Indent(int depth, std::ostringstream& out) {
  out << std::string(static_cast<std::size_t>(depth) * 2, ' ');
}

void DumpLocation(const SourceLocation& loc, std::ostringstream& out) {
  if (loc.line > 0) {
    out << " @" << loc.line << ":" << loc.column;
  }
}

bool CheckUniqueNames(const std::vector<std::string>& names, std::string_view what,
                      std::string* error) {
  std::unordered_set<std::string> seen;
  for (const std::string& name : names) {
    if (name.empty()) {
      *error = "empty " + std::string(what) + " name";
      return false;
    }
    if (!seen.insert(name).second) {
      *error = "duplicate " + std::string(what) + " name: " + name;
      return false;
    }
  }
  return true;
}

bool ValidateType(const IRType& type, std::string* error) {
  switch (type.kind) {
    case IRType::Kind::kPrimitive:
      return true;
    case IRType::Kind::kPointer:
      if (type.children.size() != 1) {
        *error = "pointer type without pointee";
        return false;
      }
      return ValidateType(type.children[0], error);
    case IRType::Kind::kArray:
      if (type.children.size() != 1 || type.length == nullptr) {
        *error = "array type without element or length";
        return false;
      }
      return ValidateType(type.children[0], error);
    case IRType::Kind::kFunctionPointer:
      if (type.children.empty()) {
        *error = "function pointer without return type";
        return false;
      }
      for (const IRType& child : type.children) {
        if (!ValidateType(child, error)) {
          return false;
        }
      }
      return true;
    case IRType::Kind::kPath:
      if (type.path.empty()) {
        *error = "empty type path";
        return false;
      }
      for (const IRType& child : type.children) {
        if (!ValidateType(child, error)) {
          return false;
        }
      }
      return true;
  }
  return true;
}

}  // namespace

std::string IRDecl::QualifiedName() const {
  return JoinPath(module_path, name);
}

std::string JoinPath(std::string_view module_path, std::string_view name) {
  if (module_path.empty()) {
    return std::string(name);
  }
  if (name.empty()) {
    return std::string(module_path);
  }
  std::string out(module_path);
  out.append("::");
  out.append(name);
  return out;
}

std::vector<std::string> SplitPath(std::string_view path) {
  std::vector<std::string> segments;
  std::size_t start = 0;
  while (start <= path.size()) {
    const std::size_t pos = path.find("::", start);
    const std::size_t end = pos == std::string_view::npos ? path.size() : pos;
    if (end > start) {
      segments.emplace_back(path.substr(start, end - start));
    }
    if (pos == std::string_view::npos) {
      break;
    }
    start = pos + 2;
  }
  return segments;
}

std::string ParentPath(std::string_view path) {
  const std::size_t pos = path.rfind("::");
  if (pos == std::string_view::npos) {
    return "";
  }
  return std::string(path.substr(0, pos));
}

std::string LastSegment(std::string_view path) {
  const std::size_t pos = path.rfind("::");
  if (pos == std::string_view::npos) {
    return std::string(path);
  }
  return std::string(path.substr(pos + 2));
}

IRType MakePrimitive(PrimitiveKind kind, int bits, bool is_signed) {
  IRType type;
  type.kind = IRType::Kind::kPrimitive;
  type.primitive = kind;
  type.bits = bits;
  type.is_signed = is_signed;
  return type;
}

IRType MakePath(std::string path) {
  IRType type;
  type.kind = IRType::Kind::kPath;
  type.path = std::move(path);
  return type;
}

IRType MakePointer(IRType pointee, bool is_mutable) {
  IRType type;
  type.kind = IRType::Kind::kPointer;
  type.is_mutable = is_mutable;
  type.children.push_back(std::move(pointee));
  return type;
}

IRType MakeArray(IRType element, IRExpr length) {
  IRType type;
  type.kind = IRType::Kind::kArray;
  type.length = std::make_shared<const IRExpr>(std::move(length));
  type.children.push_back(std::move(element));
  return type;
}

IRExpr MakeIntExpr(std::string digits, std::string suffix) {
  IRExpr expr;
  expr.kind = IRExpr::Kind::kInt;
  expr.text = std::move(digits);
  expr.suffix = std::move(suffix);
  return expr;
}

bool IsVoid(const IRType& type) {
  return type.kind == IRType::Kind::kPrimitive && type.primitive == PrimitiveKind::kVoid;
}

bool LookupBuiltinPrimitive(std::string_view name, IRType* out) {
  struct Entry {
    PrimitiveKind kind;
    int bits;
    bool is_signed;
  };
  static const std::unordered_map<std::string, Entry> kBuiltins = {
      {"u8", {PrimitiveKind::kInt, 8, false}},
      {"u16", {PrimitiveKind::kInt, 16, false}},
      {"u32", {PrimitiveKind::kInt, 32, false}},
      {"u64", {PrimitiveKind::kInt, 64, false}},
      {"u128", {PrimitiveKind::kInt, 128, false}},
      {"i8", {PrimitiveKind::kInt, 8, true}},
      {"i16", {PrimitiveKind::kInt, 16, true}},
      {"i32", {PrimitiveKind::kInt, 32, true}},
      {"i64", {PrimitiveKind::kInt, 64, true}},
      {"i128", {PrimitiveKind::kInt, 128, true}},
      {"usize", {PrimitiveKind::kPointerSizedInt, 0, false}},
      {"isize", {PrimitiveKind::kPointerSizedInt, 0, true}},
      {"f32", {PrimitiveKind::kFloat, 32, true}},
      {"f64", {PrimitiveKind::kFloat, 64, true}},
      {"bool", {PrimitiveKind::kBool, 8, false}},
  };
  const auto it = kBuiltins.find(std::string(name));
  if (it == kBuiltins.end()) {
    return false;
  }
  *out = MakePrimitive(it->second.kind, it->second.bits, it->second.is_signed);
  return true;
}

std::string DeclKindName(IRDecl::Kind kind) {
  switch (kind) {
    case IRDecl::Kind::kStruct:
      return "Struct";
    case IRDecl::Kind::kUnion:
      return "Union";
    case IRDecl::Kind::kEnum:
      return "Enum";
    case IRDecl::Kind::kFunction:
      return "Function";
    case IRDecl::Kind::kTypeAlias:
      return "TypeAlias";
    case IRDecl::Kind::kConstant:
      return "Constant";
    case IRDecl::Kind::kModule:
      return "Module";
  }
  return "Unknown";
}

std::string LayoutModeName(LayoutMode mode) {
  switch (mode) {
    case LayoutMode::kDefault:
      return "default";
    case LayoutMode::kCCompatible:
      return "c";
    case LayoutMode::kPacked:
      return "packed";
    case LayoutMode::kTransparent:
      return "transparent";
    case LayoutMode::kAligned:
      return "aligned";
  }
  return "unknown";
}

std::string DumpType(const IRType& type) {
  switch (type.kind) {
    case IRType::Kind::kPrimitive:
      return PrimitiveName(type);
    case IRType::Kind::kPointer:
      return std::string(type.is_mutable ? "*mut " : "*const ") +
             (type.children.empty() ? "?" : DumpType(type.children[0]));
    case IRType::Kind::kArray: {
      std::string out = "[";
      out += type.children.empty() ? "?" : DumpType(type.children[0]);
      out += "; ";
      out += type.length == nullptr ? "?" : DumpExpr(*type.length);
      out += "]";
      return out;
    }
    case IRType::Kind::kFunctionPointer: {
      std::string out = type.is_nullable ? "Option<" : "";
      out += "extern \"" + type.calling_convention + "\" fn(";
      for (std::size_t i = 1; i < type.children.size(); ++i) {
        if (i > 1) {
          out += ", ";
        }
        const std::size_t name_index = i - 1;
        if (name_index < type.param_names.size() && !type.param_names[name_index].empty()) {
          out += type.param_names[name_index] + ": ";
        }
        out += DumpType(type.children[i]);
      }
      if (type.is_variadic) {
        out += type.children.size() > 1 ? ", ..." : "...";
      }
      out += ")";
      if (!type.children.empty() && !IsVoid(type.children[0])) {
        out += " -> " + DumpType(type.children[0]);
      }
      if (type.is_nullable) {
        out += ">";
      }
      return out;
    }
    case IRType::Kind::kPath: {
      std::string out = type.path;
      if (!type.children.empty()) {
        out += "<";
        for (std::size_t i = 0; i < type.children.size(); ++i) {
          if (i > 0) {
            out += ", ";
          }
          out += DumpType(type.children[i]);
        }
        out += ">";
      }
      return out;
    }
  }
  return "?";
}

std::string DumpExpr(const IRExpr& expr) {
  switch (expr.kind) {
    case IRExpr::Kind::kInt:
      return expr.text + expr.suffix;
    case IRExpr::Kind::kFloat:
    case IRExpr::Kind::kBool:
    case IRExpr::Kind::kString:
    case IRExpr::Kind::kPath:
      return expr.text;
    case IRExpr::Kind::kUnary:
      return expr.text + (expr.children.empty() ? "?" : DumpExpr(expr.children[0]));
    case IRExpr::Kind::kBinary:
      if (expr.children.size() != 2) {
        return "?";
      }
      return "(" + DumpExpr(expr.children[0]) + " " + expr.text + " " +
             DumpExpr(expr.children[1]) + ")";
    case IRExpr::Kind::kCast:
      return "(" + (expr.children.empty() ? "?" : DumpExpr(expr.children[0])) + " as " +
             (expr.cast_type.empty() ? "?" : DumpType(expr.cast_type[0])) + ")";
    case IRExpr::Kind::kArray: {
      std::string out = "[";
      for (std::size_t i = 0; i < expr.children.size(); ++i) {
        if (i > 0) {
          out += ", ";
        }
        out += DumpExpr(expr.children[i]);
      }
      return out + "]";
    }
    case IRExpr::Kind::kStruct: {
      std::string out = expr.text + " {";
      for (std::size_t i = 0; i < expr.children.size(); ++i) {
        out += i > 0 ? ", " : " ";
        if (i < expr.field_names.size()) {
          out += expr.field_names[i] + ": ";
        }
        out += DumpExpr(expr.children[i]);
      }
      return out + " }";
    }
  }
  return "?";
}

void DumpDecl(const IRDecl& decl, int depth, std::ostringstream& out) {
  Indent(depth, out);
  out << DeclKindName(decl.kind) << ": " << decl.QualifiedName();
  if (decl.is_public) {
    out << " [pub]";
  }
  if (!decl.origin.empty()) {
    out << " [origin=" << decl.origin << "]";
  }

  switch (decl.kind) {
    case IRDecl::Kind::kStruct:
    case IRDecl::Kind::kUnion:
      out << " [layout=" << LayoutModeName(decl.layout.mode);
      if (decl.layout.pack > 0) {
        out << " pack=" << decl.layout.pack;
      }
      if (decl.layout.align > 0) {
        out << " align=" << decl.layout.align;
      }
      if (decl.layout.explicit_native) {
        out << " native";
      }
      if (decl.layout.ambiguous) {
        out << " ambiguous";
      }
      out << "]";
      if (decl.is_opaque) {
        out << " [opaque]";
      }
      if (decl.is_bitflags) {
        out << " [bitflags]";
      }
      out << "\n";
      for (const IRField& field : decl.fields) {
        Indent(depth + 1, out);
        out << "Field: " << field.name << " : " << DumpType(field.type) << "\n";
      }
      for (const IRAssociatedConst& assoc : decl.associated) {
        Indent(depth + 1, out);
        out << "Assoc: " << assoc.name << " = " << DumpExpr(assoc.value) << "\n";
      }
      break;
    case IRDecl::Kind::kEnum:
      out << " [" << (decl.enum_style == IRDecl::EnumStyle::kCLike ? "c-like" : "tagged")
          << " repr=" << DumpType(decl.discriminant_type) << "]\n";
      for (const IRVariant& variant : decl.variants) {
        Indent(depth + 1, out);
        out << "Variant: " << variant.name;
        if (variant.has_value) {
          out << " = " << DumpExpr(variant.value);
        }
        out << "\n";
      }
      break;
    case IRDecl::Kind::kFunction:
      out << " [abi=" << decl.calling_convention << " link=" << decl.linkage_name
          << " lib=" << decl.library << "]";
      if (decl.is_variadic) {
        out << " [variadic]";
      }
      out << " -> " << DumpType(decl.return_type) << "\n";
      for (const IRField& param : decl.params) {
        Indent(depth + 1, out);
        out << "Param: " << param.name << " : " << DumpType(param.type) << "\n";
      }
      break;
    case IRDecl::Kind::kTypeAlias:
      out << " = " << DumpType(decl.aliased) << "\n";
      break;
    case IRDecl::Kind::kConstant:
      out << " : " << DumpType(decl.const_type) << " = " << DumpExpr(decl.value);
      if (decl.is_guid) {
        out << " [guid]";
      }
      out << "\n";
      break;
    case IRDecl::Kind::kModule:
      out << "\n";
      break;
  }
}

std::string DumpModule(const IRModule& module) {
  std::ostringstream out;
  out << "Module: " << module.path;
  DumpLocation(module.location, out);
  out << "\n";
  for (const IRImport& import : module.imports) {
    out << "  Import: " << import.target;
    if (import.is_glob) {
      out << "::*";
    } else if (import.local_name != LastSegment(import.target)) {
      out << " as " << import.local_name;
    }
    if (import.is_public) {
      out << " [pub]";
    }
    out << "\n";
  }
  for (const std::string& child : module.child_modules) {
    out << "  Submodule: " << child << "\n";
  }
  for (const IRDecl& decl : module.decls) {
    DumpDecl(decl, 1, out);
  }
  return out.str();
}

bool ValidateDecl(const IRDecl& decl, std::string* error) {
  if (decl.name.empty()) {
    *error = "declaration without a name";
    return false;
  }

  std::vector<std::string> names;
  switch (decl.kind) {
    case IRDecl::Kind::kStruct:
    case IRDecl::Kind::kUnion:
      for (const IRField& field : decl.fields) {
        names.push_back(field.name);
        if (!ValidateType(field.type, error)) {
          *error = "field " + field.name + ": " + *error;
          return false;
        }
      }
      for (const IRAssociatedConst& assoc : decl.associated) {
        names.push_back(assoc.name);
      }
      if (decl.kind == IRDecl::Kind::kUnion && decl.fields.empty()) {
        *error = "union without fields";
        return false;
      }
      return CheckUniqueNames(names, "member", error);
    case IRDecl::Kind::kEnum:
      if (decl.variants.empty()) {
        *error = "enum without variants";
        return false;
      }
      for (const IRVariant& variant : decl.variants) {
        names.push_back(variant.name);
      }
      return CheckUniqueNames(names, "variant", error);
    case IRDecl::Kind::kFunction:
      for (const IRField& param : decl.params) {
        names.push_back(param.name);
        if (!ValidateType(param.type, error)) {
          *error = "parameter " + param.name + ": " + *error;
          return false;
        }
      }
      if (decl.linkage_name.empty()) {
        *error = "function without linkage name";
        return false;
      }
      if (!CheckUniqueNames(names, "parameter", error)) {
        return false;
      }
      return ValidateType(decl.return_type, error);
    case IRDecl::Kind::kTypeAlias:
      return ValidateType(decl.aliased, error);
    case IRDecl::Kind::kConstant:
      return ValidateType(decl.const_type, error);
    case IRDecl::Kind::kModule:
      return true;
  }
  return true;
}

}  // namespace ffibridge::frontend::internal
