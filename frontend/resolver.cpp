#include "resolver.h"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <utility>

#include <llvm/ADT/APInt.h>
#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/StringRef.h>

namespace ffibridge::frontend::internal {

namespace {

constexpr int kMaxResolveDepth = 16;
constexpr int kMaxEvalDepth = 64;

void AddUnique(std::vector<std::string>* list, const std::string& value) {
  if (std::find(list->begin(), list->end(), value) == list->end()) {
    list->push_back(value);
  }
}

bool IsCTypesModule(std::string_view segment) {
  return segment == "ctypes" || segment == "raw" || segment == "ffi" || segment == "libc";
}

bool IsTypeDecl(const IRDecl& decl) {
  return decl.kind == IRDecl::Kind::kStruct || decl.kind == IRDecl::Kind::kUnion ||
         decl.kind == IRDecl::Kind::kEnum || decl.kind == IRDecl::Kind::kTypeAlias;
}

unsigned LiteralRadix(const std::string& text, std::string* digits) {
  if (text.size() > 2 && text[0] == '0') {
    const char marker = text[1];
    if (marker == 'x' || marker == 'X') {
      *digits = text.substr(2);
      return 16;
    }
    if (marker == 'o') {
      *digits = text.substr(2);
      return 8;
    }
    if (marker == 'b') {
      *digits = text.substr(2);
      return 2;
    }
  }
  *digits = text;
  return 10;
}

bool ParseLiteral(const std::string& text, llvm::APInt* out, unsigned* radix) {
  std::string digits;
  *radix = LiteralRadix(text, &digits);
  // getAsInteger returns true on failure.
  return !llvm::StringRef(digits).getAsInteger(*radix, *out);
}

bool SuffixShape(const std::string& suffix, int pointer_width, unsigned* bits, bool* is_signed) {
  if (suffix.empty()) {
    return false;
  }
  *is_signed = suffix[0] == 'i';
  if (suffix == "usize" || suffix == "isize") {
    *bits = static_cast<unsigned>(pointer_width);
  } else {
    *bits = static_cast<unsigned>(std::strtoul(suffix.c_str() + 1, nullptr, 10));
  }
  return true;
}

llvm::APSInt Convert(const llvm::APSInt& value, unsigned bits, bool is_signed) {
  llvm::APInt resized = value.isSigned() ? value.sextOrTrunc(bits) : value.zextOrTrunc(bits);
  return llvm::APSInt(resized, !is_signed);
}

// Whether `value` survives conversion to `bits` bits unchanged.
bool Representable(const llvm::APSInt& value, unsigned bits, bool is_signed) {
  return llvm::APSInt::isSameValue(Convert(value, bits, is_signed), value);
}

// Whether a literal of magnitude `magnitude` fits the type; `negated` when it
// is the operand of a unary minus.
bool LiteralFits(const llvm::APInt& magnitude, unsigned bits, bool is_signed, bool negated) {
  const unsigned active = magnitude.getActiveBits();
  if (!is_signed) {
    return active <= bits;
  }
  if (!negated) {
    return active < bits;
  }
  return active < bits || (active == bits && magnitude.isPowerOf2());
}

std::string TypeShapeName(unsigned bits, bool is_signed) {
  return (is_signed ? "i" : "u") + std::to_string(bits);
}

llvm::APSInt MakeInt(std::uint64_t value, unsigned bits, bool is_signed) {
  return llvm::APSInt(llvm::APInt(bits, value), !is_signed);
}

ConstValue IntValue(llvm::APSInt integer, unsigned radix, bool is_pointer) {
  ConstValue value;
  value.kind = is_pointer ? ConstValue::Kind::kPointer : ConstValue::Kind::kInt;
  value.integer = std::move(integer);
  value.radix = radix;
  return value;
}

std::string FormatDouble(double value) {
  std::ostringstream out;
  out << std::setprecision(17) << value;
  std::string text = out.str();
  if (text.find_first_of(".eEn") == std::string::npos) {
    text += ".0";
  }
  return text;
}

// Visits every type slot of a declaration.
template <typename Fn>
void ForEachType(IRDecl* decl, Fn&& fn) {
  for (IRField& field : decl->fields) {
    fn(&field.type);
  }
  for (IRField& param : decl->params) {
    fn(&param.type);
  }
  switch (decl->kind) {
    case IRDecl::Kind::kFunction:
      fn(&decl->return_type);
      break;
    case IRDecl::Kind::kTypeAlias:
      fn(&decl->aliased);
      break;
    case IRDecl::Kind::kConstant:
      fn(&decl->const_type);
      break;
    default:
      break;
  }
}

// Turns references to `target` into unresolved placeholders. Returns false
// when a reference is by value and cannot be replaced.
bool ReplaceWithPlaceholder(IRType* type, const std::string& target, bool behind_pointer) {
  bool ok = true;
  if (type->kind == IRType::Kind::kPath && type->resolved_name == target) {
    if (!behind_pointer) {
      return false;
    }
    type->unresolved = true;
    type->resolved_name.clear();
  }
  const bool child_behind = behind_pointer || type->kind == IRType::Kind::kPointer ||
                            type->kind == IRType::Kind::kFunctionPointer;
  for (IRType& child : type->children) {
    ok = ReplaceWithPlaceholder(&child, target, child_behind) && ok;
  }
  return ok;
}

}  // namespace

std::string FormatConstValue(const ConstValue& value) {
  switch (value.kind) {
    case ConstValue::Kind::kInt:
    case ConstValue::Kind::kPointer: {
      llvm::SmallString<40> text;
      value.integer.toString(text, 10);
      return std::string(text.str());
    }
    case ConstValue::Kind::kFloat:
      return value.float_text;
    case ConstValue::Kind::kBool:
      return value.boolean ? "true" : "false";
    case ConstValue::Kind::kArray: {
      std::string out = "[";
      for (std::size_t i = 0; i < value.elements.size(); ++i) {
        if (i > 0) {
          out += ", ";
        }
        out += FormatConstValue(value.elements[i]);
      }
      return out + "]";
    }
    case ConstValue::Kind::kStruct: {
      std::string out = "{";
      for (std::size_t i = 0; i < value.elements.size(); ++i) {
        out += i > 0 ? ", " : " ";
        out += value.field_names[i] + ": " + FormatConstValue(value.elements[i]);
      }
      return out + " }";
    }
  }
  return "?";
}

Resolver::Resolver(const SymbolTable& table, const ResolveOptions& options,
                   DiagnosticsCollector* diags)
    : table_(table), options_(options), diags_(diags) {}

bool Resolver::PrimitiveAlias(std::string_view name, IRType* out) const {
  struct Entry {
    PrimitiveKind kind;
    int bits;
    bool is_signed;
  };
  const int c_long = options_.c_long_bits;
  const int wchar = options_.wchar_bits;
  const std::vector<std::pair<std::string_view, Entry>> aliases = {
      {"c_void", {PrimitiveKind::kVoid, 0, false}},
      {"c_char", {PrimitiveKind::kInt, 8, true}},
      {"c_schar", {PrimitiveKind::kInt, 8, true}},
      {"c_uchar", {PrimitiveKind::kInt, 8, false}},
      {"c_short", {PrimitiveKind::kInt, 16, true}},
      {"c_ushort", {PrimitiveKind::kInt, 16, false}},
      {"c_int", {PrimitiveKind::kInt, 32, true}},
      {"c_uint", {PrimitiveKind::kInt, 32, false}},
      {"c_long", {PrimitiveKind::kInt, c_long, true}},
      {"c_ulong", {PrimitiveKind::kInt, c_long, false}},
      {"c_longlong", {PrimitiveKind::kInt, 64, true}},
      {"c_ulonglong", {PrimitiveKind::kInt, 64, false}},
      {"c_float", {PrimitiveKind::kFloat, 32, true}},
      {"c_double", {PrimitiveKind::kFloat, 64, true}},
      {"wchar_t", {PrimitiveKind::kInt, wchar, false}},
      {"__int8", {PrimitiveKind::kInt, 8, true}},
      {"__uint8", {PrimitiveKind::kInt, 8, false}},
      {"__int16", {PrimitiveKind::kInt, 16, true}},
      {"__uint16", {PrimitiveKind::kInt, 16, false}},
      {"__int32", {PrimitiveKind::kInt, 32, true}},
      {"__uint32", {PrimitiveKind::kInt, 32, false}},
      {"__int64", {PrimitiveKind::kInt, 64, true}},
      {"__uint64", {PrimitiveKind::kInt, 64, false}},
      {"size_t", {PrimitiveKind::kPointerSizedInt, 0, false}},
      {"ssize_t", {PrimitiveKind::kPointerSizedInt, 0, true}},
  };
  for (const auto& alias : aliases) {
    if (alias.first == name) {
      *out = MakePrimitive(alias.second.kind, alias.second.bits, alias.second.is_signed);
      return true;
    }
  }
  return false;
}

PathResolution Resolver::ResolvePath(std::string_view path, std::string_view module_path) {
  return ResolveInModule(path, module_path, 0);
}

PathResolution Resolver::ResolveAbsolute(std::string_view qualified, int depth) {
  PathResolution result;
  if (depth > kMaxResolveDepth || qualified.empty()) {
    return result;
  }
  if (const SymbolEntry* entry = table_.Lookup(qualified)) {
    result.kind = PathResolution::Kind::kSymbol;
    result.entry = entry;
    result.qualified_name = std::string(qualified);
    return result;
  }

  const std::string parent = ParentPath(qualified);
  const std::string name = LastSegment(qualified);
  if (parent.empty()) {
    return result;
  }

  const IRModule* parent_module = table_.FindModule(parent);
  if (parent_module == nullptr) {
    // The parent may itself be a re-export of a module or an enum.
    const PathResolution owner = ResolveAbsolute(parent, depth + 1);
    if (owner.kind == PathResolution::Kind::kSymbol && owner.qualified_name != parent) {
      return ResolveAbsolute(JoinPath(owner.qualified_name, name), depth + 1);
    }
  } else {
    for (const IRImport& import : parent_module->imports) {
      if (!import.is_public || import.is_glob || import.local_name != name) {
        continue;
      }
      PathResolution via = ResolveAbsolute(import.target, depth + 1);
      if (via.kind == PathResolution::Kind::kNone &&
          IsCTypesModule(LastSegment(ParentPath(import.target)))) {
        if (PrimitiveAlias(LastSegment(import.target), &via.primitive)) {
          via.kind = PathResolution::Kind::kPrimitive;
        }
      }
      if (via.kind != PathResolution::Kind::kNone) {
        return via;
      }
    }
    for (const IRImport& import : parent_module->imports) {
      if (!import.is_public || !import.is_glob) {
        continue;
      }
      PathResolution via = ResolveAbsolute(JoinPath(import.target, name), depth + 1);
      if (via.kind != PathResolution::Kind::kNone) {
        return via;
      }
    }
  }

  if (IsCTypesModule(LastSegment(parent)) && PrimitiveAlias(name, &result.primitive)) {
    result.kind = PathResolution::Kind::kPrimitive;
  }
  return result;
}

PathResolution Resolver::ResolveInModule(std::string_view path, std::string_view module_path,
                                         int depth) {
  PathResolution result;
  const std::vector<std::string> segments = SplitPath(path);
  if (segments.empty() || depth > kMaxResolveDepth) {
    return result;
  }
  const IRModule* module = table_.FindModule(module_path);

  if (segments.size() == 1) {
    const std::string& name = segments[0];
    if (LookupBuiltinPrimitive(name, &result.primitive)) {
      result.kind = PathResolution::Kind::kPrimitive;
      return result;
    }
    const std::string local = JoinPath(module_path, name);
    if (table_.Lookup(local) != nullptr) {
      return ResolveAbsolute(local, depth + 1);
    }
    if (module != nullptr) {
      for (const IRImport& import : module->imports) {
        if (import.is_glob || import.local_name != name) {
          continue;
        }
        PathResolution via = ResolveAbsolute(import.target, depth + 1);
        if (via.kind != PathResolution::Kind::kNone) {
          return via;
        }
        // `use ctypes::c_int;` names a primitive even without a ctypes module.
        if (IsCTypesModule(LastSegment(ParentPath(import.target))) &&
            PrimitiveAlias(LastSegment(import.target), &result.primitive)) {
          result.kind = PathResolution::Kind::kPrimitive;
          return result;
        }
      }
      for (const IRImport& import : module->imports) {
        if (!import.is_glob) {
          continue;
        }
        PathResolution via = ResolveAbsolute(JoinPath(import.target, name), depth + 1);
        if (via.kind != PathResolution::Kind::kNone) {
          return via;
        }
      }
    }
    if (PrimitiveAlias(name, &result.primitive)) {
      result.kind = PathResolution::Kind::kPrimitive;
    }
    return result;
  }

  std::string base;
  std::size_t first = 0;
  bool anchored = false;
  if (segments[0] == "crate") {
    first = 1;
    anchored = true;
  } else if (segments[0] == "self") {
    base = std::string(module_path);
    first = 1;
    anchored = true;
  } else if (segments[0] == "super") {
    base = std::string(module_path);
    while (first < segments.size() && segments[first] == "super") {
      base = ParentPath(base);
      ++first;
    }
    anchored = true;
  }

  if (anchored) {
    std::string target = base;
    for (std::size_t i = first; i < segments.size(); ++i) {
      target = JoinPath(target, segments[i]);
    }
    result = ResolveAbsolute(target, depth + 1);
  } else {
    const std::string& head = segments[0];
    std::string rest;
    for (std::size_t i = 1; i < segments.size(); ++i) {
      rest = JoinPath(rest, segments[i]);
    }
    if (module != nullptr) {
      for (const IRImport& import : module->imports) {
        if (import.is_glob || import.local_name != head) {
          continue;
        }
        const PathResolution owner = ResolveAbsolute(import.target, depth + 1);
        const std::string owner_path =
            owner.kind == PathResolution::Kind::kSymbol ? owner.qualified_name : import.target;
        result = ResolveAbsolute(JoinPath(owner_path, rest), depth + 1);
        if (result.kind != PathResolution::Kind::kNone) {
          return result;
        }
      }
    }
    if (table_.Lookup(JoinPath(module_path, head)) != nullptr) {
      result = ResolveAbsolute(JoinPath(module_path, path), depth + 1);
    }
    if (result.kind == PathResolution::Kind::kNone) {
      result = ResolveAbsolute(path, depth + 1);
    }
  }

  if (result.kind == PathResolution::Kind::kNone &&
      IsCTypesModule(segments[segments.size() - 2]) &&
      PrimitiveAlias(segments.back(), &result.primitive)) {
    result.kind = PathResolution::Kind::kPrimitive;
  }
  return result;
}

void Resolver::ResolveType(IRType* type, std::string_view module_path, bool behind_pointer,
                           bool layout_edge, TypeWalk* walk) {
  switch (type->kind) {
    case IRType::Kind::kPrimitive:
      return;
    case IRType::Kind::kPointer:
      ResolveType(&type->children[0], module_path, true, false, walk);
      return;
    case IRType::Kind::kFunctionPointer:
      for (IRType& child : type->children) {
        ResolveType(&child, module_path, true, false, walk);
      }
      return;
    case IRType::Kind::kArray: {
      ConstValue length;
      std::string error;
      if (!EvaluateConstant(*type->length, MakePrimitive(PrimitiveKind::kPointerSizedInt),
                            module_path, &length, &error)) {
        walk->errors.push_back("array length " + DumpExpr(*type->length) + ": " + error);
      } else {
        type->resolved_length = length.integer.getLimitedValue();
      }
      ResolveType(&type->children[0], module_path, behind_pointer, layout_edge, walk);
      return;
    }
    case IRType::Kind::kPath:
      break;
  }

  for (IRType& child : type->children) {
    ResolveType(&child, module_path, behind_pointer, false, walk);
  }

  const PathResolution resolution = ResolvePath(type->path, module_path);
  if (resolution.kind == PathResolution::Kind::kPrimitive) {
    if (type->children.empty()) {
      *type = resolution.primitive;
    } else {
      type->resolved_name = type->path;
    }
    return;
  }

  auto unresolved = [&](const std::string& what) {
    type->unresolved = true;
    if (behind_pointer) {
      AddUnique(&walk->unresolved_behind_pointer, what);
    } else {
      AddUnique(&walk->unresolved_by_value, what);
    }
  };

  if (resolution.kind == PathResolution::Kind::kNone) {
    unresolved(type->path);
    return;
  }
  const SymbolEntry* entry = resolution.entry;
  if (entry->kind != SymbolEntry::Kind::kDecl || entry->decl == nullptr ||
      !IsTypeDecl(*entry->decl)) {
    unresolved(type->path + " (not a type)");
    return;
  }

  type->resolved_name = resolution.qualified_name;
  type->resolved_opaque = entry->decl->kind == IRDecl::Kind::kStruct && entry->decl->is_opaque;
  if (!behind_pointer && layout_edge) {
    AddUnique(&walk->value_deps, resolution.qualified_name);
  } else {
    AddUnique(&walk->name_deps, resolution.qualified_name);
  }
}

bool Resolver::UnderlyingType(const IRType& type, std::string_view module_path, IRType* out,
                              std::string* out_module, const IRDecl** decl, std::string* error,
                              int depth) {
  if (depth > kMaxResolveDepth) {
    *error = "type alias chain too deep";
    return false;
  }
  *decl = nullptr;
  if (type.kind != IRType::Kind::kPath) {
    *out = type;
    *out_module = std::string(module_path);
    return true;
  }

  const PathResolution resolution = ResolvePath(type.path, module_path);
  if (resolution.kind == PathResolution::Kind::kPrimitive) {
    *out = resolution.primitive;
    *out_module = std::string(module_path);
    return true;
  }
  if (resolution.kind == PathResolution::Kind::kNone) {
    *error = "cannot resolve type '" + type.path + "'";
    return false;
  }
  const SymbolEntry* entry = resolution.entry;
  if (entry->kind != SymbolEntry::Kind::kDecl || !IsTypeDecl(*entry->decl)) {
    *error = "'" + type.path + "' is not a type";
    return false;
  }
  const IRDecl* target = entry->decl;
  if (target->kind == IRDecl::Kind::kTypeAlias) {
    return UnderlyingType(target->aliased, target->module_path, out, out_module, decl, error,
                          depth + 1);
  }
  *out = type;
  *out_module = target->module_path;
  *decl = target;
  return true;
}

bool Resolver::IntegerShape(const IRType& type, std::string_view module_path, unsigned* bits,
                            bool* is_signed, bool* is_pointer, std::string* error, int depth) {
  IRType underlying;
  std::string underlying_module;
  const IRDecl* decl = nullptr;
  if (!UnderlyingType(type, module_path, &underlying, &underlying_module, &decl, error, depth)) {
    return false;
  }
  *is_pointer = false;
  if (decl != nullptr) {
    if (decl->kind == IRDecl::Kind::kEnum) {
      return IntegerShape(decl->discriminant_type, decl->module_path, bits, is_signed,
                          is_pointer, error, depth + 1);
    }
    if (decl->is_bitflags && !decl->fields.empty()) {
      return IntegerShape(decl->fields[0].type, decl->module_path, bits, is_signed, is_pointer,
                          error, depth + 1);
    }
    *error = "'" + decl->QualifiedName() + "' is not an integer type";
    return false;
  }
  switch (underlying.kind) {
    case IRType::Kind::kPointer:
    case IRType::Kind::kFunctionPointer:
      *bits = static_cast<unsigned>(options_.pointer_width);
      *is_signed = false;
      *is_pointer = true;
      return true;
    case IRType::Kind::kPrimitive:
      if (underlying.primitive == PrimitiveKind::kInt) {
        *bits = static_cast<unsigned>(underlying.bits);
        *is_signed = underlying.is_signed;
        return true;
      }
      if (underlying.primitive == PrimitiveKind::kPointerSizedInt) {
        *bits = static_cast<unsigned>(options_.pointer_width);
        *is_signed = underlying.is_signed;
        return true;
      }
      if (underlying.primitive == PrimitiveKind::kBool) {
        *bits = 8;
        *is_signed = false;
        return true;
      }
      break;
    default:
      break;
  }
  *error = "'" + DumpType(type) + "' is not an integer type";
  return false;
}

bool Resolver::EvaluateConstant(const IRExpr& expr, const IRType& type,
                                std::string_view module_path, ConstValue* out,
                                std::string* error) {
  return EvaluateValue(expr, type, module_path, module_path, out, error, 0);
}

bool Resolver::EvaluateValue(const IRExpr& expr, const IRType& type, std::string_view type_module,
                             std::string_view expr_module, ConstValue* out, std::string* error,
                             int depth) {
  if (depth > kMaxEvalDepth) {
    *error = "constant expression nested too deeply";
    return false;
  }

  IRType underlying;
  std::string underlying_module;
  const IRDecl* decl = nullptr;
  if (!UnderlyingType(type, type_module, &underlying, &underlying_module, &decl, error, 0)) {
    return false;
  }

  if (decl != nullptr && decl->kind != IRDecl::Kind::kEnum) {
    if (expr.kind == IRExpr::Kind::kPath) {
      ConstValue named;
      if (!ConstantByName(expr.text, expr_module, &named, error, depth + 1)) {
        return false;
      }
      if (decl->is_bitflags && named.kind == ConstValue::Kind::kInt) {
        out->kind = ConstValue::Kind::kStruct;
        out->field_names = {decl->fields[0].name};
        out->elements = {std::move(named)};
        return true;
      }
      if (named.kind != ConstValue::Kind::kStruct) {
        *error = "'" + expr.text + "' is not a " + decl->name + " value";
        return false;
      }
      *out = std::move(named);
      return true;
    }
    if (decl->kind == IRDecl::Kind::kUnion) {
      *error = "union constants are not supported";
      return false;
    }
    if (decl->is_opaque) {
      *error = "opaque type '" + decl->name + "' has no constant values";
      return false;
    }
    if (expr.kind != IRExpr::Kind::kStruct) {
      *error = "expected a struct literal for '" + decl->name + "'";
      return false;
    }
    out->kind = ConstValue::Kind::kStruct;
    out->elements.clear();
    out->field_names.clear();
    for (const IRField& field : decl->fields) {
      const auto it = std::find(expr.field_names.begin(), expr.field_names.end(), field.name);
      if (it == expr.field_names.end()) {
        *error = "missing field '" + field.name + "' in " + decl->name + " literal";
        return false;
      }
      const std::size_t index = static_cast<std::size_t>(it - expr.field_names.begin());
      ConstValue element;
      if (!EvaluateValue(expr.children[index], field.type, decl->module_path, expr_module,
                         &element, error, depth + 1)) {
        *error = "field '" + field.name + "': " + *error;
        return false;
      }
      out->field_names.push_back(field.name);
      out->elements.push_back(std::move(element));
    }
    if (expr.field_names.size() != decl->fields.size()) {
      *error = "unknown field in " + decl->name + " literal";
      return false;
    }
    return true;
  }

  if (underlying.kind == IRType::Kind::kArray) {
    ConstValue length;
    if (!EvaluateValue(*underlying.length, MakePrimitive(PrimitiveKind::kPointerSizedInt),
                       underlying_module, underlying_module, &length, error, depth + 1)) {
      return false;
    }
    if (expr.kind == IRExpr::Kind::kPath) {
      return ConstantByName(expr.text, expr_module, out, error, depth + 1);
    }
    if (expr.kind != IRExpr::Kind::kArray) {
      *error = "expected an array literal";
      return false;
    }
    const std::uint64_t expected = length.integer.getLimitedValue();
    if (expr.children.size() != expected) {
      *error = "array literal has " + std::to_string(expr.children.size()) +
               " elements, expected " + std::to_string(expected);
      return false;
    }
    out->kind = ConstValue::Kind::kArray;
    out->elements.clear();
    for (const IRExpr& child : expr.children) {
      ConstValue element;
      if (!EvaluateValue(child, underlying.children[0], underlying_module, expr_module, &element,
                         error, depth + 1)) {
        return false;
      }
      out->elements.push_back(std::move(element));
    }
    return true;
  }

  if (decl == nullptr && underlying.kind == IRType::Kind::kPrimitive) {
    if (underlying.primitive == PrimitiveKind::kFloat) {
      return EvaluateFloat(expr, expr_module, out, error, depth + 1);
    }
    if (underlying.primitive == PrimitiveKind::kBool) {
      out->kind = ConstValue::Kind::kBool;
      return EvaluateBool(expr, expr_module, &out->boolean, error, depth + 1);
    }
    if (underlying.primitive == PrimitiveKind::kVoid) {
      *error = "constants cannot have type void";
      return false;
    }
  }

  unsigned bits = 0;
  bool is_signed = false;
  bool is_pointer = false;
  if (!IntegerShape(type, type_module, &bits, &is_signed, &is_pointer, error, 0)) {
    return false;
  }
  llvm::APSInt integer;
  unsigned radix = 10;
  if (!EvaluateInt(expr, bits, is_signed, expr_module, &integer, &radix, error, depth + 1)) {
    return false;
  }
  *out = IntValue(std::move(integer), radix, is_pointer);
  return true;
}

bool Resolver::EvaluateInt(const IRExpr& expr, unsigned bits, bool is_signed,
                           std::string_view module_path, llvm::APSInt* out, unsigned* radix,
                           std::string* error, int depth) {
  if (depth > kMaxEvalDepth) {
    *error = "constant expression nested too deeply";
    return false;
  }
  switch (expr.kind) {
    case IRExpr::Kind::kInt: {
      llvm::APInt parsed;
      if (!ParseLiteral(expr.text, &parsed, radix)) {
        *error = "malformed integer literal '" + expr.text + "'";
        return false;
      }
      if (!LiteralFits(parsed, bits, is_signed, false)) {
        *error = "literal " + expr.text + " does not fit in " + TypeShapeName(bits, is_signed);
        return false;
      }
      *out = llvm::APSInt(parsed.zextOrTrunc(bits), !is_signed);
      return true;
    }
    case IRExpr::Kind::kBool:
      *out = MakeInt(expr.text == "true" ? 1 : 0, bits, is_signed);
      return true;
    case IRExpr::Kind::kPath: {
      ConstValue named;
      if (!ConstantByName(expr.text, module_path, &named, error, depth + 1)) {
        return false;
      }
      if (named.kind == ConstValue::Kind::kBool) {
        *out = MakeInt(named.boolean ? 1 : 0, bits, is_signed);
        return true;
      }
      if (named.kind == ConstValue::Kind::kStruct && named.elements.size() == 1 &&
          named.elements[0].kind == ConstValue::Kind::kInt) {
        named = named.elements[0];
      }
      if (named.kind != ConstValue::Kind::kInt && named.kind != ConstValue::Kind::kPointer) {
        *error = "'" + expr.text + "' is not an integer constant";
        return false;
      }
      if (!Representable(named.integer, bits, is_signed)) {
        llvm::SmallString<24> text;
        named.integer.toString(text, 10);
        *error = "value " + std::string(text.str()) + " of '" + expr.text +
                 "' does not fit in " + TypeShapeName(bits, is_signed) + " without a cast";
        return false;
      }
      *out = Convert(named.integer, bits, is_signed);
      *radix = named.radix;
      return true;
    }
    case IRExpr::Kind::kUnary: {
      if (expr.text == "-" && !is_signed) {
        *error = "cannot negate a value of unsigned type " + TypeShapeName(bits, is_signed);
        return false;
      }
      if (expr.text == "-" && expr.children[0].kind == IRExpr::Kind::kInt) {
        // -128 is a valid i8 although 128 alone is not.
        llvm::APInt parsed;
        if (!ParseLiteral(expr.children[0].text, &parsed, radix)) {
          *error = "malformed integer literal '" + expr.children[0].text + "'";
          return false;
        }
        if (!LiteralFits(parsed, bits, is_signed, true)) {
          *error = "literal -" + expr.children[0].text + " does not fit in " +
                   TypeShapeName(bits, is_signed);
          return false;
        }
        *out = llvm::APSInt(llvm::APInt(bits, 0) - parsed.zextOrTrunc(bits), !is_signed);
        return true;
      }
      llvm::APSInt operand;
      if (!EvaluateInt(expr.children[0], bits, is_signed, module_path, &operand, radix, error,
                       depth + 1)) {
        return false;
      }
      if (expr.text == "-") {
        llvm::APInt negated = llvm::APInt(bits, 0) - operand;
        *out = llvm::APSInt(negated, !is_signed);
      } else {
        *out = llvm::APSInt(~static_cast<const llvm::APInt&>(operand), !is_signed);
      }
      return true;
    }
    case IRExpr::Kind::kBinary: {
      llvm::APSInt lhs;
      llvm::APSInt rhs;
      unsigned rhs_radix = 10;
      if (!EvaluateInt(expr.children[0], bits, is_signed, module_path, &lhs, radix, error,
                       depth + 1)) {
        return false;
      }
      const std::string& op = expr.text;
      if (op == "<<" || op == ">>") {
        if (!NaturalInt(expr.children[1], module_path, &rhs, &rhs_radix, error, depth + 1)) {
          return false;
        }
        if (rhs.isNegative() || rhs.getLimitedValue() >= bits) {
          llvm::SmallString<24> amount;
          rhs.toString(amount, 10);
          *error = "shift amount " + std::string(amount.str()) + " is out of range for a " +
                   std::to_string(bits) + "-bit value";
          return false;
        }
        const unsigned amount = static_cast<unsigned>(rhs.getLimitedValue());
        llvm::APInt shifted = op == "<<" ? lhs.shl(amount)
                              : is_signed ? lhs.ashr(amount)
                                          : lhs.lshr(amount);
        *out = llvm::APSInt(shifted, !is_signed);
        return true;
      }
      if (!EvaluateInt(expr.children[1], bits, is_signed, module_path, &rhs, &rhs_radix, error,
                       depth + 1)) {
        return false;
      }
      llvm::APInt result;
      if (op == "|") {
        result = lhs | rhs;
      } else if (op == "&") {
        result = lhs & rhs;
      } else if (op == "^") {
        result = lhs ^ rhs;
      } else if (op == "+") {
        result = lhs + rhs;
      } else if (op == "-") {
        result = lhs - rhs;
      } else if (op == "*") {
        result = lhs * rhs;
      } else if (op == "/" || op == "%") {
        if (rhs.isZero()) {
          *error = "division by zero";
          return false;
        }
        if (op == "/") {
          result = is_signed ? lhs.sdiv(rhs) : lhs.udiv(rhs);
        } else {
          result = is_signed ? lhs.srem(rhs) : lhs.urem(rhs);
        }
      } else {
        *error = "unsupported operator '" + op + "'";
        return false;
      }
      *out = llvm::APSInt(result, !is_signed);
      return true;
    }
    case IRExpr::Kind::kCast: {
      unsigned target_bits = 0;
      bool target_signed = false;
      bool target_pointer = false;
      if (!IntegerShape(expr.cast_type[0], module_path, &target_bits, &target_signed,
                        &target_pointer, error, 0)) {
        return false;
      }
      llvm::APSInt operand;
      if (!NaturalInt(expr.children[0], module_path, &operand, radix, error, depth + 1)) {
        return false;
      }
      *out = Convert(Convert(operand, target_bits, target_signed), bits, is_signed);
      return true;
    }
    case IRExpr::Kind::kFloat:
      *error = "floating-point value '" + expr.text + "' in an integer constant";
      return false;
    case IRExpr::Kind::kString:
      *error = "string literals have no C representation";
      return false;
    case IRExpr::Kind::kArray:
    case IRExpr::Kind::kStruct:
      *error = "aggregate literal in an integer constant";
      return false;
  }
  *error = "unsupported constant expression";
  return false;
}

bool Resolver::NaturalInt(const IRExpr& expr, std::string_view module_path, llvm::APSInt* out,
                          unsigned* radix, std::string* error, int depth) {
  unsigned bits = 32;
  bool is_signed = true;
  switch (expr.kind) {
    case IRExpr::Kind::kInt: {
      if (!SuffixShape(expr.suffix, options_.pointer_width, &bits, &is_signed)) {
        llvm::APInt parsed;
        if (!ParseLiteral(expr.text, &parsed, radix)) {
          *error = "malformed integer literal '" + expr.text + "'";
          return false;
        }
        // Unsuffixed literals are i32 unless the value needs more room.
        const unsigned active = parsed.getActiveBits();
        if (active > 64) {
          bits = 128;
          is_signed = false;
        } else if (active > 63) {
          bits = 64;
          is_signed = false;
        } else if (active > 31) {
          bits = 64;
        }
      }
      break;
    }
    case IRExpr::Kind::kPath: {
      ConstValue named;
      if (!ConstantByName(expr.text, module_path, &named, error, depth + 1)) {
        return false;
      }
      if (named.kind != ConstValue::Kind::kInt && named.kind != ConstValue::Kind::kPointer) {
        *error = "'" + expr.text + "' is not an integer constant";
        return false;
      }
      *out = named.integer;
      *radix = named.radix;
      return true;
    }
    case IRExpr::Kind::kUnary:
    case IRExpr::Kind::kBinary: {
      llvm::APSInt lhs;
      if (!NaturalInt(expr.children[0], module_path, &lhs, radix, error, depth + 1)) {
        return false;
      }
      bits = lhs.getBitWidth();
      is_signed = lhs.isSigned();
      break;
    }
    case IRExpr::Kind::kCast: {
      bool is_pointer = false;
      if (!IntegerShape(expr.cast_type[0], module_path, &bits, &is_signed, &is_pointer, error,
                        0)) {
        return false;
      }
      break;
    }
    case IRExpr::Kind::kBool:
      bits = 8;
      is_signed = false;
      break;
    default:
      break;
  }
  return EvaluateInt(expr, bits, is_signed, module_path, out, radix, error, depth + 1);
}

bool Resolver::EvaluateFloat(const IRExpr& expr, std::string_view module_path, ConstValue* out,
                             std::string* error, int depth) {
  out->kind = ConstValue::Kind::kFloat;
  switch (expr.kind) {
    case IRExpr::Kind::kFloat:
      out->floating = std::strtod(expr.text.c_str(), nullptr);
      out->float_text = expr.text;
      if (out->float_text.find_first_of(".eE") == std::string::npos) {
        out->float_text += ".0";
      }
      return true;
    case IRExpr::Kind::kInt: {
      llvm::APInt parsed;
      unsigned radix = 10;
      if (!ParseLiteral(expr.text, &parsed, &radix)) {
        *error = "malformed integer literal '" + expr.text + "'";
        return false;
      }
      out->floating = parsed.roundToDouble(false);
      out->float_text = FormatDouble(out->floating);
      return true;
    }
    case IRExpr::Kind::kPath: {
      ConstValue named;
      if (!ConstantByName(expr.text, module_path, &named, error, depth + 1)) {
        return false;
      }
      if (named.kind != ConstValue::Kind::kFloat) {
        *error = "'" + expr.text + "' is not a floating-point constant";
        return false;
      }
      *out = std::move(named);
      return true;
    }
    case IRExpr::Kind::kUnary: {
      if (expr.text != "-") {
        *error = "operator '" + expr.text + "' is not defined for floating-point values";
        return false;
      }
      ConstValue operand;
      if (!EvaluateFloat(expr.children[0], module_path, &operand, error, depth + 1)) {
        return false;
      }
      out->floating = -operand.floating;
      out->float_text = operand.float_text[0] == '-' ? operand.float_text.substr(1)
                                                     : "-" + operand.float_text;
      return true;
    }
    case IRExpr::Kind::kBinary: {
      ConstValue lhs;
      ConstValue rhs;
      if (!EvaluateFloat(expr.children[0], module_path, &lhs, error, depth + 1) ||
          !EvaluateFloat(expr.children[1], module_path, &rhs, error, depth + 1)) {
        return false;
      }
      const std::string& op = expr.text;
      if (op == "+") {
        out->floating = lhs.floating + rhs.floating;
      } else if (op == "-") {
        out->floating = lhs.floating - rhs.floating;
      } else if (op == "*") {
        out->floating = lhs.floating * rhs.floating;
      } else if (op == "/") {
        out->floating = lhs.floating / rhs.floating;
      } else {
        *error = "operator '" + op + "' is not defined for floating-point values";
        return false;
      }
      out->float_text = FormatDouble(out->floating);
      return true;
    }
    case IRExpr::Kind::kCast: {
      if (!expr.children.empty() && expr.children[0].kind == IRExpr::Kind::kFloat) {
        return EvaluateFloat(expr.children[0], module_path, out, error, depth + 1);
      }
      llvm::APSInt operand;
      unsigned radix = 10;
      if (!NaturalInt(expr.children[0], module_path, &operand, &radix, error, depth + 1)) {
        return false;
      }
      out->floating = operand.isSigned() ? operand.roundToDouble(true)
                                         : operand.roundToDouble(false);
      out->float_text = FormatDouble(out->floating);
      return true;
    }
    default:
      break;
  }
  *error = "unsupported floating-point constant expression";
  return false;
}

bool Resolver::EvaluateBool(const IRExpr& expr, std::string_view module_path, bool* out,
                            std::string* error, int depth) {
  switch (expr.kind) {
    case IRExpr::Kind::kBool:
      *out = expr.text == "true";
      return true;
    case IRExpr::Kind::kPath: {
      ConstValue named;
      if (!ConstantByName(expr.text, module_path, &named, error, depth + 1)) {
        return false;
      }
      if (named.kind != ConstValue::Kind::kBool) {
        *error = "'" + expr.text + "' is not a bool constant";
        return false;
      }
      *out = named.boolean;
      return true;
    }
    case IRExpr::Kind::kUnary:
      if (expr.text == "!" && EvaluateBool(expr.children[0], module_path, out, error, depth + 1)) {
        *out = !*out;
        return true;
      }
      break;
    case IRExpr::Kind::kBinary: {
      bool lhs = false;
      bool rhs = false;
      if (!EvaluateBool(expr.children[0], module_path, &lhs, error, depth + 1) ||
          !EvaluateBool(expr.children[1], module_path, &rhs, error, depth + 1)) {
        return false;
      }
      if (expr.text == "&") {
        *out = lhs && rhs;
      } else if (expr.text == "|") {
        *out = lhs || rhs;
      } else if (expr.text == "^") {
        *out = lhs != rhs;
      } else {
        break;
      }
      return true;
    }
    default:
      break;
  }
  if (error->empty()) {
    *error = "unsupported bool constant expression";
  }
  return false;
}

bool Resolver::ConstantByName(std::string_view path, std::string_view module_path,
                              ConstValue* out, std::string* error, int depth) {
  const PathResolution resolution = ResolvePath(path, module_path);
  if (resolution.kind != PathResolution::Kind::kSymbol) {
    *error = "cannot resolve constant '" + std::string(path) + "'";
    return false;
  }
  const SymbolEntry* entry = resolution.entry;
  const std::string& qualified = resolution.qualified_name;

  const auto cached = constant_cache_.find(qualified);
  if (cached != constant_cache_.end()) {
    *out = cached->second;
    return true;
  }

  if (entry->kind == SymbolEntry::Kind::kDecl && entry->decl->kind == IRDecl::Kind::kConstant) {
    if (!evaluating_.insert(qualified).second) {
      *error = "constant '" + qualified + "' depends on itself";
      return false;
    }
    const IRDecl& decl = *entry->decl;
    const bool ok = EvaluateValue(decl.value, decl.const_type, decl.module_path, decl.module_path,
                                  out, error, depth + 1);
    evaluating_.erase(qualified);
    if (ok) {
      constant_cache_.emplace(qualified, *out);
    }
    return ok;
  }

  if (entry->kind == SymbolEntry::Kind::kEnumConstant ||
      (entry->kind == SymbolEntry::Kind::kMember && entry->decl->kind == IRDecl::Kind::kEnum)) {
    std::vector<ConstValue> values;
    if (!EnumValues(*entry->decl, &values, error, depth + 1)) {
      return false;
    }
    *out = values[entry->member_index];
    return true;
  }

  if (entry->kind == SymbolEntry::Kind::kMember && entry->decl->is_bitflags) {
    if (!evaluating_.insert(qualified).second) {
      *error = "constant '" + qualified + "' depends on itself";
      return false;
    }
    const IRDecl& decl = *entry->decl;
    const bool ok =
        EvaluateValue(decl.associated[entry->member_index].value, decl.fields[0].type,
                      decl.module_path, decl.module_path, out, error, depth + 1);
    evaluating_.erase(qualified);
    if (ok) {
      constant_cache_.emplace(qualified, *out);
    }
    return ok;
  }

  *error = "'" + std::string(path) + "' is not a constant";
  return false;
}

bool Resolver::EnumValues(const IRDecl& decl, std::vector<ConstValue>* out, std::string* error,
                          int depth) {
  const std::string qualified = decl.QualifiedName();
  const auto cached = enum_cache_.find(qualified);
  if (cached != enum_cache_.end()) {
    *out = cached->second;
    return true;
  }
  const std::string key = qualified + "#variants";
  if (!evaluating_.insert(key).second) {
    *error = "discriminants of '" + qualified + "' depend on themselves";
    return false;
  }

  unsigned bits = 32;
  bool is_signed = true;
  bool is_pointer = false;
  bool ok = IntegerShape(decl.discriminant_type, decl.module_path, &bits, &is_signed,
                         &is_pointer, error, 0);
  std::vector<ConstValue> values;
  for (std::size_t i = 0; ok && i < decl.variants.size(); ++i) {
    const IRVariant& variant = decl.variants[i];
    llvm::APSInt value;
    unsigned radix = values.empty() ? 10 : values.back().radix;
    if (variant.has_value) {
      ok = EvaluateInt(variant.value, bits, is_signed, decl.module_path, &value, &radix, error,
                       depth + 1);
      if (!ok) {
        *error = "variant " + variant.name + ": " + *error;
      }
    } else if (values.empty()) {
      value = MakeInt(0, bits, is_signed);
    } else {
      value = llvm::APSInt(values.back().integer + 1, !is_signed);
    }
    if (ok) {
      values.push_back(IntValue(std::move(value), radix, false));
    }
  }
  evaluating_.erase(key);
  if (!ok) {
    return false;
  }
  enum_cache_.emplace(qualified, values);
  *out = std::move(values);
  return true;
}

const std::vector<std::string>& Resolver::ValueEdges(const std::string& qualified_name) {
  const auto cached = value_edges_.find(qualified_name);
  if (cached != value_edges_.end()) {
    return cached->second;
  }
  std::vector<std::string> edges;
  const SymbolEntry* entry = table_.Lookup(qualified_name);
  if (entry != nullptr && entry->kind == SymbolEntry::Kind::kDecl && entry->decl != nullptr) {
    const IRDecl& decl = *entry->decl;
    std::vector<const IRType*> roots;
    if (decl.kind == IRDecl::Kind::kStruct || decl.kind == IRDecl::Kind::kUnion) {
      for (const IRField& field : decl.fields) {
        roots.push_back(&field.type);
      }
    } else if (decl.kind == IRDecl::Kind::kTypeAlias) {
      roots.push_back(&decl.aliased);
    }
    while (!roots.empty()) {
      const IRType* type = roots.back();
      roots.pop_back();
      if (type->kind == IRType::Kind::kArray) {
        roots.push_back(&type->children[0]);
      } else if (type->kind == IRType::Kind::kPath) {
        const PathResolution resolution = ResolvePath(type->path, decl.module_path);
        if (resolution.kind == PathResolution::Kind::kSymbol &&
            resolution.entry->kind == SymbolEntry::Kind::kDecl &&
            IsTypeDecl(*resolution.entry->decl)) {
          AddUnique(&edges, resolution.qualified_name);
        }
      }
    }
  }
  return value_edges_.emplace(qualified_name, std::move(edges)).first->second;
}

bool Resolver::FindValueCycle(const std::string& qualified_name,
                              std::vector<std::string>* cycle) {
  std::map<std::string, std::string> parent;
  std::vector<std::string> queue;
  queue.push_back(qualified_name);
  for (std::size_t i = 0; i < queue.size(); ++i) {
    const std::string node = queue[i];
    for (const std::string& next : ValueEdges(node)) {
      if (next == qualified_name) {
        std::vector<std::string> path;
        for (std::string at = node; at != qualified_name; at = parent[at]) {
          path.push_back(at);
        }
        path.push_back(qualified_name);
        std::reverse(path.begin(), path.end());
        path.push_back(qualified_name);
        *cycle = std::move(path);
        return true;
      }
      if (parent.emplace(next, node).second) {
        queue.push_back(next);
      }
    }
  }
  return false;
}

void Resolver::Resolve(const IRDecl& source, ResolvedDecl* out) {
  out->decl = source;
  IRDecl& decl = out->decl;
  const std::string qualified = decl.QualifiedName();
  const std::string& module_path = decl.module_path;
  TypeWalk walk;

  auto const_eval_error = [&](const std::string& message) {
    diags_->Report(codes::kConstEval, DiagnosticSeverity::kError, qualified, decl.location,
                   message, "declaration omitted");
    out->emit = false;
  };

  switch (decl.kind) {
    case IRDecl::Kind::kStruct:
    case IRDecl::Kind::kUnion:
      for (IRField& field : decl.fields) {
        ResolveType(&field.type, module_path, false, true, &walk);
      }
      if (decl.is_bitflags && !decl.fields.empty()) {
        unsigned bits = 0;
        bool is_signed = false;
        bool is_pointer = false;
        std::string error;
        if (!IntegerShape(decl.fields[0].type, module_path, &bits, &is_signed, &is_pointer,
                          &error, 0) ||
            is_pointer) {
          const_eval_error("backing type: " +
                           (error.empty() ? DumpType(decl.fields[0].type) + " is a pointer"
                                          : error));
          break;
        }
      }
      for (const IRAssociatedConst& assoc : decl.associated) {
        ConstValue value;
        std::string error;
        if (!ConstantByName(JoinPath(decl.name, assoc.name), module_path, &value, &error, 0)) {
          const_eval_error("flag " + assoc.name + ": " + error);
          break;
        }
        out->associated_values.push_back(std::move(value));
      }
      break;
    case IRDecl::Kind::kEnum: {
      ResolveType(&decl.discriminant_type, module_path, false, false, &walk);
      std::string error;
      if (!EnumValues(source, &out->variant_values, &error, 0)) {
        const_eval_error(error);
      }
      break;
    }
    case IRDecl::Kind::kFunction:
      for (IRField& param : decl.params) {
        ResolveType(&param.type, module_path, false, false, &walk);
      }
      ResolveType(&decl.return_type, module_path, false, false, &walk);
      break;
    case IRDecl::Kind::kTypeAlias:
      ResolveType(&decl.aliased, module_path, false, true, &walk);
      break;
    case IRDecl::Kind::kConstant: {
      ResolveType(&decl.const_type, module_path, false, false, &walk);
      if (!walk.unresolved_by_value.empty()) {
        break;
      }
      std::string error;
      if (!ConstantByName(decl.name, module_path, &out->value, &error, 0)) {
        const_eval_error(error);
      }
      break;
    }
    case IRDecl::Kind::kModule:
      if (table_.FindModule(qualified) == nullptr) {
        diags_->Report(codes::kUnresolvedReference, DiagnosticSeverity::kWarning, qualified,
                       decl.location, "module '" + qualified + "' is not part of the input",
                       "add the module's syntax dump to the corpus");
        out->emit = false;
      }
      break;
  }

  for (const std::string& error : walk.errors) {
    const_eval_error(error);
  }

  const bool omit_all = options_.unresolved_policy == UnresolvedPolicy::kOmit;
  for (const std::string& path : walk.unresolved_by_value) {
    diags_->Report(codes::kUnresolvedReference, DiagnosticSeverity::kError, qualified,
                   decl.location, "cannot resolve '" + path + "'",
                   "declaration omitted; a by-value use needs the complete type");
  }
  for (const std::string& path : walk.unresolved_behind_pointer) {
    diags_->Report(codes::kUnresolvedReference, DiagnosticSeverity::kError, qualified,
                   decl.location, "cannot resolve '" + path + "'",
                   omit_all ? "declaration omitted" : "emitted as an opaque pointer");
  }
  if (!walk.unresolved_by_value.empty() ||
      (omit_all && !walk.unresolved_behind_pointer.empty())) {
    out->emit = false;
  }

  out->value_deps = std::move(walk.value_deps);
  out->name_deps = std::move(walk.name_deps);
}

void Resolver::CollectExports(const IRModule& module, ResolvedModule* out) {
  std::set<std::string> local_names;
  for (const IRDecl& decl : module.decls) {
    local_names.insert(decl.name);
  }

  auto add_export = [&](const std::string& local_name, const PathResolution& target,
                        const SourceLocation& location) {
    if (!local_names.insert(local_name).second) {
      return false;
    }
    ResolvedExport item;
    item.local_name = local_name;
    item.target = target.qualified_name;
    item.location = location;
    if (target.entry->kind == SymbolEntry::Kind::kModule) {
      item.is_module = true;
    } else if (target.entry->decl != nullptr && target.entry->kind == SymbolEntry::Kind::kDecl) {
      item.is_type = IsTypeDecl(*target.entry->decl);
    }
    out->exports.push_back(std::move(item));
    return true;
  };

  for (const IRImport& import : module.imports) {
    if (!import.is_public) {
      continue;
    }
    if (!import.is_glob) {
      const PathResolution target = ResolveAbsolute(import.target, 0);
      if (target.kind == PathResolution::Kind::kPrimitive) {
        continue;
      }
      if (target.kind == PathResolution::Kind::kNone) {
        diags_->Report(codes::kUnresolvedReference, DiagnosticSeverity::kError,
                       JoinPath(module.path, import.local_name), import.location,
                       "cannot resolve re-export target '" + import.target + "'",
                       "re-export omitted");
        continue;
      }
      if (!add_export(import.local_name, target, import.location)) {
        diags_->Report(codes::kNameCollision, DiagnosticSeverity::kWarning,
                       JoinPath(module.path, import.local_name), import.location,
                       "re-export of '" + import.target + "' is shadowed by a local name",
                       "re-export omitted");
      }
      continue;
    }

    const IRModule* source = table_.FindModule(import.target);
    if (source == nullptr) {
      diags_->Report(codes::kUnresolvedReference, DiagnosticSeverity::kError, module.path,
                     import.location, "cannot resolve glob re-export '" + import.target + "::*'",
                     "re-export omitted");
      continue;
    }
    for (const IRDecl& decl : source->decls) {
      if (!decl.is_public || !table_.IsCanonical(decl)) {
        continue;
      }
      PathResolution target;
      target.kind = PathResolution::Kind::kSymbol;
      target.qualified_name = decl.QualifiedName();
      target.entry = table_.Lookup(target.qualified_name);
      add_export(decl.name, target, import.location);
      if (decl.kind == IRDecl::Kind::kEnum && decl.enum_style == IRDecl::EnumStyle::kCLike) {
        for (const IRVariant& variant : decl.variants) {
          PathResolution constant;
          constant.kind = PathResolution::Kind::kSymbol;
          constant.qualified_name = JoinPath(decl.module_path, variant.name);
          constant.entry = table_.Lookup(constant.qualified_name);
          if (constant.entry != nullptr && constant.entry->decl == &decl) {
            add_export(variant.name, constant, import.location);
          }
        }
      }
    }
  }
}

ResolvedModule Resolver::ResolveModule(const IRModule& module) {
  ResolvedModule out;
  out.module = &module;

  for (const IRDecl& decl : module.decls) {
    if (!table_.IsCanonical(decl)) {
      continue;
    }
    ResolvedDecl resolved;
    Resolve(decl, &resolved);
    out.decls.push_back(std::move(resolved));
  }

  for (ResolvedDecl& resolved : out.decls) {
    const IRDecl& decl = resolved.decl;
    if (decl.kind != IRDecl::Kind::kStruct && decl.kind != IRDecl::Kind::kUnion &&
        decl.kind != IRDecl::Kind::kTypeAlias) {
      continue;
    }
    std::vector<std::string> cycle;
    if (!FindValueCycle(decl.QualifiedName(), &cycle)) {
      continue;
    }
    std::string chain;
    for (const std::string& step : cycle) {
      chain += chain.empty() ? step : " -> " + step;
    }
    diags_->Report(codes::kInfiniteSize, DiagnosticSeverity::kError, decl.QualifiedName(),
                   decl.location, "type contains itself by value: " + chain,
                   "break the cycle with a pointer");
    resolved.emit = false;
  }

  CollectExports(module, &out);

  std::set<std::string> referenced;
  auto reference = [&](const std::string& qualified) {
    const SymbolEntry* entry = table_.Lookup(qualified);
    if (entry != nullptr && entry->module != nullptr && entry->module->path != module.path) {
      referenced.insert(entry->module->path);
    }
  };
  for (const ResolvedDecl& resolved : out.decls) {
    for (const std::string& dep : resolved.value_deps) {
      reference(dep);
    }
    for (const std::string& dep : resolved.name_deps) {
      reference(dep);
    }
  }
  for (const ResolvedExport& item : out.exports) {
    if (item.is_module) {
      referenced.insert(item.target);
    } else {
      reference(item.target);
    }
  }
  referenced.erase(module.path);
  out.referenced_modules.assign(referenced.begin(), referenced.end());
  return out;
}

void PropagateOmissions(std::vector<ResolvedModule>* modules, UnresolvedPolicy policy,
                        std::vector<DiagnosticsCollector>* diags) {
  std::set<std::string> omitted;
  for (const ResolvedModule& module : *modules) {
    for (const ResolvedDecl& resolved : module.decls) {
      if (!resolved.emit) {
        omitted.insert(resolved.decl.QualifiedName());
      }
    }
  }

  bool changed = !omitted.empty();
  while (changed) {
    changed = false;
    for (std::size_t m = 0; m < modules->size(); ++m) {
      for (ResolvedDecl& resolved : (*modules)[m].decls) {
        if (!resolved.emit) {
          continue;
        }
        std::string cause;
        for (const std::string& dep : resolved.value_deps) {
          if (omitted.count(dep) != 0) {
            cause = dep;
            break;
          }
        }
        // Replacements go to a copy until every omitted reference is known
        // to be behind a pointer.
        IRDecl replaced = resolved.decl;
        std::vector<std::string> placeholders;
        for (const std::string& dep : resolved.name_deps) {
          if (!cause.empty()) {
            break;
          }
          if (omitted.count(dep) == 0) {
            continue;
          }
          bool replaceable = policy == UnresolvedPolicy::kPlaceholder;
          if (replaceable) {
            ForEachType(&replaced, [&](IRType* type) {
              replaceable = ReplaceWithPlaceholder(type, dep, false) && replaceable;
            });
          }
          if (!replaceable) {
            cause = dep;
          } else {
            placeholders.push_back(dep);
          }
        }
        if (cause.empty()) {
          if (placeholders.empty()) {
            continue;
          }
          resolved.decl = std::move(replaced);
          for (const std::string& dep : placeholders) {
            resolved.name_deps.erase(
                std::remove(resolved.name_deps.begin(), resolved.name_deps.end(), dep),
                resolved.name_deps.end());
            (*diags)[m].Report(codes::kUnresolvedReference, DiagnosticSeverity::kNote,
                               resolved.decl.QualifiedName(), resolved.decl.location,
                               "pointer to '" + dep + "' emitted as opaque because '" + dep +
                                   "' is not emitted");
          }
          continue;
        }
        resolved.emit = false;
        omitted.insert(resolved.decl.QualifiedName());
        changed = true;
        (*diags)[m].Report(codes::kUnresolvedReference, DiagnosticSeverity::kNote,
                           resolved.decl.QualifiedName(), resolved.decl.location,
                           "not emitted because '" + cause + "' is not emitted");
      }
    }
  }

  for (ResolvedModule& module : *modules) {
    module.exports.erase(std::remove_if(module.exports.begin(), module.exports.end(),
                                        [&](const ResolvedExport& item) {
                                          return omitted.count(item.target) != 0;
                                        }),
                         module.exports.end());
  }
}

}  // namespace ffibridge::frontend::internal
