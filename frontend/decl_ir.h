#pragma once

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "diagnostics.h"

namespace ffibridge::frontend::internal {

enum class PrimitiveKind {
  kInt,
  kPointerSizedInt,
  kFloat,
  kBool,
  kVoid,
};

struct IRExpr;

struct IRType {
  enum class Kind {
    kPrimitive,
    kPointer,
    kArray,
    kFunctionPointer,
    kPath,
  };

  Kind kind = Kind::kPrimitive;

  PrimitiveKind primitive = PrimitiveKind::kVoid;
  int bits = 0;
  bool is_signed = false;

  // kPointer: mutability of the pointee.
  bool is_mutable = false;

  // kArray
  std::shared_ptr<const IRExpr> length;

  // kFunctionPointer
  std::string calling_convention;
  bool is_nullable = false;
  bool is_variadic = false;
  std::vector<std::string> param_names;

  // kPath: path as written in the source.
  std::string path;

  // kPointer: pointee. kArray: element. kFunctionPointer: return type
  // followed by parameter types. kPath: generic arguments.
  std::vector<IRType> children;

  // Filled in by the resolver on its own copies; empty in expander output.
  std::string resolved_name;
  bool resolved_opaque = false;
  bool unresolved = false;
  std::uint64_t resolved_length = 0;
};

struct IRExpr {
  enum class Kind {
    kInt,
    kFloat,
    kBool,
    kString,
    kPath,
    kUnary,
    kBinary,
    kCast,
    kArray,
    kStruct,
  };

  Kind kind = Kind::kInt;
  // kInt: digits including the radix prefix. kFloat/kBool/kString: literal.
  // kPath: path. kUnary/kBinary: operator. kStruct: type path.
  std::string text;
  // Integer literal type suffix ("u32"), empty when absent.
  std::string suffix;
  std::vector<IRExpr> children;
  std::vector<std::string> field_names;
  std::vector<IRType> cast_type;
};

enum class LayoutMode {
  kDefault,
  kCCompatible,
  kPacked,
  kTransparent,
  kAligned,
};

struct LayoutSpec {
  LayoutMode mode = LayoutMode::kDefault;
  unsigned pack = 0;
  unsigned align = 0;
  bool explicit_native = false;
  bool ambiguous = false;
  std::string ambiguity;
};

struct IRField {
  std::string name;
  IRType type;
  SourceLocation location;
};

struct IRVariant {
  std::string name;
  bool has_value = false;
  IRExpr value;
};

struct IRAssociatedConst {
  std::string name;
  IRExpr value;
};

struct IRDecl {
  enum class Kind {
    kStruct,
    kUnion,
    kEnum,
    kFunction,
    kTypeAlias,
    kConstant,
    kModule,
  };

  enum class EnumStyle {
    kCLike,
    kTagged,
  };

  Kind kind = Kind::kStruct;
  std::string module_path;
  std::string name;
  bool is_public = false;
  SourceLocation location;
  // Source form that produced the declaration ("struct", "STRUCT!", ...).
  std::string origin;

  // kStruct / kUnion
  LayoutSpec layout;
  std::vector<IRField> fields;
  bool is_opaque = false;
  bool is_bitflags = false;
  std::vector<IRAssociatedConst> associated;

  // kEnum
  EnumStyle enum_style = EnumStyle::kCLike;
  IRType discriminant_type;
  std::vector<IRVariant> variants;

  // kFunction
  std::string calling_convention;
  std::vector<IRField> params;
  IRType return_type;
  bool is_variadic = false;
  std::string linkage_name;
  std::string library;

  // kTypeAlias
  IRType aliased;

  // kConstant
  IRType const_type;
  IRExpr value;
  bool is_guid = false;

  std::string QualifiedName() const;
};

struct IRImport {
  std::string target;
  std::string local_name;
  bool is_public = false;
  bool is_glob = false;
  SourceLocation location;
};

struct IRModule {
  std::string path;
  std::string file;
  SourceLocation location;
  std::vector<IRDecl> decls;
  std::vector<IRImport> imports;
  std::vector<std::string> child_modules;
};

std::string JoinPath(std::string_view module_path, std::string_view name);
std::vector<std::string> SplitPath(std::string_view path);
std::string ParentPath(std::string_view path);
std::string LastSegment(std::string_view path);

IRType MakePrimitive(PrimitiveKind kind, int bits = 0, bool is_signed = false);
IRType MakePath(std::string path);
IRType MakePointer(IRType pointee, bool is_mutable);
IRType MakeArray(IRType element, IRExpr length);
IRExpr MakeIntExpr(std::string digits, std::string suffix = "");

bool IsVoid(const IRType& type);

// u8..u128, i8..i128, usize, isize, f32, f64, bool.
bool LookupBuiltinPrimitive(std::string_view name, IRType* out);

std::string DeclKindName(IRDecl::Kind kind);
std::string LayoutModeName(LayoutMode mode);

// Canonical text forms. Two declarations are byte-identical when their
// DumpDecl output matches.
std::string DumpType(const IRType& type);
std::string DumpExpr(const IRExpr& expr);
void DumpDecl(const IRDecl& decl, int depth, std::ostringstream& out);
std::string DumpModule(const IRModule& module);

// Structural checks the expander cannot express through its input shape:
// non-empty names, unique field/variant/parameter names, array lengths.
bool ValidateDecl(const IRDecl& decl, std::string* error);

}  // namespace ffibridge::frontend::internal
