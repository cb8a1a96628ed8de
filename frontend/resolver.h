#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <llvm/ADT/APSInt.h>

#include "decl_ir.h"
#include "diagnostics.h"
#include "symbol_table.h"

namespace ffibridge::frontend::internal {

enum class UnresolvedPolicy {
  // References behind a pointer become an opaque placeholder; by-value
  // references omit the declaration.
  kPlaceholder,
  // Any unresolved reference omits the declaration.
  kOmit,
};

struct ResolveOptions {
  int pointer_width = 64;
  int c_long_bits = 32;
  int wchar_bits = 16;
  UnresolvedPolicy unresolved_policy = UnresolvedPolicy::kPlaceholder;
};

// Folded constant. Integers carry the exact width and signedness of the
// type they were folded at.
struct ConstValue {
  enum class Kind {
    kInt,
    kFloat,
    kBool,
    kPointer,
    kArray,
    kStruct,
  };

  Kind kind = Kind::kInt;
  llvm::APSInt integer;
  // Radix of the literal the value came from, for faithful re-emission.
  unsigned radix = 10;
  double floating = 0.0;
  std::string float_text;
  bool boolean = false;
  std::vector<ConstValue> elements;
  std::vector<std::string> field_names;
};

std::string FormatConstValue(const ConstValue& value);

struct ResolvedDecl {
  // Copy of the source declaration whose types carry resolution results.
  IRDecl decl;
  ConstValue value;
  std::vector<ConstValue> variant_values;
  std::vector<ConstValue> associated_values;
  // Qualified names needed complete (by value) before this declaration.
  std::vector<std::string> value_deps;
  // Qualified names referenced only by name: behind pointers, in function
  // signatures, or as a constant's type.
  std::vector<std::string> name_deps;
  bool emit = true;
};

// `pub use` re-export of a declaration or module under a local name.
struct ResolvedExport {
  std::string local_name;
  std::string target;
  bool is_module = false;
  // Type-like targets can be re-exported as a C typedef.
  bool is_type = false;
  SourceLocation location;
};

struct ResolvedModule {
  const IRModule* module = nullptr;
  std::vector<ResolvedDecl> decls;
  std::vector<ResolvedExport> exports;
  // Other modules this module's output refers to, sorted.
  std::vector<std::string> referenced_modules;
};

struct PathResolution {
  enum class Kind {
    kNone,
    kPrimitive,
    kSymbol,
  };

  Kind kind = Kind::kNone;
  IRType primitive;
  const SymbolEntry* entry = nullptr;
  std::string qualified_name;
};

// Resolves one module at a time against a finished symbol table. Not
// thread-safe; every worker owns a Resolver so the memo tables are private.
class Resolver {
 public:
  Resolver(const SymbolTable& table, const ResolveOptions& options, DiagnosticsCollector* diags);

  ResolvedModule ResolveModule(const IRModule& module);

  // Looks `path` up as written inside `module_path`.
  PathResolution ResolvePath(std::string_view path, std::string_view module_path);

  // Folds `expr` at `type`. Paths in `expr` are looked up from
  // `module_path`.
  bool EvaluateConstant(const IRExpr& expr, const IRType& type, std::string_view module_path,
                        ConstValue* out, std::string* error);

  // Recognized C primitive alias (`c_int`, `wchar_t`, ...).
  bool PrimitiveAlias(std::string_view name, IRType* out) const;

 private:
  struct TypeWalk {
    std::vector<std::string> value_deps;
    std::vector<std::string> name_deps;
    std::vector<std::string> unresolved_by_value;
    std::vector<std::string> unresolved_behind_pointer;
    std::vector<std::string> errors;
  };

  PathResolution ResolveAbsolute(std::string_view qualified, int depth);
  PathResolution ResolveInModule(std::string_view path, std::string_view module_path, int depth);

  void ResolveType(IRType* type, std::string_view module_path, bool behind_pointer,
                   bool layout_edge, TypeWalk* walk);

  // Follows aliases down to a primitive, pointer, array or function pointer,
  // or to the struct/union/enum declaration a path names.
  bool UnderlyingType(const IRType& type, std::string_view module_path, IRType* out,
                      std::string* out_module, const IRDecl** decl, std::string* error,
                      int depth);
  bool IntegerShape(const IRType& type, std::string_view module_path, unsigned* bits,
                    bool* is_signed, bool* is_pointer, std::string* error, int depth);
  bool EvaluateValue(const IRExpr& expr, const IRType& type, std::string_view type_module,
                     std::string_view expr_module, ConstValue* out, std::string* error,
                     int depth);
  bool EvaluateInt(const IRExpr& expr, unsigned bits, bool is_signed,
                   std::string_view module_path, llvm::APSInt* out, unsigned* radix,
                   std::string* error, int depth);
  bool NaturalInt(const IRExpr& expr, std::string_view module_path, llvm::APSInt* out,
                  unsigned* radix, std::string* error, int depth);
  bool EvaluateFloat(const IRExpr& expr, std::string_view module_path, ConstValue* out,
                     std::string* error, int depth);
  bool EvaluateBool(const IRExpr& expr, std::string_view module_path, bool* out,
                    std::string* error, int depth);
  bool ConstantByName(std::string_view path, std::string_view module_path, ConstValue* out,
                      std::string* error, int depth);
  bool EnumValues(const IRDecl& decl, std::vector<ConstValue>* out, std::string* error,
                  int depth);

  const std::vector<std::string>& ValueEdges(const std::string& qualified_name);
  bool FindValueCycle(const std::string& qualified_name, std::vector<std::string>* cycle);

  void Resolve(const IRDecl& source, ResolvedDecl* out);
  void CollectExports(const IRModule& module, ResolvedModule* out);

  const SymbolTable& table_;
  ResolveOptions options_;
  DiagnosticsCollector* diags_;
  std::map<std::string, std::vector<std::string>> value_edges_;
  std::map<std::string, ConstValue> constant_cache_;
  std::map<std::string, std::vector<ConstValue>> enum_cache_;
  std::set<std::string> evaluating_;
};

// Marks declarations that refer to an omitted declaration (anywhere in the
// run) and omits them in turn until nothing changes. Notes go to the
// collector of the module that owns the affected declaration.
void PropagateOmissions(std::vector<ResolvedModule>* modules, UnresolvedPolicy policy,
                        std::vector<DiagnosticsCollector>* diags);

}  // namespace ffibridge::frontend::internal
