#include "expander.h"
#include "resolver.h"
#include "symbol_table.h"
#include "syntax_dump.h"

#include <algorithm>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

using ffibridge::frontend::internal::ConstValue;
using ffibridge::frontend::internal::DiagnosticSeverity;
using ffibridge::frontend::internal::DiagnosticsCollector;
using ffibridge::frontend::internal::ExpandOptions;
using ffibridge::frontend::internal::ExpandSourceFile;
using ffibridge::frontend::internal::FormatConstValue;
using ffibridge::frontend::internal::IRExpr;
using ffibridge::frontend::internal::IRModule;
using ffibridge::frontend::internal::MakeIntExpr;
using ffibridge::frontend::internal::MakePrimitive;
using ffibridge::frontend::internal::PathResolution;
using ffibridge::frontend::internal::PrimitiveKind;
using ffibridge::frontend::internal::PropagateOmissions;
using ffibridge::frontend::internal::ReadSyntaxDump;
using ffibridge::frontend::internal::ResolvedDecl;
using ffibridge::frontend::internal::ResolvedModule;
using ffibridge::frontend::internal::ResolveOptions;
using ffibridge::frontend::internal::Resolver;
using ffibridge::frontend::internal::SymbolEntry;
using ffibridge::frontend::internal::SymbolTable;
using ffibridge::frontend::internal::SyntaxReadResult;
using ffibridge::frontend::internal::UnresolvedPolicy;
namespace codes = ffibridge::frontend::internal::codes;

const char kMinwindef[] = R"(File: shared::minwindef
  Use: ctypes::{c_int, c_ulong}
  TypeAlias: DWORD
    Attr: pub
    Path: c_ulong
  TypeAlias: BOOL
    Attr: pub
    Path: c_int
  Const: WRAPPED
    Attr: pub
    Path: u8
    Binary: +
      IntLit: 200
      IntLit: 100
  Const: ALL_ONES
    Attr: pub
    Path: DWORD
    Unary: !
      IntLit: 0
  Const: TOP_BIT
    Attr: pub
    Path: u32
    Binary: <<
      IntLit: 1
      IntLit: 31
  Const: NEGATIVE
    Attr: pub
    Path: i8
    Unary: -
      IntLit: 128
  Const: TOO_FAR
    Path: u32
    Binary: <<
      IntLit: 1
      IntLit: 32
  Const: DIV_ZERO
    Path: i32
    Binary: /
      IntLit: 1
      IntLit: 0
  Const: TOO_WIDE
    Path: u8
    IntLit: 256
  Const: SIGNED_TOO_WIDE
    Path: i8
    IntLit: 128
  Const: NEGATED_UNSIGNED
    Path: u32
    Unary: -
      IntLit: 1
  Const: NARROWED
    Path: u8
    PathExpr: TOP_BIT
  Const: CAST_WRAPS
    Path: u8
    Cast
      IntLit: 256u32
      Path: u8
  TypeAlias: FLOATISH
    Path: f32
  Macro: BITFLAGS
    Ident: FLOAT_FLAGS
    Path: FLOATISH
    Flag: A
      IntLit: 0x1
)";

const char kWinnt[] = R"(File: um::winnt
  Use: shared::minwindef::{DWORD, ALL_ONES}
  Struct: LIST_ENTRY
    Attr: pub
    Attr: repr(C)
    Field: Flink
      Ptr: mut
        Path: LIST_ENTRY
    Field: Blink
      Ptr: mut
        Path: LIST_ENTRY
  Struct: Outer
    Attr: repr(C)
    Field: inner
      Path: Inner
  Struct: Inner
    Attr: repr(C)
    Field: outer
      Path: Outer
  Struct: HasMissingPointer
    Attr: repr(C)
    Field: p
      Ptr: mut
        Path: MISSING_TYPE
  Struct: HasMissingValue
    Attr: repr(C)
    Field: v
      Path: MISSING_TYPE
  Struct: UsesOmitted
    Attr: repr(C)
    Field: v
      Path: HasMissingValue
  Struct: PointsAtOmitted
    Attr: repr(C)
    Field: p
      Ptr: const
        Path: HasMissingValue
  Const: MASK
    Attr: pub
    Path: DWORD
    Binary: &
      PathExpr: ALL_ONES
      IntLit: 0xFF
  Mod: absent
)";

const char kUm[] = R"(File: um
  Mod: winnt
    Attr: pub
  Mod: fileapi
    Attr: pub
    Macro: ENUM
      Enum: CREATION_DISPOSITION
        Variant: CREATE_NEW
          IntLit: 1
        Variant: CREATE_ALWAYS
    ForeignMod: system
      Attr: link(name = "kernel32")
      ForeignFn: CloseHandle
        Attr: pub
        Param: hObject
          Ptr: mut
            Path: c_void
        Return
          Path: i32
  Use: self::fileapi::CloseHandle
    Attr: pub
  Use: shared::minwindef::DWORD
    Attr: pub
  Use: self::fileapi::*
    Attr: pub
  Use: self::winnt::NOT_THERE
    Attr: pub
)";

bool Register(SymbolTable* table, std::size_t index, const char* text, std::string_view name) {
  const SyntaxReadResult read = ReadSyntaxDump(text, name);
  if (!read.ok) {
    std::cerr << "FAIL(" << name << "): syntax dump rejected: " << read.message << "\n";
    return false;
  }
  DiagnosticsCollector diags;
  std::vector<IRModule> modules = ExpandSourceFile(read.file, ExpandOptions{}, &diags);
  if (!diags.diagnostics().empty()) {
    std::cerr << "FAIL(" << name << "): unexpected expansion diagnostic: "
              << diags.diagnostics()[0].message << "\n";
    return false;
  }
  table->RegisterFile(index, std::move(modules));
  return true;
}

void ResolveAll(const SymbolTable& table, UnresolvedPolicy policy,
                std::vector<ResolvedModule>* resolved, std::vector<DiagnosticsCollector>* diags) {
  const std::vector<const IRModule*> modules = table.Modules();
  resolved->assign(modules.size(), ResolvedModule{});
  diags->assign(modules.size(), DiagnosticsCollector{});
  ResolveOptions options;
  options.unresolved_policy = policy;
  for (std::size_t i = 0; i < modules.size(); ++i) {
    Resolver resolver(table, options, &(*diags)[i]);
    (*resolved)[i] = resolver.ResolveModule(*modules[i]);
  }
  PropagateOmissions(resolved, policy, diags);
}

const ResolvedModule* FindModule(const std::vector<ResolvedModule>& modules,
                                 std::string_view path) {
  for (const ResolvedModule& module : modules) {
    if (module.module->path == path) {
      return &module;
    }
  }
  std::cerr << "FAIL(find-module): no module " << path << "\n";
  return nullptr;
}

const ResolvedDecl* FindDecl(const std::vector<ResolvedModule>& modules,
                             std::string_view qualified) {
  for (const ResolvedModule& module : modules) {
    for (const ResolvedDecl& decl : module.decls) {
      if (decl.decl.QualifiedName() == qualified) {
        return &decl;
      }
    }
  }
  std::cerr << "FAIL(find-decl): no declaration " << qualified << "\n";
  return nullptr;
}

std::size_t CountAll(const std::vector<DiagnosticsCollector>& diags, std::string_view code,
                     DiagnosticSeverity severity) {
  std::size_t count = 0;
  for (const DiagnosticsCollector& collector : diags) {
    for (const auto& diag : collector.diagnostics()) {
      if (diag.code == code && diag.severity == severity) {
        ++count;
      }
    }
  }
  return count;
}

bool ExpectEmit(const std::vector<ResolvedModule>& modules, std::string_view qualified,
                bool expected) {
  const ResolvedDecl* decl = FindDecl(modules, qualified);
  if (decl == nullptr) {
    return false;
  }
  if (decl->emit != expected) {
    std::cerr << "FAIL(emit): " << qualified << " emit=" << decl->emit << ", expected "
              << expected << "\n";
    return false;
  }
  return true;
}

bool ExpectValue(const std::vector<ResolvedModule>& modules, std::string_view qualified,
                 std::string_view expected) {
  const ResolvedDecl* decl = FindDecl(modules, qualified);
  if (decl == nullptr) {
    return false;
  }
  const std::string got = FormatConstValue(decl->value);
  if (!decl->emit || got != expected) {
    std::cerr << "FAIL(value): " << qualified << " = " << got << " (emit=" << decl->emit
              << "), expected " << expected << "\n";
    return false;
  }
  return true;
}

bool ExpectCount(std::string_view name, std::size_t got, std::size_t expected) {
  if (got != expected) {
    std::cerr << "FAIL(" << name << "): expected " << expected << ", got " << got << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  SymbolTable table;
  // Registration order differs from input order on purpose.
  if (!Register(&table, 2, kUm, "um.dump") || !Register(&table, 0, kMinwindef, "minwindef.dump") ||
      !Register(&table, 1, kWinnt, "winnt.dump")) {
    return 1;
  }
  if (!table.Collisions().empty()) {
    std::cerr << "FAIL(collisions): unexpected collision on "
              << table.Collisions()[0].qualified_name << "\n";
    return 1;
  }
  const std::vector<const IRModule*> order = table.Modules();
  if (order.size() != 4 || order[0]->path != "shared::minwindef" ||
      order[1]->path != "um::winnt" || order[2]->path != "um" ||
      order[3]->path != "um::fileapi") {
    std::cerr << "FAIL(module-order): modules are not in input order\n";
    return 1;
  }

  std::vector<ResolvedModule> resolved;
  std::vector<DiagnosticsCollector> diags;
  ResolveAll(table, UnresolvedPolicy::kPlaceholder, &resolved, &diags);

  // Constant folding wraps at the declared width.
  if (!ExpectValue(resolved, "shared::minwindef::WRAPPED", "44") ||
      !ExpectValue(resolved, "shared::minwindef::ALL_ONES", "4294967295") ||
      !ExpectValue(resolved, "shared::minwindef::TOP_BIT", "2147483648") ||
      !ExpectValue(resolved, "shared::minwindef::NEGATIVE", "-128") ||
      !ExpectValue(resolved, "um::winnt::MASK", "255") ||
      !ExpectValue(resolved, "shared::minwindef::CAST_WRAPS", "0")) {
    return 1;
  }
  if (!ExpectEmit(resolved, "shared::minwindef::TOO_FAR", false) ||
      !ExpectEmit(resolved, "shared::minwindef::DIV_ZERO", false) ||
      !ExpectEmit(resolved, "shared::minwindef::TOO_WIDE", false) ||
      !ExpectEmit(resolved, "shared::minwindef::SIGNED_TOO_WIDE", false) ||
      !ExpectEmit(resolved, "shared::minwindef::NEGATED_UNSIGNED", false) ||
      !ExpectEmit(resolved, "shared::minwindef::NARROWED", false) ||
      !ExpectEmit(resolved, "shared::minwindef::FLOAT_FLAGS", false) ||
      !ExpectCount("const-eval", CountAll(diags, codes::kConstEval, DiagnosticSeverity::kError),
                   7)) {
    return 1;
  }
  // Only an explicit cast may change a value.
  const std::vector<std::string> range_errors = {
      "literal 256 does not fit in u8",
      "literal 128 does not fit in i8",
      "cannot negate a value of unsigned type u32",
      "value 2147483648 of 'TOP_BIT' does not fit in u8 without a cast",
  };
  for (const std::string& expected : range_errors) {
    bool seen = false;
    for (const auto& diag : diags[0].diagnostics()) {
      seen = seen || diag.message.find(expected) != std::string::npos;
    }
    if (!seen) {
      std::cerr << "FAIL(range-check): no diagnostic containing '" << expected << "'\n";
      return 1;
    }
  }
  const std::string& shift_error = diags[0].diagnostics()[0].message;
  if (shift_error.find("shift amount 32 is out of range for a 32-bit value") ==
      std::string::npos) {
    std::cerr << "FAIL(shift-message): got " << shift_error << "\n";
    return 1;
  }

  // A pointer to itself is fine; containing itself by value is not.
  const ResolvedDecl* list_entry = FindDecl(resolved, "um::winnt::LIST_ENTRY");
  if (list_entry == nullptr || !list_entry->emit || !list_entry->value_deps.empty() ||
      list_entry->name_deps != std::vector<std::string>{"um::winnt::LIST_ENTRY"}) {
    std::cerr << "FAIL(self-pointer): LIST_ENTRY should resolve with a name dependency only\n";
    return 1;
  }
  if (!ExpectEmit(resolved, "um::winnt::Outer", false) ||
      !ExpectEmit(resolved, "um::winnt::Inner", false) ||
      !ExpectCount("infinite-size",
                   CountAll(diags, codes::kInfiniteSize, DiagnosticSeverity::kError), 2)) {
    return 1;
  }
  bool saw_chain = false;
  for (const auto& diag : diags[1].diagnostics()) {
    if (diag.code == codes::kInfiniteSize &&
        diag.message == "type contains itself by value: um::winnt::Outer -> um::winnt::Inner "
                        "-> um::winnt::Outer") {
      saw_chain = true;
    }
  }
  if (!saw_chain) {
    std::cerr << "FAIL(infinite-size): cycle chain not reported for Outer\n";
    return 1;
  }

  // Unresolved references: placeholder behind a pointer, omission by value,
  // and omission spreading to by-value users.
  const ResolvedDecl* missing_pointer = FindDecl(resolved, "um::winnt::HasMissingPointer");
  if (missing_pointer == nullptr || !missing_pointer->emit ||
      !missing_pointer->decl.fields[0].type.children[0].unresolved) {
    std::cerr << "FAIL(placeholder): pointer to an unknown type should stay opaque\n";
    return 1;
  }
  if (!ExpectEmit(resolved, "um::winnt::HasMissingValue", false) ||
      !ExpectEmit(resolved, "um::winnt::UsesOmitted", false)) {
    return 1;
  }
  const ResolvedDecl* points_at = FindDecl(resolved, "um::winnt::PointsAtOmitted");
  if (points_at == nullptr || !points_at->emit ||
      !points_at->decl.fields[0].type.children[0].unresolved) {
    std::cerr << "FAIL(placeholder-propagation): pointer to an omitted type should stay opaque\n";
    return 1;
  }
  bool saw_substitution = false;
  for (const auto& diag : diags[1].diagnostics()) {
    saw_substitution =
        saw_substitution ||
        (diag.severity == DiagnosticSeverity::kNote &&
         diag.qualified_name == "um::winnt::PointsAtOmitted" &&
         diag.message == "pointer to 'um::winnt::HasMissingValue' emitted as opaque because "
                         "'um::winnt::HasMissingValue' is not emitted");
  }
  if (!saw_substitution ||
      std::find(points_at->name_deps.begin(), points_at->name_deps.end(),
                "um::winnt::HasMissingValue") != points_at->name_deps.end()) {
    std::cerr << "FAIL(placeholder-note): substitution on PointsAtOmitted was not reported\n";
    return 1;
  }
  if (!ExpectCount("unresolved-errors",
                   CountAll(diags, codes::kUnresolvedReference, DiagnosticSeverity::kError), 3) ||
      !ExpectCount("unresolved-notes",
                   CountAll(diags, codes::kUnresolvedReference, DiagnosticSeverity::kNote), 2) ||
      !ExpectCount("missing-module",
                   CountAll(diags, codes::kUnresolvedReference, DiagnosticSeverity::kWarning),
                   1)) {
    return 1;
  }

  // Re-exports.
  const ResolvedModule* um = FindModule(resolved, "um");
  if (um == nullptr) {
    return 1;
  }
  const std::vector<std::string> expected_exports = {
      "CloseHandle", "DWORD", "CREATION_DISPOSITION", "CREATE_NEW", "CREATE_ALWAYS"};
  if (um->exports.size() != expected_exports.size()) {
    std::cerr << "FAIL(exports): expected " << expected_exports.size() << " exports, got "
              << um->exports.size() << "\n";
    return 1;
  }
  for (std::size_t i = 0; i < expected_exports.size(); ++i) {
    if (um->exports[i].local_name != expected_exports[i]) {
      std::cerr << "FAIL(exports): export " << i << " is " << um->exports[i].local_name
                << ", expected " << expected_exports[i] << "\n";
      return 1;
    }
  }
  if (um->exports[0].target != "um::fileapi::CloseHandle" || um->exports[0].is_type ||
      um->exports[1].target != "shared::minwindef::DWORD" || !um->exports[1].is_type) {
    std::cerr << "FAIL(exports): wrong targets or kinds\n";
    return 1;
  }
  if (um->referenced_modules != std::vector<std::string>{"shared::minwindef", "um::fileapi"}) {
    std::cerr << "FAIL(referenced-modules): unexpected module references\n";
    return 1;
  }
  const ResolvedDecl* disposition = FindDecl(resolved, "um::fileapi::CREATION_DISPOSITION");
  if (disposition == nullptr || disposition->variant_values.size() != 2 ||
      FormatConstValue(disposition->variant_values[1]) != "2") {
    std::cerr << "FAIL(enum-values): implicit discriminant should follow the previous one\n";
    return 1;
  }

  // Path lookup from another module.
  DiagnosticsCollector lookup_diags;
  Resolver resolver(table, ResolveOptions{}, &lookup_diags);
  const PathResolution variant = resolver.ResolvePath("crate::um::CREATE_NEW", "um::winnt");
  if (variant.kind != PathResolution::Kind::kSymbol ||
      variant.qualified_name != "um::fileapi::CREATE_NEW" ||
      variant.entry->kind != SymbolEntry::Kind::kEnumConstant) {
    std::cerr << "FAIL(resolve-path): glob re-exported variant not found\n";
    return 1;
  }
  const PathResolution c_void = resolver.ResolvePath("c_void", "um::fileapi");
  if (c_void.kind != PathResolution::Kind::kPrimitive ||
      c_void.primitive.primitive != PrimitiveKind::kVoid) {
    std::cerr << "FAIL(resolve-path): c_void should be a primitive alias\n";
    return 1;
  }
  IRExpr product;
  product.kind = IRExpr::Kind::kBinary;
  product.text = "*";
  product.children = {MakeIntExpr("300"), MakeIntExpr("300")};
  ConstValue folded;
  std::string error;
  if (!resolver.EvaluateConstant(product, MakePrimitive(PrimitiveKind::kInt, 16, false),
                                 "um::winnt", &folded, &error) ||
      FormatConstValue(folded) != "24464") {
    std::cerr << "FAIL(evaluate): 300 * 300 at u16 gave " << FormatConstValue(folded) << " "
              << error << "\n";
    return 1;
  }

  // Under the omit policy a pointer to an unknown type drops the declaration.
  ResolveAll(table, UnresolvedPolicy::kOmit, &resolved, &diags);
  if (!ExpectEmit(resolved, "um::winnt::HasMissingPointer", false) ||
      !ExpectEmit(resolved, "um::winnt::PointsAtOmitted", false) ||
      !ExpectEmit(resolved, "um::winnt::LIST_ENTRY", true)) {
    return 1;
  }

  return 0;
}
