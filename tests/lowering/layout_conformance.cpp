#include "expander.h"
#include "layout.h"
#include "resolver.h"
#include "symbol_table.h"
#include "syntax_dump.h"
#include "work_pool.h"

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

using ffibridge::frontend::internal::DiagnosticSeverity;
using ffibridge::frontend::internal::DiagnosticsCollector;
using ffibridge::frontend::internal::ExpandOptions;
using ffibridge::frontend::internal::ExpandSourceFile;
using ffibridge::frontend::internal::FormatConstValue;
using ffibridge::frontend::internal::IRModule;
using ffibridge::frontend::internal::MakeArray;
using ffibridge::frontend::internal::MakeIntExpr;
using ffibridge::frontend::internal::MakePrimitive;
using ffibridge::frontend::internal::PrimitiveKind;
using ffibridge::frontend::internal::ReadSyntaxDump;
using ffibridge::frontend::internal::ResolvedDecl;
using ffibridge::frontend::internal::ResolvedModule;
using ffibridge::frontend::internal::ResolveOptions;
using ffibridge::frontend::internal::Resolver;
using ffibridge::frontend::internal::SymbolTable;
using ffibridge::frontend::internal::SyntaxReadResult;
using ffibridge::frontend::internal::WorkPool;
using ffibridge::lowering::ApplyDataLayout;
using ffibridge::lowering::CheckDeclLayout;
using ffibridge::lowering::DescribeLayout;
using ffibridge::lowering::LayoutEngine;
using ffibridge::lowering::NativeAbi;
using ffibridge::lowering::NativeAbiFromTriple;
using ffibridge::lowering::RecordLayout;
using ffibridge::lowering::TargetProfile;
using ffibridge::lowering::ZigProfile;
namespace codes = ffibridge::frontend::internal::codes;

const char kLayouts[] = R"(File: um::layout
  Use: ctypes::{c_void, c_ulong}
  TypeAlias: DWORD
    Attr: pub
    Path: c_ulong
  TypeAlias: HANDLE
    Attr: pub
    Ptr: mut
      Path: c_void
  Struct: Mixed
    Attr: repr(C)
    Field: a
      Path: u32
    Field: p
      Ptr: mut
        Path: c_void
    Field: b
      Path: u32
  Struct: Packed1
    Attr: repr(C, packed)
    Field: a
      Path: u8
    Field: b
      Path: u32
    Field: c
      Path: u16
  Struct: Reordered
    Field: a
      Path: u8
    Field: b
      Path: u32
    Field: c
      Path: u8
  Struct: Aligned
    Attr: repr(C, align(16))
    Field: x
      Path: u32
  Struct: Ambiguous
    Attr: repr(C, packed, align(8))
    Field: x
      Path: u32
  Struct: HugePack
    Attr: repr(C, packed(4294967297))
    Field: x
      Path: u32
  Macro: UNION
    Union: LARGE_INTEGER
      Field: QuadPart
        Path: i64
      Field: LowPart
        Path: DWORD
  Macro: STRUCT
    Struct: GUID
      Field: Data1
        Path: DWORD
      Field: Data2
        Path: u16
      Field: Data3
        Path: u16
      Field: Data4
        Array
          Path: u8
          IntLit: 8
  Macro: DEFINE_GUID
    Ident: IID_Sample
    IntLit: 0x12345678
    IntLit: 0x9ABC
    IntLit: 0xDEF0
    IntLit: 0x01
    IntLit: 0x02
    IntLit: 0x03
    IntLit: 0x04
    IntLit: 0x05
    IntLit: 0x06
    IntLit: 0x07
    IntLit: 0x08
  Const: INVALID_HANDLE_VALUE
    Attr: pub
    Path: HANDLE
    Cast
      Unary: -
        IntLit: 1isize
      Path: isize
  Enum: Color
    Variant: Red
    Variant: Green
  Macro: ENUM
    Enum: SHOW_WINDOW
      Variant: SW_HIDE
        IntLit: 0
)";

const ResolvedDecl* FindDecl(const ResolvedModule& module, std::string_view name) {
  for (const ResolvedDecl& decl : module.decls) {
    if (decl.decl.name == name) {
      return &decl;
    }
  }
  std::cerr << "FAIL(find-decl): no declaration " << name << "\n";
  return nullptr;
}

bool ExpectLayout(std::string_view name, const RecordLayout& layout, std::uint64_t size,
                  std::uint64_t align, const std::vector<std::uint64_t>& offsets) {
  bool ok = layout.size == size && layout.align == align &&
            layout.fields.size() == offsets.size();
  for (std::size_t i = 0; ok && i < offsets.size(); ++i) {
    ok = layout.fields[i].offset == offsets[i];
  }
  if (!ok) {
    std::cerr << "FAIL(" << name << "): got " << DescribeLayout(layout) << "\n";
  }
  return ok;
}

bool SourceLayout(LayoutEngine* engine, const ResolvedModule& module, std::string_view name,
                  RecordLayout* out) {
  const ResolvedDecl* decl = FindDecl(module, name);
  std::string error;
  if (decl == nullptr || !engine->SourceRecordLayout(decl->decl, out, &error)) {
    std::cerr << "FAIL(" << name << "): source layout failed: " << error << "\n";
    return false;
  }
  return true;
}

bool TargetLayout(LayoutEngine* engine, const ResolvedModule& module, std::string_view name,
                  const TargetProfile& profile, RecordLayout* out) {
  const ResolvedDecl* decl = FindDecl(module, name);
  std::string error;
  if (decl == nullptr || !engine->TargetRecordLayout(decl->decl, profile, out, &error)) {
    std::cerr << "FAIL(" << name << "): target layout failed: " << error << "\n";
    return false;
  }
  return true;
}

bool ExpectCheck(std::string_view name, LayoutEngine* engine, const TargetProfile& profile,
                 const ResolvedModule& module, bool expected_result,
                 std::size_t expected_diagnostics, DiagnosticSeverity severity) {
  const ResolvedDecl* decl = FindDecl(module, name);
  if (decl == nullptr) {
    return false;
  }
  DiagnosticsCollector diags;
  const bool result = CheckDeclLayout(engine, profile, *decl, &diags);
  if (result != expected_result || diags.diagnostics().size() != expected_diagnostics) {
    std::cerr << "FAIL(check-" << name << "): returned " << result << " with "
              << diags.diagnostics().size() << " diagnostic(s)\n";
    for (const auto& diag : diags.diagnostics()) {
      std::cerr << "  " << diag.message << "\n";
    }
    return false;
  }
  for (const auto& diag : diags.diagnostics()) {
    if (diag.code != codes::kLayoutMismatch || diag.severity != severity) {
      std::cerr << "FAIL(check-" << name << "): unexpected " << diag.code << "\n";
      return false;
    }
  }
  return true;
}

}  // namespace

int main() {
  const SyntaxReadResult read = ReadSyntaxDump(kLayouts, "layout.dump");
  if (!read.ok) {
    std::cerr << "FAIL(read): " << read.message << "\n";
    return 1;
  }
  DiagnosticsCollector expand_diags;
  SymbolTable table;
  table.RegisterFile(0, ExpandSourceFile(read.file, ExpandOptions{}, &expand_diags));
  if (!expand_diags.diagnostics().empty()) {
    std::cerr << "FAIL(expand): " << expand_diags.diagnostics()[0].message << "\n";
    return 1;
  }
  const IRModule* module = table.FindModule("um::layout");
  if (module == nullptr) {
    std::cerr << "FAIL(register): module um::layout missing\n";
    return 1;
  }

  DiagnosticsCollector diags;
  Resolver resolver(table, ResolveOptions{}, &diags);
  const ResolvedModule resolved = resolver.ResolveModule(*module);
  if (diags.ErrorCount() != 0) {
    std::cerr << "FAIL(resolve): " << diags.diagnostics()[0].message << "\n";
    return 1;
  }

  LayoutEngine engine(NativeAbi{}, &resolver);
  if (!engine.ok()) {
    std::cerr << "FAIL(engine): " << engine.error() << "\n";
    return 1;
  }
  if (engine.pointer_size() != 8 || !engine.little_endian()) {
    std::cerr << "FAIL(engine): default ABI should be 64-bit little-endian\n";
    return 1;
  }
  const TargetProfile zig = ZigProfile();
  TargetProfile no_packed = ZigProfile();
  no_packed.supports_packed_layout = false;

  RecordLayout layout;
  if (!SourceLayout(&engine, resolved, "Mixed", &layout) ||
      !ExpectLayout("mixed", layout, 24, 8, {0, 8, 16})) {
    return 1;
  }
  if (!SourceLayout(&engine, resolved, "Packed1", &layout) ||
      !ExpectLayout("packed-source", layout, 7, 1, {0, 1, 5}) ||
      !TargetLayout(&engine, resolved, "Packed1", zig, &layout) ||
      !ExpectLayout("packed-target", layout, 7, 1, {0, 1, 5}) ||
      !TargetLayout(&engine, resolved, "Packed1", no_packed, &layout) ||
      !ExpectLayout("packed-unsupported", layout, 12, 4, {0, 4, 8})) {
    return 1;
  }
  // Default-layout structs may be reordered by the source compiler; the
  // emitted struct keeps declaration order.
  if (!SourceLayout(&engine, resolved, "Reordered", &layout) ||
      !ExpectLayout("reordered-source", layout, 8, 4, {4, 0, 5}) ||
      !TargetLayout(&engine, resolved, "Reordered", zig, &layout) ||
      !ExpectLayout("reordered-target", layout, 12, 4, {0, 4, 8})) {
    return 1;
  }
  if (!SourceLayout(&engine, resolved, "Aligned", &layout) ||
      !ExpectLayout("aligned", layout, 16, 16, {0})) {
    return 1;
  }
  if (!SourceLayout(&engine, resolved, "LARGE_INTEGER", &layout) ||
      !ExpectLayout("union", layout, 8, 8, {0, 0})) {
    return 1;
  }
  if (!SourceLayout(&engine, resolved, "GUID", &layout) ||
      !ExpectLayout("guid", layout, 16, 4, {0, 4, 6, 8})) {
    return 1;
  }

  std::uint64_t size = 0;
  std::uint64_t align = 0;
  std::string error;
  if (!engine.TypeLayout(MakeArray(MakePrimitive(PrimitiveKind::kInt, 16, false),
                                   MakeIntExpr("3")),
                         "um::layout", &size, &align, &error) ||
      size != 6 || align != 2) {
    std::cerr << "FAIL(array-layout): size " << size << " align " << align << " " << error
              << "\n";
    return 1;
  }

  // Layout checks.
  if (!ExpectCheck("Mixed", &engine, zig, resolved, true, 0, DiagnosticSeverity::kError) ||
      !ExpectCheck("Packed1", &engine, zig, resolved, true, 0, DiagnosticSeverity::kError) ||
      !ExpectCheck("Packed1", &engine, no_packed, resolved, false, 1,
                   DiagnosticSeverity::kError) ||
      !ExpectCheck("Reordered", &engine, zig, resolved, true, 1, DiagnosticSeverity::kWarning) ||
      !ExpectCheck("Ambiguous", &engine, zig, resolved, false, 1, DiagnosticSeverity::kError) ||
      !ExpectCheck("Color", &engine, zig, resolved, true, 1, DiagnosticSeverity::kWarning) ||
      !ExpectCheck("SHOW_WINDOW", &engine, zig, resolved, true, 0, DiagnosticSeverity::kError) ||
      !ExpectCheck("IID_Sample", &engine, zig, resolved, true, 0, DiagnosticSeverity::kError) ||
      !ExpectCheck("HugePack", &engine, zig, resolved, false, 1, DiagnosticSeverity::kError)) {
    return 1;
  }
  // An out-of-range pack is reported, never truncated.
  const ResolvedDecl* huge = FindDecl(resolved, "HugePack");
  DiagnosticsCollector huge_diags;
  if (huge == nullptr || huge->decl.layout.pack != 0 ||
      CheckDeclLayout(&engine, zig, *huge, &huge_diags) ||
      huge_diags.diagnostics()[0].message.find(
          "malformed repr argument 'packed(4294967297)'") == std::string::npos) {
    std::cerr << "FAIL(huge-pack): packed(4294967297) was not rejected\n";
    return 1;
  }

  // Memory images of folded constants.
  const ResolvedDecl* guid = FindDecl(resolved, "IID_Sample");
  std::vector<std::uint8_t> image;
  if (guid == nullptr ||
      !engine.EncodeConstant(guid->value, guid->decl.const_type, "um::layout", &image, &error)) {
    std::cerr << "FAIL(guid-image): " << error << "\n";
    return 1;
  }
  const std::vector<std::uint8_t> expected_guid = {0x78, 0x56, 0x34, 0x12, 0xBC, 0x9A,
                                                   0xF0, 0xDE, 0x01, 0x02, 0x03, 0x04,
                                                   0x05, 0x06, 0x07, 0x08};
  if (image != expected_guid) {
    std::cerr << "FAIL(guid-image): bytes differ from the GUID memory layout\n";
    return 1;
  }
  const ResolvedDecl* invalid = FindDecl(resolved, "INVALID_HANDLE_VALUE");
  if (invalid == nullptr ||
      FormatConstValue(invalid->value) != "18446744073709551615" ||
      !engine.EncodeConstant(invalid->value, invalid->decl.const_type, "um::layout", &image,
                             &error) ||
      image != std::vector<std::uint8_t>(8, 0xFF)) {
    std::cerr << "FAIL(handle-image): INVALID_HANDLE_VALUE should be all ones " << error << "\n";
    return 1;
  }

  // Target lookups from several threads at once, before any other lookup
  // has registered the LLVM targets.
  std::vector<NativeAbi> concurrent(8);
  std::vector<char> concurrent_ok(concurrent.size(), 0);
  WorkPool pool(4);
  pool.RunAll(concurrent.size(), [&](std::size_t i) {
    concurrent_ok[i] = NativeAbiFromTriple("x86_64-pc-windows-msvc", &concurrent[i]).ok ? 1 : 0;
  });
  for (std::size_t i = 0; i < concurrent.size(); ++i) {
    if (concurrent_ok[i] == 0 || concurrent[i].pointer_width != 64 ||
        concurrent[i].data_layout != concurrent[0].data_layout || !pool.failures()[i].empty()) {
      std::cerr << "FAIL(triple-threads): lookup " << i << " disagreed\n";
      return 1;
    }
  }

  // Other native ABIs.
  NativeAbi x86;
  const auto x86_result = NativeAbiFromTriple("i686-pc-windows-msvc", &x86);
  if (!x86_result.ok || x86.pointer_width != 32 || x86.c_long_bits != 32 ||
      x86.wchar_bits != 16) {
    std::cerr << "FAIL(triple-x86): " << x86_result.output << "\n";
    return 1;
  }
  LayoutEngine x86_engine(x86, &resolver);
  if (!x86_engine.ok() || !SourceLayout(&x86_engine, resolved, "Mixed", &layout) ||
      !ExpectLayout("mixed-x86", layout, 12, 4, {0, 4, 8})) {
    return 1;
  }
  NativeAbi linux_abi;
  if (!NativeAbiFromTriple("x86_64-unknown-linux-gnu", &linux_abi).ok ||
      linux_abi.c_long_bits != 64 || linux_abi.wchar_bits != 32) {
    std::cerr << "FAIL(triple-linux): expected LP64 with 32-bit wchar_t\n";
    return 1;
  }
  NativeAbi unknown;
  if (NativeAbiFromTriple("nonsense-unknown-none", &unknown).ok) {
    std::cerr << "FAIL(triple-unknown): expected failure\n";
    return 1;
  }
  NativeAbi custom;
  if (ApplyDataLayout("e-z", &custom).ok ||
      !ApplyDataLayout("e-p:32:32-i64:64-n8:16:32-S32", &custom).ok ||
      custom.pointer_width != 32) {
    std::cerr << "FAIL(data-layout): unexpected data layout handling\n";
    return 1;
  }
  NativeAbi broken;
  broken.data_layout = "e-z";
  LayoutEngine broken_engine(broken, &resolver);
  if (broken_engine.ok() || broken_engine.error().find("invalid data layout") != 0) {
    std::cerr << "FAIL(broken-layout): engine accepted an invalid layout\n";
    return 1;
  }

  return 0;
}
