#include "target_profile.h"
#include "type_mapper.h"

#include <iostream>
#include <string>
#include <string_view>
#include <utility>

#ifndef FFIBRIDGE_TEST_DATA_DIR
#error "FFIBRIDGE_TEST_DATA_DIR must point at tests/data"
#endif

namespace {

using ffibridge::frontend::internal::DiagnosticsCollector;
using ffibridge::frontend::internal::IRDecl;
using ffibridge::frontend::internal::IRField;
using ffibridge::frontend::internal::IRType;
using ffibridge::frontend::internal::MakePath;
using ffibridge::frontend::internal::MakePointer;
using ffibridge::frontend::internal::MakePrimitive;
using ffibridge::frontend::internal::PrimitiveKind;
using ffibridge::frontend::internal::ResolvedDecl;
using ffibridge::lowering::ApplyIntegerWidths;
using ffibridge::lowering::CheckDeclMapping;
using ffibridge::lowering::CProfile;
using ffibridge::lowering::IsReservedWord;
using ffibridge::lowering::LoadReservedWords;
using ffibridge::lowering::MapAliasedType;
using ffibridge::lowering::MapCallingConvention;
using ffibridge::lowering::MapReturnType;
using ffibridge::lowering::MapType;
using ffibridge::lowering::TargetProfile;
using ffibridge::lowering::TargetType;
using ffibridge::lowering::TypeMapResult;
using ffibridge::lowering::ZigProfile;
namespace codes = ffibridge::frontend::internal::codes;

bool ExpectNamed(std::string_view name, const TypeMapResult& result, std::string_view expected) {
  if (!result.ok) {
    std::cerr << "FAIL(" << name << "): expected " << expected << ", got error: "
              << result.message << "\n";
    return false;
  }
  if (result.type.kind != TargetType::Kind::kNamed || result.type.name != expected) {
    std::cerr << "FAIL(" << name << "): expected " << expected << ", got " << result.type.name
              << "\n";
    return false;
  }
  return true;
}

bool ExpectFail(std::string_view name, const TypeMapResult& result,
                std::string_view expected_fragment) {
  if (result.ok) {
    std::cerr << "FAIL(" << name << "): expected failure, got success\n";
    return false;
  }
  if (result.message.find(expected_fragment) == std::string::npos) {
    std::cerr << "FAIL(" << name << "): expected message containing '" << expected_fragment
              << "', got: " << result.message << "\n";
    return false;
  }
  return true;
}

IRType Resolved(std::string path, std::string qualified, bool opaque = false) {
  IRType type = MakePath(std::move(path));
  type.resolved_name = std::move(qualified);
  type.resolved_opaque = opaque;
  return type;
}

IRType Unresolved(std::string path) {
  IRType type = MakePath(std::move(path));
  type.unresolved = true;
  return type;
}

IRType FunctionPointer(std::string convention) {
  IRType type;
  type.kind = IRType::Kind::kFunctionPointer;
  type.calling_convention = std::move(convention);
  type.is_nullable = true;
  type.children = {MakePrimitive(PrimitiveKind::kPointerSizedInt, 0, true),
                   Resolved("HWND", "um::winuser::HWND"),
                   MakePrimitive(PrimitiveKind::kInt, 32, false)};
  type.param_names = {"hwnd", "msg"};
  return type;
}

}  // namespace

int main() {
  const TargetProfile zig = ZigProfile();
  const TargetProfile c = CProfile();

  const IRType u32 = MakePrimitive(PrimitiveKind::kInt, 32, false);
  const IRType i64 = MakePrimitive(PrimitiveKind::kInt, 64, true);
  const IRType u128 = MakePrimitive(PrimitiveKind::kInt, 128, false);
  const IRType isize = MakePrimitive(PrimitiveKind::kPointerSizedInt, 0, true);
  const IRType f32 = MakePrimitive(PrimitiveKind::kFloat, 32, true);
  const IRType boolean = MakePrimitive(PrimitiveKind::kBool, 8, false);
  const IRType void_type = MakePrimitive(PrimitiveKind::kVoid);

  if (!ExpectNamed("zig-u32", MapType(u32, zig), "u32") ||
      !ExpectNamed("c-u32", MapType(u32, c), "uint32_t") ||
      !ExpectNamed("zig-i64", MapType(i64, zig), "i64") ||
      !ExpectNamed("c-i64", MapType(i64, c), "int64_t") ||
      !ExpectNamed("zig-isize", MapType(isize, zig), "isize") ||
      !ExpectNamed("c-isize", MapType(isize, c), "intptr_t") ||
      !ExpectNamed("c-f32", MapType(f32, c), "float") ||
      !ExpectNamed("zig-bool", MapType(boolean, zig), "bool") ||
      !ExpectNamed("zig-u128", MapType(u128, zig), "u128")) {
    return 1;
  }
  if (!ExpectFail("c-u128", MapType(u128, c), "c has no 128-bit integer")) {
    return 1;
  }

  // void only exists as a return type or behind a pointer.
  if (!ExpectFail("void-value", MapType(void_type, zig), "void cannot be used by value")) {
    return 1;
  }
  const TypeMapResult void_return = MapReturnType(void_type, zig);
  if (!void_return.ok || !void_return.type.is_void || void_return.type.name != "void") {
    std::cerr << "FAIL(void-return): void should be a valid return type\n";
    return 1;
  }
  const TypeMapResult zig_void_ptr = MapType(MakePointer(void_type, true), zig);
  const TypeMapResult c_void_ptr = MapType(MakePointer(void_type, false), c);
  if (!zig_void_ptr.ok || zig_void_ptr.type.kind != TargetType::Kind::kPointer ||
      zig_void_ptr.type.is_const || zig_void_ptr.type.children[0].name != "anyopaque" ||
      !c_void_ptr.ok || !c_void_ptr.type.is_const ||
      c_void_ptr.type.children[0].name != "void") {
    std::cerr << "FAIL(void-pointer): wrong pointee spelling or constness\n";
    return 1;
  }

  // Declarations are referenced by qualified name; unknown ones are opaque
  // behind a pointer and rejected by value.
  const TypeMapResult reference = MapType(Resolved("HANDLE", "um::winnt::HANDLE"), zig);
  if (!reference.ok || reference.type.kind != TargetType::Kind::kReference ||
      reference.type.name != "um::winnt::HANDLE") {
    std::cerr << "FAIL(reference): resolved path should map to a reference\n";
    return 1;
  }
  const TypeMapResult placeholder = MapType(MakePointer(Unresolved("MISSING"), true), c);
  if (!placeholder.ok || placeholder.type.children[0].kind != TargetType::Kind::kOpaque) {
    std::cerr << "FAIL(placeholder): unresolved pointee should be opaque\n";
    return 1;
  }
  if (!ExpectFail("unresolved-value", MapType(Unresolved("MISSING"), c),
                  "unresolved type 'MISSING' used by value") ||
      !ExpectFail("opaque-value", MapType(Resolved("HWND__", "um::winuser::HWND__", true), zig),
                  "opaque type 'um::winuser::HWND__' used by value")) {
    return 1;
  }
  if (!MapAliasedType(Resolved("HWND__", "um::winuser::HWND__", true), zig).ok) {
    std::cerr << "FAIL(opaque-alias): aliasing an opaque type is allowed\n";
    return 1;
  }
  IRType generic = Resolved("Option", "core::option::Option");
  generic.children.push_back(u32);
  if (!ExpectFail("generic", MapType(generic, zig), "generic type Option<u32> has no zig")) {
    return 1;
  }

  IRType array = ffibridge::frontend::internal::MakeArray(
      MakePrimitive(PrimitiveKind::kInt, 8, false),
      ffibridge::frontend::internal::MakeIntExpr("8"));
  array.resolved_length = 8;
  const TypeMapResult mapped_array = MapType(array, c);
  if (!mapped_array.ok || mapped_array.type.kind != TargetType::Kind::kArray ||
      mapped_array.type.length != 8 || mapped_array.type.children[0].name != "uint8_t") {
    std::cerr << "FAIL(array): expected uint8_t[8]\n";
    return 1;
  }

  // Calling conventions.
  const TypeMapResult zig_callback = MapType(FunctionPointer("system"), zig);
  const TypeMapResult c_callback = MapType(FunctionPointer("system"), c);
  if (!zig_callback.ok || zig_callback.type.calling_convention != "WINAPI" ||
      !zig_callback.type.is_nullable || zig_callback.type.children.size() != 3 ||
      !c_callback.ok || c_callback.type.calling_convention != "__stdcall") {
    std::cerr << "FAIL(callback): wrong calling convention spelling\n";
    return 1;
  }
  if (!ExpectFail("c-win64", MapType(FunctionPointer("win64"), c),
                  "calling convention \"win64\" is not supported by c")) {
    return 1;
  }
  std::string spelling;
  if (!MapCallingConvention("", zig, &spelling) || spelling != ".C" ||
      !MapCallingConvention("C", c, &spelling) || !spelling.empty() ||
      MapCallingConvention("efiapi", zig, &spelling)) {
    std::cerr << "FAIL(calling-convention): unexpected mapping\n";
    return 1;
  }

  // Declaration checks report one MappingError per failing type.
  IRDecl record;
  record.kind = IRDecl::Kind::kStruct;
  record.module_path = "um::winnt";
  record.name = "M128A";
  IRField low;
  low.name = "Low";
  low.type = u128;
  IRField high;
  high.name = "High";
  high.type = i64;
  record.fields = {low, high};
  ResolvedDecl resolved_record;
  resolved_record.decl = record;
  DiagnosticsCollector diags;
  if (!CheckDeclMapping(resolved_record, zig, &diags) || !diags.diagnostics().empty()) {
    std::cerr << "FAIL(check-zig): M128A is expressible in zig\n";
    return 1;
  }
  if (CheckDeclMapping(resolved_record, c, &diags) ||
      diags.CountWithCode(codes::kMappingError) != 1 ||
      diags.diagnostics()[0].message.find("field 'Low'") == std::string::npos ||
      diags.diagnostics()[0].qualified_name != "um::winnt::M128A") {
    std::cerr << "FAIL(check-c): expected one MappingError for field Low\n";
    return 1;
  }

  IRDecl function;
  function.kind = IRDecl::Kind::kFunction;
  function.module_path = "um::fileapi";
  function.name = "FlushFileBuffers";
  function.calling_convention = "win64";
  function.linkage_name = "FlushFileBuffers";
  function.return_type = MakePrimitive(PrimitiveKind::kInt, 32, true);
  ResolvedDecl resolved_function;
  resolved_function.decl = function;
  DiagnosticsCollector fn_diags;
  if (CheckDeclMapping(resolved_function, c, &fn_diags) ||
      !CheckDeclMapping(resolved_function, zig, &fn_diags) ||
      fn_diags.CountWithCode(codes::kMappingError) != 1) {
    std::cerr << "FAIL(check-function): win64 is only expressible in zig\n";
    return 1;
  }

  // Profile adjustments.
  TargetProfile narrow = ZigProfile();
  const auto widths = ApplyIntegerWidths("8, 16,32", &narrow);
  if (!widths.ok || narrow.available_integer_widths.size() != 3) {
    std::cerr << "FAIL(int-widths): " << widths.output << "\n";
    return 1;
  }
  if (!ExpectFail("narrow-i64", MapType(i64, narrow), "zig has no 64-bit integer")) {
    return 1;
  }
  const auto bad_widths = ApplyIntegerWidths("8,12", &narrow);
  if (bad_widths.ok || bad_widths.output.find("invalid integer width '12'") == std::string::npos ||
      narrow.available_integer_widths.size() != 3) {
    std::cerr << "FAIL(int-widths-invalid): expected rejection without changes\n";
    return 1;
  }

  if (!IsReservedWord(zig, "type") || !IsReservedWord(zig, "u7") ||
      !IsReservedWord(zig, "anyopaque") || IsReservedWord(zig, "HANDLE") ||
      !IsReservedWord(c, "int") || !IsReservedWord(c, "uint32_t") || IsReservedWord(c, "type")) {
    std::cerr << "FAIL(reserved): unexpected reserved word classification\n";
    return 1;
  }
  TargetProfile extended = CProfile();
  const auto loaded =
      LoadReservedWords(std::string(FFIBRIDGE_TEST_DATA_DIR) + "/reserved_words.txt", &extended);
  if (!loaded.ok || loaded.output != "3" || !IsReservedWord(extended, "HANDLE") ||
      !IsReservedWord(extended, "msg") || IsReservedWord(extended, "trailing")) {
    std::cerr << "FAIL(reserved-file): " << loaded.output << "\n";
    return 1;
  }
  if (LoadReservedWords(std::string(FFIBRIDGE_TEST_DATA_DIR) + "/no_such_file.txt", &extended)
          .ok) {
    std::cerr << "FAIL(reserved-missing): expected failure for a missing file\n";
    return 1;
  }

  return 0;
}
