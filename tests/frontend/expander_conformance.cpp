#include "expander.h"
#include "syntax_dump.h"

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

using ffibridge::frontend::internal::DiagnosticsCollector;
using ffibridge::frontend::internal::DumpModule;
using ffibridge::frontend::internal::EvaluateCfg;
using ffibridge::frontend::internal::ExpandOptions;
using ffibridge::frontend::internal::ExpandSourceFile;
using ffibridge::frontend::internal::ExpandUseTree;
using ffibridge::frontend::internal::IRImport;
using ffibridge::frontend::internal::IRModule;
using ffibridge::frontend::internal::ReadSyntaxDump;
using ffibridge::frontend::internal::SyntaxReadResult;
namespace codes = ffibridge::frontend::internal::codes;

bool Expand(std::string_view name, const std::string& text, DiagnosticsCollector* diags,
            std::vector<IRModule>* out) {
  const SyntaxReadResult read = ReadSyntaxDump(text, std::string(name) + ".dump");
  if (!read.ok) {
    std::cerr << "FAIL(" << name << "): syntax dump rejected: " << read.message << "\n";
    return false;
  }
  *out = ExpandSourceFile(read.file, ExpandOptions{}, diags);
  return true;
}

bool ExpectContains(std::string_view name, const std::string& haystack, std::string_view needle) {
  if (haystack.find(needle) == std::string::npos) {
    std::cerr << "FAIL(" << name << "): expected to find:\n" << needle << "\nin:\n" << haystack;
    return false;
  }
  return true;
}

bool ExpectCount(std::string_view name, const DiagnosticsCollector& diags, std::string_view code,
                 std::size_t expected) {
  const std::size_t got = diags.CountWithCode(code);
  if (got != expected) {
    std::cerr << "FAIL(" << name << "): expected " << expected << " " << code << ", got " << got
              << "\n";
    return false;
  }
  return true;
}

bool ExpectImport(std::string_view name, const IRImport& import, std::string_view target,
                  std::string_view local_name, bool is_glob) {
  if (import.target != target || import.local_name != local_name || import.is_glob != is_glob) {
    std::cerr << "FAIL(" << name << "): got target '" << import.target << "' local '"
              << import.local_name << "' glob " << import.is_glob << "\n";
    return false;
  }
  return true;
}

bool ExpectCfg(std::string_view predicate, const ExpandOptions& options, bool expected) {
  bool value = !expected;
  std::string error;
  if (!EvaluateCfg(predicate, options, &value, &error)) {
    std::cerr << "FAIL(cfg): '" << predicate << "' rejected: " << error << "\n";
    return false;
  }
  if (value != expected) {
    std::cerr << "FAIL(cfg): '" << predicate << "' evaluated to " << value << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  // Ten items; the function with a body has no expansion rule.
  const std::string macros = R"(File: um::sample
  Macro: STRUCT @3:1
    Struct: GUID
      Field: Data1
        Path: DWORD
      Field: Data4
        Array
          Path: BYTE
          IntLit: 8
  Macro: ENUM @9:1
    Enum: COLOR
      Variant: RED
        IntLit: 1
      Variant: GREEN
  Macro: DEFINE_GUID @14:1
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
  Macro: DECLARE_HANDLE @27:1
    Ident: HWND
    Ident: HWND__
  Macro: FN @28:1
    Ident: WNDPROC
    FnPtr: system
      Param: hwnd
        Path: HWND
      Param: msg
        Path: u32
      Return
        Path: isize
  Macro: BITFLAGS @35:1
    Ident: STYLE
    Path: u32
    Flag: BORDER
      IntLit: 0x1
    Flag: CAPTION
      Binary: |
        PathExpr: STYLE::BORDER
        IntLit: 0x2
  Fn: helper @42:1
    Attr: pub
  TypeAlias: LPVOID @45:1
    Attr: pub
    Ptr: mut
      Path: c_void
  Const: MAX_PATH @46:1
    Attr: pub
    Path: usize
    IntLit: 260usize
  Struct: Packed @47:1
    Attr: repr(C, packed(2))
    Field: a
      Path: u8
    Field: b
      Path: u32
)";
  DiagnosticsCollector diags;
  std::vector<IRModule> modules;
  if (!Expand("macros", macros, &diags, &modules)) {
    return 1;
  }
  if (modules.size() != 1) {
    std::cerr << "FAIL(macros): expected one module, got " << modules.size() << "\n";
    return 1;
  }
  // DECLARE_HANDLE! yields two declarations; the function yields none.
  if (modules[0].decls.size() != 10) {
    std::cerr << "FAIL(macros): expected 10 declarations, got " << modules[0].decls.size()
              << "\n" << DumpModule(modules[0]);
    return 1;
  }
  if (!ExpectCount("macros", diags, codes::kUnsupportedConstruct, 1) ||
      diags.diagnostics()[0].qualified_name != "um::sample::helper") {
    return 1;
  }

  const std::string dump = DumpModule(modules[0]);
  const char* const kExpected[] = {
      "Module: um::sample\n",
      "  Struct: um::sample::GUID [pub] [origin=STRUCT!] [layout=c native]\n"
      "    Field: Data1 : DWORD\n"
      "    Field: Data4 : [BYTE; 8]\n",
      "  Enum: um::sample::COLOR [pub] [origin=ENUM!] [c-like repr=u32]\n"
      "    Variant: RED = 1\n"
      "    Variant: GREEN\n",
      "  Constant: um::sample::IID_Sample [pub] [origin=DEFINE_GUID!] : GUID = GUID { Data1: "
      "0x12345678, Data2: 0x9ABC, Data3: 0xDEF0, Data4: [0x01, 0x02, 0x03, 0x04, 0x05, 0x06, "
      "0x07, 0x08] } [guid]\n",
      "  Struct: um::sample::HWND__ [pub] [origin=DECLARE_HANDLE!] [layout=c native] [opaque]\n",
      "  TypeAlias: um::sample::HWND [pub] [origin=DECLARE_HANDLE!] = *mut HWND__\n",
      "  TypeAlias: um::sample::WNDPROC [pub] [origin=FN!] = Option<extern \"system\" fn(hwnd: "
      "HWND, msg: u32) -> isize>\n",
      "  Struct: um::sample::STYLE [pub] [origin=BITFLAGS!] [layout=c native] [bitflags]\n"
      "    Field: bits : u32\n"
      "    Assoc: BORDER = 0x1\n"
      "    Assoc: CAPTION = (STYLE::BORDER | 0x2)\n",
      "  TypeAlias: um::sample::LPVOID [pub] [origin=type] = *mut c_void\n",
      "  Constant: um::sample::MAX_PATH [pub] [origin=const] : usize = 260usize\n",
      "  Struct: um::sample::Packed [origin=struct] [layout=packed pack=2 native]\n",
  };
  for (const char* expected : kExpected) {
    if (!ExpectContains("macros", dump, expected)) {
      return 1;
    }
  }

  // Malformed invocations are skipped with their own code.
  const std::string malformed = R"(File: m
  Macro: DEFINE_GUID
    Ident: IID_Short
    IntLit: 1
    IntLit: 2
  Macro: STRUCT
    Enum: NotAStruct
  Macro: DECLARE_HANDLE
    Ident: ONLY_ONE
  Macro: NOT_A_MACRO
    Ident: X
  Macro: BITFLAGS
    Ident: FLOAT_FLAGS
    Path: f32
    Flag: A
      IntLit: 0x1
  Struct: Good
    Field: x
      Path: i32
)";
  DiagnosticsCollector malformed_diags;
  if (!Expand("malformed", malformed, &malformed_diags, &modules)) {
    return 1;
  }
  if (!ExpectCount("malformed", malformed_diags, codes::kMalformedMacro, 3) ||
      !ExpectCount("malformed", malformed_diags, codes::kUnsupportedConstruct, 2)) {
    return 1;
  }
  bool rejected_float_flags = false;
  for (const auto& diag : malformed_diags.diagnostics()) {
    rejected_float_flags =
        rejected_float_flags ||
        diag.message == "BITFLAGS! backing type 'f32' is not an integer";
  }
  if (!rejected_float_flags) {
    std::cerr << "FAIL(bitflags-backing): f32 backing type was not rejected\n";
    return 1;
  }
  if (modules[0].decls.size() != 1 || modules[0].decls[0].name != "Good") {
    std::cerr << "FAIL(malformed): only Good should survive\n" << DumpModule(modules[0]);
    return 1;
  }

  // Unsupported field types skip the item; cfg-disabled items vanish silently.
  const std::string mixed = R"(File: um::mixed
  Struct: HasRef
    Field: r
      Ref
        Path: u8
  Struct: HasTuple
    Field: t
      Tuple
        Path: u8
        Path: u16
  Struct: LinuxOnly
    Attr: cfg(target_os = "linux")
    Field: x
      Path: i32
  Struct: WindowsOnly
    Attr: cfg(all(windows, target_pointer_width = "64"))
    Field: x
      Path: i32
  Enum: Opaque
  Mod: inner
    Attr: pub
    Const: ONE
      Path: u8
      IntLit: 1
  Use: super::shared::{minwindef::DWORD, ntdef::*}
)";
  DiagnosticsCollector mixed_diags;
  if (!Expand("mixed", mixed, &mixed_diags, &modules)) {
    return 1;
  }
  if (!ExpectCount("mixed", mixed_diags, codes::kUnsupportedConstruct, 2) ||
      mixed_diags.diagnostics().size() != 2) {
    return 1;
  }
  if (modules.size() != 2 || modules[1].path != "um::mixed::inner" ||
      modules[1].decls.size() != 1) {
    std::cerr << "FAIL(mixed): inline module was not expanded\n";
    return 1;
  }
  const std::string mixed_dump = DumpModule(modules[0]);
  if (!ExpectContains("mixed", mixed_dump, "  Import: um::shared::minwindef::DWORD\n") ||
      !ExpectContains("mixed", mixed_dump, "  Import: um::shared::ntdef::*\n") ||
      !ExpectContains("mixed", mixed_dump, "  Submodule: um::mixed::inner\n") ||
      !ExpectContains("mixed", mixed_dump, "Struct: um::mixed::WindowsOnly") ||
      !ExpectContains("mixed", mixed_dump,
                      "Struct: um::mixed::Opaque [origin=enum {}] [layout=default] [opaque]") ||
      !ExpectContains("mixed", mixed_dump, "Module: um::mixed::inner [pub] [origin=mod]")) {
    return 1;
  }
  if (mixed_dump.find("LinuxOnly") != std::string::npos) {
    std::cerr << "FAIL(mixed): cfg-disabled item was expanded\n";
    return 1;
  }

  // Use trees.
  std::vector<IRImport> imports;
  std::string error;
  if (!ExpandUseTree("self::fileapi::{self, CreateFileW as CreateFile, ReadFile}", "um",
                     &imports, &error)) {
    std::cerr << "FAIL(use-tree): " << error << "\n";
    return 1;
  }
  if (imports.size() != 3 ||
      !ExpectImport("use-self", imports[0], "um::fileapi", "fileapi", false) ||
      !ExpectImport("use-rename", imports[1], "um::fileapi::CreateFileW", "CreateFile", false) ||
      !ExpectImport("use-plain", imports[2], "um::fileapi::ReadFile", "ReadFile", false)) {
    return 1;
  }
  imports.clear();
  if (!ExpandUseTree("crate::shared::guiddef::*", "um::winuser", &imports, &error) ||
      imports.size() != 1 ||
      !ExpectImport("use-glob", imports[0], "shared::guiddef", "", true)) {
    return 1;
  }
  imports.clear();
  if (ExpandUseTree("a::{b, c", "m", &imports, &error)) {
    std::cerr << "FAIL(use-unclosed): expected failure\n";
    return 1;
  }

  // cfg predicates.
  ExpandOptions options;
  options.all_features = false;
  options.features = {"winuser"};
  if (!ExpectCfg("windows", options, true) || !ExpectCfg("unix", options, false) ||
      !ExpectCfg("target_arch = \"x86_64\"", options, true) ||
      !ExpectCfg("any(target_arch = \"x86\", target_arch = \"aarch64\")", options, false) ||
      !ExpectCfg("not(feature = \"fileapi\")", options, true) ||
      !ExpectCfg("all(feature = \"winuser\", target_env = \"msvc\")", options, true) ||
      !ExpectCfg("some_custom_flag", options, false)) {
    return 1;
  }
  bool value = false;
  if (EvaluateCfg("not(windows, unix)", options, &value, &error)) {
    std::cerr << "FAIL(cfg-not-arity): expected failure\n";
    return 1;
  }

  return 0;
}
