#include "emit_order.h"
#include "frontend.h"

#include <iostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace {

using ffibridge::frontend::LoadSourceFile;
using ffibridge::frontend::SourceFile;
using ffibridge::frontend::Translate;
using ffibridge::frontend::TranslateOptions;
using ffibridge::frontend::TranslationResult;
using ffibridge::lowering::CProfile;
using ffibridge::lowering::EmittedModule;
using ffibridge::lowering::ModuleAlias;
using ffibridge::lowering::ModuleFilePath;
using ffibridge::lowering::RelativeFilePath;
using ffibridge::lowering::UniqueName;
using ffibridge::lowering::ZigProfile;

const char kBase[] = R"(File: demo::base
  Use: ctypes::{c_int, c_void}
  Macro: DECLARE_HANDLE
    Ident: HWND
    Ident: HWND__
  TypeAlias: HANDLE
    Attr: pub
    Ptr: mut
      Path: c_void
  Struct: POINT
    Attr: pub
    Attr: repr(C)
    Field: x
      Path: c_int
    Field: y
      Path: c_int
  Const: MAX_COUNT
    Attr: pub
    Path: u32
    IntLit: 0x10
  Const: error
    Attr: pub
    Path: u8
    IntLit: 7
)";

// WRAPPER holds INNER by value before INNER is declared.
const char kUser[] = R"(File: demo::user
  Use: demo::base::{HANDLE, POINT}
  Struct: RECT
    Attr: pub
    Attr: repr(C)
    Field: topLeft
      Path: POINT
    Field: test
      Path: u8
  Struct: NODE
    Attr: pub
    Attr: repr(C)
    Field: next
      Ptr: mut
        Path: NODE
  Struct: WRAPPER
    Attr: pub
    Attr: repr(C)
    Field: inner
      Path: INNER
  Struct: INNER
    Attr: pub
    Attr: repr(C)
    Field: value
      Path: u16
  ForeignMod: system
    Attr: link(name = "user32")
    ForeignFn: GetHandle
      Attr: pub
      Param: point
        Ptr: const
          Path: POINT
      Return
        Path: HANDLE
  Macro: ENUM
    Enum: MODE
      Variant: MODE_A
        IntLit: 1
      Variant: MODE_B
)";

// Names used before their declarations, and a constant of enum type.
const char kOrder[] = R"(File: demo::order
  Use: ctypes::c_int
  Enum: Color
    Attr: pub
    Attr: repr(u32)
    Variant: Red
    Variant: Green
  Const: DEFAULT_COLOR
    Attr: pub
    Path: Color
    PathExpr: Color::Green
  Struct: S
    Attr: pub
    Attr: repr(C)
    Field: p
      Ptr: mut
        Path: LPINT
  ForeignMod: system
    Attr: link(name = "demo")
    ForeignFn: Take
      Attr: pub
      Param: v
        Path: MYINT
      Return
        Path: i32
  TypeAlias: LPINT
    Attr: pub
    Ptr: mut
      Path: c_int
  TypeAlias: MYINT
    Attr: pub
    Path: c_int
)";

const char kZigBase[] = R"(// Generated by ffibridge from base.dump.

pub const HWND__ = opaque {};

pub const HWND = ?*HWND__;

pub const HANDLE = ?*anyopaque;

pub const POINT = extern struct {
    x: i32,
    y: i32,
};

pub const MAX_COUNT: u32 = 0x10;

pub const error_: u8 = 7;
)";

const char kZigUser[] = R"(// Generated by ffibridge from user.dump.

const std = @import("std");
const WINAPI = std.os.windows.WINAPI;

const demo_base = @import("base.zig");

pub const RECT = extern struct {
    topLeft: demo_base.POINT,
    test_: u8,
};

pub const NODE = extern struct {
    next: ?*NODE,
};

pub const INNER = extern struct {
    value: u16,
};

pub const WRAPPER = extern struct {
    inner: INNER,
};

pub extern "user32" fn GetHandle(
    point: ?*const demo_base.POINT,
) callconv(WINAPI) demo_base.HANDLE;

pub const MODE = u32;
pub const MODE_A: MODE = 1;
pub const MODE_B: MODE = 2;
)";

const char kCBase[] = R"(/* Generated by ffibridge from base.dump. */
#ifndef FFIBRIDGE_DEMO_BASE_H_
#define FFIBRIDGE_DEMO_BASE_H_

#include <stdbool.h>
#include <stdint.h>

typedef struct HWND__ HWND__;

typedef HWND__ *HWND;

typedef void *HANDLE;

typedef struct POINT {
    int32_t x;
    int32_t y;
} POINT;

#define MAX_COUNT ((uint32_t)0x10)

#define error ((uint8_t)7)

#endif /* FFIBRIDGE_DEMO_BASE_H_ */
)";

const char kCUser[] = R"(/* Generated by ffibridge from user.dump. */
#ifndef FFIBRIDGE_DEMO_USER_H_
#define FFIBRIDGE_DEMO_USER_H_

#include <stdbool.h>
#include <stdint.h>

#include "demo/base.h"

#if defined(_MSC_VER)
#pragma comment(lib, "user32.lib")
#endif

typedef struct POINT POINT;
typedef struct RECT {
    POINT topLeft;
    uint8_t test;
} RECT;

typedef struct NODE NODE;
struct NODE {
    NODE *next;
};

typedef struct INNER {
    uint16_t value;
} INNER;

typedef struct WRAPPER {
    INNER inner;
} WRAPPER;

extern HANDLE __stdcall GetHandle(const POINT *point);

typedef uint32_t MODE;
#define MODE_A ((MODE)1)
#define MODE_B ((MODE)2)

#endif /* FFIBRIDGE_DEMO_USER_H_ */
)";

const char kZigOrder[] = R"(// Generated by ffibridge from order.dump.

const std = @import("std");
const WINAPI = std.os.windows.WINAPI;

pub const Color = enum(u32) {
    Red = 0,
    Green = 1,
    _,
};

pub const DEFAULT_COLOR: Color = @enumFromInt(1);

pub const S = extern struct {
    p: ?*LPINT,
};

pub extern "demo" fn Take(
    v: MYINT,
) callconv(WINAPI) i32;

pub const LPINT = ?*i32;

pub const MYINT = i32;
)";

// Typedefs come before their first use; only records can be stubbed.
const char kCOrder[] = R"(/* Generated by ffibridge from order.dump. */
#ifndef FFIBRIDGE_DEMO_ORDER_H_
#define FFIBRIDGE_DEMO_ORDER_H_

#include <stdbool.h>
#include <stdint.h>

#if defined(_MSC_VER)
#pragma comment(lib, "demo.lib")
#endif

typedef uint32_t Color;
#define Color_Red ((Color)0)
#define Color_Green ((Color)1)

#define DEFAULT_COLOR ((Color)1)

typedef int32_t *LPINT;

typedef struct S {
    LPINT *p;
} S;

typedef int32_t MYINT;

extern int32_t __stdcall Take(MYINT v);

#endif /* FFIBRIDGE_DEMO_ORDER_H_ */
)";

bool Load(std::string_view text, std::string_view filename, std::vector<SourceFile>* corpus) {
  SourceFile file;
  const auto loaded = LoadSourceFile(text, filename, &file);
  if (!loaded.ok) {
    std::cerr << "FAIL(load-" << filename << "): " << loaded.output << "\n";
    return false;
  }
  corpus->push_back(std::move(file));
  return true;
}

const EmittedModule* FindModule(const TranslationResult& result, std::string_view path) {
  for (const EmittedModule& module : result.modules) {
    if (module.module_path == path) {
      return &module;
    }
  }
  return nullptr;
}

bool ExpectModule(std::string_view name, const TranslationResult& result,
                  std::string_view module_path, std::string_view relative_path,
                  std::string_view expected) {
  const EmittedModule* module = FindModule(result, module_path);
  if (module == nullptr) {
    std::cerr << "FAIL(" << name << "): module " << module_path << " was not emitted\n";
    return false;
  }
  if (module->relative_path != relative_path) {
    std::cerr << "FAIL(" << name << "): expected path " << relative_path << ", got "
              << module->relative_path << "\n";
    return false;
  }
  if (module->text != expected) {
    std::cerr << "FAIL(" << name << "): emitted text differs\n--- expected\n"
              << expected << "--- got\n"
              << module->text;
    return false;
  }
  return true;
}

bool ExpectClean(std::string_view name, const TranslationResult& result) {
  if (!result.ok || result.aborted) {
    std::cerr << "FAIL(" << name << "): run failed: " << result.message << "\n";
    return false;
  }
  if (!result.diagnostics.empty()) {
    std::cerr << "FAIL(" << name << "): unexpected diagnostic "
              << result.diagnostics[0].code << " " << result.diagnostics[0].message << "\n";
    return false;
  }
  return true;
}

bool ExpectEqual(std::string_view name, const std::string& got, std::string_view expected) {
  if (got != expected) {
    std::cerr << "FAIL(" << name << "): expected '" << expected << "', got '" << got << "'\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  std::vector<SourceFile> corpus;
  if (!Load(kBase, "base.dump", &corpus) || !Load(kUser, "user.dump", &corpus)) {
    return 1;
  }

  TranslateOptions zig;
  zig.profile = ZigProfile();
  zig.jobs = 1;
  const TranslationResult zig_result = Translate(corpus, zig);
  if (!ExpectClean("zig", zig_result) ||
      !ExpectModule("zig-base", zig_result, "demo::base", "demo/base.zig", kZigBase) ||
      !ExpectModule("zig-user", zig_result, "demo::user", "demo/user.zig", kZigUser)) {
    return 1;
  }

  TranslateOptions c;
  c.profile = CProfile();
  c.jobs = 1;
  const TranslationResult c_result = Translate(corpus, c);
  if (!ExpectClean("c", c_result) ||
      !ExpectModule("c-base", c_result, "demo::base", "demo/base.h", kCBase) ||
      !ExpectModule("c-user", c_result, "demo::user", "demo/user.h", kCUser)) {
    return 1;
  }

  std::vector<SourceFile> order_corpus;
  if (!Load(kOrder, "order.dump", &order_corpus)) {
    return 1;
  }
  const TranslationResult zig_order = Translate(order_corpus, zig);
  if (!ExpectClean("zig-order", zig_order) ||
      !ExpectModule("zig-order", zig_order, "demo::order", "demo/order.zig", kZigOrder)) {
    return 1;
  }
  const TranslationResult c_order = Translate(order_corpus, c);
  if (!ExpectClean("c-order", c_order) ||
      !ExpectModule("c-order", c_order, "demo::order", "demo/order.h", kCOrder)) {
    return 1;
  }

  // Name disambiguation.
  const auto zig_profile = ZigProfile();
  std::set<std::string> taken = {"Value", "Value_"};
  if (!ExpectEqual("unique-suffix", UniqueName("Value", zig_profile, &taken), "Value_2") ||
      !ExpectEqual("unique-next", UniqueName("Value", zig_profile, &taken), "Value_3") ||
      !ExpectEqual("unique-reserved", UniqueName("fn", zig_profile, &taken), "fn_") ||
      !ExpectEqual("unique-digit", UniqueName("3D", zig_profile, &taken), "_3D") ||
      !ExpectEqual("unique-free", UniqueName("POINT", zig_profile, &taken), "POINT")) {
    return 1;
  }
  if (taken.count("Value_3") == 0 || taken.count("_3D") == 0) {
    std::cerr << "FAIL(unique-taken): assigned names were not recorded\n";
    return 1;
  }

  // Output file layout.
  if (!ExpectEqual("file-path", ModuleFilePath("um::winuser", zig_profile), "um/winuser.zig") ||
      !ExpectEqual("file-path-root", ModuleFilePath("", CProfile()), "lib.h") ||
      !ExpectEqual("relative-up",
                   RelativeFilePath("um/winuser.zig", "shared/minwindef.zig"),
                   "../shared/minwindef.zig") ||
      !ExpectEqual("relative-sibling", RelativeFilePath("um/winuser.zig", "um/winnt.zig"),
                   "winnt.zig") ||
      !ExpectEqual("relative-down", RelativeFilePath("lib.zig", "um/winnt.zig"),
                   "um/winnt.zig") ||
      !ExpectEqual("alias", ModuleAlias("um::winuser"), "um_winuser")) {
    return 1;
  }

  return 0;
}
