#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "decl_ir.h"
#include "resolver.h"
#include "target_profile.h"

namespace ffibridge::lowering {

struct EmittedName {
  std::string module_path;
  std::string name;
  frontend::internal::IRDecl::Kind kind = frontend::internal::IRDecl::Kind::kConstant;
  // Enum variant or bitflags constant rather than a declaration.
  bool is_member = false;
  // Enum emitted as a distinct type that integers do not convert to.
  bool is_tagged_enum = false;
};

// Qualified name -> emitted name, for every module of a run.
using NameMap = std::map<std::string, EmittedName>;

struct ModuleNames {
  std::string module_path;
  NameMap names;
  // Emitted names of the module's re-exports, parallel to
  // ResolvedModule::exports.
  std::vector<std::string> export_names;
  // Referenced module path -> local import name (Zig only).
  std::map<std::string, std::string> import_aliases;
};

// `wanted` when free, otherwise `wanted_`, `wanted_2`, `wanted_3`, ... A
// leading digit gets a `_` prefix first. The result is added to `taken`.
std::string UniqueName(std::string_view wanted, const TargetProfile& profile,
                       std::set<std::string>* taken);

// Assigns the module-scope names of one module's output in declaration order,
// so the assignment does not depend on scheduling.
ModuleNames AssignModuleNames(const frontend::internal::ResolvedModule& module,
                              const TargetProfile& profile);

// Indices of the emitted declarations of `module`: dependencies first,
// otherwise in source order. C also needs every typedef named before use;
// only structs and unions can be forward-declared there.
std::vector<std::size_t> EmitOrder(const frontend::internal::ResolvedModule& module,
                                   const TargetProfile& profile);

// `um::winuser` -> `um/winuser.zig`.
std::string ModuleFilePath(std::string_view module_path, const TargetProfile& profile);

// Path of `to` relative to the directory containing `from`.
std::string RelativeFilePath(std::string_view from, std::string_view to);

// `um::winuser` -> `um_winuser`.
std::string ModuleAlias(std::string_view module_path);

}  // namespace ffibridge::lowering
