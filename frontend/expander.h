#pragma once

#include <set>
#include <string>
#include <vector>

#include "decl_ir.h"
#include "diagnostics.h"
#include "syntax.h"

namespace ffibridge::frontend::internal {

struct ExpandOptions {
  // Library used for foreign blocks without #[link(name = "...")].
  std::string default_library = "kernel32";

  // cfg(...) evaluation context.
  std::string target_arch = "x86_64";
  std::string target_os = "windows";
  std::string target_env = "msvc";
  int pointer_width = 64;
  bool all_features = true;
  std::set<std::string> features;
};

// Desugars one source file into IR modules: the file's own module first,
// then one module per inline `mod` item in source order. Items that have no
// expansion rule are reported on `diags` and skipped.
std::vector<IRModule> ExpandSourceFile(const SourceFile& file, const ExpandOptions& options,
                                       DiagnosticsCollector* diags);

// `a::b::{C, D as E, f::*}` -> individual imports. Relative prefixes
// (self, super, crate) are made absolute against `module_path`.
bool ExpandUseTree(std::string_view tree, std::string_view module_path,
                   std::vector<IRImport>* out, std::string* error);

bool EvaluateCfg(std::string_view predicate, const ExpandOptions& options, bool* value,
                 std::string* error);

}  // namespace ffibridge::frontend::internal
