#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "diagnostics.h"
#include "emitter.h"
#include "expander.h"
#include "layout.h"
#include "resolver.h"
#include "syntax.h"
#include "target_profile.h"

namespace ffibridge::frontend {

using internal::Diagnostic;
using internal::SourceFile;

struct ParseResult {
  bool ok;
  std::string output;
};

struct PhaseTiming {
  std::string name;
  double seconds = 0.0;
};

struct TranslateOptions {
  lowering::TargetProfile profile = lowering::ZigProfile();
  lowering::NativeAbi abi;
  internal::ExpandOptions expand;
  internal::UnresolvedPolicy unresolved_policy = internal::UnresolvedPolicy::kPlaceholder;
  // 0 picks one worker per hardware thread.
  unsigned jobs = 0;
};

struct TranslationResult {
  // False only when the run itself failed (bad data layout, internal error);
  // `message` says why. Per-declaration failures are diagnostics.
  bool ok = false;
  std::string message;
  // A name collision stopped the run after collection; `modules` is empty.
  bool aborted = false;
  std::vector<lowering::EmittedModule> modules;
  std::vector<Diagnostic> diagnostics;
};

// Expands, collects, resolves and emits a corpus of source files. Files are
// expanded in parallel, modules resolved and emitted in parallel; the result
// does not depend on the number of workers.
TranslationResult Translate(const std::vector<SourceFile>& corpus,
                            const TranslateOptions& options,
                            std::vector<PhaseTiming>* phase_timings = nullptr);

// Canonical dump of the expanded IR of every file, in input order. Expansion
// diagnostics go to `diagnostics`.
ParseResult DumpIr(const std::vector<SourceFile>& corpus, const TranslateOptions& options,
                   std::vector<Diagnostic>* diagnostics,
                   std::vector<PhaseTiming>* phase_timings = nullptr);

// Reads one syntax dump file.
ParseResult LoadSourceFile(std::string_view text, std::string_view filename, SourceFile* out);

}  // namespace ffibridge::frontend
