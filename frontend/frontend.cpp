#include "frontend.h"

#include "decl_ir.h"
#include "emit_order.h"
#include "symbol_table.h"
#include "syntax_dump.h"
#include "type_mapper.h"
#include "work_pool.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ffibridge::frontend {

namespace {

using internal::DiagnosticsCollector;
using internal::IRModule;
using internal::ResolvedDecl;
using internal::ResolvedModule;
using internal::Resolver;
using internal::SymbolTable;
using internal::WorkPool;

template <typename Fn>
auto RunTimedPhase(std::string_view phase_name, std::vector<PhaseTiming>* phase_timings, Fn&& fn)
    -> decltype(fn()) {
  const auto start = std::chrono::steady_clock::now();
  auto result = fn();
  const auto end = std::chrono::steady_clock::now();
  if (phase_timings != nullptr) {
    phase_timings->push_back(PhaseTiming{
        std::string(phase_name),
        std::chrono::duration<double>(end - start).count(),
    });
  }
  return result;
}

// A task that threw is an internal failure of the whole run.
void ThrowOnFailure(const WorkPool& pool, std::string_view phase_name) {
  for (const std::string& failure : pool.failures()) {
    if (!failure.empty()) {
      throw std::runtime_error(std::string(phase_name) + ": " + failure);
    }
  }
}

internal::ExpandOptions ExpandOptionsFor(const TranslateOptions& options) {
  internal::ExpandOptions expand = options.expand;
  expand.pointer_width = options.abi.pointer_width;
  return expand;
}

internal::ResolveOptions ResolveOptionsFor(const TranslateOptions& options) {
  internal::ResolveOptions resolve;
  resolve.pointer_width = options.abi.pointer_width;
  resolve.c_long_bits = options.abi.c_long_bits;
  resolve.wchar_bits = options.abi.wchar_bits;
  resolve.unresolved_policy = options.unresolved_policy;
  return resolve;
}

// Per-worker state of the layout and emission phases.
struct ModuleWorker {
  ModuleWorker(const SymbolTable& table, const TranslateOptions& options)
      : resolver(table, ResolveOptionsFor(options), &scratch), layout(options.abi, &resolver) {
    if (!layout.ok()) {
      throw std::runtime_error("invalid data layout: " + layout.error());
    }
  }

  // Lookups made for layout never report; diagnostics came from resolution.
  DiagnosticsCollector scratch;
  Resolver resolver;
  lowering::LayoutEngine layout;
};

std::vector<Diagnostic> Merge(const std::vector<DiagnosticsCollector>& parts,
                              const DiagnosticsCollector* tail = nullptr) {
  DiagnosticsCollector merged;
  for (const DiagnosticsCollector& part : parts) {
    merged.Append(part);
  }
  if (tail != nullptr) {
    merged.Append(*tail);
  }
  return merged.diagnostics();
}

}  // namespace

TranslationResult Translate(const std::vector<SourceFile>& corpus,
                            const TranslateOptions& options,
                            std::vector<PhaseTiming>* phase_timings) {
  TranslationResult result;
  try {
    WorkPool pool(options.jobs == 0 ? internal::DefaultJobCount() : options.jobs);
    const internal::ExpandOptions expand = ExpandOptionsFor(options);
    const internal::ResolveOptions resolve = ResolveOptionsFor(options);

    SymbolTable table;
    std::vector<DiagnosticsCollector> file_diags(corpus.size());
    RunTimedPhase("collect", phase_timings, [&]() {
      pool.RunAll(corpus.size(), [&](std::size_t i) {
        std::vector<IRModule> modules =
            internal::ExpandSourceFile(corpus[i], expand, &file_diags[i]);
        table.RegisterFile(i, std::move(modules));
      });
      ThrowOnFailure(pool, "collect");
      return 0;
    });

    // Barrier: every file is registered from here on.
    if (!table.Collisions().empty()) {
      DiagnosticsCollector collisions;
      table.ReportCollisions(&collisions);
      result.ok = true;
      result.aborted = true;
      result.diagnostics = Merge(file_diags, &collisions);
      return result;
    }

    const std::vector<const IRModule*> modules = table.Modules();
    std::vector<ResolvedModule> resolved(modules.size());
    std::vector<DiagnosticsCollector> module_diags(modules.size());

    RunTimedPhase("resolve", phase_timings, [&]() {
      pool.RunAll(modules.size(), [&](std::size_t i) {
        Resolver resolver(table, resolve, &module_diags[i]);
        resolved[i] = resolver.ResolveModule(*modules[i]);
        for (ResolvedDecl& decl : resolved[i].decls) {
          if (decl.emit && !lowering::CheckDeclMapping(decl, options.profile, &module_diags[i])) {
            decl.emit = false;
          }
        }
      });
      ThrowOnFailure(pool, "resolve");
      internal::PropagateOmissions(&resolved, options.unresolved_policy, &module_diags);
      return 0;
    });

    RunTimedPhase("layout", phase_timings, [&]() {
      pool.RunAll(modules.size(), [&](std::size_t i) {
        ModuleWorker worker(table, options);
        for (ResolvedDecl& decl : resolved[i].decls) {
          if (decl.emit &&
              !lowering::CheckDeclLayout(&worker.layout, options.profile, decl, &module_diags[i])) {
            decl.emit = false;
          }
        }
      });
      ThrowOnFailure(pool, "layout");
      internal::PropagateOmissions(&resolved, options.unresolved_policy, &module_diags);
      return 0;
    });

    std::vector<lowering::ModuleNames> names;
    lowering::NameMap all_names;
    RunTimedPhase("names", phase_timings, [&]() {
      names.reserve(resolved.size());
      for (const ResolvedModule& module : resolved) {
        names.push_back(lowering::AssignModuleNames(module, options.profile));
        all_names.insert(names.back().names.begin(), names.back().names.end());
      }
      return 0;
    });

    result.modules.resize(resolved.size());
    RunTimedPhase("emit", phase_timings, [&]() {
      pool.RunAll(resolved.size(), [&](std::size_t i) {
        ModuleWorker worker(table, options);
        std::unique_ptr<lowering::Emitter> emitter =
            lowering::MakeEmitter(options.profile, all_names, &worker.layout);
        result.modules[i] = emitter->EmitModule(resolved[i], names[i]);
      });
      ThrowOnFailure(pool, "emit");
      return 0;
    });

    result.ok = true;
    result.diagnostics = Merge(file_diags);
    const std::vector<Diagnostic> later = Merge(module_diags);
    result.diagnostics.insert(result.diagnostics.end(), later.begin(), later.end());
    return result;
  } catch (const std::exception& ex) {
    TranslationResult failed;
    failed.ok = false;
    failed.message = ex.what();
    return failed;
  }
}

ParseResult DumpIr(const std::vector<SourceFile>& corpus, const TranslateOptions& options,
                   std::vector<Diagnostic>* diagnostics,
                   std::vector<PhaseTiming>* phase_timings) {
  try {
    WorkPool pool(options.jobs == 0 ? internal::DefaultJobCount() : options.jobs);
    const internal::ExpandOptions expand = ExpandOptionsFor(options);
    std::vector<std::vector<IRModule>> expanded(corpus.size());
    std::vector<DiagnosticsCollector> file_diags(corpus.size());
    RunTimedPhase("expand", phase_timings, [&]() {
      pool.RunAll(corpus.size(), [&](std::size_t i) {
        expanded[i] = internal::ExpandSourceFile(corpus[i], expand, &file_diags[i]);
      });
      ThrowOnFailure(pool, "expand");
      return 0;
    });

    std::ostringstream out;
    RunTimedPhase("ir-dump", phase_timings, [&]() {
      for (const std::vector<IRModule>& modules : expanded) {
        for (const IRModule& module : modules) {
          out << internal::DumpModule(module);
        }
      }
      return 0;
    });
    if (diagnostics != nullptr) {
      *diagnostics = Merge(file_diags);
    }
    return ParseResult{true, out.str()};
  } catch (const std::exception& ex) {
    return ParseResult{false, ex.what()};
  }
}

ParseResult LoadSourceFile(std::string_view text, std::string_view filename, SourceFile* out) {
  internal::SyntaxReadResult read = internal::ReadSyntaxDump(text, filename);
  if (!read.ok) {
    return ParseResult{false, read.message};
  }
  *out = std::move(read.file);
  return ParseResult{true, ""};
}

}  // namespace ffibridge::frontend
