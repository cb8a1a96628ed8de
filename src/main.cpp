#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "frontend.h"
#include "layout.h"
#include "target_profile.h"
#include "version.h"

namespace {

using ffibridge::frontend::Diagnostic;
using ffibridge::frontend::PhaseTiming;
using ffibridge::frontend::SourceFile;
using ffibridge::frontend::TranslateOptions;

void print_usage() {
  std::cout << "ffibridge <command> [options]\n"
            << "\n"
            << "Commands:\n"
            << "  --version            Print version\n"
            << "  translate <input>... [-o <dir>] [options]\n"
            << "                       Emit one binding file per module\n"
            << "  check <input>... [options]\n"
            << "                       Resolve, map and lay out without writing output\n"
            << "  dump-ir <input>... [options]\n"
            << "                       Print the expanded declaration IR\n"
            << "\n"
            << "Inputs are syntax dump files, or directories searched for *.dump.\n"
            << "\n"
            << "Options:\n"
            << "  --target-lang=zig|c  Output language (default zig)\n"
            << "  --triple=<triple>    Native ABI from a registered LLVM target\n"
            << "  --data-layout=<dl>   Native ABI data layout string\n"
            << "  --int-widths=<list>  Integer widths the target has (e.g. 8,16,32,64)\n"
            << "  --reserved-words=<file>\n"
            << "                       Extra identifiers the output must avoid\n"
            << "  --link-name=<lib>    Library for foreign blocks without #[link]\n"
            << "  --unresolved=placeholder|omit\n"
            << "                       Handling of unresolved references\n"
            << "  --no-packed          Target cannot express packed layout\n"
            << "  --no-aligned         Target cannot express over-alignment\n"
            << "  --jobs=<n>           Worker threads (default: hardware threads)\n"
            << "  --time-phases        Print phase timings\n"
            << "  --verbose            Print per-module progress\n"
            << "  --werror             Treat warnings as errors\n";
}

bool ReadFile(std::string_view path, std::string* out) {
  std::ifstream input{std::string(path)};
  if (!input.is_open()) {
    return false;
  }

  std::ostringstream buffer;
  buffer << input.rdbuf();
  *out = buffer.str();
  return true;
}

bool WriteFile(std::string_view path, std::string_view contents) {
  std::ofstream output{std::string(path)};
  if (!output.is_open()) {
    return false;
  }
  output << contents;
  return output.good();
}

bool TryParseValueArg(std::string_view arg, std::string_view prefix, std::string* value_out) {
  if (arg.substr(0, prefix.size()) != prefix) {
    return false;
  }
  *value_out = std::string(arg.substr(prefix.size()));
  return true;
}

bool TryParseUnresolvedArg(std::string_view arg, TranslateOptions* options, std::string* error) {
  std::string value;
  if (!TryParseValueArg(arg, "--unresolved=", &value)) {
    return false;
  }
  if (value == "placeholder") {
    options->unresolved_policy = ffibridge::frontend::internal::UnresolvedPolicy::kPlaceholder;
    return true;
  }
  if (value == "omit") {
    options->unresolved_policy = ffibridge::frontend::internal::UnresolvedPolicy::kOmit;
    return true;
  }
  *error = "error: invalid --unresolved value (expected placeholder or omit): " + value;
  return true;
}

bool TryParseJobsArg(std::string_view arg, unsigned* jobs_out, std::string* error) {
  std::string value;
  if (!TryParseValueArg(arg, "--jobs=", &value)) {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  const unsigned long jobs = std::strtoul(value.c_str(), &end, 10);
  if (value.empty() || *end != '\0' || errno != 0 || jobs == 0 || jobs > 1024) {
    *error = "error: invalid --jobs value (expected 1..1024): " + value;
    return true;
  }
  *jobs_out = static_cast<unsigned>(jobs);
  return true;
}

struct CommandLine {
  TranslateOptions options;
  std::vector<std::string> inputs;
  std::string output_dir = "out";
  bool time_phases = false;
  bool verbose = false;
  bool werror = false;
};

// Profile and ABI flags are applied once every argument is known, so their
// order on the command line does not matter.
int ParseCommandLine(std::string_view command, int argc, char** argv, CommandLine* out) {
  std::string target_lang = "zig";
  std::string triple;
  std::string data_layout;
  std::string int_widths;
  std::vector<std::string> reserved_word_files;
  bool no_packed = false;
  bool no_aligned = false;

  for (int i = 2; i < argc; ++i) {
    const std::string_view arg = argv[i];
    std::string value;
    std::string error;
    if (arg == "-o") {
      if (i + 1 >= argc) {
        std::cerr << "error: -o requires an output directory\n";
        return 2;
      }
      out->output_dir = argv[i + 1];
      ++i;
      continue;
    }
    if (TryParseValueArg(arg, "--target-lang=", &target_lang) ||
        TryParseValueArg(arg, "--triple=", &triple) ||
        TryParseValueArg(arg, "--data-layout=", &data_layout) ||
        TryParseValueArg(arg, "--int-widths=", &int_widths) ||
        TryParseValueArg(arg, "--link-name=", &out->options.expand.default_library)) {
      continue;
    }
    if (TryParseValueArg(arg, "--reserved-words=", &value)) {
      reserved_word_files.push_back(value);
      continue;
    }
    if (TryParseUnresolvedArg(arg, &out->options, &error) ||
        TryParseJobsArg(arg, &out->options.jobs, &error)) {
      if (!error.empty()) {
        std::cerr << error << "\n";
        return 2;
      }
      continue;
    }
    if (arg == "--no-packed") {
      no_packed = true;
      continue;
    }
    if (arg == "--no-aligned") {
      no_aligned = true;
      continue;
    }
    if (arg == "--time-phases") {
      out->time_phases = true;
      continue;
    }
    if (arg == "--verbose") {
      out->verbose = true;
      continue;
    }
    if (arg == "--werror") {
      out->werror = true;
      continue;
    }
    if (arg.substr(0, 1) == "-") {
      std::cerr << "error: unknown " << command << " argument: " << arg << "\n";
      return 2;
    }
    out->inputs.emplace_back(arg);
  }

  if (out->inputs.empty()) {
    std::cerr << "error: " << command << " requires at least one input\n";
    return 2;
  }

  if (!ffibridge::lowering::ProfileForLanguage(target_lang, &out->options.profile)) {
    std::cerr << "error: invalid --target-lang value (expected zig or c): " << target_lang
              << "\n";
    return 2;
  }
  if (!int_widths.empty()) {
    const ffibridge::lowering::Result widths =
        ffibridge::lowering::ApplyIntegerWidths(int_widths, &out->options.profile);
    if (!widths.ok) {
      std::cerr << "error: " << widths.output << "\n";
      return 2;
    }
  }
  for (const std::string& path : reserved_word_files) {
    const ffibridge::lowering::Result words =
        ffibridge::lowering::LoadReservedWords(path, &out->options.profile);
    if (!words.ok) {
      std::cerr << "error: " << words.output << "\n";
      return 2;
    }
  }
  if (no_packed) {
    out->options.profile.supports_packed_layout = false;
  }
  if (no_aligned) {
    out->options.profile.supports_aligned_layout = false;
  }

  if (!triple.empty()) {
    const ffibridge::lowering::Result abi =
        ffibridge::lowering::NativeAbiFromTriple(triple, &out->options.abi);
    if (!abi.ok) {
      std::cerr << "error: " << abi.output << "\n";
      return 2;
    }
  }
  if (!data_layout.empty()) {
    const ffibridge::lowering::Result abi =
        ffibridge::lowering::ApplyDataLayout(data_layout, &out->options.abi);
    if (!abi.ok) {
      std::cerr << "error: " << abi.output << "\n";
      return 2;
    }
  }
  return 0;
}

// Expands directories into their *.dump files, sorted so input order is
// stable across file systems.
int LoadCorpus(const std::vector<std::string>& inputs, std::vector<SourceFile>* corpus) {
  std::vector<std::string> paths;
  for (const std::string& input : inputs) {
    std::error_code ec;
    if (!std::filesystem::is_directory(input, ec)) {
      paths.push_back(input);
      continue;
    }
    std::vector<std::string> found;
    for (auto it = std::filesystem::recursive_directory_iterator(input, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
      if (it->is_regular_file(ec) && it->path().extension() == ".dump") {
        found.push_back(it->path().string());
      }
    }
    if (ec) {
      std::cerr << "error: cannot list directory: " << input << "\n";
      return 2;
    }
    std::sort(found.begin(), found.end());
    paths.insert(paths.end(), found.begin(), found.end());
  }

  for (const std::string& path : paths) {
    std::string text;
    if (!ReadFile(path, &text)) {
      std::cerr << "error: cannot read file: " << path << "\n";
      return 2;
    }
    SourceFile file;
    const ffibridge::frontend::ParseResult parsed =
        ffibridge::frontend::LoadSourceFile(text, path, &file);
    if (!parsed.ok) {
      std::cerr << "error: " << parsed.output << "\n";
      return 1;
    }
    corpus->push_back(std::move(file));
  }
  return 0;
}

void PrintPhaseTimings(const std::vector<PhaseTiming>& timings) {
  for (const PhaseTiming& timing : timings) {
    std::cerr << "phase " << timing.name << ": " << timing.seconds << "s\n";
  }
}

// Prints the report and returns the exit status it implies.
int ReportDiagnostics(const std::vector<Diagnostic>& diagnostics, bool werror) {
  using ffibridge::frontend::internal::DiagnosticSeverity;
  std::size_t errors = 0;
  std::size_t warnings = 0;
  for (const Diagnostic& diag : diagnostics) {
    std::cerr << ffibridge::frontend::internal::FormatDiagnostic(diag) << "\n";
    if (diag.severity == DiagnosticSeverity::kError) {
      ++errors;
    } else if (diag.severity == DiagnosticSeverity::kWarning) {
      ++warnings;
    }
  }
  if (errors > 0 || warnings > 0) {
    std::cerr << errors << " error(s), " << warnings << " warning(s)\n";
  }
  return errors > 0 || (werror && warnings > 0) ? 1 : 0;
}

int RunTranslate(const CommandLine& cmd, bool write_output) {
  std::vector<SourceFile> corpus;
  const int load_rc = LoadCorpus(cmd.inputs, &corpus);
  if (load_rc != 0) {
    return load_rc;
  }

  std::vector<PhaseTiming> timings;
  const ffibridge::frontend::TranslationResult result =
      ffibridge::frontend::Translate(corpus, cmd.options, cmd.time_phases ? &timings : nullptr);
  if (!result.ok) {
    std::cerr << "error: " << result.message << "\n";
    return 1;
  }

  int rc = ReportDiagnostics(result.diagnostics, cmd.werror);
  if (result.aborted) {
    std::cerr << "error: translation aborted after name collisions\n";
    rc = 1;
  }

  if (write_output && !result.aborted) {
    for (const ffibridge::lowering::EmittedModule& module : result.modules) {
      const std::filesystem::path path =
          std::filesystem::path(cmd.output_dir) / module.relative_path;
      std::error_code ec;
      std::filesystem::create_directories(path.parent_path(), ec);
      if (ec) {
        std::cerr << "error: cannot create output directory: " << path.parent_path().string()
                  << "\n";
        return 2;
      }
      if (!WriteFile(path.string(), module.text)) {
        std::cerr << "error: cannot write file: " << path.string() << "\n";
        return 2;
      }
      if (cmd.verbose) {
        std::cerr << "wrote " << path.string() << " ("
                  << (module.module_path.empty() ? "crate" : module.module_path) << ")\n";
      }
    }
  } else if (cmd.verbose) {
    for (const ffibridge::lowering::EmittedModule& module : result.modules) {
      std::cerr << "checked " << (module.module_path.empty() ? "crate" : module.module_path)
                << "\n";
    }
  }

  if (cmd.time_phases) {
    PrintPhaseTimings(timings);
  }
  return rc;
}

int RunDumpIr(const CommandLine& cmd) {
  std::vector<SourceFile> corpus;
  const int load_rc = LoadCorpus(cmd.inputs, &corpus);
  if (load_rc != 0) {
    return load_rc;
  }

  std::vector<PhaseTiming> timings;
  std::vector<Diagnostic> diagnostics;
  const ffibridge::frontend::ParseResult result = ffibridge::frontend::DumpIr(
      corpus, cmd.options, &diagnostics, cmd.time_phases ? &timings : nullptr);
  if (!result.ok) {
    std::cerr << "error: " << result.output << "\n";
    return 1;
  }
  std::cout << result.output;
  const int rc = ReportDiagnostics(diagnostics, cmd.werror);
  if (cmd.time_phases) {
    PrintPhaseTimings(timings);
  }
  return rc;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc <= 1) {
    print_usage();
    return 0;
  }

  const std::string_view arg1 = argv[1];
  if (arg1 == "--version") {
    std::cout << "ffibridge " << FFIBRIDGE_VERSION << " (llvm " << FFIBRIDGE_LLVM_VERSION
              << ")\n";
    return 0;
  }
  if (arg1 == "--help" || arg1 == "-h") {
    print_usage();
    return 0;
  }

  if (arg1 == "translate" || arg1 == "check" || arg1 == "dump-ir") {
    CommandLine cmd;
    const int parse_rc = ParseCommandLine(arg1, argc, argv, &cmd);
    if (parse_rc != 0) {
      return parse_rc;
    }
    if (arg1 == "dump-ir") {
      return RunDumpIr(cmd);
    }
    return RunTranslate(cmd, arg1 == "translate");
  }

  std::cerr << "error: unknown argument: " << arg1 << "\n";
  print_usage();
  return 2;
}
