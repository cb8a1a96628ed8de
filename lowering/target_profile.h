#pragma once

#include <map>
#include <set>
#include <string>
#include <string_view>

namespace ffibridge::lowering {

struct Result {
  bool ok;
  std::string output;
};

enum class TargetLanguage {
  kZig,
  kC,
};

enum class PointerSyntax {
  // `?*T` / `?*const T`
  kOptionalPrefix,
  // `T *` / `const T *`
  kDeclarator,
};

struct TargetProfile {
  std::string name;
  TargetLanguage language = TargetLanguage::kZig;
  std::string file_extension;
  PointerSyntax native_pointer_syntax = PointerSyntax::kOptionalPrefix;
  std::set<int> available_integer_widths;
  // Source convention name -> target spelling. An empty spelling means the
  // target's default convention.
  std::map<std::string, std::string> supported_calling_conventions;
  std::set<std::string> reserved_word_list;
  bool supports_packed_layout = true;
  bool supports_aligned_layout = true;
  // Whether a type must be declared before it is named.
  bool requires_forward_declarations = false;
};

TargetProfile ZigProfile();
TargetProfile CProfile();

// "zig" or "c".
bool ProfileForLanguage(std::string_view name, TargetProfile* out);

// Adds the whitespace-separated words of `path` (`#` starts a comment) to
// the profile's reserved words.
Result LoadReservedWords(std::string_view path, TargetProfile* profile);

// Replaces the available integer widths with a comma-separated list.
Result ApplyIntegerWidths(std::string_view list, TargetProfile* profile);

// True when `name` cannot be used as an identifier in the target language.
bool IsReservedWord(const TargetProfile& profile, std::string_view name);

}  // namespace ffibridge::lowering
