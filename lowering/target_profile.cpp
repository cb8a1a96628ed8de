#include "target_profile.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

namespace ffibridge::lowering {

namespace {

std::string TrimCopy(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

// `u7`, `i64`: every such name is a builtin integer type in Zig.
bool IsZigIntegerTypeName(std::string_view name) {
  if (name.size() < 2 || (name[0] != 'u' && name[0] != 'i')) {
    return false;
  }
  return std::all_of(name.begin() + 1, name.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

}  // namespace

TargetProfile ZigProfile() {
  TargetProfile profile;
  profile.name = "zig";
  profile.language = TargetLanguage::kZig;
  profile.file_extension = ".zig";
  profile.native_pointer_syntax = PointerSyntax::kOptionalPrefix;
  profile.available_integer_widths = {8, 16, 32, 64, 128};
  profile.supported_calling_conventions = {
      {"C", ".C"},
      {"cdecl", ".C"},
      {"system", "WINAPI"},
      {"stdcall", ".Stdcall"},
      {"fastcall", ".Fastcall"},
      {"thiscall", ".Thiscall"},
      {"vectorcall", ".Vectorcall"},
      {"win64", ".Win64"},
      {"sysv64", ".SysV"},
  };
  profile.reserved_word_list = {
      "addrspace", "align", "allowzero", "and", "anyframe", "anytype", "asm", "async",
      "await", "break", "callconv", "catch", "comptime", "const", "continue", "defer",
      "else", "enum", "errdefer", "error", "export", "extern", "fn", "for", "if", "inline",
      "linksection", "noalias", "noinline", "nosuspend", "opaque", "or", "orelse", "packed",
      "pub", "resume", "return", "struct", "suspend", "switch", "test", "threadlocal", "try",
      "union", "unreachable", "usingnamespace", "var", "volatile", "while",
      // Primitive values and types.
      "anyerror", "anyopaque", "bool", "comptime_float", "comptime_int", "f16", "f32", "f64",
      "f80", "f128", "false", "isize", "noreturn", "null", "true", "type", "undefined",
      "usize", "void", "c_char", "c_short", "c_ushort", "c_int", "c_uint", "c_long",
      "c_ulong", "c_longlong", "c_ulonglong", "c_longdouble",
      // Names the emitter declares itself.
      "std", "WINAPI",
  };
  profile.supports_packed_layout = true;
  profile.supports_aligned_layout = true;
  profile.requires_forward_declarations = false;
  return profile;
}

TargetProfile CProfile() {
  TargetProfile profile;
  profile.name = "c";
  profile.language = TargetLanguage::kC;
  profile.file_extension = ".h";
  profile.native_pointer_syntax = PointerSyntax::kDeclarator;
  profile.available_integer_widths = {8, 16, 32, 64};
  profile.supported_calling_conventions = {
      {"C", ""},
      {"cdecl", "__cdecl"},
      {"system", "__stdcall"},
      {"stdcall", "__stdcall"},
      {"fastcall", "__fastcall"},
      {"thiscall", "__thiscall"},
      {"vectorcall", "__vectorcall"},
  };
  profile.reserved_word_list = {
      "alignas", "alignof", "auto", "bool", "break", "case", "char", "const", "constexpr",
      "continue", "default", "do", "double", "else", "enum", "extern", "false", "float",
      "for", "goto", "if", "inline", "int", "long", "nullptr", "register", "restrict",
      "return", "short", "signed", "sizeof", "static", "static_assert", "struct", "switch",
      "thread_local", "true", "typedef", "typeof", "typeof_unqual", "union", "unsigned",
      "void", "volatile", "while", "_Alignas", "_Alignof", "_Atomic", "_BitInt", "_Bool",
      "_Complex", "_Decimal128", "_Decimal32", "_Decimal64", "_Generic", "_Imaginary",
      "_Noreturn", "_Static_assert", "_Thread_local",
      // Names the generated headers include or use.
      "int8_t", "int16_t", "int32_t", "int64_t", "uint8_t", "uint16_t", "uint32_t",
      "uint64_t", "intptr_t", "uintptr_t", "size_t", "ptrdiff_t", "NULL",
  };
  profile.supports_packed_layout = true;
  profile.supports_aligned_layout = true;
  profile.requires_forward_declarations = true;
  return profile;
}

bool ProfileForLanguage(std::string_view name, TargetProfile* out) {
  if (name == "zig") {
    *out = ZigProfile();
    return true;
  }
  if (name == "c") {
    *out = CProfile();
    return true;
  }
  return false;
}

Result LoadReservedWords(std::string_view path, TargetProfile* profile) {
  std::ifstream input{std::string(path)};
  if (!input) {
    return Result{false, "failed to open reserved word list: " + std::string(path)};
  }
  std::size_t added = 0;
  std::string line;
  while (std::getline(input, line)) {
    const std::size_t comment = line.find('#');
    if (comment != std::string::npos) {
      line.resize(comment);
    }
    std::istringstream words(line);
    std::string word;
    while (words >> word) {
      if (profile->reserved_word_list.insert(word).second) {
        ++added;
      }
    }
  }
  return Result{true, std::to_string(added)};
}

Result ApplyIntegerWidths(std::string_view list, TargetProfile* profile) {
  std::set<int> widths;
  std::size_t start = 0;
  while (start <= list.size()) {
    const std::size_t comma = list.find(',', start);
    const std::size_t end = comma == std::string_view::npos ? list.size() : comma;
    const std::string item = TrimCopy(list.substr(start, end - start));
    char* parse_end = nullptr;
    const long width = std::strtol(item.c_str(), &parse_end, 10);
    if (item.empty() || parse_end == nullptr || *parse_end != '\0' ||
        (width != 8 && width != 16 && width != 32 && width != 64 && width != 128)) {
      return Result{false, "invalid integer width '" + item + "' (expected 8, 16, 32, 64 or 128)"};
    }
    widths.insert(static_cast<int>(width));
    if (comma == std::string_view::npos) {
      break;
    }
    start = comma + 1;
  }
  profile->available_integer_widths = std::move(widths);
  return Result{true, ""};
}

bool IsReservedWord(const TargetProfile& profile, std::string_view name) {
  if (profile.reserved_word_list.count(std::string(name)) != 0) {
    return true;
  }
  return profile.language == TargetLanguage::kZig && IsZigIntegerTypeName(name);
}

}  // namespace ffibridge::lowering
