#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "decl_ir.h"
#include "diagnostics.h"
#include "resolver.h"
#include "target_profile.h"

namespace ffibridge::lowering {

// A type in the target language. References to declarations keep the
// qualified name; the emitter spells them with the names it assigned.
struct TargetType {
  enum class Kind {
    kNamed,
    kReference,
    // Placeholder for a type that could not be resolved. Only valid behind a
    // pointer.
    kOpaque,
    kPointer,
    kArray,
    kFunctionPointer,
  };

  Kind kind = Kind::kNamed;
  // kNamed: builtin spelling. kReference: qualified name.
  std::string name;
  bool is_void = false;
  // kPointer: the pointee is immutable.
  bool is_const = false;
  // kArray
  std::uint64_t length = 0;
  // kFunctionPointer
  std::string calling_convention;
  bool is_nullable = false;
  bool is_variadic = false;
  std::vector<std::string> param_names;
  // kPointer: pointee. kArray: element. kFunctionPointer: return type
  // followed by parameter types.
  std::vector<TargetType> children;
};

struct TypeMapResult {
  bool ok = false;
  TargetType type;
  std::string message;
};

// Maps a resolved type in a by-value position (field, parameter, constant).
TypeMapResult MapType(const frontend::internal::IRType& type, const TargetProfile& profile);

// Like MapType, but `void` is accepted.
TypeMapResult MapReturnType(const frontend::internal::IRType& type, const TargetProfile& profile);

// Maps the target of a type alias: `void` and opaque types are accepted, as
// they are behind a pointer.
TypeMapResult MapAliasedType(const frontend::internal::IRType& type,
                             const TargetProfile& profile);

// Target spelling of a source calling convention, false when the profile has
// none.
bool MapCallingConvention(const std::string& convention, const TargetProfile& profile,
                          std::string* spelling);

// Maps every type a declaration mentions. Reports MappingError and returns
// false when the declaration cannot be expressed in the target.
bool CheckDeclMapping(const frontend::internal::ResolvedDecl& resolved,
                      const TargetProfile& profile,
                      frontend::internal::DiagnosticsCollector* diags);

}  // namespace ffibridge::lowering
