#pragma once

#include <pthread.h>

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "decl_ir.h"
#include "diagnostics.h"

namespace ffibridge::frontend::internal {

// Position of a claim in input order: file index, then declaration order in
// the file's expanded modules.
struct SymbolOrigin {
  std::size_t file_index = 0;
  std::size_t item_index = 0;

  bool operator<(const SymbolOrigin& other) const {
    return file_index != other.file_index ? file_index < other.file_index
                                          : item_index < other.item_index;
  }
};

struct SymbolEntry {
  enum class Kind {
    kDecl,
    kModule,
    // Variant of a C-like enum, visible at module scope.
    kEnumConstant,
    // Variant of a tagged enum or associated constant of a bitflags struct,
    // visible as Owner::Name.
    kMember,
  };

  Kind kind = Kind::kDecl;
  const IRDecl* decl = nullptr;
  const IRModule* module = nullptr;
  std::size_t member_index = 0;
  SymbolOrigin origin;
};

struct NameCollision {
  std::string qualified_name;
  SymbolOrigin first;
  SymbolOrigin later;
  SourceLocation first_location;
  SourceLocation later_location;
};

// Global mapping from qualified name to declaration. Registration is
// mutex-guarded and write-once per name; lookups are lock-free and only valid
// once every registering worker has finished.
class SymbolTable {
 public:
  SymbolTable();
  ~SymbolTable();

  SymbolTable(const SymbolTable&) = delete;
  SymbolTable& operator=(const SymbolTable&) = delete;

  // Takes ownership of one file's expanded modules and registers every name
  // they declare. Byte-identical redeclarations are tolerated.
  void RegisterFile(std::size_t file_index, std::vector<IRModule> modules);

  const SymbolEntry* Lookup(std::string_view qualified_name) const;
  const IRModule* FindModule(std::string_view path) const;

  // True when `decl` is the declaration that owns its qualified name, false
  // for a tolerated duplicate.
  bool IsCanonical(const IRDecl& decl) const;

  // Registered modules in input order.
  std::vector<const IRModule*> Modules() const;

  // Collisions ordered by the later claim's input position.
  std::vector<NameCollision> Collisions() const;
  void ReportCollisions(DiagnosticsCollector* diags) const;

 private:
  struct OwnedModule {
    std::unique_ptr<IRModule> module;
    SymbolOrigin origin;
  };

  void Claim(const std::string& name, SymbolEntry entry, const SourceLocation& location);
  static bool SameDefinition(const SymbolEntry& lhs, const SymbolEntry& rhs);

  mutable pthread_mutex_t mutex_;
  std::vector<OwnedModule> modules_;
  std::map<std::string, SymbolEntry, std::less<>> entries_;
  std::map<std::string, SourceLocation, std::less<>> locations_;
  std::vector<NameCollision> collisions_;
};

}  // namespace ffibridge::frontend::internal
