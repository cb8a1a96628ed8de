#include "symbol_table.h"

#include <algorithm>
#include <sstream>
#include <utility>

namespace ffibridge::frontend::internal {

namespace {

std::string CanonicalText(const IRDecl& decl) {
  std::ostringstream out;
  DumpDecl(decl, 0, out);
  return out.str();
}

std::string FormatLocation(const SourceLocation& loc) {
  std::ostringstream out;
  out << (loc.file.empty() ? "<input>" : loc.file);
  if (loc.line > 0) {
    out << ":" << loc.line << ":" << loc.column;
  }
  return out.str();
}

}  // namespace

SymbolTable::SymbolTable() {
  pthread_mutex_init(&mutex_, nullptr);
}

SymbolTable::~SymbolTable() {
  pthread_mutex_destroy(&mutex_);
}

bool SymbolTable::SameDefinition(const SymbolEntry& lhs, const SymbolEntry& rhs) {
  if (lhs.kind != rhs.kind || lhs.kind == SymbolEntry::Kind::kModule) {
    return false;
  }
  if (lhs.member_index != rhs.member_index) {
    return false;
  }
  return CanonicalText(*lhs.decl) == CanonicalText(*rhs.decl);
}

void SymbolTable::Claim(const std::string& name, SymbolEntry entry,
                        const SourceLocation& location) {
  auto it = entries_.find(name);
  if (it == entries_.end()) {
    entries_.emplace(name, entry);
    locations_.emplace(name, location);
    return;
  }

  SymbolEntry& existing = it->second;

  // `mod child;` in the parent and the child's own module name the same
  // thing.
  const bool existing_is_mod_decl = existing.kind == SymbolEntry::Kind::kDecl &&
                                    existing.decl->kind == IRDecl::Kind::kModule;
  const bool entry_is_mod_decl =
      entry.kind == SymbolEntry::Kind::kDecl && entry.decl->kind == IRDecl::Kind::kModule;
  if (existing.kind == SymbolEntry::Kind::kModule && entry_is_mod_decl &&
      existing.decl == nullptr) {
    existing.decl = entry.decl;
    return;
  }
  if (existing_is_mod_decl && entry.kind == SymbolEntry::Kind::kModule) {
    entry.decl = existing.decl;
    entry.origin = std::min(entry.origin, existing.origin);
    existing = entry;
    return;
  }

  if (SameDefinition(existing, entry)) {
    if (entry.origin < existing.origin) {
      existing = entry;
      locations_[name] = location;
    }
    return;
  }

  NameCollision collision;
  collision.qualified_name = name;
  if (entry.origin < existing.origin) {
    collision.first = entry.origin;
    collision.first_location = location;
    collision.later = existing.origin;
    collision.later_location = locations_[name];
    existing = entry;
    locations_[name] = location;
  } else {
    collision.first = existing.origin;
    collision.first_location = locations_[name];
    collision.later = entry.origin;
    collision.later_location = location;
  }
  collisions_.push_back(std::move(collision));
}

void SymbolTable::RegisterFile(std::size_t file_index, std::vector<IRModule> modules) {
  std::vector<std::unique_ptr<IRModule>> owned;
  owned.reserve(modules.size());
  for (IRModule& module : modules) {
    owned.push_back(std::make_unique<IRModule>(std::move(module)));
  }

  pthread_mutex_lock(&mutex_);
  std::size_t item_index = 0;
  for (std::unique_ptr<IRModule>& module_ptr : owned) {
    const IRModule* module = module_ptr.get();

    SymbolEntry module_entry;
    module_entry.kind = SymbolEntry::Kind::kModule;
    module_entry.module = module;
    module_entry.origin = SymbolOrigin{file_index, item_index++};
    modules_.push_back(OwnedModule{std::move(module_ptr), module_entry.origin});
    Claim(module->path, module_entry, module->location);

    for (const IRDecl& decl : module->decls) {
      SymbolEntry entry;
      entry.kind = SymbolEntry::Kind::kDecl;
      entry.decl = &decl;
      entry.module = module;
      entry.origin = SymbolOrigin{file_index, item_index++};
      const std::string qualified = decl.QualifiedName();
      Claim(qualified, entry, decl.location);

      if (decl.kind == IRDecl::Kind::kEnum) {
        for (std::size_t i = 0; i < decl.variants.size(); ++i) {
          SymbolEntry variant = entry;
          variant.member_index = i;
          if (decl.enum_style == IRDecl::EnumStyle::kCLike) {
            variant.kind = SymbolEntry::Kind::kEnumConstant;
            Claim(JoinPath(decl.module_path, decl.variants[i].name), variant, decl.location);
          } else {
            variant.kind = SymbolEntry::Kind::kMember;
            Claim(JoinPath(qualified, decl.variants[i].name), variant, decl.location);
          }
        }
      }
      for (std::size_t i = 0; i < decl.associated.size(); ++i) {
        SymbolEntry member = entry;
        member.kind = SymbolEntry::Kind::kMember;
        member.member_index = i;
        Claim(JoinPath(qualified, decl.associated[i].name), member, decl.location);
      }
    }
  }
  pthread_mutex_unlock(&mutex_);
}

const SymbolEntry* SymbolTable::Lookup(std::string_view qualified_name) const {
  const auto it = entries_.find(qualified_name);
  return it == entries_.end() ? nullptr : &it->second;
}

const IRModule* SymbolTable::FindModule(std::string_view path) const {
  const SymbolEntry* entry = Lookup(path);
  if (entry == nullptr || entry->kind != SymbolEntry::Kind::kModule) {
    return nullptr;
  }
  return entry->module;
}

bool SymbolTable::IsCanonical(const IRDecl& decl) const {
  const SymbolEntry* entry = Lookup(decl.QualifiedName());
  return entry != nullptr && entry->decl == &decl;
}

std::vector<const IRModule*> SymbolTable::Modules() const {
  std::vector<const OwnedModule*> sorted;
  sorted.reserve(modules_.size());
  for (const OwnedModule& owned : modules_) {
    sorted.push_back(&owned);
  }
  std::sort(sorted.begin(), sorted.end(), [](const OwnedModule* lhs, const OwnedModule* rhs) {
    return lhs->origin < rhs->origin;
  });

  std::vector<const IRModule*> out;
  for (const OwnedModule* owned : sorted) {
    // A module path registered twice is a collision; only the owner is
    // translated.
    if (FindModule(owned->module->path) == owned->module.get()) {
      out.push_back(owned->module.get());
    }
  }
  return out;
}

std::vector<NameCollision> SymbolTable::Collisions() const {
  std::vector<NameCollision> out = collisions_;
  std::sort(out.begin(), out.end(), [](const NameCollision& lhs, const NameCollision& rhs) {
    if (lhs.later < rhs.later || rhs.later < lhs.later) {
      return lhs.later < rhs.later;
    }
    return lhs.qualified_name < rhs.qualified_name;
  });
  return out;
}

void SymbolTable::ReportCollisions(DiagnosticsCollector* diags) const {
  for (const NameCollision& collision : Collisions()) {
    diags->Report(codes::kNameCollision, DiagnosticSeverity::kError, collision.qualified_name,
                  collision.later_location,
                  "'" + collision.qualified_name + "' is already declared at " +
                      FormatLocation(collision.first_location),
                  "rename or remove one of the declarations");
  }
}

}  // namespace ffibridge::frontend::internal
