#include "emit_order.h"

#include <cctype>

namespace ffibridge::lowering {

using frontend::internal::IRDecl;
using frontend::internal::JoinPath;
using frontend::internal::ResolvedDecl;
using frontend::internal::ResolvedModule;
using frontend::internal::SplitPath;

namespace {

std::vector<std::string> SplitFilePath(std::string_view path) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (start <= path.size()) {
    const std::size_t slash = path.find('/', start);
    const std::size_t end = slash == std::string_view::npos ? path.size() : slash;
    if (end > start) {
      parts.emplace_back(path.substr(start, end - start));
    }
    if (slash == std::string_view::npos) {
      break;
    }
    start = slash + 1;
  }
  return parts;
}

}  // namespace

std::string UniqueName(std::string_view wanted, const TargetProfile& profile,
                       std::set<std::string>* taken) {
  std::string base(wanted);
  if (base.empty() || std::isdigit(static_cast<unsigned char>(base[0])) != 0) {
    base = "_" + base;
  }
  auto usable = [&](const std::string& candidate) {
    return taken->count(candidate) == 0 && !IsReservedWord(profile, candidate);
  };

  std::string name = base;
  if (!usable(name)) {
    name = base + "_";
    for (int suffix = 2; !usable(name); ++suffix) {
      name = base + "_" + std::to_string(suffix);
    }
  }
  taken->insert(name);
  return name;
}

ModuleNames AssignModuleNames(const ResolvedModule& module, const TargetProfile& profile) {
  ModuleNames out;
  out.module_path = module.module->path;
  const bool scoped_members = profile.language == TargetLanguage::kZig;
  std::set<std::string> taken;

  auto assign = [&](const std::string& qualified, const std::string& wanted, IRDecl::Kind kind,
                    bool is_member) {
    EmittedName name;
    name.module_path = out.module_path;
    name.name = UniqueName(wanted, profile, &taken);
    name.kind = kind;
    name.is_member = is_member;
    out.names.emplace(qualified, std::move(name));
  };

  for (const ResolvedDecl& resolved : module.decls) {
    if (!resolved.emit) {
      continue;
    }
    const IRDecl& decl = resolved.decl;
    const std::string qualified = decl.QualifiedName();
    assign(qualified, decl.name, decl.kind, false);

    if (decl.kind == IRDecl::Kind::kEnum) {
      out.names[qualified].is_tagged_enum = decl.enum_style != IRDecl::EnumStyle::kCLike;
      for (const auto& variant : decl.variants) {
        if (decl.enum_style == IRDecl::EnumStyle::kCLike) {
          assign(JoinPath(decl.module_path, variant.name), variant.name, IRDecl::Kind::kConstant,
                 true);
        } else if (!scoped_members) {
          assign(JoinPath(qualified, variant.name), decl.name + "_" + variant.name,
                 IRDecl::Kind::kConstant, true);
        }
      }
    }
    if (decl.is_bitflags && !scoped_members) {
      for (const auto& assoc : decl.associated) {
        assign(JoinPath(qualified, assoc.name), decl.name + "_" + assoc.name,
               IRDecl::Kind::kConstant, true);
      }
    }
  }

  for (const auto& item : module.exports) {
    out.export_names.push_back(UniqueName(item.local_name, profile, &taken));
  }

  if (profile.language == TargetLanguage::kZig) {
    for (const std::string& path : module.referenced_modules) {
      out.import_aliases.emplace(path, UniqueName(ModuleAlias(path), profile, &taken));
    }
  }
  return out;
}

std::vector<std::size_t> EmitOrder(const ResolvedModule& module, const TargetProfile& profile) {
  const std::vector<ResolvedDecl>& decls = module.decls;
  std::map<std::string, std::size_t> index_of;
  for (std::size_t i = 0; i < decls.size(); ++i) {
    if (decls[i].emit) {
      index_of.emplace(decls[i].decl.QualifiedName(), i);
    }
  }

  std::vector<std::vector<std::size_t>> dependents(decls.size());
  std::vector<std::size_t> pending(decls.size(), 0);
  for (std::size_t i = 0; i < decls.size(); ++i) {
    if (!decls[i].emit) {
      continue;
    }
    std::set<std::size_t> deps;
    auto add = [&](const std::string& qualified) {
      auto it = index_of.find(qualified);
      if (it != index_of.end() && it->second != i) {
        deps.insert(it->second);
      }
    };
    for (const std::string& dep : decls[i].value_deps) {
      add(dep);
    }
    // A constant's initializer needs its type complete.
    if (decls[i].decl.kind == IRDecl::Kind::kConstant) {
      for (const std::string& dep : decls[i].name_deps) {
        add(dep);
      }
    } else if (profile.language == TargetLanguage::kC) {
      for (const std::string& dep : decls[i].name_deps) {
        auto it = index_of.find(dep);
        if (it == index_of.end()) {
          continue;
        }
        const IRDecl::Kind kind = decls[it->second].decl.kind;
        if (kind != IRDecl::Kind::kStruct && kind != IRDecl::Kind::kUnion) {
          add(dep);
        }
      }
    }
    for (std::size_t dep : deps) {
      dependents[dep].push_back(i);
    }
    pending[i] = deps.size();
  }

  std::set<std::size_t> ready;
  for (const auto& entry : index_of) {
    if (pending[entry.second] == 0) {
      ready.insert(entry.second);
    }
  }

  std::vector<std::size_t> order;
  std::vector<bool> placed(decls.size(), false);
  while (!ready.empty()) {
    const std::size_t next = *ready.begin();
    ready.erase(ready.begin());
    order.push_back(next);
    placed[next] = true;
    for (std::size_t dependent : dependents[next]) {
      if (--pending[dependent] == 0) {
        ready.insert(dependent);
      }
    }
  }
  // By-value cycles were rejected during resolution; anything left keeps
  // source order.
  for (std::size_t i = 0; i < decls.size(); ++i) {
    if (decls[i].emit && !placed[i]) {
      order.push_back(i);
    }
  }
  return order;
}

std::string ModuleFilePath(std::string_view module_path, const TargetProfile& profile) {
  std::string path;
  for (const std::string& segment : SplitPath(module_path)) {
    if (!path.empty()) {
      path += "/";
    }
    path += segment;
  }
  if (path.empty()) {
    path = "lib";
  }
  return path + profile.file_extension;
}

std::string RelativeFilePath(std::string_view from, std::string_view to) {
  std::vector<std::string> from_dirs = SplitFilePath(from);
  if (!from_dirs.empty()) {
    from_dirs.pop_back();
  }
  const std::vector<std::string> to_parts = SplitFilePath(to);

  std::size_t common = 0;
  while (common < from_dirs.size() && common + 1 < to_parts.size() &&
         from_dirs[common] == to_parts[common]) {
    ++common;
  }
  std::string out;
  for (std::size_t i = common; i < from_dirs.size(); ++i) {
    out += "../";
  }
  for (std::size_t i = common; i < to_parts.size(); ++i) {
    out += to_parts[i];
    if (i + 1 < to_parts.size()) {
      out += "/";
    }
  }
  return out;
}

std::string ModuleAlias(std::string_view module_path) {
  std::string alias;
  for (const std::string& segment : SplitPath(module_path)) {
    if (!alias.empty()) {
      alias += "_";
    }
    alias += segment;
  }
  return alias;
}

}  // namespace ffibridge::lowering
