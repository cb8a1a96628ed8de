#include "emitter.h"

#include <cctype>
#include <set>
#include <stdexcept>

namespace ffibridge::lowering {

using frontend::internal::ConstValue;
using frontend::internal::IRDecl;
using frontend::internal::JoinPath;
using frontend::internal::ResolvedDecl;
using frontend::internal::ResolvedExport;

namespace {

constexpr char kIndent[] = "    ";

std::string GuardMacro(const std::string& relative_path) {
  std::string guard = "FFIBRIDGE_";
  for (char c : relative_path) {
    guard += std::isalnum(static_cast<unsigned char>(c)) != 0
                 ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
                 : '_';
  }
  return guard + "_";
}

class CEmitter final : public Emitter {
 public:
  CEmitter(const TargetProfile& profile, const NameMap& all_names, LayoutEngine* layout)
      : Emitter(profile, all_names, layout) {}

 protected:
  void BeginModule() override {
    declared_.clear();
    libraries_.clear();
  }

  std::string Header() override {
    std::set<std::string> includes;
    for (const std::string& path : module_->referenced_modules) {
      includes.insert(ModuleFilePath(path, profile_));
    }
    for (const ResolvedDecl& resolved : module_->decls) {
      if (resolved.emit && resolved.decl.kind == IRDecl::Kind::kModule) {
        includes.insert(ModuleFilePath(resolved.decl.QualifiedName(), profile_));
      }
    }

    const std::string guard = GuardMacro(file_path_);
    std::ostringstream out;
    out << "/* Generated by ffibridge from " << module_->module->file << ". */\n";
    out << "#ifndef " << guard << "\n";
    out << "#define " << guard << "\n\n";
    out << "#include <stdbool.h>\n";
    out << "#include <stdint.h>\n";
    if (!includes.empty()) {
      out << "\n";
      for (const std::string& include : includes) {
        out << "#include \"" << include << "\"\n";
      }
    }
    if (!libraries_.empty()) {
      out << "\n#if defined(_MSC_VER)\n";
      for (const std::string& library : libraries_) {
        out << "#pragma comment(lib, \"" << library << ".lib\")\n";
      }
      out << "#endif\n";
    }
    return out.str();
  }

  std::string Footer() override { return "\n#endif /* " + GuardMacro(file_path_) + " */\n"; }

  void EmitDecl(const ResolvedDecl& resolved, std::ostringstream& out) override {
    const IRDecl& decl = resolved.decl;
    if (decl.kind == IRDecl::Kind::kModule) {
      return;
    }
    const std::string name = Lookup(decl.QualifiedName()).name;
    out << "\n";
    EmitForwardDeclarations(decl, out);

    switch (decl.kind) {
      case IRDecl::Kind::kStruct:
      case IRDecl::Kind::kUnion:
        EmitRecord(resolved, name, out);
        break;
      case IRDecl::Kind::kEnum:
        EmitEnum(resolved, name, out);
        break;
      case IRDecl::Kind::kFunction:
        EmitFunction(decl, name, out);
        break;
      case IRDecl::Kind::kTypeAlias:
        out << "typedef " << Render(MapAlias(decl.aliased), name, false) << ";\n";
        break;
      case IRDecl::Kind::kConstant:
        EmitConstant(resolved, name, out);
        break;
      case IRDecl::Kind::kModule:
        break;
    }
  }

  void EmitExport(const ResolvedExport& item, const std::string& name,
                  std::ostringstream& out) override {
    if (item.is_module) {
      return;
    }
    const std::string target = Lookup(item.target).name;
    if (target == name) {
      return;
    }
    if (item.is_type) {
      out << "\ntypedef " << target << " " << name << ";\n";
    } else {
      out << "\n#define " << name << " " << target << "\n";
    }
  }

 private:
  std::string Render(const TargetType& type, const std::string& declarator, bool const_self) {
    switch (type.kind) {
      case TargetType::Kind::kNamed:
      case TargetType::Kind::kReference:
      case TargetType::Kind::kOpaque: {
        std::string base = type.kind == TargetType::Kind::kNamed       ? type.name
                           : type.kind == TargetType::Kind::kReference ? Lookup(type.name).name
                                                                       : "void";
        std::string text = (const_self ? "const " : "") + base;
        if (!declarator.empty()) {
          text += " " + declarator;
        }
        return text;
      }
      case TargetType::Kind::kPointer: {
        std::string inner = const_self ? "* const" : "*";
        if (!declarator.empty()) {
          inner += (const_self ? " " : "") + declarator;
        }
        if (type.children[0].kind == TargetType::Kind::kArray) {
          inner = "(" + inner + ")";
        }
        return Render(type.children[0], inner, type.is_const);
      }
      case TargetType::Kind::kArray:
        return Render(type.children[0], declarator + "[" + std::to_string(type.length) + "]",
                      const_self);
      case TargetType::Kind::kFunctionPointer: {
        std::string inner = "(";
        if (!type.calling_convention.empty()) {
          inner += type.calling_convention + " ";
        }
        inner += const_self ? "* const" : "*";
        if (!declarator.empty()) {
          inner += (const_self ? " " : "") + declarator;
        }
        inner += ")";
        std::string params;
        for (std::size_t i = 1; i < type.children.size(); ++i) {
          params += (i > 1 ? ", " : "") + Render(type.children[i], "", false);
        }
        if (type.is_variadic) {
          params += params.empty() ? "..." : ", ...";
        }
        if (params.empty()) {
          params = "void";
        }
        return Render(type.children[0], inner + "(" + params + ")", false);
      }
    }
    return "void";
  }

  std::string RecordKeyword(const EmittedName& name) const {
    return name.kind == IRDecl::Kind::kUnion ? "union" : "struct";
  }

  // `typedef struct X X;` for every struct or union the declaration names
  // before its definition has been written.
  void EmitForwardDeclarations(const IRDecl& decl, std::ostringstream& out) {
    std::vector<TargetType> types;
    switch (decl.kind) {
      case IRDecl::Kind::kStruct:
      case IRDecl::Kind::kUnion:
        for (const auto& field : decl.fields) {
          types.push_back(MapValue(field.type));
        }
        break;
      case IRDecl::Kind::kFunction:
        for (const auto& param : decl.params) {
          types.push_back(MapValue(param.type));
        }
        types.push_back(MapReturn(decl.return_type));
        break;
      case IRDecl::Kind::kTypeAlias:
        types.push_back(MapAlias(decl.aliased));
        break;
      case IRDecl::Kind::kConstant:
        types.push_back(MapValue(decl.const_type));
        break;
      default:
        break;
    }

    std::vector<std::string> references;
    for (const TargetType& type : types) {
      CollectReferences(type, &references);
    }
    const std::string self = decl.QualifiedName();
    if ((decl.kind == IRDecl::Kind::kStruct || decl.kind == IRDecl::Kind::kUnion) &&
        (decl.is_opaque || decl.fields.empty())) {
      references.push_back(self);
    }
    for (const std::string& qualified : references) {
      const EmittedName& target = Lookup(qualified);
      if (target.kind != IRDecl::Kind::kStruct && target.kind != IRDecl::Kind::kUnion) {
        continue;
      }
      // Records of other modules are stubbed too, so cyclic includes still
      // compile for references behind pointers.
      if (!declared_.insert(qualified).second) {
        continue;
      }
      out << "typedef " << RecordKeyword(target) << " " << target.name << " " << target.name
          << ";\n";
    }
  }

  void EmitRecord(const ResolvedDecl& resolved, const std::string& name,
                  std::ostringstream& out) {
    const IRDecl& decl = resolved.decl;
    const std::string keyword = decl.kind == IRDecl::Kind::kUnion ? "union" : "struct";
    if (decl.is_opaque || decl.fields.empty()) {
      return;
    }

    std::vector<std::string> wanted;
    for (const auto& field : decl.fields) {
      wanted.push_back(field.name);
    }
    const std::vector<std::string> fields = ScopedNames(wanted);

    const bool packed = decl.layout.pack != 0 && profile_.supports_packed_layout;
    const bool aligned = decl.layout.align != 0 && profile_.supports_aligned_layout;
    std::uint64_t first_align = 0;
    if (aligned) {
      const RecordLayout layout = SourceLayout(decl);
      if (layout.fields[0].align < decl.layout.align) {
        first_align = decl.layout.align;
      }
    }

    const bool stubbed = !declared_.insert(decl.QualifiedName()).second;
    if (packed) {
      out << "#pragma pack(push, " << decl.layout.pack << ")\n";
    }
    out << (stubbed ? "" : "typedef ") << keyword << " " << name << " {\n";
    for (std::size_t i = 0; i < decl.fields.size(); ++i) {
      out << kIndent;
      if (i == 0 && first_align != 0) {
        out << "_Alignas(" << first_align << ") ";
      }
      out << Render(MapValue(decl.fields[i].type), fields[i], false) << ";\n";
    }
    out << "}" << (stubbed ? "" : " " + name) << ";\n";
    if (packed) {
      out << "#pragma pack(pop)\n";
    }

    if (decl.is_bitflags) {
      const std::string bits = Render(MapValue(decl.fields[0].type), "", false);
      for (std::size_t i = 0; i < decl.associated.size(); ++i) {
        const ConstValue& value = resolved.associated_values[i];
        out << "#define " << Lookup(JoinPath(decl.QualifiedName(), decl.associated[i].name)).name
            << " ((" << bits << ")" << FormatInteger(value.integer, value.radix, IntegerStyle::kC)
            << ")\n";
      }
    }
  }

  void EmitEnum(const ResolvedDecl& resolved, const std::string& name, std::ostringstream& out) {
    const IRDecl& decl = resolved.decl;
    out << "typedef " << Render(MapValue(decl.discriminant_type), name, false) << ";\n";
    for (std::size_t i = 0; i < decl.variants.size(); ++i) {
      const std::string qualified = decl.enum_style == IRDecl::EnumStyle::kCLike
                                        ? JoinPath(decl.module_path, decl.variants[i].name)
                                        : JoinPath(decl.QualifiedName(), decl.variants[i].name);
      const ConstValue& value = resolved.variant_values[i];
      out << "#define " << Lookup(qualified).name << " ((" << name << ")"
          << FormatInteger(value.integer, value.radix, IntegerStyle::kC) << ")\n";
    }
  }

  void EmitFunction(const IRDecl& decl, const std::string& name, std::ostringstream& out) {
    if (!decl.library.empty()) {
      libraries_.insert(decl.library);
    }
    std::vector<std::string> wanted;
    for (const auto& param : decl.params) {
      wanted.push_back(param.name);
    }
    const std::vector<std::string> params = ScopedNames(wanted);

    std::string declarator;
    const std::string convention = CallingConvention(decl.calling_convention);
    if (!convention.empty()) {
      declarator += convention + " ";
    }
    declarator += name + "(";
    for (std::size_t i = 0; i < decl.params.size(); ++i) {
      declarator += (i > 0 ? ", " : "") + Render(MapValue(decl.params[i].type), params[i], false);
    }
    if (decl.is_variadic) {
      declarator += decl.params.empty() ? "..." : ", ...";
    } else if (decl.params.empty()) {
      declarator += "void";
    }
    declarator += ")";

    const std::string& linkage = decl.linkage_name.empty() ? decl.name : decl.linkage_name;
    out << "extern " << Render(MapReturn(decl.return_type), declarator, false);
    if (linkage != name) {
      out << " __asm__(\"" << linkage << "\")";
    }
    out << ";\n";
  }

  std::string Scalar(const ConstValue& value) {
    switch (value.kind) {
      case ConstValue::Kind::kInt:
        return FormatInteger(value.integer, value.radix, IntegerStyle::kC);
      case ConstValue::Kind::kPointer: {
        llvm::APSInt address = value.integer;
        address.setIsUnsigned(true);
        return "(uintptr_t)" + FormatInteger(address, 16, IntegerStyle::kC);
      }
      case ConstValue::Kind::kFloat:
        return value.float_text;
      case ConstValue::Kind::kBool:
        return value.boolean ? "true" : "false";
      case ConstValue::Kind::kArray: {
        std::string text = "{";
        for (std::size_t i = 0; i < value.elements.size(); ++i) {
          text += (i == 0 ? " " : ", ") + Scalar(value.elements[i]);
        }
        return text + " }";
      }
      case ConstValue::Kind::kStruct: {
        const std::vector<std::string> fields = ScopedNames(value.field_names);
        std::string text = "{";
        for (std::size_t i = 0; i < value.elements.size(); ++i) {
          text += (i == 0 ? " ." : ", .") + fields[i] + " = " + Scalar(value.elements[i]);
        }
        return text + " }";
      }
    }
    return "0";
  }

  void EmitConstant(const ResolvedDecl& resolved, const std::string& name,
                    std::ostringstream& out) {
    const TargetType type = MapValue(resolved.decl.const_type);
    const ConstValue& value = resolved.value;
    if (value.kind == ConstValue::Kind::kArray || value.kind == ConstValue::Kind::kStruct) {
      out << "static const " << Render(type, name, false) << " = " << Scalar(value) << ";\n";
      return;
    }
    out << "#define " << name << " ((" << Render(type, "", false) << ")" << Scalar(value)
        << ")\n";
  }

  // Structs and unions already introduced in the current header.
  std::set<std::string> declared_;
  std::set<std::string> libraries_;
};

}  // namespace

std::unique_ptr<Emitter> MakeCEmitter(const TargetProfile& profile, const NameMap& all_names,
                                      LayoutEngine* layout) {
  return std::make_unique<CEmitter>(profile, all_names, layout);
}

}  // namespace ffibridge::lowering
