#include "emitter.h"

#include <stdexcept>

#include <llvm/ADT/SmallString.h>

namespace ffibridge::lowering {

using frontend::internal::ConstValue;
using frontend::internal::IRDecl;
using frontend::internal::ResolvedDecl;
using frontend::internal::ResolvedExport;

namespace {

constexpr char kIndent[] = "    ";

class ZigEmitter final : public Emitter {
 public:
  ZigEmitter(const TargetProfile& profile, const NameMap& all_names, LayoutEngine* layout)
      : Emitter(profile, all_names, layout) {}

 protected:
  void BeginModule() override { uses_winapi_ = false; }

  std::string Header() override {
    std::ostringstream out;
    out << "// Generated by ffibridge from " << module_->module->file << ".\n";
    if (uses_winapi_) {
      out << "\nconst std = @import(\"std\");\n";
      out << "const WINAPI = std.os.windows.WINAPI;\n";
    }
    if (!names_->import_aliases.empty()) {
      out << "\n";
      for (const auto& import : names_->import_aliases) {
        out << "const " << import.second << " = @import(\""
            << RelativeFilePath(file_path_, ModuleFilePath(import.first, profile_)) << "\");\n";
      }
    }
    return out.str();
  }

  std::string Footer() override { return ""; }

  void EmitDecl(const ResolvedDecl& resolved, std::ostringstream& out) override {
    const IRDecl& decl = resolved.decl;
    const std::string name = Lookup(decl.QualifiedName()).name;
    const std::string vis = decl.is_public ? "pub " : "";
    out << "\n";
    switch (decl.kind) {
      case IRDecl::Kind::kStruct:
      case IRDecl::Kind::kUnion:
        EmitRecord(resolved, name, vis, out);
        break;
      case IRDecl::Kind::kEnum:
        EmitEnum(resolved, name, vis, out);
        break;
      case IRDecl::Kind::kFunction:
        EmitFunction(decl, name, vis, out);
        break;
      case IRDecl::Kind::kTypeAlias:
        out << vis << "const " << name << " = " << Render(MapAlias(decl.aliased)) << ";\n";
        break;
      case IRDecl::Kind::kConstant: {
        const TargetType type = MapValue(decl.const_type);
        out << vis << "const " << name << ": " << Render(type) << " = "
            << Value(resolved.value, type) << ";\n";
        break;
      }
      case IRDecl::Kind::kModule:
        out << vis << "const " << name << " = @import(\""
            << RelativeFilePath(file_path_, ModuleFilePath(decl.QualifiedName(), profile_))
            << "\");\n";
        break;
    }
  }

  void EmitExport(const ResolvedExport& item, const std::string& name,
                  std::ostringstream& out) override {
    std::string target;
    if (item.is_module) {
      target = ModuleRef(item.target);
    } else {
      target = Ref(item.target);
    }
    out << "\npub const " << name << " = " << target << ";\n";
  }

 private:
  std::string ModuleRef(const std::string& module_path) const {
    auto it = names_->import_aliases.find(module_path);
    if (it == names_->import_aliases.end()) {
      throw std::logic_error("module '" + module_path + "' was not imported");
    }
    return it->second;
  }

  std::string Ref(const std::string& qualified) const {
    const EmittedName& target = Lookup(qualified);
    if (target.module_path == module_->module->path) {
      return target.name;
    }
    return ModuleRef(target.module_path) + "." + target.name;
  }

  std::string Render(const TargetType& type) {
    switch (type.kind) {
      case TargetType::Kind::kNamed:
        return type.name;
      case TargetType::Kind::kReference:
        return Ref(type.name);
      case TargetType::Kind::kOpaque:
        return "anyopaque";
      case TargetType::Kind::kPointer:
        return std::string("?*") + (type.is_const ? "const " : "") + Render(type.children[0]);
      case TargetType::Kind::kArray:
        return "[" + std::to_string(type.length) + "]" + Render(type.children[0]);
      case TargetType::Kind::kFunctionPointer: {
        std::string text = type.is_nullable ? "?*const fn (" : "*const fn (";
        for (std::size_t i = 1; i < type.children.size(); ++i) {
          if (i > 1) {
            text += ", ";
          }
          text += Render(type.children[i]);
        }
        if (type.is_variadic) {
          text += type.children.size() > 1 ? ", ..." : "...";
        }
        return text + ") callconv(" + Convention(type.calling_convention) + ") " +
               Render(type.children[0]);
      }
    }
    return "anyopaque";
  }

  std::string Convention(const std::string& spelling) {
    if (spelling == "WINAPI") {
      uses_winapi_ = true;
    }
    return spelling;
  }

  std::string Value(const ConstValue& value, const TargetType& type) {
    switch (value.kind) {
      case ConstValue::Kind::kInt: {
        const std::string number = FormatInteger(value.integer, value.radix, IntegerStyle::kZig);
        if (type.kind == TargetType::Kind::kReference && Lookup(type.name).is_tagged_enum) {
          return "@enumFromInt(" + number + ")";
        }
        return number;
      }
      case ConstValue::Kind::kPointer: {
        if (value.integer.isZero()) {
          return "null";
        }
        llvm::APSInt address = value.integer;
        address.setIsUnsigned(true);
        return "@ptrFromInt(" + FormatInteger(address, 16, IntegerStyle::kZig) + ")";
      }
      case ConstValue::Kind::kFloat:
        return value.float_text;
      case ConstValue::Kind::kBool:
        return value.boolean ? "true" : "false";
      case ConstValue::Kind::kArray: {
        const TargetType element =
            type.kind == TargetType::Kind::kArray ? type.children[0] : TargetType();
        std::string text = ".{";
        for (std::size_t i = 0; i < value.elements.size(); ++i) {
          text += i == 0 ? " " : ", ";
          text += Value(value.elements[i], element);
        }
        return text + (value.elements.empty() ? "}" : " }");
      }
      case ConstValue::Kind::kStruct: {
        const std::vector<std::string> fields = ScopedNames(value.field_names);
        std::string text = ".{";
        for (std::size_t i = 0; i < value.elements.size(); ++i) {
          text += i == 0 ? " ." : ", .";
          text += fields[i] + " = " + Value(value.elements[i], TargetType());
        }
        return text + (value.elements.empty() ? "}" : " }");
      }
    }
    return "undefined";
  }

  void EmitRecord(const ResolvedDecl& resolved, const std::string& name, const std::string& vis,
                  std::ostringstream& out) {
    const IRDecl& decl = resolved.decl;
    if (decl.is_opaque) {
      out << vis << "const " << name << " = opaque {};\n";
      return;
    }

    std::vector<std::string> wanted;
    for (const auto& field : decl.fields) {
      wanted.push_back(field.name);
    }
    for (const auto& assoc : decl.associated) {
      wanted.push_back(assoc.name);
    }
    const std::vector<std::string> scoped = ScopedNames(wanted);

    // Field alignment overrides reproduce pack and align attributes.
    std::vector<std::uint64_t> aligns(decl.fields.size(), 0);
    const bool packed = decl.layout.pack != 0 && profile_.supports_packed_layout;
    const bool aligned = decl.layout.align != 0 && profile_.supports_aligned_layout;
    if ((packed || aligned) && !decl.fields.empty()) {
      const RecordLayout layout = SourceLayout(decl);
      if (packed) {
        for (std::size_t i = 0; i < decl.fields.size(); ++i) {
          aligns[i] = layout.fields[i].align;
        }
      }
      if (aligned && layout.fields[0].align < decl.layout.align) {
        aligns[0] = decl.layout.align;
      }
    }

    out << vis << "const " << name << " = extern "
        << (decl.kind == IRDecl::Kind::kUnion ? "union" : "struct") << " {";
    if (decl.fields.empty() && decl.associated.empty()) {
      out << "};\n";
      return;
    }
    out << "\n";
    for (std::size_t i = 0; i < decl.fields.size(); ++i) {
      out << kIndent << scoped[i] << ": " << Render(MapValue(decl.fields[i].type));
      if (aligns[i] != 0) {
        out << " align(" << aligns[i] << ")";
      }
      out << ",\n";
    }
    if (!decl.associated.empty()) {
      out << "\n";
      for (std::size_t i = 0; i < decl.associated.size(); ++i) {
        const ConstValue& value = resolved.associated_values[i];
        out << kIndent << "pub const " << scoped[decl.fields.size() + i] << ": " << name
            << " = .{ ." << scoped[0] << " = "
            << FormatInteger(value.integer, value.radix, IntegerStyle::kZig) << " };\n";
      }
    }
    out << "};\n";
  }

  void EmitEnum(const ResolvedDecl& resolved, const std::string& name, const std::string& vis,
                std::ostringstream& out) {
    const IRDecl& decl = resolved.decl;
    const std::string tag = Render(MapValue(decl.discriminant_type));
    if (decl.enum_style == IRDecl::EnumStyle::kCLike) {
      out << vis << "const " << name << " = " << tag << ";\n";
      for (std::size_t i = 0; i < decl.variants.size(); ++i) {
        const ConstValue& value = resolved.variant_values[i];
        const std::string variant =
            Lookup(frontend::internal::JoinPath(decl.module_path, decl.variants[i].name)).name;
        out << vis << "const " << variant << ": " << name << " = "
            << FormatInteger(value.integer, value.radix, IntegerStyle::kZig) << ";\n";
      }
      return;
    }

    std::vector<std::string> wanted;
    for (const auto& variant : decl.variants) {
      wanted.push_back(variant.name);
    }
    const std::vector<std::string> scoped = ScopedNames(wanted);
    out << vis << "const " << name << " = enum(" << tag << ") {\n";
    for (std::size_t i = 0; i < decl.variants.size(); ++i) {
      const ConstValue& value = resolved.variant_values[i];
      out << kIndent << scoped[i] << " = "
          << FormatInteger(value.integer, value.radix, IntegerStyle::kZig) << ",\n";
    }
    out << kIndent << "_,\n";
    out << "};\n";
  }

  std::string Signature(const IRDecl& decl, bool with_names) {
    std::vector<std::string> wanted;
    for (const auto& param : decl.params) {
      wanted.push_back(param.name);
    }
    const std::vector<std::string> params = ScopedNames(wanted);
    std::string text = "(";
    const bool multiline = with_names && !decl.params.empty();
    for (std::size_t i = 0; i < decl.params.size(); ++i) {
      const std::string type = Render(MapValue(decl.params[i].type));
      if (multiline) {
        text += std::string("\n") + kIndent + params[i] + ": " + type + ",";
      } else {
        text += (i == 0 ? "" : ", ") + type;
      }
    }
    if (decl.is_variadic) {
      if (multiline) {
        text += std::string("\n") + kIndent + "...";
      } else {
        text += decl.params.empty() ? "..." : ", ...";
      }
    }
    if (multiline) {
      text += "\n";
    }
    return text + ") callconv(" + Convention(CallingConvention(decl.calling_convention)) + ") " +
           Render(MapReturn(decl.return_type));
  }

  void EmitFunction(const IRDecl& decl, const std::string& name, const std::string& vis,
                    std::ostringstream& out) {
    const std::string& linkage = decl.linkage_name.empty() ? decl.name : decl.linkage_name;
    if (linkage == name) {
      out << vis << "extern ";
      if (!decl.library.empty()) {
        out << "\"" << decl.library << "\" ";
      }
      out << "fn " << name << Signature(decl, true) << ";\n";
      return;
    }
    // The symbol name is not a usable identifier here; bind it explicitly.
    out << vis << "const " << name << " = @extern(*const fn " << Signature(decl, false)
        << ", .{ .name = \"" << linkage << "\", .library_name = \"" << decl.library
        << "\" });\n";
  }

  bool uses_winapi_ = false;
};

}  // namespace

std::unique_ptr<Emitter> MakeZigEmitter(const TargetProfile& profile, const NameMap& all_names,
                                        LayoutEngine* layout) {
  return std::make_unique<ZigEmitter>(profile, all_names, layout);
}

}  // namespace ffibridge::lowering
