#include "emitter.h"

#include <stdexcept>
#include <utility>

#include <llvm/ADT/APInt.h>
#include <llvm/ADT/SmallString.h>

namespace ffibridge::lowering {

using frontend::internal::IRDecl;
using frontend::internal::IRType;
using frontend::internal::ResolvedModule;

Emitter::Emitter(const TargetProfile& profile, const NameMap& all_names, LayoutEngine* layout)
    : profile_(profile), all_names_(all_names), layout_(layout) {}

EmittedModule Emitter::EmitModule(const ResolvedModule& module, const ModuleNames& names) {
  module_ = &module;
  names_ = &names;
  file_path_ = ModuleFilePath(module.module->path, profile_);
  BeginModule();

  std::ostringstream body;
  for (std::size_t index : EmitOrder(module, profile_)) {
    EmitDecl(module.decls[index], body);
  }
  for (std::size_t i = 0; i < module.exports.size() && i < names.export_names.size(); ++i) {
    EmitExport(module.exports[i], names.export_names[i], body);
  }

  EmittedModule out;
  out.module_path = module.module->path;
  out.relative_path = file_path_;
  out.text = Header() + body.str() + Footer();
  module_ = nullptr;
  names_ = nullptr;
  return out;
}

const EmittedName& Emitter::Lookup(const std::string& qualified) const {
  auto it = all_names_.find(qualified);
  if (it == all_names_.end()) {
    throw std::logic_error("no emitted name for '" + qualified + "'");
  }
  return it->second;
}

TargetType Emitter::MapValue(const IRType& type) const {
  TypeMapResult result = MapType(type, profile_);
  if (!result.ok) {
    throw std::logic_error("unchecked type reached the emitter: " + result.message);
  }
  return std::move(result.type);
}

TargetType Emitter::MapReturn(const IRType& type) const {
  TypeMapResult result = MapReturnType(type, profile_);
  if (!result.ok) {
    throw std::logic_error("unchecked type reached the emitter: " + result.message);
  }
  return std::move(result.type);
}

TargetType Emitter::MapAlias(const IRType& type) const {
  TypeMapResult result = MapAliasedType(type, profile_);
  if (!result.ok) {
    throw std::logic_error("unchecked type reached the emitter: " + result.message);
  }
  return std::move(result.type);
}

std::string Emitter::CallingConvention(const std::string& convention) const {
  std::string spelling;
  if (!MapCallingConvention(convention, profile_, &spelling)) {
    throw std::logic_error("unchecked calling convention reached the emitter: " + convention);
  }
  return spelling;
}

RecordLayout Emitter::SourceLayout(const IRDecl& decl) const {
  RecordLayout layout;
  std::string error;
  if (!layout_->SourceRecordLayout(decl, &layout, &error)) {
    throw std::logic_error("layout of '" + decl.QualifiedName() + "': " + error);
  }
  return layout;
}

std::vector<std::string> Emitter::ScopedNames(const std::vector<std::string>& wanted) const {
  std::set<std::string> taken;
  std::vector<std::string> names;
  names.reserve(wanted.size());
  for (const std::string& name : wanted) {
    names.push_back(UniqueName(name, profile_, &taken));
  }
  return names;
}

std::string Emitter::FormatInteger(const llvm::APSInt& value, unsigned radix, IntegerStyle style) {
  const bool negative = value.isSigned() && value.isNegative();
  // One extra bit so the most negative value has a magnitude.
  llvm::APInt magnitude = negative ? value.sext(value.getBitWidth() + 1).abs() : llvm::APInt(value);

  if (style == IntegerStyle::kC && radix == 2) {
    radix = 16;
  }
  std::string prefix;
  switch (radix) {
    case 16:
      prefix = "0x";
      break;
    case 8:
      prefix = style == IntegerStyle::kZig ? "0o" : "0";
      break;
    case 2:
      prefix = "0b";
      break;
    default:
      radix = 10;
      break;
  }

  llvm::SmallString<48> digits;
  magnitude.toString(digits, radix, /*Signed=*/false);
  std::string text = (negative ? "-" : "") + prefix + std::string(digits.str());
  if (style == IntegerStyle::kC && magnitude.getActiveBits() > 31) {
    text += "ULL";
  }
  return text;
}

void Emitter::CollectReferences(const TargetType& type, std::vector<std::string>* out) {
  if (type.kind == TargetType::Kind::kReference) {
    out->push_back(type.name);
  }
  for (const TargetType& child : type.children) {
    CollectReferences(child, out);
  }
}

std::unique_ptr<Emitter> MakeEmitter(const TargetProfile& profile, const NameMap& all_names,
                                     LayoutEngine* layout) {
  switch (profile.language) {
    case TargetLanguage::kZig:
      return MakeZigEmitter(profile, all_names, layout);
    case TargetLanguage::kC:
      return MakeCEmitter(profile, all_names, layout);
  }
  return nullptr;
}

}  // namespace ffibridge::lowering
