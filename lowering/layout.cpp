#include "layout.h"

#include <algorithm>
#include <mutex>
#include <numeric>
#include <sstream>
#include <utility>

#include <llvm/ADT/APInt.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/Type.h>
#include <llvm/MC/TargetRegistry.h>
#include <llvm/Support/Alignment.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/MathExtras.h>
#include <llvm/Support/TargetSelect.h>
#include <llvm/Target/TargetMachine.h>
#include <llvm/Target/TargetOptions.h>

namespace ffibridge::lowering {

using frontend::internal::ConstValue;
using frontend::internal::DiagnosticSeverity;
using frontend::internal::DiagnosticsCollector;
using frontend::internal::IRDecl;
using frontend::internal::IRType;
using frontend::internal::LayoutMode;
using frontend::internal::MakePrimitive;
using frontend::internal::PathResolution;
using frontend::internal::PrimitiveKind;
using frontend::internal::ResolvedDecl;
using frontend::internal::SymbolEntry;

namespace codes = frontend::internal::codes;

namespace {

constexpr int kMaxLayoutDepth = 32;

// Translate may run from several threads of the embedding program.
void EnsureLlvmTargetsInitialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    llvm::InitializeAllTargetInfos();
    llvm::InitializeAllTargets();
    llvm::InitializeAllTargetMCs();
  });
}

bool IsWindowsTriple(std::string_view triple) {
  return triple.find("windows") != std::string_view::npos ||
         triple.find("win32") != std::string_view::npos ||
         triple.find("mingw") != std::string_view::npos;
}

bool SameLayout(const RecordLayout& a, const RecordLayout& b) {
  if (a.size != b.size || a.align != b.align || a.fields.size() != b.fields.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.fields.size(); ++i) {
    if (a.fields[i].offset != b.fields[i].offset) {
      return false;
    }
  }
  return true;
}

}  // namespace

Result NativeAbiFromTriple(std::string_view triple, NativeAbi* out) {
  EnsureLlvmTargetsInitialized();

  const std::string triple_text(triple);
  std::string target_error;
  const llvm::Target* target = llvm::TargetRegistry::lookupTarget(triple_text, target_error);
  if (!target) {
    return Result{false, target_error};
  }

  llvm::TargetOptions options;
  std::unique_ptr<llvm::TargetMachine> tm(
      target->createTargetMachine(triple_text, "", "", options, llvm::Reloc::PIC_));
  if (!tm) {
    return Result{false, "failed to create LLVM target machine for " + triple_text};
  }
  const llvm::DataLayout layout = tm->createDataLayout();

  out->triple = triple_text;
  out->data_layout = layout.getStringRepresentation();
  out->pointer_width = static_cast<int>(layout.getPointerSizeInBits(0));
  if (IsWindowsTriple(triple)) {
    out->c_long_bits = 32;
    out->wchar_bits = 16;
  } else {
    out->c_long_bits = out->pointer_width;
    out->wchar_bits = 32;
  }
  return Result{true, out->data_layout};
}

Result ApplyDataLayout(std::string_view data_layout, NativeAbi* out) {
  llvm::Expected<llvm::DataLayout> parsed = llvm::DataLayout::parse(data_layout);
  if (!parsed) {
    return Result{false, "invalid data layout: " + llvm::toString(parsed.takeError())};
  }
  out->data_layout = std::string(data_layout);
  out->pointer_width = static_cast<int>(parsed->getPointerSizeInBits(0));
  return Result{true, out->data_layout};
}

std::string DescribeLayout(const RecordLayout& layout) {
  std::ostringstream out;
  out << "size " << layout.size << ", align " << layout.align;
  for (const FieldLayout& field : layout.fields) {
    out << ", " << field.name << "@" << field.offset;
  }
  return out.str();
}

std::string LayoutEngine::Rules::Key() const {
  std::string key;
  key += reorder_default ? 'r' : '-';
  key += honor_pack ? 'p' : '-';
  key += honor_align ? 'a' : '-';
  return key + ":";
}

LayoutEngine::LayoutEngine(const NativeAbi& abi, frontend::internal::Resolver* resolver)
    : resolver_(resolver) {
  llvm::Expected<llvm::DataLayout> parsed = llvm::DataLayout::parse(abi.data_layout);
  if (!parsed) {
    error_ = "invalid data layout: " + llvm::toString(parsed.takeError());
    return;
  }
  data_layout_ = std::make_unique<llvm::DataLayout>(std::move(*parsed));
}

std::uint64_t LayoutEngine::pointer_size() const {
  return data_layout_->getPointerSize(0);
}

bool LayoutEngine::little_endian() const {
  return data_layout_->isLittleEndian();
}

bool LayoutEngine::Lookup(const IRType& type, std::string_view module_path, PathResolution* out,
                          std::string* error) {
  if (type.unresolved) {
    *error = "'" + type.path + "' is unresolved";
    return false;
  }
  if (!type.children.empty()) {
    *error = "generic type '" + type.path + "' has no fixed layout";
    return false;
  }
  *out = type.resolved_name.empty() ? resolver_->ResolvePath(type.path, module_path)
                                     : resolver_->ResolvePath("crate::" + type.resolved_name, "");
  if (out->kind == PathResolution::Kind::kNone) {
    *error = "cannot resolve type '" + type.path + "'";
    return false;
  }
  if (out->kind == PathResolution::Kind::kSymbol &&
      (out->entry->kind != SymbolEntry::Kind::kDecl || out->entry->decl == nullptr)) {
    *error = "'" + type.path + "' is not a type";
    return false;
  }
  return true;
}

llvm::Type* LayoutEngine::ScalarType(const IRType& type) {
  switch (type.primitive) {
    case PrimitiveKind::kInt:
      return llvm::IntegerType::get(context_, static_cast<unsigned>(type.bits));
    case PrimitiveKind::kPointerSizedInt:
      return data_layout_->getIntPtrType(context_, 0);
    case PrimitiveKind::kFloat:
      return type.bits == 32 ? llvm::Type::getFloatTy(context_) : llvm::Type::getDoubleTy(context_);
    case PrimitiveKind::kBool:
      return llvm::Type::getInt8Ty(context_);
    case PrimitiveKind::kVoid:
      return nullptr;
  }
  return nullptr;
}

bool LayoutEngine::ArrayLength(const IRType& type, std::string_view module_path,
                               std::uint64_t* length, std::string* error) {
  if (!type.length) {
    *error = "array without a length";
    return false;
  }
  ConstValue value;
  if (!resolver_->EvaluateConstant(*type.length, MakePrimitive(PrimitiveKind::kPointerSizedInt),
                                   module_path, &value, error)) {
    return false;
  }
  *length = value.integer.getLimitedValue();
  return true;
}

bool LayoutEngine::TypeLayout(const IRType& type, std::string_view module_path,
                              std::uint64_t* size, std::uint64_t* align, std::string* error) {
  return TypeLayoutWith(type, module_path, Rules{true, true, true}, size, align, error, 0);
}

bool LayoutEngine::TypeLayoutWith(const IRType& type, std::string_view module_path,
                                  const Rules& rules, std::uint64_t* size, std::uint64_t* align,
                                  std::string* error, int depth) {
  if (depth > kMaxLayoutDepth) {
    *error = "type nesting too deep";
    return false;
  }
  switch (type.kind) {
    case IRType::Kind::kPrimitive: {
      llvm::Type* scalar = ScalarType(type);
      if (scalar == nullptr) {
        *error = "void has no size";
        return false;
      }
      *size = data_layout_->getTypeAllocSize(scalar).getKnownMinValue();
      *align = data_layout_->getABITypeAlign(scalar).value();
      return true;
    }
    case IRType::Kind::kPointer:
    case IRType::Kind::kFunctionPointer:
      *size = data_layout_->getPointerSize(0);
      *align = data_layout_->getPointerABIAlignment(0).value();
      return true;
    case IRType::Kind::kArray: {
      std::uint64_t length = 0;
      if (!ArrayLength(type, module_path, &length, error)) {
        return false;
      }
      std::uint64_t element_size = 0;
      if (!TypeLayoutWith(type.children[0], module_path, rules, &element_size, align, error,
                          depth + 1)) {
        return false;
      }
      *size = element_size * length;
      return true;
    }
    case IRType::Kind::kPath:
      break;
  }

  PathResolution resolution;
  if (!Lookup(type, module_path, &resolution, error)) {
    return false;
  }
  if (resolution.kind == PathResolution::Kind::kPrimitive) {
    return TypeLayoutWith(resolution.primitive, module_path, rules, size, align, error, depth + 1);
  }
  const IRDecl& decl = *resolution.entry->decl;
  switch (decl.kind) {
    case IRDecl::Kind::kStruct:
    case IRDecl::Kind::kUnion: {
      RecordLayout record;
      if (!Record(decl, rules, &record, error, depth + 1)) {
        return false;
      }
      *size = record.size;
      *align = record.align;
      return true;
    }
    case IRDecl::Kind::kEnum:
      return TypeLayoutWith(decl.discriminant_type, decl.module_path, rules, size, align, error,
                            depth + 1);
    case IRDecl::Kind::kTypeAlias:
      return TypeLayoutWith(decl.aliased, decl.module_path, rules, size, align, error, depth + 1);
    default:
      *error = "'" + type.path + "' is not a type";
      return false;
  }
}

llvm::Type* LayoutEngine::LlvmType(const IRType& type, std::string_view module_path,
                                   const Rules& rules, int depth) {
  if (depth > kMaxLayoutDepth) {
    return nullptr;
  }
  switch (type.kind) {
    case IRType::Kind::kPrimitive:
      return ScalarType(type);
    case IRType::Kind::kPointer:
    case IRType::Kind::kFunctionPointer:
      return llvm::PointerType::getUnqual(llvm::Type::getInt8Ty(context_));
    case IRType::Kind::kArray: {
      std::uint64_t length = 0;
      std::string error;
      if (!ArrayLength(type, module_path, &length, &error)) {
        return nullptr;
      }
      llvm::Type* element = LlvmType(type.children[0], module_path, rules, depth + 1);
      return element == nullptr ? nullptr : llvm::ArrayType::get(element, length);
    }
    case IRType::Kind::kPath:
      break;
  }

  PathResolution resolution;
  std::string error;
  if (!Lookup(type, module_path, &resolution, &error)) {
    return nullptr;
  }
  if (resolution.kind == PathResolution::Kind::kPrimitive) {
    return ScalarType(resolution.primitive);
  }
  const IRDecl& decl = *resolution.entry->decl;
  switch (decl.kind) {
    case IRDecl::Kind::kStruct: {
      if (decl.is_opaque || (rules.honor_pack && decl.layout.pack != 0) ||
          (rules.honor_align && decl.layout.align != 0) ||
          (rules.reorder_default && decl.layout.mode == LayoutMode::kDefault)) {
        return nullptr;
      }
      std::vector<llvm::Type*> elements;
      for (const auto& field : decl.fields) {
        llvm::Type* element = LlvmType(field.type, decl.module_path, rules, depth + 1);
        if (element == nullptr) {
          return nullptr;
        }
        elements.push_back(element);
      }
      return llvm::StructType::get(context_, elements);
    }
    case IRDecl::Kind::kEnum:
      return LlvmType(decl.discriminant_type, decl.module_path, rules, depth + 1);
    case IRDecl::Kind::kTypeAlias:
      return LlvmType(decl.aliased, decl.module_path, rules, depth + 1);
    default:
      return nullptr;
  }
}

bool LayoutEngine::PlainRecord(const IRDecl& decl, const Rules& rules, RecordLayout* out,
                               int depth) {
  std::vector<llvm::Type*> elements;
  for (const auto& field : decl.fields) {
    llvm::Type* element = LlvmType(field.type, decl.module_path, rules, depth + 1);
    if (element == nullptr) {
      return false;
    }
    elements.push_back(element);
  }
  llvm::StructType* type = llvm::StructType::get(context_, elements);
  const llvm::StructLayout* layout = data_layout_->getStructLayout(type);

  out->size = static_cast<std::uint64_t>(layout->getSizeInBytes());
  out->align = layout->getAlignment().value();
  out->fields.clear();
  for (std::size_t i = 0; i < decl.fields.size(); ++i) {
    FieldLayout field;
    field.name = decl.fields[i].name;
    field.offset = static_cast<std::uint64_t>(layout->getElementOffset(static_cast<unsigned>(i)));
    field.size = data_layout_->getTypeAllocSize(elements[i]).getKnownMinValue();
    field.align = data_layout_->getABITypeAlign(elements[i]).value();
    out->fields.push_back(std::move(field));
  }
  return true;
}

bool LayoutEngine::Record(const IRDecl& decl, const Rules& rules, RecordLayout* out,
                          std::string* error, int depth) {
  const std::string key = rules.Key() + decl.QualifiedName();
  auto cached = record_cache_.find(key);
  if (cached != record_cache_.end()) {
    *out = cached->second;
    return true;
  }
  if (depth > kMaxLayoutDepth) {
    *error = "type nesting too deep";
    return false;
  }
  if (decl.is_opaque) {
    *error = "opaque type '" + decl.QualifiedName() + "' has no size";
    return false;
  }

  const bool is_union = decl.kind == IRDecl::Kind::kUnion;
  const unsigned pack = rules.honor_pack ? decl.layout.pack : 0;
  const unsigned min_align = rules.honor_align ? decl.layout.align : 0;
  const bool reorder =
      rules.reorder_default && decl.layout.mode == LayoutMode::kDefault && !is_union;

  RecordLayout layout;
  if (!is_union && pack == 0 && min_align == 0 && !reorder &&
      PlainRecord(decl, rules, &layout, depth)) {
    record_cache_.emplace(key, layout);
    *out = std::move(layout);
    return true;
  }

  layout.fields.resize(decl.fields.size());
  for (std::size_t i = 0; i < decl.fields.size(); ++i) {
    FieldLayout& field = layout.fields[i];
    field.name = decl.fields[i].name;
    std::string field_error;
    if (!TypeLayoutWith(decl.fields[i].type, decl.module_path, rules, &field.size, &field.align,
                        &field_error, depth + 1)) {
      *error = "field '" + field.name + "': " + field_error;
      return false;
    }
    if (pack != 0) {
      field.align = std::min<std::uint64_t>(field.align, pack);
    }
  }

  std::vector<std::size_t> order(layout.fields.size());
  std::iota(order.begin(), order.end(), 0);
  if (reorder) {
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
      return layout.fields[a].align > layout.fields[b].align;
    });
  }

  std::uint64_t offset = 0;
  std::uint64_t max_align = 1;
  for (std::size_t index : order) {
    FieldLayout& field = layout.fields[index];
    if (is_union) {
      field.offset = 0;
      offset = std::max(offset, field.size);
    } else {
      offset = llvm::alignTo(offset, llvm::Align(field.align));
      field.offset = offset;
      offset += field.size;
    }
    max_align = std::max(max_align, field.align);
  }
  if (min_align != 0) {
    max_align = std::max<std::uint64_t>(max_align, min_align);
  }
  layout.align = max_align;
  layout.size = llvm::alignTo(offset, llvm::Align(max_align));

  record_cache_.emplace(key, layout);
  *out = std::move(layout);
  return true;
}

bool LayoutEngine::SourceRecordLayout(const IRDecl& decl, RecordLayout* out, std::string* error) {
  return Record(decl, Rules{true, true, true}, out, error, 0);
}

bool LayoutEngine::TargetRecordLayout(const IRDecl& decl, const TargetProfile& profile,
                                      RecordLayout* out, std::string* error) {
  return Record(decl,
                Rules{false, profile.supports_packed_layout, profile.supports_aligned_layout},
                out, error, 0);
}

bool LayoutEngine::RecordLayoutOfType(const IRType& type, std::string_view module_path,
                                      RecordLayout* out, std::string* error) {
  const IRType* current = &type;
  std::string current_module(module_path);
  for (int depth = 0; depth <= kMaxLayoutDepth; ++depth) {
    if (current->kind != IRType::Kind::kPath) {
      *error = "type is not a struct or union";
      return false;
    }
    PathResolution resolution;
    if (!Lookup(*current, current_module, &resolution, error)) {
      return false;
    }
    if (resolution.kind == PathResolution::Kind::kPrimitive) {
      *error = "'" + current->path + "' is not a struct or union";
      return false;
    }
    const IRDecl& decl = *resolution.entry->decl;
    if (decl.kind == IRDecl::Kind::kTypeAlias) {
      current = &decl.aliased;
      current_module = decl.module_path;
      continue;
    }
    if (decl.kind != IRDecl::Kind::kStruct && decl.kind != IRDecl::Kind::kUnion) {
      *error = "'" + current->path + "' is not a struct or union";
      return false;
    }
    return SourceRecordLayout(decl, out, error);
  }
  *error = "type alias chain too deep";
  return false;
}

void LayoutEngine::StoreInteger(const llvm::APSInt& value, std::uint64_t offset,
                                std::uint64_t size, std::vector<std::uint8_t>* out) const {
  const unsigned bits = static_cast<unsigned>(size * 8);
  const llvm::APInt image = value.isSigned() ? value.sextOrTrunc(bits) : value.zextOrTrunc(bits);
  const bool little = data_layout_->isLittleEndian();
  for (std::uint64_t i = 0; i < size; ++i) {
    const std::uint64_t byte = image.extractBitsAsZExtValue(8, static_cast<unsigned>(i * 8));
    const std::uint64_t at = little ? offset + i : offset + size - 1 - i;
    (*out)[at] = static_cast<std::uint8_t>(byte);
  }
}

bool LayoutEngine::EncodeConstant(const ConstValue& value, const IRType& type,
                                  std::string_view module_path, std::vector<std::uint8_t>* out,
                                  std::string* error) {
  std::uint64_t size = 0;
  std::uint64_t align = 0;
  if (!TypeLayout(type, module_path, &size, &align, error)) {
    return false;
  }
  out->assign(size, 0);
  return Encode(value, type, module_path, 0, out, error, 0);
}

bool LayoutEngine::Encode(const ConstValue& value, const IRType& type,
                          std::string_view module_path, std::uint64_t offset,
                          std::vector<std::uint8_t>* out, std::string* error, int depth) {
  if (depth > kMaxLayoutDepth) {
    *error = "constant nesting too deep";
    return false;
  }
  const bool is_integer =
      value.kind == ConstValue::Kind::kInt || value.kind == ConstValue::Kind::kPointer;

  switch (type.kind) {
    case IRType::Kind::kPrimitive: {
      std::uint64_t size = 0;
      std::uint64_t align = 0;
      if (!TypeLayout(type, module_path, &size, &align, error)) {
        return false;
      }
      if (type.primitive == PrimitiveKind::kBool) {
        if (value.kind != ConstValue::Kind::kBool) {
          *error = "expected a bool value";
          return false;
        }
        (*out)[offset] = value.boolean ? 1 : 0;
        return true;
      }
      if (type.primitive == PrimitiveKind::kFloat) {
        if (value.kind != ConstValue::Kind::kFloat) {
          *error = "expected a float value";
          return false;
        }
        const llvm::APInt bits =
            type.bits == 32
                ? llvm::APInt(32, llvm::FloatToBits(static_cast<float>(value.floating)))
                : llvm::APInt(64, llvm::DoubleToBits(value.floating));
        StoreInteger(llvm::APSInt(bits, true), offset, size, out);
        return true;
      }
      if (!is_integer) {
        *error = "expected an integer value";
        return false;
      }
      StoreInteger(value.integer, offset, size, out);
      return true;
    }
    case IRType::Kind::kPointer:
    case IRType::Kind::kFunctionPointer:
      if (!is_integer) {
        *error = "expected an address value";
        return false;
      }
      StoreInteger(value.integer, offset, pointer_size(), out);
      return true;
    case IRType::Kind::kArray: {
      std::uint64_t length = 0;
      if (!ArrayLength(type, module_path, &length, error)) {
        return false;
      }
      if (value.kind != ConstValue::Kind::kArray || value.elements.size() != length) {
        *error = "expected an array of " + std::to_string(length) + " elements";
        return false;
      }
      std::uint64_t element_size = 0;
      std::uint64_t element_align = 0;
      if (!TypeLayout(type.children[0], module_path, &element_size, &element_align, error)) {
        return false;
      }
      for (std::size_t i = 0; i < value.elements.size(); ++i) {
        if (!Encode(value.elements[i], type.children[0], module_path, offset + i * element_size,
                    out, error, depth + 1)) {
          return false;
        }
      }
      return true;
    }
    case IRType::Kind::kPath:
      break;
  }

  PathResolution resolution;
  if (!Lookup(type, module_path, &resolution, error)) {
    return false;
  }
  if (resolution.kind == PathResolution::Kind::kPrimitive) {
    return Encode(value, resolution.primitive, module_path, offset, out, error, depth + 1);
  }
  const IRDecl& decl = *resolution.entry->decl;
  switch (decl.kind) {
    case IRDecl::Kind::kTypeAlias:
      return Encode(value, decl.aliased, decl.module_path, offset, out, error, depth + 1);
    case IRDecl::Kind::kEnum:
      return Encode(value, decl.discriminant_type, decl.module_path, offset, out, error,
                    depth + 1);
    case IRDecl::Kind::kStruct:
    case IRDecl::Kind::kUnion: {
      if (value.kind != ConstValue::Kind::kStruct) {
        *error = "expected a struct literal for '" + decl.QualifiedName() + "'";
        return false;
      }
      RecordLayout layout;
      if (!SourceRecordLayout(decl, &layout, error)) {
        return false;
      }
      for (std::size_t i = 0; i < value.elements.size(); ++i) {
        std::size_t index = 0;
        while (index < decl.fields.size() && decl.fields[index].name != value.field_names[i]) {
          ++index;
        }
        if (index == decl.fields.size()) {
          *error = "'" + decl.QualifiedName() + "' has no field '" + value.field_names[i] + "'";
          return false;
        }
        if (!Encode(value.elements[i], decl.fields[index].type, decl.module_path,
                    offset + layout.fields[index].offset, out, error, depth + 1)) {
          return false;
        }
      }
      return true;
    }
    default:
      *error = "'" + type.path + "' is not a type";
      return false;
  }
}

bool CheckDeclLayout(LayoutEngine* engine, const TargetProfile& profile,
                     const ResolvedDecl& resolved, DiagnosticsCollector* diags) {
  const IRDecl& decl = resolved.decl;
  const std::string qualified = decl.QualifiedName();
  auto report = [&](DiagnosticSeverity severity, std::string message, std::string remediation) {
    diags->Report(codes::kLayoutMismatch, severity, qualified, decl.location, std::move(message),
                  std::move(remediation));
  };

  switch (decl.kind) {
    case IRDecl::Kind::kEnum:
      if (decl.layout.ambiguous) {
        report(DiagnosticSeverity::kError, "ambiguous enum layout: " + decl.layout.ambiguity,
               "declaration omitted");
        return false;
      }
      if (!decl.layout.explicit_native) {
        report(DiagnosticSeverity::kWarning,
               "enum has no integer repr; discriminant emitted as a 32-bit C int",
               "add #[repr(i32)] or the intended width");
      }
      return true;

    case IRDecl::Kind::kStruct:
    case IRDecl::Kind::kUnion: {
      if (decl.is_opaque) {
        return true;
      }
      if (decl.layout.ambiguous) {
        report(DiagnosticSeverity::kError,
               "layout attributes have no single native meaning: " + decl.layout.ambiguity,
               "declaration omitted");
        return false;
      }
      RecordLayout source;
      RecordLayout target;
      std::string error;
      if (!engine->SourceRecordLayout(decl, &source, &error) ||
          !engine->TargetRecordLayout(decl, profile, &target, &error)) {
        report(DiagnosticSeverity::kError, "cannot compute layout: " + error,
               "declaration omitted");
        return false;
      }
      if (SameLayout(source, target)) {
        return true;
      }
      const std::string message = "source layout (" + DescribeLayout(source) +
                                  ") differs from emitted layout (" + DescribeLayout(target) + ")";
      if (decl.layout.explicit_native) {
        report(DiagnosticSeverity::kError, message,
               "declaration omitted; " + profile.name + " cannot express this layout");
        return false;
      }
      report(DiagnosticSeverity::kWarning, message, "add #[repr(C)] to pin the field order");
      return true;
    }

    case IRDecl::Kind::kConstant: {
      if (!decl.is_guid) {
        return true;
      }
      RecordLayout layout;
      std::string error;
      if (!engine->RecordLayoutOfType(decl.const_type, decl.module_path, &layout, &error)) {
        report(DiagnosticSeverity::kError, "GUID type: " + error, "declaration omitted");
        return false;
      }
      const std::uint64_t offsets[] = {0, 4, 6, 8};
      const std::uint64_t sizes[] = {4, 2, 2, 8};
      bool shaped = layout.size == 16 && layout.fields.size() == 4;
      for (std::size_t i = 0; shaped && i < 4; ++i) {
        shaped = layout.fields[i].offset == offsets[i] && layout.fields[i].size == sizes[i];
      }
      if (!shaped) {
        report(DiagnosticSeverity::kError,
               "GUID type does not have the 16-byte {u32, u16, u16, [u8; 8]} shape (" +
                   DescribeLayout(layout) + ")",
               "declaration omitted");
        return false;
      }
      std::vector<std::uint8_t> image;
      if (!engine->EncodeConstant(resolved.value, decl.const_type, decl.module_path, &image,
                                  &error)) {
        report(DiagnosticSeverity::kError, "GUID value: " + error, "declaration omitted");
        return false;
      }
      return true;
    }

    default:
      return true;
  }
}

}  // namespace ffibridge::lowering
