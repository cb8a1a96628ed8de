#include "type_mapper.h"

#include <utility>

namespace ffibridge::lowering {

using frontend::internal::DiagnosticSeverity;
using frontend::internal::DiagnosticsCollector;
using frontend::internal::DumpType;
using frontend::internal::IRDecl;
using frontend::internal::IRType;
using frontend::internal::PrimitiveKind;
using frontend::internal::ResolvedDecl;

namespace codes = frontend::internal::codes;

namespace {

enum class Position {
  kValue,
  kReturn,
  kPointee,
};

TypeMapResult Fail(std::string message) {
  TypeMapResult result;
  result.ok = false;
  result.message = std::move(message);
  return result;
}

TypeMapResult Named(std::string name, bool is_void = false) {
  TypeMapResult result;
  result.ok = true;
  result.type.kind = TargetType::Kind::kNamed;
  result.type.name = std::move(name);
  result.type.is_void = is_void;
  return result;
}

TypeMapResult MapPrimitive(const IRType& type, const TargetProfile& profile, Position position) {
  const bool zig = profile.language == TargetLanguage::kZig;
  switch (type.primitive) {
    case PrimitiveKind::kInt: {
      if (profile.available_integer_widths.count(type.bits) == 0) {
        return Fail(std::string(type.is_signed ? "i" : "u") + std::to_string(type.bits) +
                    ": " + profile.name + " has no " + std::to_string(type.bits) +
                    "-bit integer");
      }
      if (zig) {
        return Named((type.is_signed ? "i" : "u") + std::to_string(type.bits));
      }
      return Named(std::string(type.is_signed ? "int" : "uint") + std::to_string(type.bits) +
                   "_t");
    }
    case PrimitiveKind::kPointerSizedInt:
      if (zig) {
        return Named(type.is_signed ? "isize" : "usize");
      }
      return Named(type.is_signed ? "intptr_t" : "uintptr_t");
    case PrimitiveKind::kFloat:
      if (type.bits != 32 && type.bits != 64) {
        return Fail("f" + std::to_string(type.bits) + " has no target equivalent");
      }
      if (zig) {
        return Named(type.bits == 32 ? "f32" : "f64");
      }
      return Named(type.bits == 32 ? "float" : "double");
    case PrimitiveKind::kBool:
      return Named("bool");
    case PrimitiveKind::kVoid:
      if (position == Position::kValue) {
        return Fail("void cannot be used by value");
      }
      return Named(zig && position == Position::kPointee ? "anyopaque" : "void", true);
  }
  return Fail("unknown primitive");
}

TypeMapResult Map(const IRType& type, const TargetProfile& profile, Position position) {
  switch (type.kind) {
    case IRType::Kind::kPrimitive:
      return MapPrimitive(type, profile, position);

    case IRType::Kind::kPointer: {
      TypeMapResult pointee = Map(type.children[0], profile, Position::kPointee);
      if (!pointee.ok) {
        return pointee;
      }
      TypeMapResult result;
      result.ok = true;
      result.type.kind = TargetType::Kind::kPointer;
      result.type.is_const = !type.is_mutable;
      result.type.children.push_back(std::move(pointee.type));
      return result;
    }

    case IRType::Kind::kArray: {
      TypeMapResult element = Map(type.children[0], profile, Position::kValue);
      if (!element.ok) {
        return element;
      }
      TypeMapResult result;
      result.ok = true;
      result.type.kind = TargetType::Kind::kArray;
      result.type.length = type.resolved_length;
      result.type.children.push_back(std::move(element.type));
      return result;
    }

    case IRType::Kind::kFunctionPointer: {
      TypeMapResult result;
      result.ok = true;
      result.type.kind = TargetType::Kind::kFunctionPointer;
      if (!MapCallingConvention(type.calling_convention, profile,
                                &result.type.calling_convention)) {
        return Fail("calling convention \"" + type.calling_convention +
                    "\" is not supported by " + profile.name);
      }
      result.type.is_nullable = type.is_nullable;
      result.type.is_variadic = type.is_variadic;
      result.type.param_names = type.param_names;
      for (std::size_t i = 0; i < type.children.size(); ++i) {
        TypeMapResult child =
            Map(type.children[i], profile, i == 0 ? Position::kReturn : Position::kValue);
        if (!child.ok) {
          return Fail((i == 0 ? std::string("return type: ")
                              : "parameter " + std::to_string(i - 1) + ": ") +
                      child.message);
        }
        result.type.children.push_back(std::move(child.type));
      }
      return result;
    }

    case IRType::Kind::kPath:
      break;
  }

  if (!type.children.empty()) {
    return Fail("generic type " + DumpType(type) + " has no " + profile.name + " equivalent");
  }
  if (type.unresolved || type.resolved_name.empty()) {
    if (position != Position::kPointee) {
      return Fail("unresolved type '" + type.path + "' used by value");
    }
    TypeMapResult result;
    result.ok = true;
    result.type.kind = TargetType::Kind::kOpaque;
    result.type.name = type.path;
    return result;
  }
  if (type.resolved_opaque && position != Position::kPointee) {
    return Fail("opaque type '" + type.resolved_name + "' used by value");
  }
  TypeMapResult result;
  result.ok = true;
  result.type.kind = TargetType::Kind::kReference;
  result.type.name = type.resolved_name;
  return result;
}

}  // namespace

TypeMapResult MapType(const IRType& type, const TargetProfile& profile) {
  return Map(type, profile, Position::kValue);
}

TypeMapResult MapReturnType(const IRType& type, const TargetProfile& profile) {
  return Map(type, profile, Position::kReturn);
}

TypeMapResult MapAliasedType(const IRType& type, const TargetProfile& profile) {
  return Map(type, profile, Position::kPointee);
}

bool MapCallingConvention(const std::string& convention, const TargetProfile& profile,
                          std::string* spelling) {
  auto it = profile.supported_calling_conventions.find(convention.empty() ? "C" : convention);
  if (it == profile.supported_calling_conventions.end()) {
    return false;
  }
  *spelling = it->second;
  return true;
}

bool CheckDeclMapping(const ResolvedDecl& resolved, const TargetProfile& profile,
                      DiagnosticsCollector* diags) {
  const IRDecl& decl = resolved.decl;
  std::vector<std::string> errors;
  auto check = [&](const std::string& what, const TypeMapResult& result) {
    if (!result.ok) {
      errors.push_back(what + ": " + result.message);
    }
  };

  switch (decl.kind) {
    case IRDecl::Kind::kStruct:
    case IRDecl::Kind::kUnion:
      for (const auto& field : decl.fields) {
        check("field '" + field.name + "'", MapType(field.type, profile));
      }
      break;
    case IRDecl::Kind::kEnum:
      check("discriminant", MapType(decl.discriminant_type, profile));
      break;
    case IRDecl::Kind::kFunction: {
      std::string spelling;
      if (!MapCallingConvention(decl.calling_convention, profile, &spelling)) {
        errors.push_back("calling convention \"" + decl.calling_convention +
                         "\" is not supported by " + profile.name);
      }
      for (const auto& param : decl.params) {
        check("parameter '" + param.name + "'", MapType(param.type, profile));
      }
      check("return type", MapReturnType(decl.return_type, profile));
      break;
    }
    case IRDecl::Kind::kTypeAlias:
      check("aliased type", MapAliasedType(decl.aliased, profile));
      break;
    case IRDecl::Kind::kConstant:
      check("type", MapType(decl.const_type, profile));
      break;
    case IRDecl::Kind::kModule:
      break;
  }

  for (const std::string& error : errors) {
    diags->Report(codes::kMappingError, DiagnosticSeverity::kError, decl.QualifiedName(),
                  decl.location, error, "declaration omitted");
  }
  return errors.empty();
}

}  // namespace ffibridge::lowering
