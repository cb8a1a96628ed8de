#pragma once

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <llvm/ADT/APSInt.h>

#include "emit_order.h"
#include "layout.h"
#include "resolver.h"
#include "target_profile.h"
#include "type_mapper.h"

namespace ffibridge::lowering {

struct EmittedModule {
  std::string module_path;
  // `um/winuser.zig`
  std::string relative_path;
  std::string text;
};

// Renders resolved modules as source text of one target language. An emitter
// holds per-module state while EmitModule runs, so each worker needs its own.
class Emitter {
 public:
  virtual ~Emitter() = default;

  Emitter(const Emitter&) = delete;
  Emitter& operator=(const Emitter&) = delete;

  // `names` must hold the module's own names; `all_names` every module's.
  // Throws std::logic_error when the module was not checked against the
  // profile first.
  EmittedModule EmitModule(const frontend::internal::ResolvedModule& module,
                           const ModuleNames& names);

 protected:
  Emitter(const TargetProfile& profile, const NameMap& all_names, LayoutEngine* layout);

  virtual void BeginModule() = 0;
  virtual void EmitDecl(const frontend::internal::ResolvedDecl& resolved,
                        std::ostringstream& out) = 0;
  virtual void EmitExport(const frontend::internal::ResolvedExport& item,
                          const std::string& name, std::ostringstream& out) = 0;
  virtual std::string Header() = 0;
  virtual std::string Footer() = 0;

  enum class IntegerStyle {
    kZig,
    kC,
  };

  const EmittedName& Lookup(const std::string& qualified) const;
  TargetType MapValue(const frontend::internal::IRType& type) const;
  TargetType MapReturn(const frontend::internal::IRType& type) const;
  TargetType MapAlias(const frontend::internal::IRType& type) const;
  std::string CallingConvention(const std::string& convention) const;
  RecordLayout SourceLayout(const frontend::internal::IRDecl& decl) const;

  // Names for one scope (fields, parameters, variants) in the given order.
  std::vector<std::string> ScopedNames(const std::vector<std::string>& wanted) const;

  static std::string FormatInteger(const llvm::APSInt& value, unsigned radix, IntegerStyle style);

  // Qualified names of every declaration `type` refers to.
  static void CollectReferences(const TargetType& type, std::vector<std::string>* out);

  const TargetProfile& profile_;
  const NameMap& all_names_;
  LayoutEngine* layout_;
  const frontend::internal::ResolvedModule* module_ = nullptr;
  const ModuleNames* names_ = nullptr;
  std::string file_path_;
};

std::unique_ptr<Emitter> MakeZigEmitter(const TargetProfile& profile, const NameMap& all_names,
                                        LayoutEngine* layout);
std::unique_ptr<Emitter> MakeCEmitter(const TargetProfile& profile, const NameMap& all_names,
                                      LayoutEngine* layout);

// Emitter for `profile.language`.
std::unique_ptr<Emitter> MakeEmitter(const TargetProfile& profile, const NameMap& all_names,
                                     LayoutEngine* layout);

}  // namespace ffibridge::lowering
