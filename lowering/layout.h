#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <llvm/IR/DataLayout.h>
#include <llvm/IR/LLVMContext.h>

#include "diagnostics.h"
#include "resolver.h"
#include "target_profile.h"

namespace ffibridge::lowering {

inline constexpr char kDefaultTriple[] = "x86_64-pc-windows-msvc";
inline constexpr char kDefaultDataLayout[] =
    "e-m:w-p270:32:32-p271:32:32-p272:64:64-i64:64-f80:128-n8:16:32:64-S128";

// The native ABI that emitted declarations must reproduce.
struct NativeAbi {
  std::string triple = kDefaultTriple;
  std::string data_layout = kDefaultDataLayout;
  int pointer_width = 64;
  int c_long_bits = 32;
  int wchar_bits = 16;
};

// Takes the data layout and C type widths from a registered LLVM target.
Result NativeAbiFromTriple(std::string_view triple, NativeAbi* out);

// Replaces the data layout string after checking that LLVM accepts it.
Result ApplyDataLayout(std::string_view data_layout, NativeAbi* out);

struct FieldLayout {
  std::string name;
  std::uint64_t offset = 0;
  std::uint64_t size = 0;
  std::uint64_t align = 1;
};

// Fields are listed in declaration order whatever order they are placed in.
struct RecordLayout {
  std::uint64_t size = 0;
  std::uint64_t align = 1;
  std::vector<FieldLayout> fields;
};

std::string DescribeLayout(const RecordLayout& layout);

// Computes sizes, alignments and field offsets against one LLVM DataLayout.
// Owns an LLVMContext, so every worker thread needs its own engine.
class LayoutEngine {
 public:
  LayoutEngine(const NativeAbi& abi, frontend::internal::Resolver* resolver);
  LayoutEngine(const LayoutEngine&) = delete;
  LayoutEngine& operator=(const LayoutEngine&) = delete;

  bool ok() const { return data_layout_ != nullptr; }
  const std::string& error() const { return error_; }

  bool TypeLayout(const frontend::internal::IRType& type, std::string_view module_path,
                  std::uint64_t* size, std::uint64_t* align, std::string* error);

  // Layout the source language gives the declaration: default-layout structs
  // may have their fields reordered, pack and align are always honored.
  bool SourceRecordLayout(const frontend::internal::IRDecl& decl, RecordLayout* out,
                          std::string* error);

  // Layout the emitted declaration gets: fields in declaration order, pack and
  // align only where the profile can express them.
  bool TargetRecordLayout(const frontend::internal::IRDecl& decl, const TargetProfile& profile,
                          RecordLayout* out, std::string* error);

  // Source layout of the struct or union `type` names, through aliases.
  bool RecordLayoutOfType(const frontend::internal::IRType& type, std::string_view module_path,
                          RecordLayout* out, std::string* error);

  // Memory image of a folded constant of type `type`, padding zeroed.
  bool EncodeConstant(const frontend::internal::ConstValue& value,
                      const frontend::internal::IRType& type, std::string_view module_path,
                      std::vector<std::uint8_t>* out, std::string* error);

  std::uint64_t pointer_size() const;
  bool little_endian() const;

 private:
  struct Rules {
    bool reorder_default = false;
    bool honor_pack = true;
    bool honor_align = true;

    std::string Key() const;
  };

  bool Lookup(const frontend::internal::IRType& type, std::string_view module_path,
              frontend::internal::PathResolution* out, std::string* error);
  bool TypeLayoutWith(const frontend::internal::IRType& type, std::string_view module_path,
                      const Rules& rules, std::uint64_t* size, std::uint64_t* align,
                      std::string* error, int depth);
  bool Record(const frontend::internal::IRDecl& decl, const Rules& rules, RecordLayout* out,
              std::string* error, int depth);
  bool PlainRecord(const frontend::internal::IRDecl& decl, const Rules& rules,
                   RecordLayout* out, int depth);
  llvm::Type* ScalarType(const frontend::internal::IRType& type);
  llvm::Type* LlvmType(const frontend::internal::IRType& type, std::string_view module_path,
                       const Rules& rules, int depth);
  bool ArrayLength(const frontend::internal::IRType& type, std::string_view module_path,
                   std::uint64_t* length, std::string* error);
  bool Encode(const frontend::internal::ConstValue& value, const frontend::internal::IRType& type,
              std::string_view module_path, std::uint64_t offset, std::vector<std::uint8_t>* out,
              std::string* error, int depth);
  void StoreInteger(const llvm::APSInt& value, std::uint64_t offset, std::uint64_t size,
                    std::vector<std::uint8_t>* out) const;

  llvm::LLVMContext context_;
  std::unique_ptr<llvm::DataLayout> data_layout_;
  frontend::internal::Resolver* resolver_;
  std::string error_;
  std::map<std::string, RecordLayout> record_cache_;
};

// Compares the source and target layouts of one declaration and checks GUID
// constants. Reports LayoutMismatch; returns false when the declaration must
// not be emitted.
bool CheckDeclLayout(LayoutEngine* engine, const TargetProfile& profile,
                     const frontend::internal::ResolvedDecl& resolved,
                     frontend::internal::DiagnosticsCollector* diags);

}  // namespace ffibridge::lowering
