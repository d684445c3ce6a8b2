#pragma once

#include <llvm/IR/DataLayout.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/LLVMContext.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>

#include "ir.hpp"
#include "types.hpp"

namespace llvm {
class Constant;
}

namespace mlc {

// Maps source types to LLVM layout types.
//
// Value representations:
// - unit      `%mlc.unit = {}`
// - bool/int  `i1` / `i64`
// - float     `double`
// - string    `%mlc.string = { ptr chars, i64 length }`, passed by value
// - tuple     `ptr` to a heap record `{ elem0, elem1, ... }`
// - array     `%mlc.array = { ptr buffer, i64 size }`, passed by value
// - function  `%mlc.closure = { ptr fn, ptr env }`, passed by value
class TypeLayoutBuilder {
   public:
    TypeLayoutBuilder(llvm::LLVMContext& ctx, const llvm::DataLayout& dl,
                      const TypeStore& types);

    llvm::Type* convert(TypeId ty);

    // The heap record a tuple value points to.
    llvm::StructType* tuple_record(TypeId tuple_ty);

    // Signature of a function of static type `fn_ty`. Closure-shaped
    // functions take the captures pointer first. A unit result is `void`.
    llvm::FunctionType* function_type(TypeId fn_ty, bool with_env);

    // `<fun>.captures`: the typed record behind a closure's environment.
    llvm::StructType* captures_record(std::string_view fun,
                                      const ClosureDescriptor& desc);

    // `<fun>.clsobj`: per-function view of the closure shell with the
    // captures pointer typed for that function.
    llvm::StructType* closure_shell(std::string_view fun);

    // Bytes the target allocates for one value of `ty`.
    std::uint64_t alloc_size(llvm::Type* ty) const;

    llvm::StructType* unit_type() const { return unit_ty_; }
    llvm::IntegerType* bool_type() const { return bool_ty_; }
    llvm::IntegerType* int_type() const { return int_ty_; }
    llvm::Type* float_type() const { return float_ty_; }
    llvm::StructType* string_type() const { return string_ty_; }
    llvm::StructType* array_type() const { return array_ty_; }
    llvm::StructType* closure_type() const { return closure_ty_; }
    llvm::PointerType* ptr_type() const { return ptr_ty_; }
    // Integer as wide as a pointer; allocation sizes are passed in it.
    llvm::IntegerType* size_type() const { return size_ty_; }

    llvm::Constant* unit_value() const;

    const TypeStore& types() const { return types_; }

   private:
    llvm::LLVMContext& ctx_;
    const llvm::DataLayout& dl_;
    const TypeStore& types_;

    llvm::StructType* unit_ty_ = nullptr;
    llvm::IntegerType* bool_ty_ = nullptr;
    llvm::IntegerType* int_ty_ = nullptr;
    llvm::Type* float_ty_ = nullptr;
    llvm::StructType* string_ty_ = nullptr;
    llvm::StructType* array_ty_ = nullptr;
    llvm::StructType* closure_ty_ = nullptr;
    llvm::PointerType* ptr_ty_ = nullptr;
    llvm::IntegerType* size_ty_ = nullptr;

    std::unordered_map<TypeId, llvm::StructType*> tuple_cache_{};
    std::unordered_map<std::string, llvm::StructType*> captures_cache_{};
    std::unordered_map<std::string, llvm::StructType*> shell_cache_{};
};

}  // namespace mlc
