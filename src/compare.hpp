#pragma once

#include <llvm/IR/IRBuilder.h>

#include <cstdint>

#include "ir.hpp"
#include "types.hpp"

namespace mlc {

class TypeLayoutBuilder;
struct SymbolTable;

// Type-directed lowering of the comparison operators. Results are `i1`.
class ComparisonDispatcher {
   public:
    // Deepest `TypeStore::nesting_depth` accepted by `=` and `<>`.
    static constexpr std::uint32_t kMaxTypeNesting = 64;

    ComparisonDispatcher(llvm::IRBuilder<>& builder, TypeLayoutBuilder& layout,
                         const SymbolTable& symbols);

    // Structural comparison keyed by the static type of the operands. All
    // six operators are accepted for bool/int/float; only `=` and `<>` for
    // unit, string, tuple and function values. Arrays are not comparable.
    llvm::Value* compare(TypeId ty, BinaryOp op, llvm::Value* lhs,
                         llvm::Value* rhs);

    // `<`, `<=`, `>`, `>=` on int and float operands only.
    llvm::Value* order(TypeId ty, BinaryOp op, llvm::Value* lhs,
                       llvm::Value* rhs);

   private:
    llvm::IRBuilder<>& builder_;
    TypeLayoutBuilder& layout_;
    const SymbolTable& symbols_;

    llvm::Value* equal(TypeId ty, llvm::Value* lhs, llvm::Value* rhs);
    llvm::Value* string_equal(llvm::Value* lhs, llvm::Value* rhs);
    llvm::Value* tuple_equal(TypeId ty, llvm::Value* lhs, llvm::Value* rhs);
    llvm::Value* scalar(TypeKind kind, BinaryOp op, llvm::Value* lhs,
                        llvm::Value* rhs);
};

bool is_ordering(BinaryOp op);

}  // namespace mlc
