#include <llvm/IR/BasicBlock.h>
#include <llvm/IR/Constants.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/Instructions.h>

#include "layout.hpp"
#include "lower_block.hpp"
#include "runtime.hpp"

namespace mlc {

// Both arms are lowered as nested blocks and joined by a PHI whose type comes
// from the destination identifier, not from the arm values. Blocks are laid
// out then, else, merge.
llvm::Value* BlockLowering::lower_if(IdentId ident, const ValueExpr::If& e) {
    if (!e.then_block || !e.else_block)
        fail("`if` bound to `" + name_of(ident) + "` is missing a branch");

    llvm::LLVMContext& ctx = builder_.getContext();
    llvm::Function* parent = current_function();
    llvm::BasicBlock* then_bb =
        llvm::BasicBlock::Create(ctx, "if.then", parent);
    llvm::BasicBlock* else_bb =
        llvm::BasicBlock::Create(ctx, "if.else", parent);
    llvm::BasicBlock* end_bb = llvm::BasicBlock::Create(ctx, "if.end", parent);

    llvm::Type* ty = cx_.layout.convert(type_of(ident));
    llvm::Value* cond = resolve(e.cond);
    builder_.CreateCondBr(cond, then_bb, else_bb);

    builder_.SetInsertPoint(then_bb);
    llvm::Value* then_val = lower_block(*e.then_block);
    builder_.CreateBr(end_bb);
    llvm::BasicBlock* then_last = builder_.GetInsertBlock();

    // Nested control flow may have appended blocks after `if.else`.
    else_bb->moveAfter(then_last);
    builder_.SetInsertPoint(else_bb);
    llvm::Value* else_val = lower_block(*e.else_block);
    builder_.CreateBr(end_bb);
    llvm::BasicBlock* else_last = builder_.GetInsertBlock();

    end_bb->moveAfter(else_last);
    builder_.SetInsertPoint(end_bb);
    llvm::PHINode* phi = builder_.CreatePHI(ty, 2, "if.merge");
    phi->addIncoming(then_val, then_last);
    phi->addIncoming(else_val, else_last);
    return phi;
}

// `Array.make n v`: a heap buffer filled element by element, wrapped in a
// `{buffer, size}` record.
llvm::Value* BlockLowering::lower_array(IdentId ident,
                                       const ValueExpr::Array& a) {
    const TypeData& d = cx_.layout.types().get(type_of(ident));
    if (d.kind != TypeKind::Array)
        fail("type of array literal `" + name_of(ident) + "` is not array");

    llvm::LLVMContext& ctx = builder_.getContext();
    llvm::StructType* array_ty = cx_.layout.array_type();
    llvm::IntegerType* int_ty = cx_.layout.int_type();
    llvm::Type* elem_ty = cx_.layout.convert(d.elem);

    llvm::Value* ptr = entry_alloca(array_ty, name_of(ident));

    llvm::Value* size_val = resolve(a.size);
    llvm::Value* buffer = emit_array_malloc(
        builder_, cx_.allocator, cx_.layout, elem_ty, size_val, "array.ptr");
    builder_.CreateStore(buffer,
                         builder_.CreateStructGEP(array_ty, ptr, 0, ""));

    llvm::Value* elem_val = resolve(a.elem);
    llvm::Value* iter_ptr = entry_alloca(int_ty, "arr.init.iter");
    builder_.CreateStore(llvm::ConstantInt::get(int_ty, 0), iter_ptr);

    llvm::Function* parent = current_function();
    llvm::BasicBlock* cond_bb =
        llvm::BasicBlock::Create(ctx, "arr.init.cond", parent);
    llvm::BasicBlock* loop_bb =
        llvm::BasicBlock::Create(ctx, "arr.init.setelem", parent);
    llvm::BasicBlock* end_bb =
        llvm::BasicBlock::Create(ctx, "arr.init.end", parent);
    builder_.CreateBr(cond_bb);

    builder_.SetInsertPoint(cond_bb);
    llvm::Value* iter_val = builder_.CreateLoad(int_ty, iter_ptr, "");
    llvm::Value* done = builder_.CreateICmpEQ(iter_val, size_val, "");
    builder_.CreateCondBr(done, end_bb, loop_bb);

    builder_.SetInsertPoint(loop_bb);
    llvm::Value* elem_ptr =
        builder_.CreateInBoundsGEP(elem_ty, buffer, {iter_val}, "");
    builder_.CreateStore(elem_val, elem_ptr);
    llvm::Value* next = builder_.CreateAdd(
        iter_val, llvm::ConstantInt::get(int_ty, 1), "arr.init.inc");
    builder_.CreateStore(next, iter_ptr);
    builder_.CreateBr(cond_bb);

    builder_.SetInsertPoint(end_bb);
    builder_.CreateStore(size_val,
                         builder_.CreateStructGEP(array_ty, ptr, 1, ""));
    return builder_.CreateLoad(array_ty, ptr, "array");
}

}  // namespace mlc
