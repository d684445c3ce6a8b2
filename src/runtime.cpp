#include "runtime.hpp"

#include <llvm/IR/Constants.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/Module.h>

#include <utility>

#include "diag.hpp"
#include "layout.hpp"

namespace mlc {

std::string closure_wrapper_name(std::string_view external) {
    return std::string(external) + "$closure";
}

llvm::Function* SymbolTable::function(std::string_view name) const {
    auto it = functions.find(std::string(name));
    return it == functions.end() ? nullptr : it->second;
}

llvm::GlobalValue* SymbolTable::global(std::string_view name) const {
    auto it = globals.find(std::string(name));
    return it == globals.end() ? nullptr : it->second;
}

llvm::Function* SymbolTable::global_function(std::string_view name) const {
    return llvm::dyn_cast_if_present<llvm::Function>(global(name));
}

RuntimeAllocator::RuntimeAllocator(const SymbolTable& symbols,
                                   std::string entry_point)
    : symbols_(symbols), entry_point_(std::move(entry_point)) {}

llvm::Value* RuntimeAllocator::emit_alloc(llvm::IRBuilder<>& builder,
                                          llvm::Value* size,
                                          const llvm::Twine& name) {
    llvm::Function* malloc_fn = symbols_.global_function(entry_point_);
    if (!malloc_fn)
        internal_error("allocator entry point `" + entry_point_ +
                       "` was not declared");
    return builder.CreateCall(malloc_fn->getFunctionType(), malloc_fn, {size},
                              name);
}

llvm::Function* declare_allocator(llvm::Module& module,
                                  const TypeLayoutBuilder& layout,
                                  std::string_view symbol) {
    llvm::FunctionType* fty = llvm::FunctionType::get(
        layout.ptr_type(), {layout.size_type()}, /*isVarArg=*/false);
    llvm::FunctionCallee callee = module.getOrInsertFunction(
        llvm::StringRef(symbol.data(), symbol.size()), fty);
    return llvm::cast<llvm::Function>(callee.getCallee());
}

llvm::Function* declare_str_equal(llvm::Module& module,
                                  const TypeLayoutBuilder& layout) {
    llvm::FunctionType* fty = llvm::FunctionType::get(
        layout.bool_type(), {layout.string_type(), layout.string_type()},
        /*isVarArg=*/false);
    llvm::FunctionCallee callee = module.getOrInsertFunction(
        llvm::StringRef(kStrEqualSymbol.data(), kStrEqualSymbol.size()), fty);
    auto* fn = llvm::cast<llvm::Function>(callee.getCallee());
    fn->addRetAttr(llvm::Attribute::ZExt);
    return fn;
}

llvm::Value* emit_malloc(llvm::IRBuilder<>& builder, Allocator& allocator,
                         const TypeLayoutBuilder& layout, llvm::Type* ty,
                         const llvm::Twine& name) {
    llvm::Value* size =
        llvm::ConstantInt::get(layout.size_type(), layout.alloc_size(ty),
                               /*IsSigned=*/false);
    llvm::Value* raw = allocator.emit_alloc(builder, size, "");
    return builder.CreatePointerCast(raw, layout.ptr_type(), name);
}

llvm::Value* emit_array_malloc(llvm::IRBuilder<>& builder,
                               Allocator& allocator,
                               const TypeLayoutBuilder& layout,
                               llvm::Type* elem_ty, llvm::Value* count,
                               const llvm::Twine& name) {
    llvm::Value* elem_size =
        llvm::ConstantInt::get(layout.size_type(), layout.alloc_size(elem_ty),
                               /*IsSigned=*/false);
    llvm::Value* n = builder.CreateTrunc(count, layout.size_type());
    llvm::Value* size = builder.CreateMul(elem_size, n);
    llvm::Value* raw = allocator.emit_alloc(builder, size, "");
    return builder.CreatePointerCast(raw, layout.ptr_type(), name);
}

}  // namespace mlc
