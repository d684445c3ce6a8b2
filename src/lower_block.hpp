#pragma once

#include <llvm/IR/IRBuilder.h>

#include <cstddef>
#include <string>
#include <vector>

#include "compare.hpp"
#include "ir.hpp"
#include "source.hpp"

namespace mlc {

class Allocator;
class TypeLayoutBuilder;
struct SymbolTable;

// Read-only collaborators shared by every lowering session of a module.
struct LoweringContext {
    const IrModule& module;
    TypeLayoutBuilder& layout;
    const SymbolTable& symbols;
    Allocator& allocator;
};

// Values already materialized in the function being lowered, indexed by
// identifier. Each identifier is bound exactly once.
class RegisterTable {
   public:
    explicit RegisterTable(std::size_t capacity) : values_(capacity, nullptr) {}

    // Returns false when `ident` already has a value.
    bool bind(IdentId ident, llvm::Value* value);
    llvm::Value* find(IdentId ident) const;

   private:
    std::vector<llvm::Value*> values_{};
};

// Lowers the blocks of one function body into the insertion point of
// `builder`. A session is created per function and owns nothing but its
// register table reference; everything else is borrowed from the context.
class BlockLowering {
   public:
    BlockLowering(const LoweringContext& cx, llvm::IRBuilder<>& builder,
                  RegisterTable& registers);

    // Lowers every instruction in order and returns the last one's value.
    llvm::Value* lower_block(const Block& block);
    llvm::Value* lower_insn(const Insn& insn);

    llvm::Value* unit_value() const;

   private:
    const LoweringContext& cx_;
    llvm::IRBuilder<>& builder_;
    RegisterTable& registers_;
    ComparisonDispatcher compare_;
    Span span_{};

    [[noreturn]] void fail(std::string message) const;
    const std::string& name_of(IdentId ident) const;
    llvm::Value* resolve(IdentId ident) const;
    TypeId type_of(IdentId ident) const;
    llvm::Function* current_function() const;
    llvm::AllocaInst* entry_alloca(llvm::Type* ty, const llvm::Twine& name);

    llvm::Value* lower_value(IdentId ident, const ValueExpr& value);
    llvm::Value* lower_string(const ValueExpr::String& s);
    llvm::Value* lower_unary(const ValueExpr::Unary& u);
    llvm::Value* lower_binary(const ValueExpr::Binary& b);
    llvm::Value* lower_tuple(IdentId ident, const ValueExpr::Tuple& t);
    llvm::Value* lower_tuple_load(const ValueExpr::TupleLoad& l);
    llvm::Value* lower_array_load(const ValueExpr::ArrayLoad& l);
    llvm::Value* lower_array_store(const ValueExpr::ArrayStore& s);
    llvm::Value* lower_array_size(const ValueExpr::ArraySize& s);
    llvm::Value* element_address(IdentId array, IdentId index);

    // lower_control.cpp
    llvm::Value* lower_if(IdentId ident, const ValueExpr::If& e);
    llvm::Value* lower_array(IdentId ident, const ValueExpr::Array& a);

    // lower_closure.cpp
    llvm::Value* lower_app(const ValueExpr::App& app);
    llvm::Value* lower_extern_ref(const ValueExpr::ExternRef& x);
    llvm::Value* lower_make_closure(const ValueExpr::MakeClosure& c);
};

}  // namespace mlc
