#include "lower_block.hpp"

#include <llvm/IR/Constants.h>
#include <llvm/IR/Function.h>

#include <type_traits>
#include <utility>

#include "diag.hpp"
#include "layout.hpp"
#include "runtime.hpp"

namespace mlc {

bool RegisterTable::bind(IdentId ident, llvm::Value* value) {
    if (ident >= values_.size())
        values_.resize(static_cast<size_t>(ident) + 1, nullptr);
    if (values_[ident]) return false;
    values_[ident] = value;
    return true;
}

llvm::Value* RegisterTable::find(IdentId ident) const {
    return ident < values_.size() ? values_[ident] : nullptr;
}

BlockLowering::BlockLowering(const LoweringContext& cx,
                             llvm::IRBuilder<>& builder,
                             RegisterTable& registers)
    : cx_(cx),
      builder_(builder),
      registers_(registers),
      compare_(builder, cx.layout, cx.symbols) {}

void BlockLowering::fail(std::string message) const {
    throw InternalError(std::move(message), span_);
}

const std::string& BlockLowering::name_of(IdentId ident) const {
    if (ident >= cx_.module.idents.size())
        fail("identifier #" + std::to_string(ident) + " was never interned");
    return cx_.module.idents.name(ident);
}

llvm::Value* BlockLowering::resolve(IdentId ident) const {
    // Functions and externals are reached through the symbol table by the
    // cases that name them; everything else must already be a register.
    if (llvm::Value* v = registers_.find(ident)) return v;
    fail("no value was found for identifier `" + name_of(ident) + "`");
}

TypeId BlockLowering::type_of(IdentId ident) const {
    if (auto ty = cx_.module.env.lookup(ident)) return *ty;
    fail("type was not found for identifier `" + name_of(ident) + "`");
}

llvm::Function* BlockLowering::current_function() const {
    return builder_.GetInsertBlock()->getParent();
}

// Stack records are placed in the entry block of the current function.
llvm::AllocaInst* BlockLowering::entry_alloca(llvm::Type* ty,
                                              const llvm::Twine& name) {
    llvm::BasicBlock& entry = current_function()->getEntryBlock();
    llvm::IRBuilder<> entry_builder(&entry, entry.begin());
    return entry_builder.CreateAlloca(ty, nullptr, name);
}

llvm::Value* BlockLowering::unit_value() const {
    return cx_.layout.unit_value();
}

llvm::Value* BlockLowering::lower_block(const Block& block) {
    if (block.insns.empty()) fail("cannot lower an empty block");
    llvm::Value* last = nullptr;
    for (const Insn& insn : block.insns) last = lower_insn(insn);
    return last;
}

llvm::Value* BlockLowering::lower_insn(const Insn& insn) {
    span_ = insn.span;
    llvm::Value* v = nullptr;
    try {
        v = lower_value(insn.ident, insn.value);
    } catch (const InternalError& e) {
        // Failures raised below the session (layout, runtime symbols) carry
        // no position; attribute them to this instruction.
        if (e.span().known() || !insn.span.known()) throw;
        throw InternalError(e.what(), insn.span);
    }
    span_ = insn.span;
    if (!registers_.bind(insn.ident, v))
        fail("identifier `" + name_of(insn.ident) + "` is defined twice");
    return v;
}

llvm::Value* BlockLowering::lower_value(IdentId ident, const ValueExpr& value) {
    return std::visit(
        [&](const auto& e) -> llvm::Value* {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, ValueExpr::Unit>) {
                return unit_value();
            } else if constexpr (std::is_same_v<T, ValueExpr::Bool>) {
                return llvm::ConstantInt::get(cx_.layout.bool_type(),
                                              e.v ? 1 : 0);
            } else if constexpr (std::is_same_v<T, ValueExpr::Int>) {
                return llvm::ConstantInt::getSigned(cx_.layout.int_type(),
                                                    e.v);
            } else if constexpr (std::is_same_v<T, ValueExpr::Float>) {
                return llvm::ConstantFP::get(cx_.layout.float_type(), e.v);
            } else if constexpr (std::is_same_v<T, ValueExpr::String>) {
                return lower_string(e);
            } else if constexpr (std::is_same_v<T, ValueExpr::Unary>) {
                return lower_unary(e);
            } else if constexpr (std::is_same_v<T, ValueExpr::Binary>) {
                return lower_binary(e);
            } else if constexpr (std::is_same_v<T, ValueExpr::Ref>) {
                return resolve(e.target);
            } else if constexpr (std::is_same_v<T, ValueExpr::If>) {
                return lower_if(ident, e);
            } else if constexpr (std::is_same_v<T, ValueExpr::App>) {
                return lower_app(e);
            } else if constexpr (std::is_same_v<T, ValueExpr::Tuple>) {
                return lower_tuple(ident, e);
            } else if constexpr (std::is_same_v<T, ValueExpr::Array>) {
                return lower_array(ident, e);
            } else if constexpr (std::is_same_v<T, ValueExpr::TupleLoad>) {
                return lower_tuple_load(e);
            } else if constexpr (std::is_same_v<T, ValueExpr::ArrayLoad>) {
                return lower_array_load(e);
            } else if constexpr (std::is_same_v<T, ValueExpr::ArrayStore>) {
                return lower_array_store(e);
            } else if constexpr (std::is_same_v<T, ValueExpr::ArraySize>) {
                return lower_array_size(e);
            } else if constexpr (std::is_same_v<T, ValueExpr::ExternRef>) {
                return lower_extern_ref(e);
            } else if constexpr (std::is_same_v<T, ValueExpr::MakeClosure>) {
                return lower_make_closure(e);
            } else if constexpr (std::is_same_v<T, ValueExpr::Fun>) {
                fail("function literal `" + name_of(ident) +
                     "` survived closure conversion");
            } else if constexpr (std::is_same_v<T, ValueExpr::Nop>) {
                fail("NOP instruction `" + name_of(ident) +
                     "` reached code generation");
            } else {
                static_assert(sizeof(T) == 0, "unhandled IR value in lowering");
            }
        },
        value.data);
}

// Strings are `{chars, length}` records handled by value.
llvm::Value* BlockLowering::lower_string(const ValueExpr::String& s) {
    llvm::StructType* string_ty = cx_.layout.string_type();
    llvm::Value* str = entry_alloca(string_ty, "");

    llvm::Value* chars = builder_.CreateGlobalString(s.bytes, ".str");
    builder_.CreateStore(chars,
                         builder_.CreateStructGEP(string_ty, str, 0, ""));

    llvm::Value* size = llvm::ConstantInt::get(
        cx_.layout.int_type(), static_cast<std::uint64_t>(s.bytes.size()),
        /*IsSigned=*/true);
    builder_.CreateStore(
        size, builder_.CreateStructGEP(string_ty, str, 1, "str.size"));

    return builder_.CreateLoad(string_ty, str, "str");
}

llvm::Value* BlockLowering::lower_unary(const ValueExpr::Unary& u) {
    llvm::Value* child = resolve(u.operand);
    switch (u.op) {
        case UnaryOp::Neg:
            return builder_.CreateNeg(child, "neg");
        case UnaryOp::FNeg:
            return builder_.CreateFNeg(child, "fneg");
        case UnaryOp::Not:
            return builder_.CreateNot(child, "not");
    }
    fail(std::string("unknown unary operator `") + unary_op_str(u.op) + "`");
}

llvm::Value* BlockLowering::lower_binary(const ValueExpr::Binary& b) {
    llvm::Value* lhs = resolve(b.lhs);
    llvm::Value* rhs = resolve(b.rhs);
    switch (b.op) {
        case BinaryOp::Add:
            return builder_.CreateAdd(lhs, rhs, "add");
        case BinaryOp::Sub:
            return builder_.CreateSub(lhs, rhs, "sub");
        case BinaryOp::Mul:
            return builder_.CreateMul(lhs, rhs, "mul");
        case BinaryOp::Div:
            return builder_.CreateSDiv(lhs, rhs, "div");
        case BinaryOp::FAdd:
            return builder_.CreateFAdd(lhs, rhs, "fadd");
        case BinaryOp::FSub:
            return builder_.CreateFSub(lhs, rhs, "fsub");
        case BinaryOp::FMul:
            return builder_.CreateFMul(lhs, rhs, "fmul");
        case BinaryOp::FDiv:
            return builder_.CreateFDiv(lhs, rhs, "fdiv");
        case BinaryOp::Lt:
        case BinaryOp::Le:
        case BinaryOp::Gt:
        case BinaryOp::Ge:
            return compare_.order(type_of(b.lhs), b.op, lhs, rhs);
        case BinaryOp::Eq:
        case BinaryOp::Ne:
            return compare_.compare(type_of(b.lhs), b.op, lhs, rhs);
        // Both operands are already evaluated; short-circuiting was
        // desugared into `if` upstream.
        case BinaryOp::And:
            return builder_.CreateAnd(lhs, rhs, "andl");
        case BinaryOp::Or:
            return builder_.CreateOr(lhs, rhs, "orl");
    }
    fail(std::string("unknown binary operator `") + binary_op_str(b.op) +
         "`");
}

// Tuples live on the managed heap; the value is the record pointer.
llvm::Value* BlockLowering::lower_tuple(IdentId ident,
                                       const ValueExpr::Tuple& t) {
    const std::string& name = name_of(ident);
    llvm::StructType* record = cx_.layout.tuple_record(type_of(ident));
    if (record->getNumElements() != t.elems.size())
        fail("tuple `" + name + "` has " + std::to_string(t.elems.size()) +
             " elements but its type has " +
             std::to_string(record->getNumElements()));

    llvm::Value* ptr =
        emit_malloc(builder_, cx_.allocator, cx_.layout, record, name);
    for (size_t i = 0; i < t.elems.size(); i++) {
        llvm::Value* v = resolve(t.elems[i]);
        llvm::Value* p = builder_.CreateStructGEP(
            record, ptr, static_cast<unsigned>(i),
            name + "." + std::to_string(i));
        builder_.CreateStore(v, p);
    }
    return ptr;
}

llvm::Value* BlockLowering::lower_tuple_load(const ValueExpr::TupleLoad& l) {
    llvm::StructType* record = cx_.layout.tuple_record(type_of(l.from));
    if (l.index >= record->getNumElements())
        fail("tuple index " + std::to_string(l.index) +
             " is out of range for `" + name_of(l.from) + "`");
    llvm::Value* from = resolve(l.from);
    llvm::Value* p = builder_.CreateStructGEP(record, from, l.index, "");
    return builder_.CreateLoad(record->getElementType(l.index), p, "tplload");
}

// No bounds check: indices were validated, if at all, before this stage.
llvm::Value* BlockLowering::element_address(IdentId array, IdentId index) {
    const TypeData& d = cx_.layout.types().get(type_of(array));
    if (d.kind != TypeKind::Array)
        fail("`" + name_of(array) + "` is indexed but is not an array");
    llvm::Value* array_val = resolve(array);
    llvm::Value* idx = resolve(index);
    llvm::Value* buffer = builder_.CreateExtractValue(array_val, 0, "");
    return builder_.CreateInBoundsGEP(cx_.layout.convert(d.elem), buffer, {idx},
                                      "");
}

llvm::Value* BlockLowering::lower_array_load(const ValueExpr::ArrayLoad& l) {
    const TypeData& d = cx_.layout.types().get(type_of(l.from));
    llvm::Value* p = element_address(l.from, l.index);
    return builder_.CreateLoad(cx_.layout.convert(d.elem), p, "arrload");
}

llvm::Value* BlockLowering::lower_array_store(const ValueExpr::ArrayStore& s) {
    llvm::Value* p = element_address(s.to, s.index);
    builder_.CreateStore(resolve(s.rhs), p);
    return unit_value();
}

llvm::Value* BlockLowering::lower_array_size(const ValueExpr::ArraySize& s) {
    if (cx_.layout.types().kind(type_of(s.array)) != TypeKind::Array)
        fail("size requested for non-array `" + name_of(s.array) + "`");
    return builder_.CreateExtractValue(resolve(s.array), 1, "arrsize");
}

}  // namespace mlc
