#include "compare.hpp"

#include <llvm/IR/Constants.h>
#include <llvm/IR/InstrTypes.h>

#include <string>

#include "diag.hpp"
#include "layout.hpp"
#include "runtime.hpp"

namespace mlc {
namespace {

struct Predicates {
    llvm::CmpInst::Predicate icmp;
    llvm::CmpInst::Predicate fcmp;
    const char* name;
};

// `<>` on floats is the negation of `=`, so it holds for NaN operands.
Predicates predicates_for(BinaryOp op) {
    switch (op) {
        case BinaryOp::Lt:
            return {llvm::CmpInst::ICMP_SLT, llvm::CmpInst::FCMP_OLT, "less"};
        case BinaryOp::Le:
            return {llvm::CmpInst::ICMP_SLE, llvm::CmpInst::FCMP_OLE,
                    "lesseq"};
        case BinaryOp::Gt:
            return {llvm::CmpInst::ICMP_SGT, llvm::CmpInst::FCMP_OGT,
                    "greater"};
        case BinaryOp::Ge:
            return {llvm::CmpInst::ICMP_SGE, llvm::CmpInst::FCMP_OGE,
                    "greatereq"};
        case BinaryOp::Eq:
            return {llvm::CmpInst::ICMP_EQ, llvm::CmpInst::FCMP_OEQ, "eql"};
        case BinaryOp::Ne:
            return {llvm::CmpInst::ICMP_NE, llvm::CmpInst::FCMP_UNE, "neq"};
        default:
            break;
    }
    internal_error(std::string("`") + binary_op_str(op) +
                   "` is not a comparison operator");
}

}  // namespace

bool is_ordering(BinaryOp op) {
    return op == BinaryOp::Lt || op == BinaryOp::Le || op == BinaryOp::Gt ||
           op == BinaryOp::Ge;
}

ComparisonDispatcher::ComparisonDispatcher(llvm::IRBuilder<>& builder,
                                           TypeLayoutBuilder& layout,
                                           const SymbolTable& symbols)
    : builder_(builder), layout_(layout), symbols_(symbols) {}

llvm::Value* ComparisonDispatcher::scalar(TypeKind kind, BinaryOp op,
                                          llvm::Value* lhs, llvm::Value* rhs) {
    Predicates p = predicates_for(op);
    if (kind == TypeKind::Float)
        return builder_.CreateFCmp(p.fcmp, lhs, rhs, p.name);
    return builder_.CreateICmp(p.icmp, lhs, rhs, p.name);
}

llvm::Value* ComparisonDispatcher::compare(TypeId ty, BinaryOp op,
                                           llvm::Value* lhs, llvm::Value* rhs) {
    const TypeStore& ts = layout_.types();
    const TypeKind kind = ts.kind(ty);
    switch (kind) {
        case TypeKind::Bool:
        case TypeKind::Int:
        case TypeKind::Float:
            return scalar(kind, op, lhs, rhs);
        default:
            break;
    }

    if (op != BinaryOp::Eq && op != BinaryOp::Ne)
        internal_error(std::string("`") + binary_op_str(op) +
                       "` is not defined on values of type " +
                       ts.to_string(ty));

    if (kind == TypeKind::Unit) {
        // `() = ()` always holds and `() <> ()` never does.
        return llvm::ConstantInt::get(layout_.bool_type(),
                                      op == BinaryOp::Eq ? 1 : 0);
    }

    if (kind == TypeKind::Fn) {
        // Closures are equal when they wrap the same code; captures are
        // not inspected.
        llvm::Value* lfun = builder_.CreateExtractValue(lhs, 0, "");
        llvm::Value* rfun = builder_.CreateExtractValue(rhs, 0, "");
        return builder_.CreateICmp(predicates_for(op).icmp, lfun, rfun,
                                   std::string(predicates_for(op).name) +
                                       ".fun");
    }

    if (ts.nesting_depth(ty) > kMaxTypeNesting)
        internal_error("type nests deeper than " +
                       std::to_string(kMaxTypeNesting) +
                       " levels in equality: " + ts.to_string(ty));

    llvm::Value* eq = equal(ty, lhs, rhs);
    if (op == BinaryOp::Ne) return builder_.CreateNot(eq, "neq");
    return eq;
}

llvm::Value* ComparisonDispatcher::order(TypeId ty, BinaryOp op,
                                         llvm::Value* lhs, llvm::Value* rhs) {
    const TypeStore& ts = layout_.types();
    const TypeKind kind = ts.kind(ty);
    if (!is_ordering(op))
        internal_error(std::string("`") + binary_op_str(op) +
                       "` is not an ordering operator");
    if (kind != TypeKind::Int && kind != TypeKind::Float)
        internal_error(std::string("invalid type for `") + binary_op_str(op) +
                       "` operator: " + ts.to_string(ty));
    return scalar(kind, op, lhs, rhs);
}

llvm::Value* ComparisonDispatcher::equal(TypeId ty, llvm::Value* lhs,
                                         llvm::Value* rhs) {
    const TypeStore& ts = layout_.types();
    switch (ts.kind(ty)) {
        case TypeKind::Unit:
            return llvm::ConstantInt::getTrue(layout_.bool_type());
        case TypeKind::Bool:
        case TypeKind::Int:
        case TypeKind::Float:
            return scalar(ts.kind(ty), BinaryOp::Eq, lhs, rhs);
        case TypeKind::String:
            return string_equal(lhs, rhs);
        case TypeKind::Tuple:
            return tuple_equal(ty, lhs, rhs);
        case TypeKind::Fn: {
            llvm::Value* lfun = builder_.CreateExtractValue(lhs, 0, "");
            llvm::Value* rfun = builder_.CreateExtractValue(rhs, 0, "");
            return builder_.CreateICmpEQ(lfun, rfun, "eql.fun");
        }
        case TypeKind::Array:
            break;
    }
    internal_error("values of type " + ts.to_string(ty) +
                   " cannot be compared");
}

llvm::Value* ComparisonDispatcher::string_equal(llvm::Value* lhs,
                                                llvm::Value* rhs) {
    llvm::Function* eql = symbols_.global_function(kStrEqualSymbol);
    if (!eql)
        internal_error(std::string(kStrEqualSymbol) + "() was not declared");
    llvm::Value* r =
        builder_.CreateCall(eql->getFunctionType(), eql, {lhs, rhs}, "");
    return builder_.CreateICmpEQ(
        r, llvm::ConstantInt::get(layout_.bool_type(), 1), "eql.str");
}

llvm::Value* ComparisonDispatcher::tuple_equal(TypeId ty, llvm::Value* lhs,
                                               llvm::Value* rhs) {
    const TypeData& d = layout_.types().get(ty);
    llvm::StructType* record = layout_.tuple_record(ty);
    llvm::Value* cmp = nullptr;
    for (size_t i = 0; i < d.tuple_elems.size(); i++) {
        const unsigned idx = static_cast<unsigned>(i);
        llvm::Type* elem_ty = record->getElementType(idx);
        llvm::Value* l = builder_.CreateLoad(
            elem_ty, builder_.CreateStructGEP(record, lhs, idx, "tpl.left"));
        llvm::Value* r = builder_.CreateLoad(
            elem_ty, builder_.CreateStructGEP(record, rhs, idx, "tpl.right"));
        llvm::Value* elem_cmp = equal(d.tuple_elems[i], l, r);
        cmp = cmp ? builder_.CreateAnd(cmp, elem_cmp) : elem_cmp;
    }
    if (!cmp) return llvm::ConstantInt::getTrue(layout_.bool_type());
    if (llvm::isa<llvm::Instruction>(cmp)) cmp->setName("eql.tpl");
    return cmp;
}

}  // namespace mlc
