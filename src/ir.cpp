#include "ir.hpp"

#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace mlc {

IdentId IdentTable::intern(std::string_view name) {
    if (auto it = by_name_.find(std::string(name)); it != by_name_.end())
        return it->second;
    IdentId id = static_cast<IdentId>(names_.size());
    names_.emplace_back(name);
    by_name_.insert({names_.back(), id});
    return id;
}

std::optional<IdentId> IdentTable::find(std::string_view name) const {
    if (auto it = by_name_.find(std::string(name)); it != by_name_.end())
        return it->second;
    return std::nullopt;
}

void TypeEnv::bind(IdentId ident, TypeId ty) {
    if (ident >= types_.size()) types_.resize(static_cast<size_t>(ident) + 1);
    types_[ident] = ty;
}

std::optional<TypeId> TypeEnv::lookup(IdentId ident) const {
    if (ident >= types_.size()) return std::nullopt;
    return types_[ident];
}

IrFunction& IrModule::add_function(IrFunction fn) {
    function_index_[fn.name] = functions.size();
    functions.push_back(std::move(fn));
    return functions.back();
}

const IrFunction* IrModule::function(IdentId name) const {
    auto it = function_index_.find(name);
    if (it == function_index_.end()) return nullptr;
    return &functions[it->second];
}

const IrExternal* IrModule::external(IdentId name) const {
    for (const IrExternal& x : externals) {
        if (x.name == name) return &x;
    }
    return nullptr;
}

const char* unary_op_str(UnaryOp op) {
    switch (op) {
        case UnaryOp::Neg:
            return "neg";
        case UnaryOp::FNeg:
            return "fneg";
        case UnaryOp::Not:
            return "not";
    }
    return "<unary>";
}

const char* binary_op_str(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::FAdd:
            return "+.";
        case BinaryOp::FSub:
            return "-.";
        case BinaryOp::FMul:
            return "*.";
        case BinaryOp::FDiv:
            return "/.";
        case BinaryOp::Lt:
            return "<";
        case BinaryOp::Le:
            return "<=";
        case BinaryOp::Gt:
            return ">";
        case BinaryOp::Ge:
            return ">=";
        case BinaryOp::Eq:
            return "=";
        case BinaryOp::Ne:
            return "<>";
        case BinaryOp::And:
            return "&&";
        case BinaryOp::Or:
            return "||";
    }
    return "<binary>";
}

const char* call_kind_str(CallKind kind) {
    switch (kind) {
        case CallKind::Direct:
            return "app";
        case CallKind::Closure:
            return "appcls";
        case CallKind::External:
            return "appx";
    }
    return "app";
}

namespace {

void dump_idents(std::ostream& os, const IdentTable& idents,
                 const std::vector<IdentId>& ids) {
    for (size_t i = 0; i < ids.size(); i++) {
        if (i) os << ", ";
        os << idents.name(ids[i]);
    }
}

void dump_value(std::ostream& os, const IrModule& m, const ValueExpr& v,
                int indent) {
    const IdentTable& ids = m.idents;
    std::visit(
        [&](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, ValueExpr::Unit>) {
                os << "unit";
            } else if constexpr (std::is_same_v<T, ValueExpr::Bool>) {
                os << "bool " << (e.v ? "true" : "false");
            } else if constexpr (std::is_same_v<T, ValueExpr::Int>) {
                os << "int " << e.v;
            } else if constexpr (std::is_same_v<T, ValueExpr::Float>) {
                os << "float " << e.v;
            } else if constexpr (std::is_same_v<T, ValueExpr::String>) {
                os << "string \"" << e.bytes << "\"";
            } else if constexpr (std::is_same_v<T, ValueExpr::Unary>) {
                os << "unary " << unary_op_str(e.op) << " "
                   << ids.name(e.operand);
            } else if constexpr (std::is_same_v<T, ValueExpr::Binary>) {
                os << "binary " << ids.name(e.lhs) << " "
                   << binary_op_str(e.op) << " " << ids.name(e.rhs);
            } else if constexpr (std::is_same_v<T, ValueExpr::Ref>) {
                os << "ref " << ids.name(e.target);
            } else if constexpr (std::is_same_v<T, ValueExpr::If>) {
                os << "if " << ids.name(e.cond) << " ### then\n";
                if (e.then_block) dump_ir_block(os, m, *e.then_block, indent + 1);
                os << std::string(static_cast<size_t>(indent) * 2, ' ')
                   << "### else\n";
                if (e.else_block) dump_ir_block(os, m, *e.else_block, indent + 1);
                os << std::string(static_cast<size_t>(indent) * 2, ' ')
                   << "### end";
            } else if constexpr (std::is_same_v<T, ValueExpr::App>) {
                os << call_kind_str(e.kind) << " " << ids.name(e.callee);
                for (IdentId a : e.args) os << " " << ids.name(a);
            } else if constexpr (std::is_same_v<T, ValueExpr::Tuple>) {
                os << "tuple ";
                dump_idents(os, ids, e.elems);
            } else if constexpr (std::is_same_v<T, ValueExpr::Array>) {
                os << "array " << ids.name(e.size) << " " << ids.name(e.elem);
            } else if constexpr (std::is_same_v<T, ValueExpr::TupleLoad>) {
                os << "tplload " << e.index << " " << ids.name(e.from);
            } else if constexpr (std::is_same_v<T, ValueExpr::ArrayLoad>) {
                os << "arrload " << ids.name(e.index) << " "
                   << ids.name(e.from);
            } else if constexpr (std::is_same_v<T, ValueExpr::ArrayStore>) {
                os << "arrstore " << ids.name(e.index) << " "
                   << ids.name(e.to) << " " << ids.name(e.rhs);
            } else if constexpr (std::is_same_v<T, ValueExpr::ArraySize>) {
                os << "arrsize " << ids.name(e.array);
            } else if constexpr (std::is_same_v<T, ValueExpr::ExternRef>) {
                os << "xref " << ids.name(e.ident);
            } else if constexpr (std::is_same_v<T, ValueExpr::MakeClosure>) {
                os << "makecls (";
                dump_idents(os, ids, e.vars);
                os << ") " << ids.name(e.fun);
            } else if constexpr (std::is_same_v<T, ValueExpr::Fun>) {
                os << "fun ";
                dump_idents(os, ids, e.params);
            } else if constexpr (std::is_same_v<T, ValueExpr::Nop>) {
                os << "nop";
            } else {
                static_assert(sizeof(T) == 0, "unhandled IR value in dump");
            }
        },
        v.data);
}

}  // namespace

void dump_ir_block(std::ostream& os, const IrModule& module,
                   const Block& block, int indent) {
    const std::string pad(static_cast<size_t>(indent) * 2, ' ');
    for (const Insn& insn : block.insns) {
        os << pad << module.idents.name(insn.ident);
        if (auto ty = module.env.lookup(insn.ident))
            os << ": " << module.types.to_string(*ty);
        os << " = ";
        dump_value(os, module, insn.value, indent);
        os << "\n";
    }
}

void dump_ir(std::ostream& os, const IrModule& module) {
    os << "ir.module\n";
    for (const IrExternal& x : module.externals) {
        os << "  extern " << module.idents.name(x.name) << ": "
           << module.types.to_string(x.type) << "\n";
    }
    for (const IrFunction& f : module.functions) {
        os << "  fun " << module.idents.name(f.name) << "(";
        dump_idents(os, module.idents, f.params);
        os << ")";
        if (f.closure) {
            os << " captures(";
            dump_idents(os, module.idents, f.closure->free_vars);
            os << ")";
        }
        os << "\n";
        dump_ir_block(os, module, f.body, 2);
    }
    if (module.entry) {
        os << "  entry\n";
        dump_ir_block(os, module, *module.entry, 2);
    }
}

}  // namespace mlc
