#pragma once

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "source.hpp"
#include "types.hpp"

namespace mlc {

// Identifiers are renamed to dense integers before they reach codegen; the
// textual names survive only for symbol names and diagnostics.
using IdentId = std::uint32_t;

class IdentTable {
   public:
    IdentId intern(std::string_view name);
    std::optional<IdentId> find(std::string_view name) const;

    const std::string& name(IdentId id) const {
        return names_.at(static_cast<size_t>(id));
    }
    std::size_t size() const { return names_.size(); }

   private:
    std::vector<std::string> names_{};
    std::unordered_map<std::string, IdentId> by_name_{};
};

enum class UnaryOp : std::uint8_t { Neg, FNeg, Not };

enum class BinaryOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Div,
    FAdd,
    FSub,
    FMul,
    FDiv,
    Lt,
    Le,
    Gt,
    Ge,
    Eq,
    Ne,
    And,
    Or,
};

enum class CallKind : std::uint8_t { Direct, Closure, External };

const char* unary_op_str(UnaryOp op);
const char* binary_op_str(BinaryOp op);
const char* call_kind_str(CallKind kind);

struct Block;

struct ValueExpr {
    struct Unit {};
    struct Bool {
        bool v = false;
    };
    struct Int {
        std::int64_t v = 0;
    };
    struct Float {
        double v = 0.0;
    };
    struct String {
        std::string bytes{};
    };
    struct Unary {
        UnaryOp op{};
        IdentId operand = 0;
    };
    struct Binary {
        BinaryOp op{};
        IdentId lhs = 0;
        IdentId rhs = 0;
    };
    struct Ref {
        IdentId target = 0;
    };
    struct If {
        IdentId cond = 0;
        std::unique_ptr<Block> then_block{};
        std::unique_ptr<Block> else_block{};
    };
    struct App {
        IdentId callee = 0;
        std::vector<IdentId> args{};
        CallKind kind = CallKind::Direct;
    };
    struct Tuple {
        std::vector<IdentId> elems{};
    };
    struct Array {
        IdentId size = 0;
        IdentId elem = 0;
    };
    struct TupleLoad {
        IdentId from = 0;
        std::uint32_t index = 0;
    };
    struct ArrayLoad {
        IdentId from = 0;
        IdentId index = 0;
    };
    struct ArrayStore {
        IdentId to = 0;
        IdentId index = 0;
        IdentId rhs = 0;
    };
    struct ArraySize {
        IdentId array = 0;
    };
    struct ExternRef {
        IdentId ident = 0;
    };
    struct MakeClosure {
        IdentId fun = 0;
        std::vector<IdentId> vars{};
    };
    // Eliminated by closure conversion; never valid input to codegen.
    struct Fun {
        std::vector<IdentId> params{};
        std::unique_ptr<Block> body{};
    };
    struct Nop {};

    std::variant<Unit, Bool, Int, Float, String, Unary, Binary, Ref, If, App,
                 Tuple, Array, TupleLoad, ArrayLoad, ArrayStore, ArraySize,
                 ExternRef, MakeClosure, Fun, Nop>
        data{};
};

struct Insn {
    IdentId ident = 0;
    ValueExpr value{};
    Span span{};
};

// The value of a block is the value of its last instruction.
struct Block {
    std::vector<Insn> insns{};
};

struct ClosureDescriptor {
    std::vector<IdentId> free_vars{};
    std::vector<TypeId> captured_types{};  // parallel to free_vars
};

struct IrFunction {
    IdentId name = 0;
    std::vector<IdentId> params{};
    // Present when the function is closure-shaped: it receives the opaque
    // captures pointer as its first argument, even with no captures.
    std::optional<ClosureDescriptor> closure{};
    Block body{};
    Span span{};
};

struct IrExternal {
    IdentId name = 0;
    TypeId type = 0;
};

class TypeEnv {
   public:
    void bind(IdentId ident, TypeId ty);
    std::optional<TypeId> lookup(IdentId ident) const;

   private:
    std::vector<std::optional<TypeId>> types_{};
};

struct IrModule {
    IdentTable idents{};
    TypeStore types{};
    TypeEnv env{};

    std::vector<IrExternal> externals{};
    std::vector<IrFunction> functions{};
    std::optional<Block> entry{};

    IrFunction& add_function(IrFunction fn);
    const IrFunction* function(IdentId name) const;
    const IrExternal* external(IdentId name) const;

   private:
    std::unordered_map<IdentId, std::size_t> function_index_{};
};

void dump_ir(std::ostream& os, const IrModule& module);
void dump_ir_block(std::ostream& os, const IrModule& module,
                   const Block& block, int indent);

}  // namespace mlc
