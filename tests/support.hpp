#pragma once

#include <gtest/gtest.h>
#include <llvm/ExecutionEngine/Orc/LLJIT.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "codegen.hpp"
#include "ir.hpp"
#include "session.hpp"
#include "target.hpp"

namespace mlc::test {

// Host side of the runtime entry points the emitted code calls.
struct HostRuntime {
    static std::size_t allocations;
    static std::size_t bytes;

    static void reset();
    static void* gc_malloc(std::size_t size);
    // `__str_equal` takes two `%mlc.string` values. LLVM passes a
    // first-class struct argument as its scalar fields, so on x86-64 SysV
    // and AArch64 each string arrives as a (chars, length) register pair.
    static bool str_equal(const char* lhs, std::int64_t lhs_len,
                          const char* rhs, std::int64_t rhs_len);
};

// Hand-assembles closure-converted IR.
class IrAssembler {
   public:
    IrModule module{};

    TypeStore& types() { return module.types; }
    IdentId ident(std::string_view name) { return module.idents.intern(name); }

    // Appends `name : ty = value` to `block`.
    template <typename V>
    IdentId let(Block& block, std::string_view name, TypeId ty, V value) {
        IdentId id = ident(name);
        module.env.bind(id, ty);
        Insn insn{};
        insn.ident = id;
        insn.value.data = std::move(value);
        insn.span = Span{0, SourceLoc{line_++, 1}};
        block.insns.push_back(std::move(insn));
        return id;
    }

    IdentId int_(Block& block, std::string_view name, std::int64_t v) {
        return let(block, name, types().int_(), ValueExpr::Int{v});
    }
    IdentId float_(Block& block, std::string_view name, double v) {
        return let(block, name, types().float_(), ValueExpr::Float{v});
    }
    IdentId bool_(Block& block, std::string_view name, bool v) {
        return let(block, name, types().bool_(), ValueExpr::Bool{v});
    }
    IdentId string(Block& block, std::string_view name, std::string bytes) {
        return let(block, name, types().string(),
                   ValueExpr::String{std::move(bytes)});
    }
    IdentId binary(Block& block, std::string_view name, TypeId ty,
                   BinaryOp op, IdentId lhs, IdentId rhs) {
        return let(block, name, ty, ValueExpr::Binary{op, lhs, rhs});
    }
    IdentId compare(Block& block, std::string_view name, BinaryOp op,
                    IdentId lhs, IdentId rhs) {
        return binary(block, name, types().bool_(), op, lhs, rhs);
    }

    // Declares `name(params) -> ret` and returns its body for filling in.
    IrFunction& function(std::string_view name,
                         std::vector<std::pair<std::string, TypeId>> params,
                         TypeId ret);
    IrFunction& closure(std::string_view name,
                        std::vector<std::pair<std::string, TypeId>> params,
                        TypeId ret,
                        std::vector<std::pair<std::string, TypeId>> captures);
    IdentId external(std::string_view name, TypeId ty);

   private:
    std::uint32_t line_ = 1;
};

// Compiles an emitted module in-process with the runtime bound to
// `HostRuntime`, plus any extra host symbols.
class Jit {
   public:
    explicit Jit(EmittedModule emitted,
                 std::vector<std::pair<std::string, void*>> extra = {});

    template <typename F>
    F* function(std::string_view name) {
        auto addr = jit_->lookup(name);
        if (!addr) {
            ADD_FAILURE() << "JIT lookup of `" << std::string(name)
                          << "` failed: " << llvm::toString(addr.takeError());
            return nullptr;
        }
        return addr->toPtr<F*>();
    }

   private:
    std::unique_ptr<llvm::orc::LLJIT> jit_{};
};

class CodegenTest : public ::testing::Test {
   protected:
    Session session{};
    IrAssembler ir{};
    std::optional<TargetSpec> target{};

    void SetUp() override;

    // Emits `ir.module`; records a test failure with the diagnostics when
    // emission fails.
    std::optional<EmittedModule> emit(const CodegenOptions& opts = {});
    std::string emit_text(const CodegenOptions& opts = {});
    std::string diagnostics() const;
};

}  // namespace mlc::test
