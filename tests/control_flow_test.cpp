#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <string>

#include "support.hpp"

using namespace mlc;
using namespace mlc::test;

namespace {

class ControlFlowTest : public CodegenTest {
   protected:
    std::unique_ptr<Block> block() { return std::make_unique<Block>(); }
};

}  // namespace

TEST_F(ControlFlowTest, IfSelectsThenBranch) {
    TypeId i = ir.types().int_();
    IrFunction& f = ir.function("pick_then", {}, i);
    IdentId cond = ir.bool_(f.body, "cond", true);

    auto then_block = block();
    ir.int_(*then_block, "one", 1);
    auto else_block = block();
    ir.int_(*else_block, "two", 2);
    ir.let(f.body, "r", i,
           ValueExpr::If{cond, std::move(then_block), std::move(else_block)});

    auto emitted = emit();
    ASSERT_TRUE(emitted);
    Jit jit(std::move(*emitted));
    auto* fn = jit.function<std::int64_t()>("pick_then");
    ASSERT_NE(fn, nullptr);
    EXPECT_EQ(fn(), 1);
}

TEST_F(ControlFlowTest, IfMergesTupleValues) {
    TypeId i = ir.types().int_();
    TypeId pair = ir.types().tuple({i, i});
    IrFunction& f = ir.function("pick_else", {}, i);
    IdentId cond = ir.bool_(f.body, "cond", false);

    auto then_block = block();
    IdentId one = ir.int_(*then_block, "one", 1);
    IdentId two = ir.int_(*then_block, "two", 2);
    ir.let(*then_block, "p12", pair, ValueExpr::Tuple{{one, two}});

    auto else_block = block();
    IdentId three = ir.int_(*else_block, "three", 3);
    IdentId four = ir.int_(*else_block, "four", 4);
    ir.let(*else_block, "p34", pair, ValueExpr::Tuple{{three, four}});

    IdentId merged = ir.let(
        f.body, "merged", pair,
        ValueExpr::If{cond, std::move(then_block), std::move(else_block)});
    ir.let(f.body, "second", i, ValueExpr::TupleLoad{merged, 1});

    auto emitted = emit();
    ASSERT_TRUE(emitted);
    Jit jit(std::move(*emitted));
    auto* fn = jit.function<std::int64_t()>("pick_else");
    ASSERT_NE(fn, nullptr);
    EXPECT_EQ(fn(), 4);
}

TEST_F(ControlFlowTest, NestedIfUsesLastBlockOfEachArm) {
    TypeId i = ir.types().int_();
    IrFunction& f = ir.function("classify", {{"x", i}}, i);
    IdentId zero = ir.int_(f.body, "zero", 0);
    IdentId neg = ir.compare(f.body, "neg", BinaryOp::Lt, f.params[0], zero);

    auto then_block = block();
    ir.int_(*then_block, "minus", -1);

    // else: if x = 0 then 0 else 1
    auto else_block = block();
    IdentId is_zero =
        ir.compare(*else_block, "is_zero", BinaryOp::Eq, f.params[0], zero);
    auto zero_block = block();
    ir.int_(*zero_block, "z", 0);
    auto pos_block = block();
    ir.int_(*pos_block, "p", 1);
    ir.let(*else_block, "inner", i,
           ValueExpr::If{is_zero, std::move(zero_block), std::move(pos_block)});

    ir.let(f.body, "sign", i,
           ValueExpr::If{neg, std::move(then_block), std::move(else_block)});

    auto emitted = emit();
    ASSERT_TRUE(emitted);
    Jit jit(std::move(*emitted));
    auto* fn = jit.function<std::int64_t(std::int64_t)>("classify");
    ASSERT_NE(fn, nullptr);
    EXPECT_EQ(fn(-5), -1);
    EXPECT_EQ(fn(0), 0);
    EXPECT_EQ(fn(9), 1);
}

TEST_F(ControlFlowTest, BlocksAreLaidOutThenElseMerge) {
    TypeId i = ir.types().int_();
    IrFunction& f = ir.function("layout", {{"c", ir.types().bool_()}}, i);
    auto then_block = block();
    ir.int_(*then_block, "one", 1);
    auto else_block = block();
    ir.int_(*else_block, "two", 2);
    ir.let(f.body, "r", i,
           ValueExpr::If{f.params[0], std::move(then_block),
                         std::move(else_block)});

    std::string text = emit_text();
    std::size_t then_pos = text.find("if.then:");
    std::size_t else_pos = text.find("if.else:");
    std::size_t end_pos = text.find("if.end:");
    ASSERT_NE(then_pos, std::string::npos) << text;
    ASSERT_NE(else_pos, std::string::npos) << text;
    ASSERT_NE(end_pos, std::string::npos) << text;
    EXPECT_LT(then_pos, else_pos);
    EXPECT_LT(else_pos, end_pos);
    EXPECT_NE(text.find("%if.merge = phi i64"), std::string::npos) << text;
}

TEST_F(ControlFlowTest, UnitIfMergesUnitValues) {
    TypeId u = ir.types().unit();
    IrFunction& f = ir.function("effect", {{"c", ir.types().bool_()}}, u);
    auto then_block = block();
    ir.let(*then_block, "a", u, ValueExpr::Unit{});
    auto else_block = block();
    ir.let(*else_block, "b", u, ValueExpr::Unit{});
    ir.let(f.body, "r", u,
           ValueExpr::If{f.params[0], std::move(then_block),
                         std::move(else_block)});

    std::string text = emit_text();
    EXPECT_NE(text.find("phi %mlc.unit"), std::string::npos) << text;
    EXPECT_NE(text.find("ret void"), std::string::npos) << text;
}
