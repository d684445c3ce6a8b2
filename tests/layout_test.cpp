#include "layout.hpp"

#include <gtest/gtest.h>
#include <llvm/IR/DataLayout.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/LLVMContext.h>

#include "diag.hpp"
#include "ir.hpp"

using namespace mlc;

namespace {

constexpr const char* kX86_64Layout =
    "e-m:e-p270:32:32-p271:32:32-p272:64:64-i64:64-i128:128-f80:128-n8:16:32:"
    "64-S128";

class LayoutTest : public ::testing::Test {
   protected:
    llvm::LLVMContext ctx;
    llvm::DataLayout dl{kX86_64Layout};
    TypeStore types;
    TypeLayoutBuilder layout{ctx, dl, types};
};

}  // namespace

TEST_F(LayoutTest, ScalarRepresentations) {
    EXPECT_TRUE(layout.convert(types.bool_())->isIntegerTy(1));
    EXPECT_TRUE(layout.convert(types.int_())->isIntegerTy(64));
    EXPECT_TRUE(layout.convert(types.float_())->isDoubleTy());
    EXPECT_EQ(layout.convert(types.unit()), layout.unit_type());
    EXPECT_EQ(layout.alloc_size(layout.unit_type()), 0u);
    EXPECT_EQ(layout.size_type()->getBitWidth(), 64u);
}

TEST_F(LayoutTest, AggregatesAreFatValuesOrPointers) {
    EXPECT_EQ(layout.convert(types.string()), layout.string_type());
    EXPECT_EQ(layout.alloc_size(layout.string_type()), 16u);

    TypeId arr = types.array(types.float_());
    EXPECT_EQ(layout.convert(arr), layout.array_type());

    TypeId fn = types.fn({types.int_()}, types.int_());
    EXPECT_EQ(layout.convert(fn), layout.closure_type());
    EXPECT_EQ(layout.alloc_size(layout.closure_type()), 16u);

    TypeId pair = types.tuple({types.int_(), types.bool_()});
    EXPECT_TRUE(layout.convert(pair)->isPointerTy());
}

TEST_F(LayoutTest, TupleRecordFollowsElementOrder) {
    TypeId t = types.tuple({types.bool_(), types.float_(), types.string()});
    llvm::StructType* record = layout.tuple_record(t);
    ASSERT_EQ(record->getNumElements(), 3u);
    EXPECT_TRUE(record->getElementType(0)->isIntegerTy(1));
    EXPECT_TRUE(record->getElementType(1)->isDoubleTy());
    EXPECT_EQ(record->getElementType(2), layout.string_type());
    EXPECT_EQ(layout.alloc_size(record), 32u);
    EXPECT_EQ(layout.tuple_record(t), record);
}

TEST_F(LayoutTest, FunctionTypes) {
    TypeId fn = types.fn({types.int_(), types.bool_()}, types.unit());
    llvm::FunctionType* plain = layout.function_type(fn, false);
    EXPECT_TRUE(plain->getReturnType()->isVoidTy());
    ASSERT_EQ(plain->getNumParams(), 2u);
    EXPECT_TRUE(plain->getParamType(1)->isIntegerTy(1));

    llvm::FunctionType* with_env = layout.function_type(fn, true);
    ASSERT_EQ(with_env->getNumParams(), 3u);
    EXPECT_TRUE(with_env->getParamType(0)->isPointerTy());
    EXPECT_TRUE(with_env->getParamType(1)->isIntegerTy(64));

    EXPECT_THROW(layout.function_type(types.int_(), false), InternalError);
}

TEST_F(LayoutTest, CapturesRecord) {
    ClosureDescriptor desc{};
    desc.free_vars = {0, 1};
    desc.captured_types = {types.int_(), types.string()};
    llvm::StructType* record = layout.captures_record("adder", desc);
    EXPECT_EQ(record->getName(), "adder.captures");
    ASSERT_EQ(record->getNumElements(), 2u);
    EXPECT_EQ(record->getElementType(1), layout.string_type());
    EXPECT_EQ(layout.captures_record("adder", desc), record);

    EXPECT_EQ(layout.closure_shell("adder")->getName(), "adder.clsobj");

    ClosureDescriptor bad{};
    bad.free_vars = {0, 1};
    bad.captured_types = {types.int_()};
    EXPECT_THROW(layout.captures_record("broken", bad), InternalError);
}

TEST_F(LayoutTest, UnknownTypeIsInternalError) {
    EXPECT_THROW(layout.convert(12345), InternalError);
}
