#include <llvm/IR/Constants.h>
#include <llvm/IR/Function.h>

#include <string>
#include <vector>

#include "diag.hpp"
#include "layout.hpp"
#include "lower_block.hpp"
#include "runtime.hpp"

namespace mlc {

llvm::Value* BlockLowering::lower_app(const ValueExpr::App& app) {
    const std::string& name = name_of(app.callee);
    std::vector<llvm::Value*> args;
    args.reserve(app.args.size() + 1);

    llvm::Value* callee = nullptr;
    llvm::FunctionType* fn_ty = nullptr;
    switch (app.kind) {
        case CallKind::Direct: {
            llvm::Function* fn = cx_.symbols.function(name);
            if (!fn) fail("value for function `" + name + "` was not found");
            callee = fn;
            fn_ty = fn->getFunctionType();
            break;
        }
        case CallKind::External: {
            llvm::Function* fn = cx_.symbols.global_function(name);
            if (!fn)
                fail("value for external function `" + name +
                     "` was not found");
            callee = fn;
            fn_ty = fn->getFunctionType();
            break;
        }
        case CallKind::Closure: {
            llvm::Value* closure = resolve(app.callee);
            if (llvm::Function* fn = cx_.symbols.function(name)) {
                // Known at compile time: skip the indirect call.
                callee = fn;
                fn_ty = fn->getFunctionType();
            } else {
                callee = builder_.CreateExtractValue(closure, 0, "funptr");
                fn_ty = cx_.layout.function_type(type_of(app.callee),
                                                 /*with_env=*/true);
            }
            args.push_back(
                builder_.CreateExtractValue(closure, 1, "capturesptr"));
            break;
        }
    }
    if (!fn_ty)
        fail(std::string("unknown call kind `") + call_kind_str(app.kind) +
             "`");

    for (IdentId a : app.args) args.push_back(resolve(a));
    if (fn_ty->getNumParams() != args.size())
        fail("call to `" + name + "` passes " + std::to_string(args.size()) +
             " arguments but its signature takes " +
             std::to_string(fn_ty->getNumParams()));

    if (fn_ty->getReturnType()->isVoidTy()) {
        builder_.CreateCall(fn_ty, callee, args);
        return unit_value();
    }
    return builder_.CreateCall(fn_ty, callee, args);
}

llvm::Value* BlockLowering::lower_extern_ref(const ValueExpr::ExternRef& x) {
    const std::string& name = name_of(x.ident);
    const IrExternal* ext = cx_.module.external(x.ident);
    TypeId ty = ext ? ext->type : type_of(x.ident);

    if (cx_.layout.types().kind(ty) != TypeKind::Fn) {
        llvm::GlobalValue* global = cx_.symbols.global(name);
        if (!global)
            fail("value for external value `" + name + "` was not found");
        return builder_.CreateLoad(cx_.layout.convert(ty), global, name);
    }

    // External functions have no environment; the wrapper ignores it.
    llvm::Function* wrapper =
        cx_.symbols.function(closure_wrapper_name(name));
    if (!wrapper)
        fail("closure wrapper for external function `" + name +
             "` was not found");
    llvm::StructType* closure_ty = cx_.layout.closure_type();
    llvm::Value* shell = entry_alloca(closure_ty, "");
    builder_.CreateStore(wrapper,
                         builder_.CreateStructGEP(closure_ty, shell, 0, ""));
    builder_.CreateStore(
        llvm::ConstantPointerNull::get(cx_.layout.ptr_type()),
        builder_.CreateStructGEP(closure_ty, shell, 1, ""));
    return builder_.CreateLoad(closure_ty, shell, name + ".cls");
}

llvm::Value* BlockLowering::lower_make_closure(
    const ValueExpr::MakeClosure& c) {
    const std::string& fun = name_of(c.fun);
    const IrFunction* def = cx_.module.function(c.fun);
    if (!def || !def->closure)
        fail("closure for function `" + fun + "` was not found");
    const ClosureDescriptor& desc = *def->closure;
    if (desc.free_vars.size() != c.vars.size())
        fail("closure of `" + fun + "` captures " +
             std::to_string(c.vars.size()) + " values but `" + fun +
             "` has " + std::to_string(desc.free_vars.size()) +
             " free variables");

    llvm::Function* fn = cx_.symbols.function(fun);
    if (!fn) fail("value for function `" + fun + "` was not found");

    llvm::StructType* shell_ty = cx_.layout.closure_shell(fun);
    llvm::StructType* captures_ty = cx_.layout.captures_record(fun, desc);

    llvm::Value* shell = entry_alloca(shell_ty, "");
    builder_.CreateStore(fn, builder_.CreateStructGEP(shell_ty, shell, 0, ""));

    llvm::Value* captures = emit_malloc(builder_, cx_.allocator, cx_.layout,
                                        captures_ty, "captures." + fun);
    if (desc.captured_types.size() != desc.free_vars.size())
        fail("closure descriptor of `" + fun + "` lists " +
             std::to_string(desc.free_vars.size()) + " free variables but " +
             std::to_string(desc.captured_types.size()) + " captured types");
    const TypeStore& types = cx_.module.types;
    for (size_t i = 0; i < c.vars.size(); i++) {
        const TypeId var_ty = type_of(c.vars[i]);
        if (!types.equal(var_ty, desc.captured_types[i]))
            fail("closure of `" + fun + "` captures `" + name_of(c.vars[i]) +
                 "` of type " + types.to_string(var_ty) + " where " +
                 types.to_string(desc.captured_types[i]) + " is expected");
    }
    for (size_t i = 0; i < c.vars.size(); i++) {
        llvm::Value* v = resolve(c.vars[i]);
        llvm::Value* p = builder_.CreateStructGEP(
            captures_ty, captures, static_cast<unsigned>(i), "");
        builder_.CreateStore(v, p);
    }
    builder_.CreateStore(captures,
                         builder_.CreateStructGEP(shell_ty, shell, 1, ""));

    // Read back through the erased closure type every caller agrees on.
    return builder_.CreateLoad(cx_.layout.closure_type(), shell,
                               "closure." + fun);
}

}  // namespace mlc
