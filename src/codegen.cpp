#include "codegen.hpp"

#include <llvm/IR/BasicBlock.h>
#include <llvm/IR/Constants.h>
#include <llvm/IR/DataLayout.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/GlobalVariable.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/raw_os_ostream.h>
#include <llvm/Support/raw_ostream.h>
#include <llvm/TargetParser/Triple.h>

#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "diag.hpp"
#include "ir.hpp"
#include "layout.hpp"
#include "lower_block.hpp"
#include "session.hpp"
#include "target.hpp"

namespace mlc {
namespace {

// Module emitter.
//
// Emission order:
// - runtime entry points (allocator, string equality)
// - externals: declarations, plus a `<name>$closure` wrapper for every
//   external function so it can be used as a first-class value
// - declarations of every IR function, so bodies may call in any order
// - bodies, each lowered in a fresh session with its own register table
// - `i32 main()` from the top-level entry block, when present
//
// Closure ABI: a closure-shaped function takes the environment pointer as its
// first parameter. Its prologue loads every capture from `<fun>.captures` and
// binds the function's own identifier to `{self, env}`, which is what
// self-recursive closure calls resolve.
class ModuleEmitter {
   public:
    ModuleEmitter(Session& session, const IrModule& ir,
                  const TargetSpec& target, const CodegenOptions& opts)
        : session_(session),
          ir_(ir),
          target_(target),
          opts_(opts),
          ctx_(std::make_unique<llvm::LLVMContext>()),
          module_(std::make_unique<llvm::Module>(opts.module_name, *ctx_)),
          builder_(*ctx_),
          allocator_(symbols_, opts.allocator_symbol) {}

    std::optional<EmittedModule> run() {
        if (!configure_target()) return std::nullopt;
        layout_.emplace(*ctx_, module_->getDataLayout(), ir_.types);
        LoweringContext cx{ir_, *layout_, symbols_, allocator_};

        try {
            declare_runtime();
            declare_externals();
            declare_functions();
            for (const IrFunction& f : ir_.functions) emit_function_body(cx, f);
            if (ir_.entry) emit_main(cx, *ir_.entry);
        } catch (const InternalError& e) {
            session_.report(e);
            return std::nullopt;
        }

        if (session_.has_errors()) return std::nullopt;
        if (opts_.verify && !verify_module()) return std::nullopt;

        EmittedModule out{};
        out.context = std::move(ctx_);
        out.module = std::move(module_);
        return out;
    }

   private:
    Session& session_;
    const IrModule& ir_;
    const TargetSpec& target_;
    const CodegenOptions& opts_;

    std::unique_ptr<llvm::LLVMContext> ctx_{};
    std::unique_ptr<llvm::Module> module_{};
    llvm::IRBuilder<> builder_;

    std::optional<TypeLayoutBuilder> layout_{};
    SymbolTable symbols_{};
    RuntimeAllocator allocator_;

    std::unordered_map<IdentId, llvm::Function*> fn_decls_{};

    const std::string& name_of(IdentId ident) const {
        return ir_.idents.name(ident);
    }

    // The layout builder sizes heap records with the module's data layout, so
    // it has to be final before anything is declared.
    bool configure_target() {
        module_->setTargetTriple(llvm::Triple(target_.triple));
        if (target_.data_layout.empty()) return true;

        llvm::Expected<llvm::DataLayout> dl =
            llvm::DataLayout::parse(target_.data_layout);
        if (!dl) {
            session_.error(Span{}, "invalid data layout `" +
                                       target_.data_layout +
                                       "`: " + llvm::toString(dl.takeError()));
            return false;
        }
        module_->setDataLayout(*dl);
        return true;
    }

    void check_symbol_free(const std::string& name, Span span) {
        if (module_->getNamedValue(name))
            internal_error("symbol `" + name + "` is declared twice", span);
    }

    void declare_runtime() {
        if (!opts_.allocator_symbol.empty()) {
            symbols_.globals[opts_.allocator_symbol] =
                declare_allocator(*module_, *layout_, opts_.allocator_symbol);
        }
        symbols_.globals[std::string(kStrEqualSymbol)] =
            declare_str_equal(*module_, *layout_);
    }

    // `Bool` crosses function boundaries zero-extended.
    void add_bool_attrs(llvm::Function* fn, TypeId fn_ty, unsigned first_param) {
        const TypeStore& types = ir_.types;
        const TypeData& d = types.get(fn_ty);
        if (types.kind(d.fn_ret) == TypeKind::Bool)
            fn->addRetAttr(llvm::Attribute::ZExt);
        for (size_t i = 0; i < d.fn_params.size(); i++) {
            if (types.kind(d.fn_params[i]) == TypeKind::Bool)
                fn->addParamAttr(first_param + static_cast<unsigned>(i),
                                 llvm::Attribute::ZExt);
        }
    }

    void declare_externals() {
        for (const IrExternal& ext : ir_.externals) {
            const std::string& name = name_of(ext.name);
            check_symbol_free(name, Span{});

            if (ir_.types.kind(ext.type) != TypeKind::Fn) {
                auto* gv = new llvm::GlobalVariable(
                    *module_, layout_->convert(ext.type), /*isConstant=*/false,
                    llvm::GlobalValue::ExternalLinkage, nullptr, name);
                symbols_.globals[name] = gv;
                continue;
            }

            llvm::FunctionType* fty =
                layout_->function_type(ext.type, /*with_env=*/false);
            llvm::Function* fn = llvm::Function::Create(
                fty, llvm::Function::ExternalLinkage, name, module_.get());
            add_bool_attrs(fn, ext.type, 0);
            symbols_.globals[name] = fn;
            emit_closure_wrapper(name, ext.type, fn);
        }
    }

    // `<name>$closure(env, args...)` forwards to `name(args...)`.
    void emit_closure_wrapper(const std::string& name, TypeId fn_ty,
                              llvm::Function* target) {
        std::string wrapper_name = closure_wrapper_name(name);
        check_symbol_free(wrapper_name, Span{});

        llvm::FunctionType* fty =
            layout_->function_type(fn_ty, /*with_env=*/true);
        llvm::Function* fn = llvm::Function::Create(
            fty, llvm::Function::InternalLinkage, wrapper_name, module_.get());
        add_bool_attrs(fn, fn_ty, 1);
        fn->getArg(0)->setName("env");

        llvm::BasicBlock* bb = llvm::BasicBlock::Create(*ctx_, "entry", fn);
        llvm::IRBuilder<> b(bb);
        std::vector<llvm::Value*> args{};
        args.reserve(fn->arg_size() - 1);
        for (unsigned i = 1; i < fn->arg_size(); i++)
            args.push_back(fn->getArg(i));

        llvm::FunctionType* target_ty = target->getFunctionType();
        if (target_ty->getReturnType()->isVoidTy()) {
            b.CreateCall(target_ty, target, args);
            b.CreateRetVoid();
        } else {
            b.CreateRet(b.CreateCall(target_ty, target, args));
        }
        symbols_.functions[wrapper_name] = fn;
    }

    void declare_functions() {
        for (const IrFunction& f : ir_.functions) {
            const std::string& name = name_of(f.name);
            std::optional<TypeId> fn_ty = ir_.env.lookup(f.name);
            if (!fn_ty)
                internal_error("type was not found for function `" + name + "`",
                               f.span);
            if (ir_.types.kind(*fn_ty) != TypeKind::Fn)
                internal_error("function `" + name + "` has non-function type " +
                                   ir_.types.to_string(*fn_ty),
                               f.span);
            if (ir_.types.get(*fn_ty).fn_params.size() != f.params.size())
                internal_error("function `" + name + "` binds " +
                                   std::to_string(f.params.size()) +
                                   " parameters but its type is " +
                                   ir_.types.to_string(*fn_ty),
                               f.span);
            check_symbol_free(name, f.span);

            const bool with_env = f.closure.has_value();
            llvm::FunctionType* fty = layout_->function_type(*fn_ty, with_env);
            llvm::Function* fn = llvm::Function::Create(
                fty, llvm::Function::ExternalLinkage, name, module_.get());
            add_bool_attrs(fn, *fn_ty, with_env ? 1 : 0);

            unsigned arg = 0;
            if (with_env) fn->getArg(arg++)->setName("env");
            for (IdentId p : f.params) fn->getArg(arg++)->setName(name_of(p));

            symbols_.functions[name] = fn;
            fn_decls_[f.name] = fn;
        }
    }

    void bind(RegisterTable& registers, IdentId ident, llvm::Value* v,
              Span span) {
        if (!registers.bind(ident, v))
            internal_error("identifier `" + name_of(ident) +
                               "` is defined twice",
                           span);
    }

    void emit_function_body(const LoweringContext& cx, const IrFunction& f) {
        const std::string& name = name_of(f.name);
        llvm::Function* fn = fn_decls_.at(f.name);
        llvm::BasicBlock* entry = llvm::BasicBlock::Create(*ctx_, "entry", fn);
        builder_.SetInsertPoint(entry);

        RegisterTable registers(ir_.idents.size());
        unsigned arg = f.closure ? 1 : 0;
        for (IdentId p : f.params) bind(registers, p, fn->getArg(arg++), f.span);

        if (f.closure) {
            llvm::Argument* env = fn->getArg(0);
            const ClosureDescriptor& desc = *f.closure;
            if (!desc.free_vars.empty()) {
                llvm::StructType* captures_ty =
                    layout_->captures_record(name, desc);
                for (size_t i = 0; i < desc.free_vars.size(); i++) {
                    llvm::Value* p = builder_.CreateStructGEP(
                        captures_ty, env, static_cast<unsigned>(i), "");
                    llvm::Value* v = builder_.CreateLoad(
                        captures_ty->getElementType(static_cast<unsigned>(i)),
                        p, name_of(desc.free_vars[i]));
                    bind(registers, desc.free_vars[i], v, f.span);
                }
            }

            llvm::StructType* closure_ty = layout_->closure_type();
            llvm::Value* self = builder_.CreateInsertValue(
                llvm::PoisonValue::get(closure_ty), fn, 0, "");
            self = builder_.CreateInsertValue(self, env, 1, name + ".self");
            bind(registers, f.name, self, f.span);
        }

        BlockLowering lowering(cx, builder_, registers);
        llvm::Value* result = lowering.lower_block(f.body);
        if (fn->getReturnType()->isVoidTy()) {
            builder_.CreateRetVoid();
        } else {
            builder_.CreateRet(result);
        }
    }

    void emit_main(const LoweringContext& cx, const Block& entry_block) {
        check_symbol_free("main", Span{});
        auto* i32 = llvm::Type::getInt32Ty(*ctx_);
        llvm::Function* fn =
            llvm::Function::Create(llvm::FunctionType::get(i32, false),
                                   llvm::Function::ExternalLinkage, "main",
                                   module_.get());
        builder_.SetInsertPoint(llvm::BasicBlock::Create(*ctx_, "entry", fn));

        RegisterTable registers(ir_.idents.size());
        BlockLowering lowering(cx, builder_, registers);
        lowering.lower_block(entry_block);
        builder_.CreateRet(llvm::ConstantInt::get(i32, 0));
    }

    bool verify_module() {
        std::string out{};
        llvm::raw_string_ostream os(out);
        if (!llvm::verifyModule(*module_, &os)) return true;
        session_.error(Span{},
                       "LLVM module verification failed:\n" + os.str());
        return false;
    }
};

}  // namespace

std::optional<EmittedModule> emit_module(Session& session, const IrModule& ir,
                                         const TargetSpec& target,
                                         const CodegenOptions& opts) {
    ModuleEmitter emitter(session, ir, target, opts);
    return emitter.run();
}

void print_module(const EmittedModule& emitted, std::ostream& os) {
    llvm::raw_os_ostream out(os);
    emitted.module->print(out, nullptr);
}

}  // namespace mlc
