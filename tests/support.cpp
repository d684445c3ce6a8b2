#include "support.hpp"

#include <llvm/ExecutionEngine/JITSymbol.h>
#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>
#include <llvm/Support/TargetSelect.h>

#include <cstring>
#include <sstream>

namespace mlc::test {

std::size_t HostRuntime::allocations = 0;
std::size_t HostRuntime::bytes = 0;

namespace {

std::vector<std::unique_ptr<std::max_align_t[]>>& arena() {
    static std::vector<std::unique_ptr<std::max_align_t[]>> blocks{};
    return blocks;
}

}  // namespace

void HostRuntime::reset() {
    arena().clear();
    allocations = 0;
    bytes = 0;
}

void* HostRuntime::gc_malloc(std::size_t size) {
    allocations++;
    bytes += size;
    std::size_t words = size / sizeof(std::max_align_t) + 1;
    arena().push_back(std::make_unique<std::max_align_t[]>(words));
    return arena().back().get();
}

bool HostRuntime::str_equal(const char* lhs, std::int64_t lhs_len,
                            const char* rhs, std::int64_t rhs_len) {
    if (lhs_len != rhs_len) return false;
    return std::memcmp(lhs, rhs, static_cast<std::size_t>(lhs_len)) == 0;
}

IrFunction& IrAssembler::function(
    std::string_view name, std::vector<std::pair<std::string, TypeId>> params,
    TypeId ret) {
    IrFunction fn{};
    fn.name = ident(name);
    fn.span = Span{0, SourceLoc{line_++, 1}};
    std::vector<TypeId> param_types{};
    for (auto& [pname, pty] : params) {
        IdentId p = ident(pname);
        module.env.bind(p, pty);
        fn.params.push_back(p);
        param_types.push_back(pty);
    }
    module.env.bind(fn.name, types().fn(std::move(param_types), ret));
    return module.add_function(std::move(fn));
}

IrFunction& IrAssembler::closure(
    std::string_view name, std::vector<std::pair<std::string, TypeId>> params,
    TypeId ret, std::vector<std::pair<std::string, TypeId>> captures) {
    ClosureDescriptor desc{};
    for (auto& [cname, cty] : captures) {
        IdentId c = ident(cname);
        module.env.bind(c, cty);
        desc.free_vars.push_back(c);
        desc.captured_types.push_back(cty);
    }
    IrFunction& fn = function(name, std::move(params), ret);
    fn.closure = std::move(desc);
    return fn;
}

IdentId IrAssembler::external(std::string_view name, TypeId ty) {
    IdentId id = ident(name);
    module.env.bind(id, ty);
    module.externals.push_back(IrExternal{id, ty});
    return id;
}

Jit::Jit(EmittedModule emitted,
         std::vector<std::pair<std::string, void*>> extra) {
    llvm::InitializeNativeTarget();
    llvm::InitializeNativeTargetAsmPrinter();

    jit_ = llvm::cantFail(llvm::orc::LLJITBuilder().create());

    llvm::orc::SymbolMap runtime{};
    auto bind = [&](std::string_view name, void* addr,
                    llvm::JITSymbolFlags flags) {
        runtime[jit_->mangleAndIntern(name)] = llvm::orc::ExecutorSymbolDef(
            llvm::orc::ExecutorAddr::fromPtr(addr), flags);
    };
    const auto callable =
        llvm::JITSymbolFlags::Exported | llvm::JITSymbolFlags::Callable;
    bind(kDefaultAllocatorSymbol,
         reinterpret_cast<void*>(&HostRuntime::gc_malloc), callable);
    bind(kStrEqualSymbol, reinterpret_cast<void*>(&HostRuntime::str_equal),
         callable);
    for (auto& [name, addr] : extra)
        bind(name, addr, llvm::JITSymbolFlags::Exported);
    llvm::cantFail(jit_->getMainJITDylib().define(
        llvm::orc::absoluteSymbols(std::move(runtime))));

    llvm::cantFail(jit_->addIRModule(llvm::orc::ThreadSafeModule(
        std::move(emitted.module), std::move(emitted.context))));
}

void CodegenTest::SetUp() {
    HostRuntime::reset();
    target = compute_target_spec(session, std::nullopt);
    ASSERT_TRUE(target.has_value()) << diagnostics();
}

std::optional<EmittedModule> CodegenTest::emit(const CodegenOptions& opts) {
    std::optional<EmittedModule> out =
        emit_module(session, ir.module, *target, opts);
    if (!out) ADD_FAILURE() << "emission failed:\n" << diagnostics();
    return out;
}

std::string CodegenTest::emit_text(const CodegenOptions& opts) {
    std::optional<EmittedModule> out = emit(opts);
    if (!out) return "";
    std::ostringstream os{};
    print_module(*out, os);
    return os.str();
}

std::string CodegenTest::diagnostics() const {
    std::ostringstream os{};
    for (const Diagnostic& d : session.diags)
        os << format_diagnostic(session.sources, d) << "\n";
    return os.str();
}

}  // namespace mlc::test
