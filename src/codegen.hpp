#pragma once

#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

#include "runtime.hpp"

namespace mlc {

struct IrModule;
struct Session;
struct TargetSpec;

struct CodegenOptions {
    std::string module_name = "mlc";
    // Symbol of the managed heap entry point, `ptr (size_t)`. When empty no
    // allocator is declared and any allocation is an internal error.
    std::string allocator_symbol = std::string(kDefaultAllocatorSymbol);
    bool verify = true;
};

// The context outlives the module; members are destroyed in reverse order.
struct EmittedModule {
    std::unique_ptr<llvm::LLVMContext> context{};
    std::unique_ptr<llvm::Module> module{};
};

// Lowers a closure-converted module to LLVM IR. Errors, including internal
// ones, are reported to the session and yield no module.
std::optional<EmittedModule> emit_module(Session& session, const IrModule& ir,
                                         const TargetSpec& target,
                                         const CodegenOptions& opts = {});

void print_module(const EmittedModule& emitted, std::ostream& os);

}  // namespace mlc
