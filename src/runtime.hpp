#pragma once

#include <llvm/ADT/Twine.h>
#include <llvm/IR/IRBuilder.h>

#include <string>
#include <string_view>
#include <unordered_map>

namespace mlc {

class TypeLayoutBuilder;

inline constexpr std::string_view kDefaultAllocatorSymbol = "GC_malloc";
inline constexpr std::string_view kStrEqualSymbol = "__str_equal";

// `print` used as a first-class value is called through `print$closure`.
std::string closure_wrapper_name(std::string_view external);

// Everything a lowering session may call or load by name. Populated by the
// module emitter before any body is lowered, read-only afterwards.
struct SymbolTable {
    // User functions and the closure wrappers of external functions.
    std::unordered_map<std::string, llvm::Function*> functions{};
    // Runtime entry points, external functions and external data.
    std::unordered_map<std::string, llvm::GlobalValue*> globals{};

    llvm::Function* function(std::string_view name) const;
    llvm::GlobalValue* global(std::string_view name) const;
    llvm::Function* global_function(std::string_view name) const;
};

// Source of managed heap memory for tuples, array buffers and closure
// captures. Memory is never released by generated code.
class Allocator {
   public:
    virtual ~Allocator() = default;

    // Emits code yielding a pointer to `size` fresh bytes.
    virtual llvm::Value* emit_alloc(llvm::IRBuilder<>& builder,
                                    llvm::Value* size,
                                    const llvm::Twine& name) = 0;
};

// Calls a runtime entry point `ptr <symbol>(size_t)` registered in the
// symbol table (`GC_malloc` unless configured otherwise).
class RuntimeAllocator : public Allocator {
   public:
    RuntimeAllocator(const SymbolTable& symbols, std::string entry_point);

    llvm::Value* emit_alloc(llvm::IRBuilder<>& builder, llvm::Value* size,
                            const llvm::Twine& name) override;

   private:
    const SymbolTable& symbols_;
    std::string entry_point_{};
};

llvm::Function* declare_allocator(llvm::Module& module,
                                  const TypeLayoutBuilder& layout,
                                  std::string_view symbol);
// `zeroext i1 __str_equal(%mlc.string, %mlc.string)`. The strings are
// first-class struct arguments; the runtime sees each as `(ptr, i64)`.
llvm::Function* declare_str_equal(llvm::Module& module,
                                  const TypeLayoutBuilder& layout);

// Memory for one value of `ty`, typed as a pointer to it.
llvm::Value* emit_malloc(llvm::IRBuilder<>& builder, Allocator& allocator,
                         const TypeLayoutBuilder& layout, llvm::Type* ty,
                         const llvm::Twine& name);

// Memory for `count` values of `elem_ty`. `count` is truncated to the size
// word before the multiplication.
llvm::Value* emit_array_malloc(llvm::IRBuilder<>& builder,
                               Allocator& allocator,
                               const TypeLayoutBuilder& layout,
                               llvm::Type* elem_ty, llvm::Value* count,
                               const llvm::Twine& name);

}  // namespace mlc
