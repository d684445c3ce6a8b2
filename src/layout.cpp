#include "layout.hpp"

#include <llvm/IR/Constants.h>

#include <string>
#include <vector>

#include "diag.hpp"

namespace mlc {

TypeLayoutBuilder::TypeLayoutBuilder(llvm::LLVMContext& ctx,
                                     const llvm::DataLayout& dl,
                                     const TypeStore& types)
    : ctx_(ctx), dl_(dl), types_(types) {
    ptr_ty_ = llvm::PointerType::get(ctx_, 0);
    bool_ty_ = llvm::Type::getInt1Ty(ctx_);
    int_ty_ = llvm::Type::getInt64Ty(ctx_);
    float_ty_ = llvm::Type::getDoubleTy(ctx_);
    size_ty_ = llvm::IntegerType::get(ctx_, dl_.getPointerSizeInBits(0));

    unit_ty_ = llvm::StructType::create(ctx_, "mlc.unit");
    unit_ty_->setBody({}, /*isPacked=*/false);

    string_ty_ = llvm::StructType::create(ctx_, "mlc.string");
    string_ty_->setBody({ptr_ty_, int_ty_}, /*isPacked=*/false);

    array_ty_ = llvm::StructType::create(ctx_, "mlc.array");
    array_ty_->setBody({ptr_ty_, int_ty_}, /*isPacked=*/false);

    closure_ty_ = llvm::StructType::create(ctx_, "mlc.closure");
    closure_ty_->setBody({ptr_ty_, ptr_ty_}, /*isPacked=*/false);
}

llvm::Type* TypeLayoutBuilder::convert(TypeId ty) {
    if (!types_.contains(ty))
        internal_error("unknown type id " + std::to_string(ty));
    switch (types_.kind(ty)) {
        case TypeKind::Unit:
            return unit_ty_;
        case TypeKind::Bool:
            return bool_ty_;
        case TypeKind::Int:
            return int_ty_;
        case TypeKind::Float:
            return float_ty_;
        case TypeKind::String:
            return string_ty_;
        case TypeKind::Tuple:
            return ptr_ty_;
        case TypeKind::Fn:
            return closure_ty_;
        case TypeKind::Array:
            return array_ty_;
    }
    internal_error("unsupported type in layout: " + types_.to_string(ty));
}

llvm::StructType* TypeLayoutBuilder::tuple_record(TypeId tuple_ty) {
    if (auto it = tuple_cache_.find(tuple_ty); it != tuple_cache_.end())
        return it->second;
    const TypeData& d = types_.get(tuple_ty);
    if (d.kind != TypeKind::Tuple)
        internal_error("tuple record requested for non-tuple type " +
                       types_.to_string(tuple_ty));
    std::vector<llvm::Type*> elems{};
    elems.reserve(d.tuple_elems.size());
    for (TypeId e : d.tuple_elems) elems.push_back(convert(e));
    llvm::StructType* st =
        llvm::StructType::get(ctx_, elems, /*isPacked=*/false);
    tuple_cache_.insert({tuple_ty, st});
    return st;
}

llvm::FunctionType* TypeLayoutBuilder::function_type(TypeId fn_ty,
                                                     bool with_env) {
    const TypeData& d = types_.get(fn_ty);
    if (d.kind != TypeKind::Fn)
        internal_error("function signature requested for non-function type " +
                       types_.to_string(fn_ty));
    std::vector<llvm::Type*> params{};
    params.reserve(d.fn_params.size() + 1);
    if (with_env) params.push_back(ptr_ty_);
    for (TypeId p : d.fn_params) params.push_back(convert(p));
    llvm::Type* ret = types_.kind(d.fn_ret) == TypeKind::Unit
                          ? llvm::Type::getVoidTy(ctx_)
                          : convert(d.fn_ret);
    return llvm::FunctionType::get(ret, params, /*isVarArg=*/false);
}

llvm::StructType* TypeLayoutBuilder::captures_record(
    std::string_view fun, const ClosureDescriptor& desc) {
    std::string name = std::string(fun) + ".captures";
    if (auto it = captures_cache_.find(name); it != captures_cache_.end())
        return it->second;
    if (desc.captured_types.size() != desc.free_vars.size())
        internal_error("closure descriptor of `" + std::string(fun) +
                       "` lists " + std::to_string(desc.free_vars.size()) +
                       " free variables but " +
                       std::to_string(desc.captured_types.size()) + " types");
    std::vector<llvm::Type*> fields{};
    fields.reserve(desc.captured_types.size());
    for (TypeId t : desc.captured_types) fields.push_back(convert(t));
    llvm::StructType* st = llvm::StructType::create(ctx_, name);
    st->setBody(fields, /*isPacked=*/false);
    captures_cache_.insert({std::move(name), st});
    return st;
}

llvm::StructType* TypeLayoutBuilder::closure_shell(std::string_view fun) {
    std::string name = std::string(fun) + ".clsobj";
    if (auto it = shell_cache_.find(name); it != shell_cache_.end())
        return it->second;
    llvm::StructType* st = llvm::StructType::create(ctx_, name);
    st->setBody({ptr_ty_, ptr_ty_}, /*isPacked=*/false);
    shell_cache_.insert({std::move(name), st});
    return st;
}

std::uint64_t TypeLayoutBuilder::alloc_size(llvm::Type* ty) const {
    return dl_.getTypeAllocSize(ty).getFixedValue();
}

llvm::Constant* TypeLayoutBuilder::unit_value() const {
    return llvm::ConstantStruct::get(unit_ty_,
                                     llvm::ArrayRef<llvm::Constant*>{});
}

}  // namespace mlc
