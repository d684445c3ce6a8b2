#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mlc {

using TypeId = std::uint32_t;

enum class TypeKind : std::uint8_t {
    Unit,
    Bool,
    Int,
    Float,
    String,
    Tuple,
    Fn,
    Array,
};

struct TypeData {
    TypeKind kind = TypeKind::Unit;

    // Tuple
    std::vector<TypeId> tuple_elems{};

    // Function
    std::vector<TypeId> fn_params{};
    TypeId fn_ret = 0;

    // Array
    TypeId elem = 0;
};

// Owns every source-level type of a compilation unit. Scalars are cached;
// composite types are allocated per request and compared structurally.
class TypeStore {
   public:
    TypeStore() = default;

    TypeId unit() const;
    TypeId bool_() const;
    TypeId int_() const;
    TypeId float_() const;
    TypeId string() const;

    TypeId tuple(std::vector<TypeId> elems) const;
    TypeId fn(std::vector<TypeId> params, TypeId ret) const;
    TypeId array(TypeId elem) const;

    const TypeData& get(TypeId id) const {
        return types_.at(static_cast<size_t>(id));
    }
    TypeKind kind(TypeId id) const { return get(id).kind; }
    bool contains(TypeId id) const { return id < types_.size(); }

    bool equal(TypeId a, TypeId b) const;
    std::string to_string(TypeId t) const;

    // Depth of type constructors: scalars are 1, `(int * (int * int))` is 3.
    std::uint32_t nesting_depth(TypeId t) const;

   private:
    mutable std::vector<TypeData> types_{};

    mutable std::optional<TypeId> cached_unit_{};
    mutable std::optional<TypeId> cached_bool_{};
    mutable std::optional<TypeId> cached_int_{};
    mutable std::optional<TypeId> cached_float_{};
    mutable std::optional<TypeId> cached_string_{};

    TypeId make(TypeData d) const;
    TypeId cached(std::optional<TypeId>& slot, TypeKind kind) const;
};

}  // namespace mlc
