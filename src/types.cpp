#include "types.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace mlc {

TypeId TypeStore::make(TypeData d) const {
    TypeId id = static_cast<TypeId>(types_.size());
    types_.push_back(std::move(d));
    return id;
}

TypeId TypeStore::cached(std::optional<TypeId>& slot, TypeKind kind) const {
    if (slot) return *slot;
    slot = make(TypeData{.kind = kind});
    return *slot;
}

TypeId TypeStore::unit() const { return cached(cached_unit_, TypeKind::Unit); }

TypeId TypeStore::bool_() const { return cached(cached_bool_, TypeKind::Bool); }

TypeId TypeStore::int_() const { return cached(cached_int_, TypeKind::Int); }

TypeId TypeStore::float_() const {
    return cached(cached_float_, TypeKind::Float);
}

TypeId TypeStore::string() const {
    return cached(cached_string_, TypeKind::String);
}

TypeId TypeStore::tuple(std::vector<TypeId> elems) const {
    TypeData d{.kind = TypeKind::Tuple};
    d.tuple_elems = std::move(elems);
    return make(std::move(d));
}

TypeId TypeStore::fn(std::vector<TypeId> params, TypeId ret) const {
    TypeData d{.kind = TypeKind::Fn};
    d.fn_params = std::move(params);
    d.fn_ret = ret;
    return make(std::move(d));
}

TypeId TypeStore::array(TypeId elem) const {
    return make(TypeData{.kind = TypeKind::Array, .elem = elem});
}

static bool vec_equal(const TypeStore& ts, const std::vector<TypeId>& a,
                      const std::vector<TypeId>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (!ts.equal(a[i], b[i])) return false;
    }
    return true;
}

bool TypeStore::equal(TypeId a, TypeId b) const {
    if (a == b) return true;
    const TypeData& ta = get(a);
    const TypeData& tb = get(b);
    if (ta.kind != tb.kind) return false;

    switch (ta.kind) {
        case TypeKind::Unit:
        case TypeKind::Bool:
        case TypeKind::Int:
        case TypeKind::Float:
        case TypeKind::String:
            return true;
        case TypeKind::Tuple:
            return vec_equal(*this, ta.tuple_elems, tb.tuple_elems);
        case TypeKind::Fn:
            return vec_equal(*this, ta.fn_params, tb.fn_params) &&
                   equal(ta.fn_ret, tb.fn_ret);
        case TypeKind::Array:
            return equal(ta.elem, tb.elem);
    }
    return false;
}

std::uint32_t TypeStore::nesting_depth(TypeId t) const {
    const TypeData& d = get(t);
    std::uint32_t inner = 0;
    switch (d.kind) {
        case TypeKind::Unit:
        case TypeKind::Bool:
        case TypeKind::Int:
        case TypeKind::Float:
        case TypeKind::String:
            return 1;
        case TypeKind::Tuple:
            for (TypeId e : d.tuple_elems)
                inner = std::max(inner, nesting_depth(e));
            return inner + 1;
        case TypeKind::Fn:
            for (TypeId p : d.fn_params)
                inner = std::max(inner, nesting_depth(p));
            return std::max(inner, nesting_depth(d.fn_ret)) + 1;
        case TypeKind::Array:
            return nesting_depth(d.elem) + 1;
    }
    return 1;
}

std::string TypeStore::to_string(TypeId t) const {
    const TypeData& d = get(t);
    switch (d.kind) {
        case TypeKind::Unit:
            return "unit";
        case TypeKind::Bool:
            return "bool";
        case TypeKind::Int:
            return "int";
        case TypeKind::Float:
            return "float";
        case TypeKind::String:
            return "string";
        case TypeKind::Tuple: {
            std::ostringstream out;
            out << "(";
            for (size_t i = 0; i < d.tuple_elems.size(); i++) {
                if (i) out << " * ";
                out << to_string(d.tuple_elems[i]);
            }
            out << ")";
            return out.str();
        }
        case TypeKind::Fn: {
            std::ostringstream out;
            out << "(";
            for (size_t i = 0; i < d.fn_params.size(); i++) {
                if (i) out << ", ";
                out << to_string(d.fn_params[i]);
            }
            out << ") -> " << to_string(d.fn_ret);
            return out.str();
        }
        case TypeKind::Array:
            return to_string(d.elem) + " array";
    }
    return "<type>";
}

}  // namespace mlc
