// Validating constructor generated per registered variant.
#pragma once
#include "pmatch/edn.hpp"
#include "pmatch/registry.hpp"
#include "pmatch/value.hpp"
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace pmatch {

class VariantConstructor {
public:
    explicit VariantConstructor(std::shared_ptr<const VariantDef> def);

    // Arity first, then field constraints left to right; the first violation throws
    // and no value is produced.
    value_ptr call(std::vector<value_ptr> args) const;

    template<typename... Args>
    value_ptr operator()(Args&&... args) const {
        return call(std::vector<value_ptr>{to_value(std::forward<Args>(args))...});
    }

    const VariantDef& definition() const { return *def_; }
    const std::string& name() const { return def_->name; }
    size_t arity() const { return def_->arity(); }

private:
    std::shared_ptr<const VariantDef> def_;
};

// Value of a literal node (nil, true, 42, 1.5, "s"); nullptr for symbols and collections.
value_ptr literal_value(const node& n);

// Build a value from an expression form: literals, nullary variant symbols and
// (VARIANT arg...) applications, e.g. (CONS 1 (CONS 2 NIL)).
value_ptr build_value(const TypeRegistry& reg, const node_ptr& form);
// Same, from text: EDN when it starts with '(', surface syntax (CONS(1, NIL)) otherwise.
value_ptr build_value(const TypeRegistry& reg, std::string_view src);

} // namespace pmatch
