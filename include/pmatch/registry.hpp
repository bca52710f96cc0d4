// Process-wide table of algebraic data types and their variants.
#pragma once
#include "pmatch/constraint.hpp"
#include "pmatch/edn.hpp"
#include "pmatch/value.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pmatch {

class VariantConstructor;

struct FieldSpec {
    std::string name;
    FieldConstraint constraint;
};

struct VariantSpec {
    std::string name;
    std::vector<FieldSpec> fields;
};

// Immutable once registered; shared by the registry snapshot and any constructor handed out.
struct VariantDef {
    std::string type_name;
    std::string name;
    std::vector<FieldSpec> fields;
    size_t arity() const { return fields.size(); }
    bool nullary() const { return fields.empty(); }
};

struct SumDef {
    std::string name;
    std::vector<std::shared_ptr<const VariantDef>> variants; // declaration order
};

class TypeRegistry {
public:
    TypeRegistry();
    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

    static TypeRegistry& global();

    // Installs (or replaces) type_name; validation happens before anything is published.
    void define(const std::string& type_name, std::vector<VariantSpec> variants);
    // (sum :name T :variants [ (variant :name A :fields [ x (field :name y :type numeric) ]) ])
    void define(const node_ptr& sum_form);
    // T := A | B(x : numeric, y)
    void declare(std::string_view surface_src);

    // nullptr when the variant is not registered.
    std::shared_ptr<const VariantDef> lookup_variant(const std::string& variant) const;
    std::shared_ptr<const SumDef> lookup_type(const std::string& type_name) const;
    bool is_nullary(const std::string& name) const;
    std::vector<std::string> variant_names() const;
    // Bumped by every successful define; compiled clause caches key on it.
    uint64_t generation() const;

    // Throws unknown_variant_error.
    VariantConstructor constructor(const std::string& variant) const;
    value_ptr construct_values(const std::string& variant, std::vector<value_ptr> args) const;
    template<typename... Args>
    value_ptr construct(const std::string& variant, Args&&... args) const {
        return construct_values(variant, std::vector<value_ptr>{to_value(std::forward<Args>(args))...});
    }

private:
    struct table {
        std::unordered_map<std::string, std::shared_ptr<const SumDef>> types;
        std::unordered_map<std::string, std::shared_ptr<const VariantDef>> variants;
        uint64_t generation = 0;
    };
    std::shared_ptr<const table> snapshot() const { return std::atomic_load(&table_); }

    mutable std::mutex write_mutex_;
    std::shared_ptr<const table> table_;
};

// "did you mean" candidates within edit distance 2 (at most five).
std::vector<std::string> suggest_names(const std::string& target, const std::vector<std::string>& pool, int max_dist = 2);

} // namespace pmatch
