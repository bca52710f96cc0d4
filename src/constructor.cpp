#include "pmatch/constructor.hpp"
#include "pmatch/errors.hpp"
#include "pmatch/surface.hpp"
#include <stdexcept>
#include <variant>

namespace pmatch {

VariantConstructor::VariantConstructor(std::shared_ptr<const VariantDef> def) : def_(std::move(def)) {
    if(!def_) throw std::invalid_argument("VariantConstructor: null variant definition");
}

value_ptr VariantConstructor::call(std::vector<value_ptr> args) const {
    const auto& fields = def_->fields;
    if(args.size() != fields.size()) throw arity_mismatch_error(def_->name, fields.size(), args.size());
    for(size_t i=0;i<args.size(); ++i){
        if(!args[i]) throw std::invalid_argument("VariantConstructor: null argument " + std::to_string(i) + " for " + def_->name);
        if(!fields[i].constraint.accepts(*args[i]))
            throw field_type_error(def_->name, i, fields[i].name, fields[i].constraint.description(), to_string(args[i]) + " : " + kind_name(*args[i]));
    }
    return detail::make_value(tagged_value{def_->type_name, def_->name, std::move(args)});
}

namespace {
// Leaf nodes become values; symbols and collections yield nullptr.
struct leaf_visitor {
    value_ptr operator()(std::monostate) const { return v_nil(); }
    value_ptr operator()(bool b) const { return v_bool(b); }
    value_ptr operator()(int64_t i) const { return v_i64(i); }
    value_ptr operator()(double d) const { return v_f64(d); }
    value_ptr operator()(const std::string& s) const { return v_str(s); }
    template<typename T> value_ptr operator()(const T&) const { return nullptr; }
};
} // namespace

value_ptr literal_value(const node& n){
    return std::visit(leaf_visitor{}, n.data);
}

value_ptr build_value(const TypeRegistry& reg, const node_ptr& form){
    if(!form) throw std::invalid_argument("build_value: null form");
    if(auto v = literal_value(*form)) return v;
    if(auto* s = as_symbol(*form)) return reg.constructor(s->name).call({});
    if(auto* l = as_list(*form)){
        if(l->elems.empty() || !as_symbol(*l->elems[0]))
            throw pattern_error("value expression must be (VARIANT arg...): " + to_string(form), line(*form), col(*form));
        auto ctor = reg.constructor(as_symbol(*l->elems[0])->name);
        std::vector<value_ptr> args;
        for(size_t i=1;i<l->elems.size(); ++i) args.push_back(build_value(reg, l->elems[i]));
        return ctor.call(std::move(args));
    }
    throw pattern_error("unsupported value expression: " + to_string(form), line(*form), col(*form));
}

value_ptr build_value(const TypeRegistry& reg, std::string_view src){
    return build_value(reg, read_expression(src));
}

} // namespace pmatch
