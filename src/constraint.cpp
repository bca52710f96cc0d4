#include "pmatch/constraint.hpp"
#include <stdexcept>

namespace pmatch {

FieldConstraint FieldConstraint::of_type(std::string name){
    if(name.empty()) throw std::invalid_argument("FieldConstraint::of_type: empty type name");
    FieldConstraint c; c.kind_=Kind::Type; c.description_=std::move(name); return c;
}

FieldConstraint FieldConstraint::predicate(std::string description, predicate_fn fn){
    if(!fn) throw std::invalid_argument("FieldConstraint::predicate: empty predicate");
    FieldConstraint c; c.kind_=Kind::Predicate; c.description_=std::move(description); c.fn_=std::move(fn); return c;
}

static bool accepts_type(const std::string& name, const value& v){
    if(name=="numeric") return is_number(v);
    if(name=="integer") return std::holds_alternative<int64_t>(v.data);
    if(name=="double") return std::holds_alternative<double>(v.data);
    if(name=="character" || name=="string") return std::holds_alternative<std::string>(v.data);
    if(name=="logical" || name=="bool") return std::holds_alternative<bool>(v.data);
    auto* t = as_tagged(v);
    return t && t->type_name==name;
}

bool FieldConstraint::accepts(const value& v) const {
    switch(kind_){
        case Kind::Any: return true;
        case Kind::Type: return accepts_type(description_, v);
        case Kind::Predicate: return fn_(v);
    }
    return false;
}

} // namespace pmatch
