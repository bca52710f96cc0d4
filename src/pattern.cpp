#include "pmatch/pattern.hpp"

namespace pmatch {

static pattern_ptr make(pattern p){ return std::make_shared<const pattern>(std::move(p)); }

pattern_ptr p_wildcard(){ pattern p; p.kind=PatternKind::Wildcard; return make(std::move(p)); }
pattern_ptr p_catchall(){ pattern p; p.kind=PatternKind::Catchall; return make(std::move(p)); }
pattern_ptr p_bind(std::string name){ pattern p; p.kind=PatternKind::Bind; p.name=std::move(name); return make(std::move(p)); }
pattern_ptr p_literal(value_ptr v){ pattern p; p.kind=PatternKind::Literal; p.literal=std::move(v); return make(std::move(p)); }
pattern_ptr p_tuple(std::vector<pattern_ptr> subpatterns){ pattern p; p.kind=PatternKind::Tuple; p.subpatterns=std::move(subpatterns); return make(std::move(p)); }

pattern_ptr p_ctor(std::string variant, std::vector<pattern_ptr> subpatterns, std::string type_name){
    pattern p; p.kind=PatternKind::Constructor;
    p.name=std::move(variant); p.type_name=std::move(type_name); p.subpatterns=std::move(subpatterns);
    return make(std::move(p));
}

static std::string join(const std::string& head, const std::vector<pattern_ptr>& subs){
    std::string out = head + "(";
    for(size_t i=0;i<subs.size(); ++i){ if(i) out += ", "; out += to_string(subs[i]); }
    return out + ")";
}

std::string to_string(const pattern& p){
    switch(p.kind){
        case PatternKind::Wildcard: return wildcard_token;
        case PatternKind::Catchall: return catchall_token;
        case PatternKind::Bind: return p.name;
        case PatternKind::Literal: return to_string(p.literal);
        case PatternKind::Constructor: return p.subpatterns.empty() ? p.name : join(p.name, p.subpatterns);
        case PatternKind::Tuple: return join(tuple_token, p.subpatterns);
    }
    return "<pattern>";
}

} // namespace pmatch
