#include "pmatch/matcher.hpp"
#include <iostream>

namespace pmatch {

static bool match_fields(const std::vector<pattern_ptr>& subs, const std::vector<value_ptr>& fields, Bindings& out){
    for(size_t i=0;i<subs.size(); ++i){
        if(!match_pattern(*subs[i], fields[i], out)) return false;
    }
    return true;
}

bool match_pattern(const pattern& p, const value_ptr& subject, Bindings& out){
    if(!subject) throw std::invalid_argument("match_pattern: null subject");
    switch(p.kind){
        case PatternKind::Wildcard:
        case PatternKind::Catchall:
            return true;
        case PatternKind::Bind:
            out.bind(p.name, subject);
            return true;
        case PatternKind::Literal:
            return equal(p.literal, subject);
        case PatternKind::Constructor: {
            auto* t = as_tagged(*subject);
            if(!t || t->variant != p.name) return false;
            if(t->fields.size() != p.subpatterns.size()) throw arity_mismatch_error(p.name, t->fields.size(), p.subpatterns.size());
            return match_fields(p.subpatterns, t->fields, out);
        }
        case PatternKind::Tuple: {
            auto* t = as_tuple(*subject);
            if(!t) return false;
            if(t->elems.size() != p.subpatterns.size()) throw arity_mismatch_error(tuple_token, t->elems.size(), p.subpatterns.size());
            return match_fields(p.subpatterns, t->elems, out);
        }
    }
    return false;
}

MatchResult match_one(const value_ptr& subject, const std::vector<pattern_ptr>& patterns, bool trace){
    if(!subject) throw std::invalid_argument("match_one: null subject");
    for(size_t i=0;i<patterns.size(); ++i){
        MatchResult r;
        r.clause_index = i;
        bool ok = match_pattern(*patterns[i], subject, r.bindings);
        if(trace) std::cerr << "[pmatch][trace] clause " << i << " " << to_string(patterns[i]) << " vs " << to_string(subject) << (ok ? ": matched" : ": rejected") << "\n";
        if(ok) return r;
    }
    throw no_match_error(describe_tag(*subject), to_string(subject));
}

} // namespace pmatch
