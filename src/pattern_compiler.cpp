#include "pmatch/pattern.hpp"
#include "pmatch/constructor.hpp"
#include "pmatch/diagnostics_json.hpp"
#include "pmatch/env.hpp"
#include "pmatch/surface.hpp"

namespace pmatch {

namespace {

struct compile_ctx {
    const TypeRegistry& reg;

    pattern_ptr positioned(pattern_ptr p, const node& n) const {
        auto copy = std::make_shared<pattern>(*p);
        copy->line = line(n); copy->col = col(n);
        return copy;
    }

    pattern_ptr symbol_pattern(const symbol& s, const node& n) const {
        if(s.name==wildcard_token) return positioned(p_wildcard(), n);
        if(s.name==catchall_token) return positioned(p_catchall(), n);
        if(s.name==tuple_token) throw pattern_error("'..' is not a binder; use (.. p ...) for a tuple pattern", line(n), col(n));
        auto def = reg.lookup_variant(s.name);
        if(def && def->nullary()) return positioned(p_ctor(s.name, {}, def->type_name), n);
        return positioned(p_bind(s.name), n);
    }

    pattern_ptr application(const list& l, const node& n) const {
        if(l.elems.empty()) throw pattern_error("empty list is not a pattern", line(n), col(n));
        auto* head = as_symbol(*l.elems[0]);
        if(!head) throw pattern_error("pattern application needs a variant name head: " + to_string(n), line(n), col(n));
        std::vector<pattern_ptr> subs;
        for(size_t i=1;i<l.elems.size(); ++i) subs.push_back(compile(l.elems[i]));
        if(head->name==tuple_token){
            if(subs.empty()) throw pattern_error("tuple pattern needs at least one element", line(n), col(n));
            return positioned(p_tuple(std::move(subs)), n);
        }
        auto def = reg.lookup_variant(head->name);
        if(!def) throw unknown_variant_error(head->name, suggest_names(head->name, reg.variant_names()));
        // Arity is checked against the subject at match time.
        return positioned(p_ctor(head->name, std::move(subs), def->type_name), n);
    }

    pattern_ptr compile(const node_ptr& expr) const {
        if(!expr) throw pattern_error("null pattern expression");
        const node& n = *expr;
        if(auto* s = as_symbol(n)) return symbol_pattern(*s, n);
        if(auto* l = as_list(n)) return application(*l, n);
        if(auto v = literal_value(n)) return positioned(p_literal(std::move(v)), n);
        throw pattern_error("unsupported pattern form: " + to_string(n), line(n), col(n));
    }
};

} // namespace

pattern_ptr PatternCompiler::compile(const node_ptr& expr) const {
    return compile_ctx{reg_}.compile(expr);
}

pattern_ptr PatternCompiler::compile(std::string_view src) const {
    return compile(read_expression(src));
}

CompiledClauses PatternCompiler::compile_clauses(const std::vector<PatternSource>& sources) const {
    CompiledClauses out;
    out.generation = reg_.generation();
    out.trace = detect_env().trace;
    compile_ctx ctx{reg_};
    size_t catchall_at = sources.size();
    for(size_t i=0;i<sources.size(); ++i){
        const auto& src = sources[i];
        if(catchall_at < i){
            MatchWarning w;
            w.code = "W2100";
            w.message = "unreachable clause after catch-all (clause " + std::to_string(catchall_at) + ")";
            w.hint = "move '" + std::string(catchall_token) + "' to the last clause";
            w.clause_index = i;
            if(src.expr){ w.line = line(*src.expr); w.col = col(*src.expr); }
            out.warnings.push_back(std::move(w));
            continue;
        }
        pattern_ptr p = src.tree ? src.tree : ctx.compile(src.expr);
        if(p->kind==PatternKind::Catchall) catchall_at = i;
        out.patterns.push_back(std::move(p));
    }
    report_warnings(out.warnings);
    return out;
}

CompiledClauses PatternCompiler::compile_clauses(const std::vector<node_ptr>& exprs) const {
    std::vector<PatternSource> sources;
    sources.reserve(exprs.size());
    for(auto& e : exprs) sources.push_back(PatternSource{e, nullptr});
    return compile_clauses(sources);
}

} // namespace pmatch
