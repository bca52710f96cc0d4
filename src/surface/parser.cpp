#include "pmatch/surface.hpp"
#include "prelude.hpp"
#include "grammar.hpp"
#include "actions.hpp"
#include <tao/pegtl.hpp>

namespace pmatch {
using namespace pmatch::surface_front;

static SurfaceResult failure(const tao::pegtl::parse_error& e){
    SurfaceResult r; r.success=false; r.error_message = e.what();
    if(!e.positions().empty()){
        const auto& p = e.positions().front();
        r.line = static_cast<int>(p.line); r.column = static_cast<int>(p.column);
    }
    return r;
}

static node_ptr lower_declaration(const decl_state& st){
    vector_t variants;
    for(auto& v : st.variants){
        vector_t fields;
        for(auto& f : v.fields){
            if(f.type.empty()) fields << n_sym(f.name);
            else fields << node_list({ n_sym("field"), n_kw("name"), n_sym(f.name), n_kw("type"), n_sym(f.type) });
        }
        list vl; vl << n_sym("variant") << n_kw("name") << n_sym(v.name);
        if(!v.fields.empty()) vl << n_kw("fields") << std::make_shared<node>(node{ std::move(fields), {} });
        variants << std::make_shared<node>(node{ std::move(vl), {} });
    }
    return node_list({ n_sym("sum"), n_kw("name"), n_sym(st.type_name), n_kw("variants"),
                       std::make_shared<node>(node{ std::move(variants), {} }) });
}

SurfaceResult SurfaceParser::parse_declaration(std::string_view src, std::string_view source) const {
    tao::pegtl::memory_input in(src.data(), src.size(), std::string(source));
    decl_state st;
    try {
        tao::pegtl::parse< grammar::declaration_rule, actions::decl_action >(in, st);
    } catch (const tao::pegtl::parse_error& e) {
        return failure(e);
    }
    SurfaceResult r; r.success=true; r.form = lower_declaration(st); return r;
}

SurfaceResult SurfaceParser::parse_expression(std::string_view src, std::string_view source) const {
    tao::pegtl::memory_input in(src.data(), src.size(), std::string(source));
    expr_state st;
    try {
        tao::pegtl::parse< grammar::expression_rule, actions::expr_action >(in, st);
    } catch (const tao::pegtl::parse_error& e) {
        return failure(e);
    }
    SurfaceResult r; r.success=true; r.form = st.frames.front().elems.front(); return r;
}

node_ptr read_expression(std::string_view src){
    auto first = src.find_first_not_of(" \t\r\n");
    if(first != std::string_view::npos && src[first]=='(') return parse(src);
    SurfaceParser parser;
    auto r = parser.parse_expression(src);
    if(!r.success) throw parse_error(r.error_message);
    return r.form;
}

} // namespace pmatch
