#pragma once
#include "prelude.hpp"
#include "grammar.hpp"
#include <tao/pegtl.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace pmatch::surface_front::actions {
using tao::pegtl::nothing;

// --- expression lowering ---

template<typename Rule>
struct expr_action : nothing<Rule> {};

template<typename Input>
inline void push_pos(expr_state& st, node_ptr n, const Input& in){
    auto p = in.position();
    set_pos(*n, static_cast<int>(p.line), static_cast<int>(p.column));
    st.push(std::move(n));
}

template<> struct expr_action< grammar::call_head > {
    template<typename Input>
    static void apply(const Input& in, expr_state& st){
        auto p = in.position();
        st.frames.push_back(expr_state::frame{ n_sym(in.string()), {}, static_cast<int>(p.line), static_cast<int>(p.column) });
    }
};
template<> struct expr_action< grammar::tuple_head > {
    template<typename Input>
    static void apply(const Input& in, expr_state& st){
        auto p = in.position();
        st.frames.push_back(expr_state::frame{ n_sym(".."), {}, static_cast<int>(p.line), static_cast<int>(p.column) });
    }
};
template<> struct expr_action< grammar::call_close > {
    template<typename Input>
    static void apply(const Input&, expr_state& st){
        auto f = std::move(st.frames.back());
        st.frames.pop_back();
        list l; l.elems.push_back(f.head);
        for(auto& e : f.elems) l.elems.push_back(std::move(e));
        auto n = std::make_shared<node>(node{ std::move(l), {} });
        set_pos(*n, f.line, f.col);
        st.push(std::move(n));
    }
};
template<> struct expr_action< grammar::name_ref > {
    template<typename Input>
    static void apply(const Input& in, expr_state& st){ push_pos(st, n_sym(in.string()), in); }
};
template<> struct expr_action< grammar::number > {
    template<typename Input>
    static void apply(const Input& in, expr_state& st){
        auto s = in.string();
        node_ptr n;
        try {
            if(s.find_first_of(".eE") != std::string::npos) n = n_f64(std::stod(s));
            else n = n_i64(static_cast<int64_t>(std::stoll(s)));
        } catch (const std::logic_error&) {
            throw tao::pegtl::parse_error("number out of range: " + s, in);
        }
        push_pos(st, std::move(n), in);
    }
};
template<> struct expr_action< grammar::string_lit > {
    template<typename Input>
    static void apply(const Input& in, expr_state& st){ push_pos(st, n_str(unquote(in.string())), in); }
};
template<> struct expr_action< grammar::kw_true > {
    template<typename Input>
    static void apply(const Input& in, expr_state& st){ push_pos(st, n_bool(true), in); }
};
template<> struct expr_action< grammar::kw_false > {
    template<typename Input>
    static void apply(const Input& in, expr_state& st){ push_pos(st, n_bool(false), in); }
};
template<> struct expr_action< grammar::kw_null > {
    template<typename Input>
    static void apply(const Input& in, expr_state& st){ push_pos(st, n_nil(), in); }
};

// --- declaration lowering ---

template<typename Rule>
struct decl_action : nothing<Rule> {};

template<> struct decl_action< grammar::decl_type_name > {
    template<typename Input>
    static void apply(const Input& in, decl_state& st){ st.type_name = in.string(); }
};
template<> struct decl_action< grammar::variant_name > {
    template<typename Input>
    static void apply(const Input& in, decl_state& st){ st.variants.push_back(decl_state::variant{ in.string(), {} }); }
};
template<> struct decl_action< grammar::field_name > {
    template<typename Input>
    static void apply(const Input& in, decl_state& st){ st.variants.back().fields.push_back(decl_state::field{ in.string(), {} }); }
};
template<> struct decl_action< grammar::field_type > {
    template<typename Input>
    static void apply(const Input& in, decl_state& st){ st.variants.back().fields.back().type = in.string(); }
};

} // namespace pmatch::surface_front::actions
