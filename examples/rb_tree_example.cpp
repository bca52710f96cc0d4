// Red-black tree insertion with Okasaki-style balancing by nested patterns.
#include <iostream>
#include "pmatch/pmatch.hpp"

using namespace pmatch;

static value_ptr node_of(const value_ptr& col, const value_ptr& l, const value_ptr& v, const value_ptr& r){
    return TypeRegistry::global().construct("T", col, l, v, r);
}

// All four red-red shapes rotate into the same result.
static value_ptr rotated(const Bindings& b){
    auto& reg = TypeRegistry::global();
    return node_of(reg.construct("R"),
                   node_of(reg.construct("B"), b.at("a"), b.at("x"), b.at("b")),
                   b.at("y"),
                   node_of(reg.construct("B"), b.at("c"), b.at("z"), b.at("d")));
}

static value_ptr balance(const value_ptr& tree){
    return dispatch<value_ptr>(tree, {
        { "T(B, T(R, a, x, T(R, b, y, c)), z, d)", rotated },
        { "T(B, T(R, T(R, a, x, b), y, c), z, d)", rotated },
        { "T(B, a, x, T(R, b, y, T(R, c, z, d)))", rotated },
        { "T(B, a, x, T(R, T(R, b, y, c), z, d))", rotated },
        { "otherwise", [&](const Bindings&){ return tree; } },
    });
}

static value_ptr insert_rec(const value_ptr& tree, int64_t x){
    auto& reg = TypeRegistry::global();
    return dispatch<value_ptr>(tree, {
        { "E", [&](const Bindings&){ return node_of(reg.construct("R"), reg.construct("E"), v_i64(x), reg.construct("E")); } },
        { "T(col, left, val, right)", [&](const Bindings& b){
            int64_t v = b.get<int64_t>("val");
            if(x < v) return balance(node_of(b.at("col"), insert_rec(b.at("left"), x), b.at("val"), b.at("right")));
            if(x > v) return balance(node_of(b.at("col"), b.at("left"), b.at("val"), insert_rec(b.at("right"), x)));
            return tree;
        } },
    });
}

// The root is always recoloured black by reconstruction.
static value_ptr insert(const value_ptr& tree, int64_t x){
    auto grown = insert_rec(tree, x);
    const auto& t = *as_tagged(*grown);
    return node_of(TypeRegistry::global().construct("B"), t.fields[1], t.fields[2], t.fields[3]);
}

static bool member(const value_ptr& tree, int64_t x){
    return dispatch<bool>(tree, {
        { "E", [](const Bindings&){ return false; } },
        { "T(_, left, val, right)", [x](const Bindings& b){
            int64_t v = b.get<int64_t>("val");
            if(x < v) return member(b.at("left"), x);
            if(x > v) return member(b.at("right"), x);
            return true;
        } },
    });
}

int main(){
    try {
        auto& reg = TypeRegistry::global();
        reg.declare("colour := R | B");
        reg.declare("rb_tree := E | T(col : colour, left : rb_tree, value, right : rb_tree)");
        value_ptr tree = reg.construct("E");
        for(int64_t i=1;i<=7;++i) tree = insert(tree, i);
        std::cout << to_string(tree) << "\n";
        for(int64_t i=0;i<=8;++i) std::cout << i << " : " << (member(tree, i) ? "TRUE" : "FALSE") << "\n";
    } catch(const pmatch_error& e){
        std::cerr << "error[" << e.code << "]: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
