// Unbalanced binary search tree: insert and member.
#include <iostream>
#include "pmatch/pmatch.hpp"

using namespace pmatch;

static bool member(const value_ptr& tree, int64_t x){
    return dispatch<bool>(tree, {
        { "E", [](const Bindings&){ return false; } },
        { "T(left, val, right)", [x](const Bindings& b){
            int64_t v = b.get<int64_t>("val");
            if(x < v) return member(b.at("left"), x);
            if(x > v) return member(b.at("right"), x);
            return true;
        } },
    });
}

static value_ptr insert(const value_ptr& tree, int64_t x){
    auto& reg = TypeRegistry::global();
    return dispatch<value_ptr>(tree, {
        { "E", [&](const Bindings&){ return reg.construct("T", reg.construct("E"), x, reg.construct("E")); } },
        { "T(left, val, right)", [&](const Bindings& b){
            int64_t v = b.get<int64_t>("val");
            if(x < v) return reg.construct("T", insert(b.at("left"), x), v, b.at("right"));
            if(x > v) return reg.construct("T", b.at("left"), v, insert(b.at("right"), x));
            return tree;
        } },
    });
}

int main(){
    try {
        auto& reg = TypeRegistry::global();
        reg.declare("search_tree := E | T(left : search_tree, value, right : search_tree)");
        value_ptr tree = reg.construct("E");
        for(int64_t i : {3, 2, 4}) tree = insert(tree, i);
        std::cout << to_string(tree) << "\n";
        for(int64_t i=1;i<=6;++i) std::cout << i << " : " << (member(tree, i) ? "TRUE" : "FALSE") << "\n";
    } catch(const pmatch_error& e){
        std::cerr << "error[" << e.code << "]: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
