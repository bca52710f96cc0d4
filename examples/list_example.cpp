// Linked lists: length, reverse and conversion to and from std::vector.
#include <iostream>
#include <vector>
#include "pmatch/pmatch.hpp"

using namespace pmatch;

static int64_t list_length(const value_ptr& lst, int64_t acc = 0){
    static const ClauseList<int64_t> cases{
        { "NIL", [](const Bindings&){ return int64_t{0}; } },
        { "CONS(_, cdr)", [](const Bindings& b){ return 1 + list_length(b.at("cdr")); } },
    };
    return acc + dispatch(lst, cases);
}

static value_ptr reverse_list(const value_ptr& lst, value_ptr acc){
    auto& reg = TypeRegistry::global();
    return dispatch<value_ptr>(lst, {
        { "NIL", [&](const Bindings&){ return acc; } },
        { "CONS(car, cdr)", [&](const Bindings& b){ return reverse_list(b.at("cdr"), reg.construct("CONS", b.at("car"), acc)); } },
    });
}

static value_ptr vector_to_list(const std::vector<int64_t>& xs){
    auto& reg = TypeRegistry::global();
    value_ptr lst = reg.construct("NIL");
    for(auto it = xs.rbegin(); it != xs.rend(); ++it) lst = reg.construct("CONS", *it, lst);
    return lst;
}

static void list_to_vector(const value_ptr& lst, std::vector<int64_t>& out){
    static const ClauseList<bool> cases{
        { "NIL", [](const Bindings&){ return false; } },
        { "CONS(car, cdr)", [](const Bindings&){ return true; } },
    };
    value_ptr cur = lst;
    // Iterative walk; the handler only reports which shape was seen.
    while(dispatch(cur, cases)){
        const auto& t = *as_tagged(*cur);
        out.push_back(std::get<int64_t>(t.fields[0]->data));
        cur = t.fields[1];
    }
}

int main(){
    try {
        TypeRegistry::global().declare("linked_list := NIL | CONS(car, cdr : linked_list)");
        auto lst = vector_to_list({1, 2, 3, 4, 5});
        std::cout << to_string(lst) << " length " << list_length(lst) << "\n";
        auto rev = reverse_list(lst, TypeRegistry::global().construct("NIL"));
        std::vector<int64_t> xs; list_to_vector(rev, xs);
        std::cout << "reversed:";
        for(auto x : xs) std::cout << " " << x;
        std::cout << "\n";
    } catch(const pmatch_error& e){
        std::cerr << "error[" << e.code << "]: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
