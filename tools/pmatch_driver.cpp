#include <iostream>
#include <fstream>
#include <sstream>
#include <vector>
#include "pmatch/pmatch.hpp"

using namespace pmatch;

static std::string read_file(const std::string& path){ std::ifstream ifs(path); std::stringstream ss; ss<<ifs.rdbuf(); return ss.str(); }

static bool has_head(const node_ptr& n, const char* head){
    auto* l = n ? as_list(*n) : nullptr;
    if(!l || l->elems.empty()) return false;
    auto* s = as_symbol(*l->elems[0]);
    return s && s->name==head;
}

// A string holds surface syntax, anything else is an EDN form.
static node_ptr expression_of(const node_ptr& n){
    if(n && std::holds_alternative<std::string>(n->data)) return read_expression(std::get<std::string>(n->data));
    return n;
}

static value_ptr subject_of(const TypeRegistry& reg, const node_ptr& n){
    if(auto* v = n ? as_vector(*n) : nullptr){
        std::vector<value_ptr> subjects;
        for(auto& e : v->elems) subjects.push_back(build_value(reg, expression_of(e)));
        return zip_subject_list(std::move(subjects));
    }
    return build_value(reg, expression_of(n));
}

static void print_error(const pmatch_error& e){
    std::cerr << "error[" << e.code << "]: " << e.what() << "\n";
    if(detect_env().diagJson) std::cerr << error_to_json(e) << "\n";
}

// (match <value> :cases [ <pattern>* ])
static bool run_match(const TypeRegistry& reg, const node_ptr& form, size_t index){
    const auto& elems = std::get<list>(form->data).elems;
    if(elems.size()<2){ std::cerr << "match " << index << ": missing subject\n"; return false; }
    value_ptr subject = subject_of(reg, elems[1]);
    std::vector<node_ptr> cases;
    for(size_t j=2;j+1<elems.size(); j+=2){
        if(!is_keyword(*elems[j]) || std::get<keyword>(elems[j]->data).name!="cases") continue;
        auto* v = as_vector(*elems[j+1]);
        if(!v){ std::cerr << "match " << index << ": :cases must be a vector\n"; return false; }
        for(auto& c : v->elems) cases.push_back(expression_of(c));
    }
    auto compiled = PatternCompiler(reg).compile_clauses(cases);
    MatchResult r = match_one(subject, compiled);
    std::cout << "match " << index << ": " << to_string(subject) << " -> clause " << r.clause_index
              << " " << to_string(compiled.patterns[r.clause_index]) << " {";
    bool first=true;
    for(auto& kv : r.bindings){ std::cout << (first?"":", ") << kv.first << "=" << to_string(kv.second); first=false; }
    std::cout << "}\n";
    return true;
}

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: pmatch_driver <edn-file>\n"; return 1; }
    std::string src = read_file(argv[1]); if(src.empty()){ std::cerr << "failed to read file\n"; return 1; }
    node_ptr module;
    try { module = parse(src); }
    catch(const parse_error& e){ std::cerr << "parse error: " << e.what() << "\n"; return 1; }
    if(!has_head(module, "module")){ std::cerr << "expected (module ...)\n"; return 1; }

    TypeRegistry reg;
    int failures = 0; size_t matches = 0;
    const auto& items = std::get<list>(module->data).elems;
    for(size_t i=1;i<items.size(); ++i){
        const node_ptr& item = items[i];
        try {
            if(has_head(item, "sum")) reg.define(item);
            else if(has_head(item, "declare")){
                auto& l = std::get<list>(item->data).elems;
                if(l.size()!=2 || !std::holds_alternative<std::string>(l[1]->data)){ std::cerr << "expected (declare \"T := ...\")\n"; ++failures; continue; }
                reg.declare(std::get<std::string>(l[1]->data));
            }
            else if(has_head(item, "match")){ if(!run_match(reg, item, matches++)) ++failures; }
            else { std::cerr << "skipping unknown form: " << to_string(item) << "\n"; }
        } catch(const pmatch_error& e){ print_error(e); ++failures; }
        catch(const parse_error& e){ std::cerr << "parse error: " << e.what() << "\n"; ++failures; }
    }
    return failures ? 2 : 0;
}
