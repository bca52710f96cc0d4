#include "pmatch/registry.hpp"
#include "pmatch/constructor.hpp"
#include "pmatch/env.hpp"
#include "pmatch/errors.hpp"
#include "pmatch/surface.hpp"
#include <algorithm>
#include <unordered_set>

namespace pmatch {

TypeRegistry::TypeRegistry() : table_(std::make_shared<const table>()) {}

TypeRegistry& TypeRegistry::global(){
    static TypeRegistry instance;
    return instance;
}

void TypeRegistry::define(const std::string& type_name, std::vector<VariantSpec> variants){
    if(type_name.empty()) throw declaration_error("E2000", type_name, "type definition has an empty name");
    if(variants.empty()) throw declaration_error("E2001", type_name, "type '" + type_name + "' has no variants");
    std::unordered_set<std::string> vnames;
    for(auto& v : variants){
        if(v.name.empty()) throw declaration_error("E2002", type_name, "variant of '" + type_name + "' has an empty name");
        if(!vnames.insert(v.name).second) throw duplicate_variant_error(type_name, v.name);
        std::unordered_set<std::string> fnames;
        for(auto& f : v.fields){
            if(f.name.empty()) throw declaration_error("E2003", type_name, "field of '" + v.name + "' has an empty name");
            if(!fnames.insert(f.name).second) throw declaration_error("E2004", type_name, "duplicate field '" + f.name + "' in variant '" + v.name + "'");
        }
    }

    auto sum = std::make_shared<SumDef>();
    sum->name = type_name;
    for(auto& v : variants){
        auto def = std::make_shared<VariantDef>();
        def->type_name = type_name; def->name = std::move(v.name); def->fields = std::move(v.fields);
        sum->variants.push_back(std::move(def));
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    auto next = std::make_shared<table>(*snapshot());
    // Drop variants owned by the previous definition of this type.
    if(auto it = next->types.find(type_name); it != next->types.end()){
        for(auto& old : it->second->variants){
            auto vit = next->variants.find(old->name);
            if(vit != next->variants.end() && vit->second == old) next->variants.erase(vit);
        }
    }
    for(auto& def : sum->variants){
        // A variant name moving from another type leaves that type without it.
        if(auto vit = next->variants.find(def->name); vit != next->variants.end() && vit->second->type_name != type_name){
            auto owner = next->types.find(vit->second->type_name);
            if(owner != next->types.end()){
                auto trimmed = std::make_shared<SumDef>(*owner->second);
                trimmed->variants.erase(std::remove(trimmed->variants.begin(), trimmed->variants.end(), vit->second), trimmed->variants.end());
                owner->second = std::move(trimmed);
            }
        }
        next->variants[def->name] = def;
    }
    next->types[type_name] = std::move(sum);
    ++next->generation;
    std::atomic_store(&table_, std::shared_ptr<const table>(std::move(next)));
}

// --- EDN declaration form ---

static std::string sym_or_str(const node_ptr& n){
    if(!n) return {};
    if(auto* s = as_symbol(*n)) return s->name;
    if(std::holds_alternative<std::string>(n->data)) return std::get<std::string>(n->data);
    return {};
}

// Walk `:key value` pairs following the head symbol of a list form.
template<typename Fn>
static void each_keyword_arg(const std::vector<node_ptr>& l, Fn&& fn){
    for(size_t j=1;j<l.size(); ++j){
        if(!l[j]||!is_keyword(*l[j])) break;
        std::string kw=std::get<keyword>(l[j]->data).name;
        if(++j>=l.size()) break;
        fn(kw, l[j]);
    }
}

static bool has_head(const node_ptr& n, const char* head){
    if(!n) return false;
    auto* l = as_list(*n);
    if(!l || l->elems.empty()) return false;
    auto* s = as_symbol(*l->elems[0]);
    return s && s->name==head;
}

static FieldSpec parse_field(const std::string& type_name, const node_ptr& f){
    if(auto* s = f ? as_symbol(*f) : nullptr) return FieldSpec{s->name, FieldConstraint::any()};
    if(!has_head(f, "field"))
        throw declaration_error("E2003", type_name, "field malformed: use a symbol or (field :name x :type t)");
    FieldSpec spec; std::string type;
    each_keyword_arg(std::get<list>(f->data).elems, [&](const std::string& kw, const node_ptr& val){
        if(kw=="name") spec.name = sym_or_str(val);
        else if(kw=="type") type = sym_or_str(val);
    });
    if(spec.name.empty()) throw declaration_error("E2003", type_name, "field missing :name");
    spec.constraint = (type.empty() || type=="any") ? FieldConstraint::any() : FieldConstraint::of_type(type);
    return spec;
}

void TypeRegistry::define(const node_ptr& sum_form){
    if(!has_head(sum_form, "sum")) throw declaration_error("E2000", "", "expected (sum :name T :variants [ ... ])");
    std::string name; node_ptr variantsNode;
    each_keyword_arg(std::get<list>(sum_form->data).elems, [&](const std::string& kw, const node_ptr& val){
        if(kw=="name") name = sym_or_str(val);
        else if(kw=="variants") variantsNode = val;
    });
    if(name.empty()) throw declaration_error("E2000", "", "sum missing :name");
    if(!variantsNode || !is_vector(*variantsNode)) throw declaration_error("E2001", name, "sum missing :variants vector");

    std::vector<VariantSpec> specs;
    for(auto& vn : std::get<vector_t>(variantsNode->data).elems){
        if(!has_head(vn, "variant")) throw declaration_error("E2002", name, "variant malformed: use (variant :name A :fields [ ... ])");
        VariantSpec spec; node_ptr fieldsNode;
        each_keyword_arg(std::get<list>(vn->data).elems, [&](const std::string& kw, const node_ptr& val){
            if(kw=="name") spec.name = sym_or_str(val);
            else if(kw=="fields") fieldsNode = val;
        });
        if(spec.name.empty()) throw declaration_error("E2002", name, "variant missing :name");
        if(fieldsNode){
            if(!is_vector(*fieldsNode)) throw declaration_error("E2003", name, "variant :fields must be a vector");
            for(auto& f : std::get<vector_t>(fieldsNode->data).elems) spec.fields.push_back(parse_field(name, f));
        }
        specs.push_back(std::move(spec));
    }
    define(name, std::move(specs));
}

void TypeRegistry::declare(std::string_view surface_src){
    SurfaceParser parser;
    auto r = parser.parse_declaration(surface_src);
    if(!r.success) throw parse_error(r.error_message);
    define(r.form);
}

// --- lookups ---

std::shared_ptr<const VariantDef> TypeRegistry::lookup_variant(const std::string& variant) const {
    auto t = snapshot();
    auto it = t->variants.find(variant);
    return it == t->variants.end() ? nullptr : it->second;
}

std::shared_ptr<const SumDef> TypeRegistry::lookup_type(const std::string& type_name) const {
    auto t = snapshot();
    auto it = t->types.find(type_name);
    return it == t->types.end() ? nullptr : it->second;
}

bool TypeRegistry::is_nullary(const std::string& name) const {
    auto def = lookup_variant(name);
    return def && def->nullary();
}

std::vector<std::string> TypeRegistry::variant_names() const {
    auto t = snapshot();
    std::vector<std::string> out; out.reserve(t->variants.size());
    for(auto& kv : t->variants) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

uint64_t TypeRegistry::generation() const { return snapshot()->generation; }

VariantConstructor TypeRegistry::constructor(const std::string& variant) const {
    auto def = lookup_variant(variant);
    if(!def) throw unknown_variant_error(variant, suggest_names(variant, variant_names()));
    return VariantConstructor(std::move(def));
}

value_ptr TypeRegistry::construct_values(const std::string& variant, std::vector<value_ptr> args) const {
    return constructor(variant).call(std::move(args));
}

// --- suggestions ---

static int edit_distance(const std::string& a, const std::string& b){
    size_t n=a.size(), m=b.size();
    if(n>64||m>64){ // cap to avoid large allocs; simple fallback
        int dist=0; for(size_t i=0;i<std::min(n,m);++i) if(a[i]!=b[i]) ++dist; dist += (int)std::max(n,m)- (int)std::min(n,m); return dist; }
    int dp[65][65];
    for(size_t i=0;i<=n;++i) dp[i][0]=(int)i;
    for(size_t j=0;j<=m;++j) dp[0][j]=(int)j;
    for(size_t i=1;i<=n;++i){ for(size_t j=1;j<=m;++j){ int c = a[i-1]==b[j-1]?0:1; dp[i][j]=std::min({dp[i-1][j]+1, dp[i][j-1]+1, dp[i-1][j-1]+c}); } }
    return dp[n][m];
}

std::vector<std::string> suggest_names(const std::string& target, const std::vector<std::string>& pool, int max_dist){
    std::vector<std::string> out;
    if(!detect_env().suggest) return out;
    for(auto &c: pool){ if(c.empty() || c==target) continue; if(edit_distance(target,c)<=max_dist) out.push_back(c); }
    if(out.size()>5) out.resize(5);
    return out;
}

} // namespace pmatch
