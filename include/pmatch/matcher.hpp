// First-match structural matcher over compiled clause lists.
#pragma once
#include "pmatch/edn.hpp"
#include "pmatch/errors.hpp"
#include "pmatch/pattern.hpp"
#include "pmatch/registry.hpp"
#include "pmatch/surface.hpp"
#include "pmatch/value.hpp"
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace pmatch {

// Binder name -> matched value for one match. A name bound twice keeps the later value.
class Bindings {
public:
    using map_type = std::map<std::string, value_ptr>;

    void bind(const std::string& name, value_ptr v){ vars_[name] = std::move(v); }
    bool contains(const std::string& name) const { return vars_.count(name) != 0; }
    // Throws std::out_of_range for an unbound name.
    const value_ptr& at(const std::string& name) const {
        auto it = vars_.find(name);
        if(it == vars_.end()) throw std::out_of_range("no binding named '" + name + "'");
        return it->second;
    }
    // int64 or double leaf as double.
    double number(const std::string& name) const { return as_number(*at(name)); }

    // value_ptr, bool, std::string, integral (from an int64 leaf) or floating (from any number).
    template<typename T>
    T get(const std::string& name) const {
        const value_ptr& v = at(name);
        if constexpr (std::is_same_v<T, value_ptr>) return v;
        else if constexpr (std::is_same_v<T, bool>) return std::get<bool>(v->data);
        else if constexpr (std::is_same_v<T, std::string>) return std::get<std::string>(v->data);
        else if constexpr (std::is_integral_v<T>) return static_cast<T>(std::get<int64_t>(v->data));
        else if constexpr (std::is_floating_point_v<T>) return static_cast<T>(as_number(*v));
        else static_assert(sizeof(T) == 0, "Bindings::get: unsupported type");
    }

    size_t size() const { return vars_.size(); }
    bool empty() const { return vars_.empty(); }
    map_type::const_iterator begin() const { return vars_.begin(); }
    map_type::const_iterator end() const { return vars_.end(); }

private:
    map_type vars_;
};

struct MatchResult {
    Bindings bindings;
    size_t clause_index = 0;
};

// Structural match of one pattern; bindings are written as sub-patterns succeed,
// so the caller discards `out` on failure. Throws arity_mismatch_error when a
// constructor (or tuple) pattern agrees on the tag but not the field count.
bool match_pattern(const pattern& p, const value_ptr& subject, Bindings& out);

// First clause whose pattern matches wins; throws no_match_error otherwise.
// With `trace` set each attempt is logged to stderr.
MatchResult match_one(const value_ptr& subject, const std::vector<pattern_ptr>& patterns, bool trace = false);
inline MatchResult match_one(const value_ptr& subject, const CompiledClauses& cc){ return match_one(subject, cc.patterns, cc.trace); }

template<typename R>
struct Clause {
    using handler_type = std::function<R(const Bindings&)>;

    PatternSource source;
    handler_type handler;

    Clause(const char* expr, handler_type h) : Clause(read_expression(expr), std::move(h)) {}
    Clause(const std::string& expr, handler_type h) : Clause(read_expression(expr), std::move(h)) {}
    Clause(node_ptr expr, handler_type h) : source{std::move(expr), nullptr}, handler(std::move(h)) { check(); }
    Clause(pattern_ptr tree, handler_type h) : source{nullptr, std::move(tree)}, handler(std::move(h)) { check(); }

private:
    void check() const {
        if(!source.expr && !source.tree) throw std::invalid_argument("clause without a pattern");
        if(!handler) throw std::invalid_argument("clause without a handler");
    }
};

// Clause list that compiles its patterns once and reuses them until the registry changes.
template<typename R>
class ClauseList {
public:
    explicit ClauseList(std::initializer_list<Clause<R>> clauses, const TypeRegistry& reg = TypeRegistry::global())
        : clauses_(clauses), reg_(reg) {}
    explicit ClauseList(std::vector<Clause<R>> clauses, const TypeRegistry& reg = TypeRegistry::global())
        : clauses_(std::move(clauses)), reg_(reg) {}
    ClauseList(const ClauseList&) = delete;
    ClauseList& operator=(const ClauseList&) = delete;

    std::shared_ptr<const CompiledClauses> compiled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if(!cache_ || cache_->generation != reg_.generation()){
            std::vector<PatternSource> sources;
            sources.reserve(clauses_.size());
            for(auto& c : clauses_) sources.push_back(c.source);
            cache_ = std::make_shared<const CompiledClauses>(PatternCompiler(reg_).compile_clauses(sources));
        }
        return cache_;
    }

    const Clause<R>& clause(size_t i) const { return clauses_.at(i); }
    size_t size() const { return clauses_.size(); }
    const TypeRegistry& registry() const { return reg_; }

private:
    std::vector<Clause<R>> clauses_;
    const TypeRegistry& reg_;
    mutable std::mutex mutex_;
    mutable std::shared_ptr<const CompiledClauses> cache_;
};

template<typename R>
R dispatch(const value_ptr& subject, const ClauseList<R>& clauses){
    auto compiled = clauses.compiled();
    MatchResult r = match_one(subject, *compiled);
    return clauses.clause(r.clause_index).handler(r.bindings);
}

// Uncached: compiles the clause list on every call.
template<typename R>
R dispatch(const value_ptr& subject, std::vector<Clause<R>> clauses, const TypeRegistry& reg = TypeRegistry::global()){
    ClauseList<R> cl(std::move(clauses), reg);
    return dispatch(subject, cl);
}

template<typename R>
R dispatch(const value_ptr& subject, std::initializer_list<Clause<R>> clauses, const TypeRegistry& reg = TypeRegistry::global()){
    ClauseList<R> cl(clauses, reg);
    return dispatch(subject, cl);
}

template<typename R>
R match(const value_ptr& subject, const ClauseList<R>& clauses){ return dispatch(subject, clauses); }

template<typename R>
R match(const value_ptr& subject, std::initializer_list<Clause<R>> clauses, const TypeRegistry& reg = TypeRegistry::global()){
    return dispatch<R>(subject, clauses, reg);
}

} // namespace pmatch
