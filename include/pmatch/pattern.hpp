// Pattern trees and the compiler that builds them from pattern expressions.
#pragma once
#include "pmatch/edn.hpp"
#include "pmatch/errors.hpp"
#include "pmatch/registry.hpp"
#include "pmatch/value.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pmatch {

enum class PatternKind { Wildcard, Bind, Literal, Constructor, Tuple, Catchall };

struct pattern;
using pattern_ptr = std::shared_ptr<const pattern>;

struct pattern {
    PatternKind kind = PatternKind::Wildcard;
    std::string name;       // Bind: binder; Constructor: variant tag
    std::string type_name;  // Constructor: owning type at compile time (informational; matching uses the tag)
    value_ptr literal;      // Literal
    std::vector<pattern_ptr> subpatterns; // Constructor, Tuple
    int line=-1, col=-1;
};

pattern_ptr p_wildcard();
pattern_ptr p_catchall();
pattern_ptr p_bind(std::string name);
pattern_ptr p_literal(value_ptr v);
pattern_ptr p_ctor(std::string variant, std::vector<pattern_ptr> subpatterns = {}, std::string type_name = {});
pattern_ptr p_tuple(std::vector<pattern_ptr> subpatterns);

// CONS(_, cdr), ..(a, b), otherwise, 42
std::string to_string(const pattern& p);
inline std::string to_string(const pattern_ptr& p) { return p ? to_string(*p) : std::string("<null>"); }

// Either an uncompiled expression or an already built tree.
struct PatternSource {
    node_ptr expr;
    pattern_ptr tree;
};

struct CompiledClauses {
    std::vector<pattern_ptr> patterns; // up to and including the first top-level catch-all
    std::vector<MatchWarning> warnings;
    uint64_t generation = 0;           // registry generation the trees were resolved against
    bool trace = false;                // PMATCH_TRACE as seen when compiled
};

// Reserved tokens in pattern expressions.
inline constexpr const char* wildcard_token = "_";
inline constexpr const char* catchall_token = "otherwise";
inline constexpr const char* tuple_token = "..";

class PatternCompiler {
public:
    explicit PatternCompiler(const TypeRegistry& reg = TypeRegistry::global()) : reg_(reg) {}

    // A bare name is a zero-field constructor when it names a registered nullary
    // variant and a binder otherwise. (N p...) requires N to be registered.
    pattern_ptr compile(const node_ptr& expr) const;
    pattern_ptr compile(std::string_view src) const;

    // Clauses after a top-level catch-all are left uncompiled and reported (W2100).
    CompiledClauses compile_clauses(const std::vector<PatternSource>& sources) const;
    CompiledClauses compile_clauses(const std::vector<node_ptr>& exprs) const;

private:
    const TypeRegistry& reg_;
};

} // namespace pmatch
