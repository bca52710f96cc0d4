// Error taxonomy for registration, construction, pattern compilation and matching.
#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pmatch {

// Base of every thrown pmatch diagnostic; `code` is stable (E2xxx).
struct pmatch_error : std::runtime_error {
    std::string code;
    pmatch_error(std::string c, const std::string& msg) : std::runtime_error(msg), code(std::move(c)) {}
};

// Malformed type declaration (E2000-E2004).
struct declaration_error : pmatch_error {
    std::string type_name;
    declaration_error(std::string c, std::string type, const std::string& msg)
        : pmatch_error(std::move(c), msg), type_name(std::move(type)) {}
};

struct duplicate_variant_error : pmatch_error {
    std::string type_name, variant;
    duplicate_variant_error(std::string type, std::string v)
        : pmatch_error("E2005", "duplicate variant '" + v + "' in definition of '" + type + "'"), type_name(std::move(type)), variant(std::move(v)) {}
};

struct unknown_variant_error : pmatch_error {
    std::string variant;
    std::vector<std::string> suggestions;
    unknown_variant_error(std::string v, std::vector<std::string> suggs)
        : pmatch_error("E2010", build_message(v, suggs)), variant(std::move(v)), suggestions(std::move(suggs)) {}
private:
    static std::string build_message(const std::string& v, const std::vector<std::string>& suggs){
        std::string msg = "unknown variant '" + v + "'";
        if(suggs.empty()) return msg;
        msg += "; did you mean ";
        for(size_t i=0;i<suggs.size();++i){ msg+=suggs[i]; if(i+1<suggs.size()) msg+= i+2==suggs.size()?" or ":", "; }
        return msg;
    }
};

// Pattern expression that is none of the recognised forms.
struct pattern_error : pmatch_error {
    int line=-1, col=-1;
    pattern_error(const std::string& msg, int l=-1, int c=-1) : pmatch_error("E2011", msg), line(l), col(c) {}
};

struct arity_mismatch_error : pmatch_error {
    std::string variant;
    size_t expected, actual;
    arity_mismatch_error(std::string v, size_t exp, size_t act)
        : pmatch_error("E2020", "arity mismatch for '" + v + "': expected " + std::to_string(exp) + " field(s), got " + std::to_string(act)),
          variant(std::move(v)), expected(exp), actual(act) {}
};

struct field_type_error : pmatch_error {
    std::string variant;
    size_t field_index;
    std::string expected; // constraint description
    std::string actual;   // rendering of the rejected value
    field_type_error(std::string v, size_t idx, std::string field, std::string exp, std::string act)
        : pmatch_error("E2021", "field " + std::to_string(idx) + " ('" + field + "') of '" + v + "' expects " + exp + ", got " + act),
          variant(std::move(v)), field_index(idx), expected(std::move(exp)), actual(std::move(act)) {}
};

struct no_match_error : pmatch_error {
    std::string subject_tag; // type::variant or literal text
    explicit no_match_error(std::string tag, const std::string& rendered)
        : pmatch_error("E2030", "no clause matched subject " + rendered + " (" + tag + ")"), subject_tag(std::move(tag)) {}
};

// Non-fatal diagnostics (W2xxx); currently only unreachable clauses.
struct MatchWarning {
    std::string code;
    std::string message;
    std::string hint;
    size_t clause_index = 0;
    int line=-1, col=-1;
};

} // namespace pmatch
