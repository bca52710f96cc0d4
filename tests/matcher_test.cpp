#include <gtest/gtest.h>
#include <string>
#include "pmatch/matcher.hpp"
#include "pmatch/constructor.hpp"
#include "pmatch/tuple.hpp"

using namespace pmatch;

namespace {

struct MatcherTest : ::testing::Test {
    TypeRegistry reg;
    void SetUp() override {
        reg.declare("linked_list := NIL | CONS(car, cdr : linked_list)");
        reg.declare("count := ZERO | ONE(x) | TWO(x, y)");
    }
    value_ptr val(const char* src) const { return build_value(reg, src); }
    pattern_ptr pat(const char* src) const { return PatternCompiler(reg).compile(src); }
    bool matches(const char* p, const char* v, Bindings& b) const { return match_pattern(*pat(p), val(v), b); }
    bool matches(const char* p, const char* v) const { Bindings b; return matches(p, v, b); }
};

} // namespace

TEST_F(MatcherTest, WildcardAndCatchallBindNothing){
    Bindings b;
    EXPECT_TRUE(matches("_", "CONS(1, NIL)", b));
    EXPECT_TRUE(matches("otherwise", "42", b));
    EXPECT_TRUE(b.empty());
}

TEST_F(MatcherTest, BinderCapturesWholeSubtree){
    Bindings b;
    auto subject = val("CONS(1, NIL)");
    EXPECT_TRUE(match_pattern(*pat("whole"), subject, b));
    EXPECT_EQ(b.at("whole").get(), subject.get());
}

TEST_F(MatcherTest, LiteralsUseExactNumericEquality){
    EXPECT_TRUE(matches("1", "1"));
    EXPECT_TRUE(matches("1", "1.0"));
    EXPECT_FALSE(matches("1", "1.5"));
    EXPECT_FALSE(matches("13", "\"13\""));
    EXPECT_TRUE(matches("\"one\"", "\"one\""));
    EXPECT_FALSE(matches("1", "ONE(1)"));
}

TEST_F(MatcherTest, ConstructorChecksTagThenFields){
    Bindings b;
    EXPECT_TRUE(matches("CONS(h, t)", "CONS(1, CONS(2, NIL))", b));
    EXPECT_EQ(b.get<int64_t>("h"), 1);
    EXPECT_EQ(to_string(b.at("t")), "CONS(2, NIL)");
    EXPECT_FALSE(matches("NIL", "CONS(1, NIL)"));
    EXPECT_TRUE(matches("NIL", "NIL"));
    EXPECT_FALSE(matches("CONS(2, _)", "CONS(1, NIL)"));
    EXPECT_FALSE(matches("CONS(_, _)", "7"));
}

TEST_F(MatcherTest, NestedPatterns){
    Bindings b;
    EXPECT_TRUE(matches("TWO(ONE(x), ONE(y))", "TWO(ONE(1), ONE(2))", b));
    EXPECT_EQ(b.get<int64_t>("x"), 1);
    EXPECT_EQ(b.get<int64_t>("y"), 2);
    EXPECT_FALSE(matches("TWO(ONE(x), ONE(y))", "TWO(ONE(1), ZERO)"));
}

TEST_F(MatcherTest, ArityMismatchAtMatchTime){
    auto p = pat("CONS(x)");
    Bindings b;
    try {
        match_pattern(*p, val("CONS(1, NIL)"), b);
        FAIL() << "expected arity_mismatch_error";
    } catch(const arity_mismatch_error& e){
        EXPECT_EQ(e.variant, "CONS");
        EXPECT_EQ(e.expected, 2u);
        EXPECT_EQ(e.actual, 1u);
    }
    // A different tag is just a non-match.
    EXPECT_FALSE(match_pattern(*p, val("NIL"), b));
}

TEST_F(MatcherTest, RepeatedBinderKeepsLaterValue){
    Bindings b;
    EXPECT_TRUE(matches("TWO(x, x)", "TWO(1, 2)", b));
    EXPECT_EQ(b.size(), 1u);
    EXPECT_EQ(b.get<int64_t>("x"), 2);
}

TEST_F(MatcherTest, MatchOneIsFirstMatch){
    std::vector<pattern_ptr> clauses{ pat("CONS(_, _)"), pat("CONS(h, _)"), pat("_") };
    auto subject = val("CONS(1, NIL)");
    for(int i=0;i<3;++i){
        auto r = match_one(subject, clauses);
        EXPECT_EQ(r.clause_index, 0u);
        EXPECT_TRUE(r.bindings.empty());
    }
    EXPECT_EQ(match_one(val("NIL"), clauses).clause_index, 2u);
}

TEST_F(MatcherTest, BindingsFromRejectedClausesDoNotLeak){
    std::vector<pattern_ptr> clauses{ pat("CONS(h, CONS(_, _))"), pat("CONS(first, rest)") };
    auto r = match_one(val("CONS(1, NIL)"), clauses);
    EXPECT_EQ(r.clause_index, 1u);
    EXPECT_FALSE(r.bindings.contains("h"));
    EXPECT_TRUE(r.bindings.contains("first"));
}

TEST_F(MatcherTest, NoMatchCarriesSubjectTag){
    std::vector<pattern_ptr> clauses{ pat("NIL") };
    try {
        match_one(val("CONS(1, NIL)"), clauses);
        FAIL() << "expected no_match_error";
    } catch(const no_match_error& e){
        EXPECT_EQ(e.code, "E2030");
        EXPECT_EQ(e.subject_tag, "linked_list::CONS");
        EXPECT_NE(std::string(e.what()).find("CONS(1, NIL)"), std::string::npos);
    }
    try {
        match_one(val("42"), clauses);
        FAIL() << "expected no_match_error";
    } catch(const no_match_error& e){
        EXPECT_EQ(e.subject_tag, "42");
    }
    EXPECT_THROW(match_one(val("NIL"), std::vector<pattern_ptr>{}), no_match_error);
}

TEST_F(MatcherTest, BindingsAccessors){
    Bindings b;
    b.bind("i", v_i64(3));
    b.bind("d", v_f64(0.5));
    b.bind("s", v_str("txt"));
    b.bind("t", v_bool(true));
    EXPECT_EQ(b.get<int>("i"), 3);
    EXPECT_DOUBLE_EQ(b.get<double>("i"), 3.0);
    EXPECT_DOUBLE_EQ(b.number("d"), 0.5);
    EXPECT_EQ(b.get<std::string>("s"), "txt");
    EXPECT_TRUE(b.get<bool>("t"));
    EXPECT_THROW(b.at("missing"), std::out_of_range);
    EXPECT_THROW(b.get<int64_t>("s"), std::bad_variant_access);
    std::string keys;
    for(auto& kv : b) keys += kv.first;
    EXPECT_EQ(keys, "dist");
}

TEST_F(MatcherTest, DispatchReturnsHandlerResult){
    auto describe = [&](const char* v){
        return dispatch<std::string>(val(v), {
            { "ZERO", [](const Bindings&){ return std::string("zero"); } },
            { "ONE(x)", [](const Bindings& b){ return "one:" + to_string(b.at("x")); } },
            { "TWO(x, y)", [](const Bindings& b){ return "two:" + to_string(b.at("x")) + "," + to_string(b.at("y")); } },
        }, reg);
    };
    EXPECT_EQ(describe("ZERO"), "zero");
    EXPECT_EQ(describe("ONE(\"a\")"), "one:\"a\"");
    EXPECT_EQ(describe("TWO(1, 2)"), "two:1,2");
    EXPECT_THROW(describe("NIL"), no_match_error);
}

TEST_F(MatcherTest, ClauseListCachesUntilRegistryChanges){
    ClauseList<int> cases({
        { "NIL", [](const Bindings&){ return 0; } },
        { "CONS(_, _)", [](const Bindings&){ return 1; } },
    }, reg);
    auto first = cases.compiled();
    EXPECT_EQ(cases.compiled().get(), first.get());
    EXPECT_EQ(dispatch(val("NIL"), cases), 0);
    EXPECT_EQ(match(val("CONS(1, NIL)"), cases), 1);
    EXPECT_EQ(cases.compiled().get(), first.get());

    reg.declare("colour := R | B");
    auto second = cases.compiled();
    EXPECT_NE(second.get(), first.get());
    EXPECT_EQ(second->generation, reg.generation());
}

TEST_F(MatcherTest, RedefinitionChangesBareNameResolution){
    ClauseList<std::string> cases({
        { "E", [](const Bindings&){ return std::string("empty"); } },
        { "other", [](const Bindings&){ return std::string("other"); } },
    }, reg);
    // E is not registered yet: it compiles as a binder and catches everything.
    EXPECT_EQ(dispatch(val("NIL"), cases), "empty");
    reg.declare("tree := E | T(l, v, r)");
    EXPECT_EQ(dispatch(val("NIL"), cases), "other");
    EXPECT_EQ(dispatch(val("E"), cases), "empty");
}

TEST_F(MatcherTest, ClausesFromPrebuiltTreesAndForms){
    ClauseList<int> cases({
        { p_ctor("ONE", { p_bind("x") }), [](const Bindings& b){ return b.get<int>("x"); } },
        { node_list({ n_sym("TWO"), n_sym("_"), n_sym("y") }), [](const Bindings& b){ return b.get<int>("y"); } },
        { std::string("otherwise"), [](const Bindings&){ return -1; } },
    }, reg);
    EXPECT_EQ(dispatch(val("ONE(4)"), cases), 4);
    EXPECT_EQ(dispatch(val("TWO(4, 5)"), cases), 5);
    EXPECT_EQ(dispatch(val("ZERO"), cases), -1);
    EXPECT_THROW(Clause<int>("x", nullptr), std::invalid_argument);
}

TEST_F(MatcherTest, CatchallMakesDispatchTotal){
    const char* subjects[] = { "ZERO", "ONE(1)", "TWO(1, 2)", "NIL", "CONS(1, NIL)", "42", "\"s\"" };
    for(auto s : subjects){
        int r = dispatch<int>(val(s), {
            { "ONE(x)", [](const Bindings&){ return 1; } },
            { "CONS(_, _)", [](const Bindings&){ return 2; } },
            { "otherwise", [](const Bindings&){ return 0; } },
        }, reg);
        EXPECT_GE(r, 0);
    }
}

TEST_F(MatcherTest, TuplePatternAgainstTupleSubject){
    Bindings b;
    auto subject = zip_subjects(val("CONS(1, NIL)"), val("CONS(2, NIL)"));
    EXPECT_TRUE(match_pattern(*pat("..(CONS(a, as), CONS(b, bs))"), subject, b));
    EXPECT_EQ(b.size(), 4u);
    // Plain subjects never match a tuple pattern.
    Bindings c;
    EXPECT_FALSE(match_pattern(*pat("..(x, y)"), val("CONS(1, NIL)"), c));
    EXPECT_THROW(match_pattern(*pat("..(x)"), subject, c), arity_mismatch_error);
}
