#include <gtest/gtest.h>
#include <string>
#include "pmatch/pmatch.hpp"
#include "test_env.hpp"

using namespace pmatch;

TEST(Diagnostics, JsonEscape){
    EXPECT_EQ(json_escape("a\"b\\c\n"), "\"a\\\"b\\\\c\\n\"");
    EXPECT_EQ(json_escape(std::string(1, '\x01')), "\"\\u0001\"");
}

TEST(Diagnostics, WarningsToJson){
    MatchWarning w;
    w.code = "W2100"; w.message = "unreachable clause"; w.hint = "move it"; w.clause_index = 3; w.line = 2; w.col = 5;
    auto js = warnings_to_json({ w });
    EXPECT_EQ(js, "{\"warnings\":[{\"code\":\"W2100\",\"message\":\"unreachable clause\",\"hint\":\"move it\",\"clause\":3,\"line\":2,\"col\":5}]}");
    EXPECT_EQ(warnings_to_json({}), "{\"warnings\":[]}");
}

TEST(Diagnostics, ErrorToJsonCarriesStructuredFields){
    auto uv = error_to_json(unknown_variant_error("CONZ", { "CONS" }));
    EXPECT_NE(uv.find("\"code\":\"E2010\""), std::string::npos);
    EXPECT_NE(uv.find("\"suggestions\":[\"CONS\"]"), std::string::npos);
    auto ft = error_to_json(field_type_error("ONE", 0, "x", "numeric", "\"foo\" : character"));
    EXPECT_NE(ft.find("\"field\":0"), std::string::npos);
    EXPECT_NE(ft.find("\"expected\":\"numeric\""), std::string::npos);
    auto am = error_to_json(arity_mismatch_error("TWO", 2, 1));
    EXPECT_NE(am.find("\"expected\":2,\"actual\":1"), std::string::npos);
    auto nm = error_to_json(no_match_error("linked_list::NIL", "NIL"));
    EXPECT_NE(nm.find("\"subject\":\"linked_list::NIL\""), std::string::npos);
}

TEST(Diagnostics, EnvironmentSwitches){
    auto e = detect_env();
    EXPECT_FALSE(e.trace);
    EXPECT_TRUE(e.suggest);
    {
        scoped_env t("PMATCH_TRACE=1"), j("PMATCH_DIAG_JSON=1"), s("PMATCH_SUGGEST=0");
        auto on = detect_env();
        EXPECT_TRUE(on.trace);
        EXPECT_TRUE(on.diagJson);
        EXPECT_FALSE(on.suggest);
    }
    EXPECT_FALSE(detect_env().trace);
}

TEST(Diagnostics, UnreachableClauseIsLogged){
    TypeRegistry reg;
    scoped_env w("PMATCH_WARN=1");
    ::testing::internal::CaptureStderr();
    auto cc = PatternCompiler(reg).compile_clauses(std::vector<node_ptr>{ parse("otherwise"), parse("\n  13") });
    std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(cc.warnings.size(), 1u);
    EXPECT_NE(err.find("[pmatch][warn] W2100 clause 1"), std::string::npos) << err;
    EXPECT_NE(err.find("line 2, col 3"), std::string::npos) << err;
}

TEST(Diagnostics, WarningsAsJsonWhenRequested){
    TypeRegistry reg;
    scoped_env j("PMATCH_DIAG_JSON=1");
    ::testing::internal::CaptureStderr();
    PatternCompiler(reg).compile_clauses(std::vector<node_ptr>{ parse("otherwise"), parse("x") });
    std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("{\"warnings\":[{\"code\":\"W2100\""), std::string::npos) << err;
    EXPECT_EQ(err.find("[pmatch][warn]"), std::string::npos) << err;
}

TEST(Diagnostics, TraceLogsEachClauseAttempt){
    TypeRegistry reg;
    reg.declare("linked_list := NIL | CONS(car, cdr : linked_list)");
    scoped_env t("PMATCH_TRACE=1");
    ::testing::internal::CaptureStderr();
    int r = dispatch<int>(build_value(reg, "CONS(1, NIL)"), {
        { "NIL", [](const Bindings&){ return 0; } },
        { "CONS(_, _)", [](const Bindings&){ return 1; } },
    }, reg);
    std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(r, 1);
    EXPECT_NE(err.find("[pmatch][trace] clause 0 NIL vs CONS(1, NIL): rejected"), std::string::npos) << err;
    EXPECT_NE(err.find("[pmatch][trace] clause 1 CONS(_, _) vs CONS(1, NIL): matched"), std::string::npos) << err;
}

TEST(Diagnostics, TraceFlagIsReadWhenClausesCompile){
    TypeRegistry reg;
    reg.declare("linked_list := NIL | CONS(car, cdr : linked_list)");
    ClauseList<int> quiet({
        { "NIL", [](const Bindings&){ return 0; } },
        { "CONS(_, _)", [](const Bindings&){ return 1; } },
    }, reg);
    EXPECT_FALSE(quiet.compiled()->trace);

    scoped_env t("PMATCH_TRACE=1");
    ::testing::internal::CaptureStderr();
    EXPECT_EQ(dispatch(build_value(reg, "CONS(1, NIL)"), quiet), 1);
    EXPECT_EQ(::testing::internal::GetCapturedStderr().find("[pmatch][trace]"), std::string::npos);

    // A registry change forces a recompile, which picks the switch up.
    reg.declare("colour := R | B");
    EXPECT_TRUE(quiet.compiled()->trace);
    ::testing::internal::CaptureStderr();
    EXPECT_EQ(dispatch(build_value(reg, "NIL"), quiet), 0);
    EXPECT_NE(::testing::internal::GetCapturedStderr().find("[pmatch][trace] clause 0 NIL vs NIL: matched"), std::string::npos);
}
