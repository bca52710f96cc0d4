#include <gtest/gtest.h>
#include "pmatch/matcher.hpp"
#include "pmatch/constructor.hpp"
#include "pmatch/tuple.hpp"

using namespace pmatch;

TEST(TupleCombinator, WrapsSubjectsWithoutCopying){
    auto a = v_i64(1), b = v_str("x");
    auto t = zip_subjects(a, b);
    auto* tv = as_tuple(*t);
    ASSERT_NE(tv, nullptr);
    ASSERT_EQ(tv->elems.size(), 2u);
    EXPECT_EQ(tv->elems[0].get(), a.get());
    EXPECT_EQ(tv->elems[1].get(), b.get());
    EXPECT_EQ(describe_tag(*t), "tuple/2");
    EXPECT_EQ(to_string(zip_subjects(1, "y", true)), "..(1, \"y\", true)");
}

TEST(TupleCombinator, RejectsEmptyAndNullSubjects){
    EXPECT_THROW(zip_subject_list({}), std::invalid_argument);
    EXPECT_THROW(zip_subject_list({ v_i64(1), value_ptr{} }), std::invalid_argument);
}

// A tuple pattern matches iff each element pattern matches its subject on its own,
// and the bindings are the union of the element bindings.
TEST(TupleCombinator, MatchesElementWiseAndUnionsBindings){
    TypeRegistry reg;
    reg.declare("linked_list := NIL | CONS(car, cdr : linked_list)");
    PatternCompiler pc(reg);
    const char* patterns[] = { "NIL", "CONS(a, as)", "CONS(1, _)", "_", "z", "2" };
    const char* values[] = { "NIL", "CONS(1, NIL)", "CONS(2, CONS(3, NIL))", "2" };
    for(auto p1 : patterns) for(auto p2 : patterns){
        // Rename the second pattern's binders so the union is unambiguous.
        std::string q2 = p2;
        for(auto& c : q2) if(c=='a' || c=='z') c = static_cast<char>(c - 'a' + 'A');
        auto lhs = pc.compile(p1), rhs = pc.compile(q2);
        auto joint = p_tuple({ lhs, rhs });
        for(auto v1 : values) for(auto v2 : values){
            auto s1 = build_value(reg, v1), s2 = build_value(reg, v2);
            Bindings b1, b2, bj;
            bool m1 = match_pattern(*lhs, s1, b1);
            bool m2 = match_pattern(*rhs, s2, b2);
            bool mj = match_pattern(*joint, zip_subjects(s1, s2), bj);
            EXPECT_EQ(mj, m1 && m2) << p1 << " / " << q2 << " on " << v1 << " / " << v2;
            if(mj){
                EXPECT_EQ(bj.size(), b1.size() + b2.size());
                for(auto& kv : b1) EXPECT_EQ(bj.at(kv.first).get(), kv.second.get());
                for(auto& kv : b2) EXPECT_EQ(bj.at(kv.first).get(), kv.second.get());
            }
        }
    }
}
