#include <iostream>
#include "test_env.hpp"
// We only link GTest::gtest, not gtest_main, so the binary provides its own entry point.
#include <gtest/gtest.h>

int main(int argc, char** argv){
    // Unreachable-clause tests would otherwise print [pmatch][warn] lines; tests that
    // check the warning output turn them back on locally.
    _putenv("PMATCH_WARN=0");
    _putenv("PMATCH_TRACE=");
    _putenv("PMATCH_DIAG_JSON=");
    _putenv("PMATCH_SUGGEST=");
    ::testing::InitGoogleTest(&argc, argv);
    int gtest_result = RUN_ALL_TESTS();
    if(gtest_result) std::cerr << "[pmatch_tests] failures reported\n";
    return gtest_result;
}
