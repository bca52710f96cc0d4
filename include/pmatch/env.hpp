#pragma once
#include <string>

namespace pmatch {

// Process-level switches, all optional:
//   PMATCH_TRACE=1      log every clause attempt to stderr
//   PMATCH_DIAG_JSON=1  print compile warnings as JSON to stderr
//   PMATCH_SUGGEST=0    drop "did you mean" suggestions from unknown-variant errors
//   PMATCH_WARN=0       silence [pmatch][warn] lines
struct MatchEnv {
    bool trace = false;
    bool diagJson = false;
    bool suggest = true;
    bool warnings = true;
};

// Read the environment. Callers read it once per compile or report, not per match.
MatchEnv detect_env();

} // namespace pmatch
