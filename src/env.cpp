#include "pmatch/env.hpp"
#include <cstdlib>

namespace pmatch {

MatchEnv detect_env(){
    MatchEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("PMATCH_TRACE")) e.trace = (std::string(v) == "1");
    if (const char* v = get("PMATCH_DIAG_JSON")) e.diagJson = (v[0] == '1');
    // Suggestions and warning lines default on; only an explicit 0 disables them.
    if (const char* v = get("PMATCH_SUGGEST")) e.suggest = (v[0] != '0');
    if (const char* v = get("PMATCH_WARN")) e.warnings = (v[0] != '0');

    return e;
}

} // namespace pmatch
