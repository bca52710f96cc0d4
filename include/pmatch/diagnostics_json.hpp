// diagnostics_json.hpp - JSON serialization for compile warnings and thrown diagnostics
#pragma once
#include "pmatch/errors.hpp"
#include <string>
#include <vector>

namespace pmatch {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// {"warnings":[{"code":..,"message":..,"hint":..,"clause":..,"line":..,"col":..}]}
std::string warnings_to_json(const std::vector<MatchWarning>& ws);

// {"code":..,"message":..} plus the structured fields of the concrete error type.
std::string error_to_json(const pmatch_error& e);

// If PMATCH_DIAG_JSON=1 in the environment, print warnings JSON to stderr.
void maybe_print_json(const std::vector<MatchWarning>& ws);

// One "[pmatch][warn]" line per warning unless PMATCH_WARN=0, then maybe_print_json.
void report_warnings(const std::vector<MatchWarning>& ws);

} // namespace pmatch
