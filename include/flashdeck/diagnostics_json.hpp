// diagnostics_json.hpp - JSON serialization and user-facing summaries for ParseResult
#pragma once
#include "flashdeck/line_parser.hpp"
#include <string>

namespace flashdeck {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize a load result to a compact JSON string.
std::string diagnostics_to_json(const ParseResult& r);

// If FLASHDECK_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const ParseResult& r);

// Message shown after a load: success count plus corrections, or the failure reasons.
std::string summary_message(const ParseResult& r);

} // namespace flashdeck
