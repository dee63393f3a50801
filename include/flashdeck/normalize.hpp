// normalize.hpp - auto-fix pipeline as an ordered list of named rules
#pragma once
#include "flashdeck/diagnostics.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flashdeck {

// Result of one rule: the rewritten text and, when the rule changed it, the soft-fix tag.
struct RuleOutcome {
    std::string text;
    std::optional<Issue> issue;
    std::string detail;
};

using RuleFn = RuleOutcome (*)(const std::string&);

struct NormalizationRule {
    const char* name;
    RuleFn apply;
};

// Pipeline in application order: unicode-spaces, dashes, numbering, separator-spacing.
const std::vector<NormalizationRule>& normalization_rules();

RuleOutcome fix_unicode_spaces(const std::string& line);
RuleOutcome normalize_dashes(const std::string& line);
RuleOutcome strip_numbering(const std::string& line);
RuleOutcome fix_separator_spacing(const std::string& line);

// Blank or '#' comment once unicode spaces are ignored. Such lines never produce diagnostics.
bool is_skippable_line(const std::string& line);

// Length of a leading numbering group ("12. ", "3) ", "(4) ", "5 ") or 0.
size_t leading_numbering_length(const std::string& line);
// Same, but only for punctuated groups ("12. ", "3) ", "(4) ").
size_t leading_punctuated_numbering_length(const std::string& line);

// Byte offsets of every non-overlapping " - " occurrence.
std::vector<size_t> separator_positions(const std::string& line);

// Interior hyphens that separator-spacing could promote to " - ".
struct SeparatorCandidates {
    std::vector<size_t> loose; // whitespace on one side only
    std::vector<size_t> bare;  // no whitespace on either side
};
SeparatorCandidates separator_candidates(const std::string& line);

std::string trim_copy(std::string_view s);

} // namespace flashdeck
