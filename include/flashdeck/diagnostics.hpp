// diagnostics.hpp - per-line parse diagnostics and their console rendering
#pragma once
#include <string>
#include <utility>
#include <vector>

namespace flashdeck {

enum class Issue {
    NumberingStripped,
    SpacingFixed,
    DashNormalized,
    UnicodeSpaceFixed,
    Rejected
};

enum class RejectReason {
    None,
    MissingSeparator,
    TooManySeparators,
    AmbiguousSeparator,
    ConflictingNumbering,
    EmptyTerm,
    EmptyDefinition
};

// Codes:
// - W0101: unicode spaces / invisible characters replaced
// - W0102: dash variants normalized
// - W0103: leading numbering stripped
// - W0104: spacing inserted around separator hyphen
// - E0201: missing separator
// - E0202: too many separators
// - E0203: ambiguous separator
// - E0204: conflicting numbering (fatal under every load policy)
// - E0205: empty term
// - E0206: empty definition
struct ParseDiagnostic {
    int line = 0;
    std::string raw_text;
    Issue issue = Issue::Rejected;
    std::string detail;
    std::string code;
    std::string hint;
    RejectReason reason = RejectReason::None;

    bool is_rejection() const { return issue==Issue::Rejected; }
};

const char* issue_name(Issue issue);
const char* reason_text(RejectReason reason);
const char* issue_code(Issue issue);
const char* reason_code(RejectReason reason);

// Collects diagnostics for one load (same shape as the checker's reporter).
struct DiagnosticReporter {
    std::vector<ParseDiagnostic>* sink=nullptr;
    void soft_fix(int line, const std::string& raw, Issue issue, std::string detail);
    void reject(int line, const std::string& raw, RejectReason reason, std::string detail={});
};

// Debug console text: one block per diagnostic keyed by line number.
std::string format_console(const std::vector<ParseDiagnostic>& diags);

} // namespace flashdeck
