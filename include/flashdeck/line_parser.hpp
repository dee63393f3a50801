// line_parser.hpp - converts flashcard file text into a validated Deck
#pragma once
#include "flashdeck/diagnostics.hpp"
#include "flashdeck/flashcard.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flashdeck {

struct ParseOptions {
    // Skip rejected lines instead of failing the load. Conflicting numbering stays fatal.
    bool partial_load = false;
    bool trace = false;
    static ParseOptions from_env();
};

enum class FailureKind { None, StructuralReject, IoError, NoCards };

struct ParseResult {
    bool success{false};
    Deck deck;                               // empty unless success
    std::vector<ParseDiagnostic> diagnostics;
    FailureKind failure{FailureKind::None};
    std::string error_message;               // If !success, human-readable message

    size_t rejected_count() const;
    size_t soft_fix_count() const;
};

// Outcome of a single line: a card, nothing (blank/comment), or a rejection recorded in diagnostics.
struct LineOutcome {
    std::optional<Flashcard> card;
    std::vector<ParseDiagnostic> diagnostics;
    bool skipped{false};
    bool rejected() const { return !card && !skipped; }
};

class LineParser {
public:
    explicit LineParser(ParseOptions opts = {}): opts_(opts) {}

    // Parse a whole file's text. Every line is examined; diagnostics are collected, not thrown.
    ParseResult parse_string(std::string_view text) const;

    // Normalize and validate one raw line. line_no is only used to key diagnostics.
    LineOutcome parse_line(const std::string& raw, int line_no) const;

    const ParseOptions& options() const { return opts_; }

private:
    ParseOptions opts_;
};

} // namespace flashdeck
