#include "flashdeck/line_parser.hpp"
#include "flashdeck/features.hpp"
#include "flashdeck/normalize.hpp"
#include <cstdio>
#include <sstream>
#include <utility>

namespace flashdeck {

ParseOptions ParseOptions::from_env(){
    ParseOptions o;
    o.partial_load = partial_load_enabled();
    o.trace = debug_trace_enabled();
    return o;
}

size_t ParseResult::rejected_count() const {
    size_t n=0; for(auto& d: diagnostics) if(d.is_rejection()) ++n; return n;
}
size_t ParseResult::soft_fix_count() const {
    size_t n=0; for(auto& d: diagnostics) if(!d.is_rejection()) ++n; return n;
}

LineOutcome LineParser::parse_line(const std::string& raw, int line_no) const {
    LineOutcome out;
    if(is_skippable_line(raw)){ out.skipped = true; return out; }

    DiagnosticReporter rep{&out.diagnostics};
    auto reject = [&](RejectReason reason, std::string detail){
        // a rejected line reports only its rejection
        out.diagnostics.clear();
        rep.reject(line_no, raw, reason, std::move(detail));
        if(opts_.trace) std::fprintf(stderr, "[dbg][parse] line=%d rejected reason=%s\n", line_no, reason_text(reason));
    };

    std::string text = trim_copy(raw);
    bool numbering_stripped = false;
    for(const auto& rule : normalization_rules()){
        RuleOutcome r = rule.apply(text);
        if(r.issue){
            if(opts_.trace) std::fprintf(stderr, "[dbg][normalize] line=%d rule=%s before='%s' after='%s'\n",
                                         line_no, rule.name, text.c_str(), r.text.c_str());
            if(*r.issue==Issue::NumberingStripped) numbering_stripped = true;
            rep.soft_fix(line_no, raw, *r.issue, std::move(r.detail));
        }
        text = std::move(r.text);
    }

    if(numbering_stripped && leading_punctuated_numbering_length(text)>0){
        reject(RejectReason::ConflictingNumbering, "multiple numbering patterns at start of line");
        return out;
    }

    auto seps = separator_positions(text);
    if(seps.size()>1){
        std::ostringstream os; os<<"too many separators ("<<seps.size()<<" occurrences of ' - ')";
        reject(RejectReason::TooManySeparators, os.str());
        return out;
    }
    if(seps.empty()){
        if(text.size()>1 && text.compare(0, 2, "- ")==0){ reject(RejectReason::EmptyTerm, "empty term before ' - '"); return out; }
        if(text.size()>1 && text.compare(text.size()-2, 2, " -")==0){ reject(RejectReason::EmptyDefinition, "empty definition after ' - '"); return out; }
        auto c = separator_candidates(text);
        if(c.loose.size()+c.bare.size()>1){
            std::ostringstream os; os<<"ambiguous separator ("<<(c.loose.size()+c.bare.size())<<" hyphens could split this line)";
            reject(RejectReason::AmbiguousSeparator, os.str());
        }else{
            reject(RejectReason::MissingSeparator, "missing separator (no ' - ' between term and definition)");
        }
        return out;
    }

    // text is trimmed, so both sides of a single interior separator are non-empty
    std::string term = trim_copy(std::string_view(text).substr(0, seps.front()));
    std::string definition = trim_copy(std::string_view(text).substr(seps.front()+3));

    if(opts_.trace) std::fprintf(stderr, "[dbg][parse] line=%d term='%s' definition='%s'\n", line_no, term.c_str(), definition.c_str());
    out.card = Flashcard{std::move(term), std::move(definition)};
    return out;
}

ParseResult LineParser::parse_string(std::string_view text) const {
    ParseResult r;
    std::vector<Flashcard> cards;
    size_t rejected = 0;
    bool fatal = false;
    std::string first_reject;

    int line_no = 0;
    size_t pos = 0;
    while(pos<=text.size()){
        size_t nl = text.find('\n', pos);
        size_t end = nl==std::string_view::npos? text.size() : nl;
        std::string line(text.substr(pos, end-pos));
        if(!line.empty() && line.back()=='\r') line.pop_back();
        ++line_no;

        LineOutcome lo = parse_line(line, line_no);
        if(!lo.skipped){
            for(auto& d: lo.diagnostics){
                if(d.is_rejection()){
                    if(d.reason==RejectReason::ConflictingNumbering) fatal = true;
                    if(first_reject.empty()) first_reject = "line " + std::to_string(d.line) + ": " + d.detail;
                }
                r.diagnostics.push_back(std::move(d));
            }
            if(lo.card) cards.push_back(std::move(*lo.card));
            else ++rejected;
        }
        if(nl==std::string_view::npos) break;
        pos = nl+1;
    }

    if(rejected>0 && (!opts_.partial_load || fatal || cards.empty())){
        r.failure = FailureKind::StructuralReject;
        std::ostringstream os;
        os<<"file refused: "<<rejected<<" malformed line"<<(rejected==1? "":"s")<<" (first: "<<first_reject<<")";
        r.error_message = os.str();
        return r;
    }
    if(cards.empty()){
        r.failure = FailureKind::NoCards;
        r.error_message = "no flashcards found";
        return r;
    }
    r.success = true;
    r.deck = Deck(std::move(cards));
    return r;
}

} // namespace flashdeck
