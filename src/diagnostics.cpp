#include "flashdeck/diagnostics.hpp"
#include <sstream>

namespace flashdeck {

const char* issue_name(Issue issue){
    switch(issue){
        case Issue::NumberingStripped: return "NumberingStripped";
        case Issue::SpacingFixed: return "SpacingFixed";
        case Issue::DashNormalized: return "DashNormalized";
        case Issue::UnicodeSpaceFixed: return "UnicodeSpaceFixed";
        case Issue::Rejected: return "Rejected";
    }
    return "Unknown";
}

const char* reason_text(RejectReason reason){
    switch(reason){
        case RejectReason::None: return "none";
        case RejectReason::MissingSeparator: return "missing separator";
        case RejectReason::TooManySeparators: return "too many separators";
        case RejectReason::AmbiguousSeparator: return "ambiguous separator";
        case RejectReason::ConflictingNumbering: return "conflicting numbering";
        case RejectReason::EmptyTerm: return "empty term";
        case RejectReason::EmptyDefinition: return "empty definition";
    }
    return "unknown";
}

const char* issue_code(Issue issue){
    switch(issue){
        case Issue::UnicodeSpaceFixed: return "W0101";
        case Issue::DashNormalized: return "W0102";
        case Issue::NumberingStripped: return "W0103";
        case Issue::SpacingFixed: return "W0104";
        case Issue::Rejected: return "E0200";
    }
    return "E0200";
}

const char* reason_code(RejectReason reason){
    switch(reason){
        case RejectReason::None: return "E0200";
        case RejectReason::MissingSeparator: return "E0201";
        case RejectReason::TooManySeparators: return "E0202";
        case RejectReason::AmbiguousSeparator: return "E0203";
        case RejectReason::ConflictingNumbering: return "E0204";
        case RejectReason::EmptyTerm: return "E0205";
        case RejectReason::EmptyDefinition: return "E0206";
    }
    return "E0200";
}

static const char* reason_hint(RejectReason reason){
    switch(reason){
        case RejectReason::TooManySeparators: return "use ' - ' only once; hyphens inside words may stay";
        case RejectReason::AmbiguousSeparator: return "write the delimiter as ' - ' with a space on each side";
        case RejectReason::ConflictingNumbering: return "keep at most one number at the start of the line";
        case RejectReason::EmptyTerm:
        case RejectReason::EmptyDefinition: return "both sides of ' - ' need text";
        default: return "use the format 'term - definition'";
    }
}

void DiagnosticReporter::soft_fix(int line, const std::string& raw, Issue issue, std::string detail){
    if(!sink) return;
    sink->push_back(ParseDiagnostic{line, raw, issue, std::move(detail), issue_code(issue), "", RejectReason::None});
}

void DiagnosticReporter::reject(int line, const std::string& raw, RejectReason reason, std::string detail){
    if(!sink) return;
    if(detail.empty()) detail = reason_text(reason);
    sink->push_back(ParseDiagnostic{line, raw, Issue::Rejected, std::move(detail), reason_code(reason), reason_hint(reason), reason});
}

std::string format_console(const std::vector<ParseDiagnostic>& diags){
    std::ostringstream os;
    for(const auto& d: diags){
        os<<"Line "<<d.line<<": ["<<issue_name(d.issue)<<"] "<<d.code<<" "<<d.detail<<"\n";
        os<<"  raw: "<<d.raw_text<<"\n";
        if(!d.hint.empty()) os<<"  hint: "<<d.hint<<"\n";
    }
    return os.str();
}

} // namespace flashdeck
