#include "flashdeck/diagnostics_json.hpp"
#include "flashdeck/features.hpp"
#include <cstdio>
#include <sstream>

namespace flashdeck {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static const char* failure_name(FailureKind k){
    switch(k){
        case FailureKind::None: return "none";
        case FailureKind::StructuralReject: return "structural-reject";
        case FailureKind::IoError: return "io-error";
        case FailureKind::NoCards: return "no-cards";
    }
    return "none";
}

std::string diagnostics_to_json(const ParseResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")
      <<",\"failure\":"<<json_escape(failure_name(r.failure))
      <<",\"message\":"<<json_escape(r.error_message)
      <<",\"cards\":"<<r.deck.size()
      <<",\"diagnostics\":[";
    for(size_t i=0;i<r.diagnostics.size(); ++i){
        const auto &d=r.diagnostics[i]; if(i) os<<",";
        os<<"{"
            "\"code\":"<<json_escape(d.code)
            <<",\"issue\":"<<json_escape(issue_name(d.issue))
            <<",\"line\":"<<d.line
            <<",\"raw\":"<<json_escape(d.raw_text)
            <<",\"detail\":"<<json_escape(d.detail)
            <<",\"hint\":"<<json_escape(d.hint)
            <<"}";
    }
    os<<"]}";
    return os.str();
}

void maybe_print_json(const ParseResult& r){
    if(diag_json_enabled()){
        auto js=diagnostics_to_json(r);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

static constexpr size_t kListedLines = 5;

static void append_lines(std::ostringstream& os, const ParseResult& r, bool rejections){
    size_t shown=0, total=0;
    for(const auto& d: r.diagnostics){
        if(d.is_rejection()!=rejections) continue;
        ++total;
        if(shown<kListedLines){
            os<<"\nLine "<<d.line<<": "<<d.detail;
            if(rejections) os<<" - '"<<d.raw_text<<"'";
            ++shown;
        }
    }
    if(total>shown) os<<"\n... and "<<(total-shown)<<" more";
}

std::string summary_message(const ParseResult& r){
    std::ostringstream os;
    const size_t rejected = r.rejected_count();
    if(r.success){
        const size_t n = r.deck.size();
        os<<"Successfully loaded "<<n<<" flashcard"<<(n==1? "":"s");
        if(r.soft_fix_count()>0){
            os<<"\n\nAuto-corrections applied:";
            append_lines(os, r, false);
        }
        if(rejected>0){
            os<<"\n\nSkipped "<<rejected<<" malformed line"<<(rejected==1? "":"s")<<":";
            append_lines(os, r, true);
            os<<"\n\nValid format: 'term - definition' (with spaces around the hyphen)";
            os<<"\nCheck the debug console for detailed parsing information.";
        }
        return os.str();
    }
    if(r.failure==FailureKind::IoError){
        os<<"Error loading file: "<<r.error_message;
        return os.str();
    }
    os<<"Failed to load flashcards.";
    if(!r.error_message.empty()) os<<"\n\n"<<r.error_message;
    if(rejected>0){
        os<<"\n";
        append_lines(os, r, true);
        os<<"\n\nValid format: 'term - definition' (with spaces around the hyphen)";
        os<<"\nPlease fix the formatting and try again. Check the debug console for details.";
    }
    return os.str();
}

} // namespace flashdeck
