#include <cassert>
#include <iostream>
#include <string>
#include "flashdeck/line_parser.hpp"

using namespace flashdeck;

static bool has_issue(const std::vector<ParseDiagnostic>& diags, Issue issue){
    for(auto& d: diags) if(d.issue==issue) return true;
    return false;
}

static void test_canonical_line(){
    LineParser p;
    auto lo = p.parse_line("bonjour - hello", 1);
    assert(lo.card && lo.card->term=="bonjour" && lo.card->definition=="hello");
    assert(lo.diagnostics.empty());
    // hyphens inside words are content
    auto wk = p.parse_line("well-known - famous", 2);
    assert(wk.card && wk.card->term=="well-known" && wk.card->definition=="famous");
    assert(wk.diagnostics.empty());
    auto extra = p.parse_line("  l'escalier (le)   -   the staircase  ", 3);
    assert(extra.card && extra.card->term=="l'escalier (le)" && extra.card->definition=="the staircase");
    assert(extra.diagnostics.empty());
}

static void test_soft_fixes(){
    LineParser p;
    auto num = p.parse_line("1. bonjour - hello", 4);
    assert(num.card && num.card->term=="bonjour" && num.card->definition=="hello");
    assert(num.diagnostics.size()==1);
    assert(num.diagnostics[0].issue==Issue::NumberingStripped);
    assert(num.diagnostics[0].line==4);
    assert(num.diagnostics[0].raw_text=="1. bonjour - hello");
    assert(num.diagnostics[0].code=="W0103");

    auto sp = p.parse_line("bonjour-hello", 5);
    assert(sp.card && sp.card->term=="bonjour" && sp.card->definition=="hello");
    assert(sp.diagnostics.size()==1 && sp.diagnostics[0].issue==Issue::SpacingFixed);

    auto en = p.parse_line("bonjour \xE2\x80\x93 hello", 6);
    assert(en.card && en.card->term=="bonjour" && en.card->definition=="hello");
    assert(en.diagnostics.size()==1 && en.diagnostics[0].issue==Issue::DashNormalized);

    auto nb = p.parse_line("bonjour\xC2\xA0- hello", 7);
    assert(nb.card && nb.card->term=="bonjour");
    assert(nb.diagnostics.size()==1 && nb.diagnostics[0].issue==Issue::UnicodeSpaceFixed);

    // several fixes on one line are reported in pipeline order
    auto all = p.parse_line("2.\xC2\xA0""chat\xE2\x80\x94""cat", 8);
    assert(all.card && all.card->term=="chat" && all.card->definition=="cat");
    assert(all.diagnostics.size()==4);
    assert(all.diagnostics[0].issue==Issue::UnicodeSpaceFixed);
    assert(all.diagnostics[1].issue==Issue::DashNormalized);
    assert(all.diagnostics[2].issue==Issue::NumberingStripped);
    assert(all.diagnostics[3].issue==Issue::SpacingFixed);

    auto pi = p.parse_line("1. pi - 3.14", 9);
    assert(pi.card && pi.card->term=="pi" && pi.card->definition=="3.14");
}

static void test_rejections(){
    LineParser p;
    auto many = p.parse_line("term - with - many - separators", 10);
    assert(many.rejected() && !many.card);
    assert(many.diagnostics.size()==1);
    assert(many.diagnostics[0].issue==Issue::Rejected);
    assert(many.diagnostics[0].reason==RejectReason::TooManySeparators);
    assert(many.diagnostics[0].detail.find("too many separators")!=std::string::npos);
    assert(many.diagnostics[0].line==10);

    auto missing = p.parse_line("term definition", 11);
    assert(missing.rejected());
    assert(missing.diagnostics[0].reason==RejectReason::MissingSeparator);
    assert(missing.diagnostics[0].detail.find("missing separator")!=std::string::npos);
    assert(missing.diagnostics[0].code=="E0201");
    assert(!missing.diagnostics[0].hint.empty());

    auto amb = p.parse_line("a-b-c", 12);
    assert(amb.rejected() && amb.diagnostics[0].reason==RejectReason::AmbiguousSeparator);

    // a rejected line carries only its rejection, not the fixes attempted on it
    auto twice = p.parse_line("2. 2. term - definition", 13);
    assert(twice.rejected());
    assert(twice.diagnostics.size()==1);
    assert(twice.diagnostics[0].reason==RejectReason::ConflictingNumbering);

    auto no_term = p.parse_line("- definition", 14);
    assert(no_term.rejected() && no_term.diagnostics[0].reason==RejectReason::EmptyTerm);
    auto no_def = p.parse_line("term -", 15);
    assert(no_def.rejected() && no_def.diagnostics[0].reason==RejectReason::EmptyDefinition);
}

static void test_skipped_lines(){
    LineParser p;
    auto blank = p.parse_line("   ", 1);
    assert(blank.skipped && !blank.card && blank.diagnostics.empty() && !blank.rejected());
    auto comment = p.parse_line("# term - with - many - separators", 2);
    assert(comment.skipped && comment.diagnostics.empty());
}

static void test_idempotence(){
    LineParser p;
    auto first = p.parse_line("1. bonjour-hello", 1);
    assert(first.card);
    std::string canonical = first.card->term + " - " + first.card->definition;
    auto again = p.parse_line(canonical, 1);
    assert(again.card && *again.card==*first.card);
    assert(again.diagnostics.empty());
}

static void test_parse_file_text(){
    LineParser p;
    std::string text =
        "# French basics\n"
        "\n"
        "bonjour - hello\r\n"
        "2. merci - thank you\n"
        "chien-dog\n"
        "   \n"
        "chat \xE2\x80\x93 cat";
    auto r = p.parse_string(text);
    assert(r.success);
    assert(r.failure==FailureKind::None);
    assert(r.deck.size()==4);
    assert(r.deck.at(0)->term=="bonjour" && r.deck.at(0)->definition=="hello");
    assert(r.deck.at(1)->term=="merci" && r.deck.at(1)->definition=="thank you");
    assert(r.deck.at(2)->term=="chien");
    assert(r.deck.at(3)->term=="chat" && r.deck.at(3)->definition=="cat");
    assert(r.diagnostics.size()==3);
    // diagnostics are keyed by physical line number
    assert(r.diagnostics[0].line==4 && r.diagnostics[0].issue==Issue::NumberingStripped);
    assert(r.diagnostics[1].line==5 && r.diagnostics[1].issue==Issue::SpacingFixed);
    assert(r.diagnostics[2].line==7 && r.diagnostics[2].issue==Issue::DashNormalized);
    assert(r.soft_fix_count()==3 && r.rejected_count()==0);
}

static void test_whole_file_reject(){
    LineParser p;
    std::string text =
        "bonjour - hello\n"
        "term - with - many - separators\n"
        "merci - thank you\n"
        "term definition\n";
    auto r = p.parse_string(text);
    assert(!r.success);
    assert(r.failure==FailureKind::StructuralReject);
    assert(r.deck.empty());
    // every bad line is reported, not only the first
    assert(r.rejected_count()==2);
    assert(r.diagnostics[0].line==2 && r.diagnostics[0].reason==RejectReason::TooManySeparators);
    assert(r.diagnostics[1].line==4 && r.diagnostics[1].reason==RejectReason::MissingSeparator);
    assert(r.error_message.find("line 2")!=std::string::npos);
}

static void test_partial_load(){
    ParseOptions opts; opts.partial_load = true;
    LineParser p(opts);
    auto r = p.parse_string("bonjour - hello\nterm definition\nmerci - thank you\n");
    assert(r.success);
    assert(r.deck.size()==2);
    assert(r.deck.at(1)->term=="merci");
    assert(r.rejected_count()==1 && r.diagnostics[0].line==2);

    // conflicting numbering still refuses the file
    auto fatal = p.parse_string("bonjour - hello\n3. 3. merci - thank you\n");
    assert(!fatal.success && fatal.failure==FailureKind::StructuralReject && fatal.deck.empty());

    auto nothing_left = p.parse_string("term definition\n");
    assert(!nothing_left.success && nothing_left.failure==FailureKind::StructuralReject);
}

static void test_no_cards(){
    LineParser p;
    auto empty = p.parse_string("");
    assert(!empty.success && empty.failure==FailureKind::NoCards && empty.diagnostics.empty());
    auto comments = p.parse_string("# nothing here\n\n# still nothing\n");
    assert(!comments.success && comments.failure==FailureKind::NoCards && comments.diagnostics.empty());
}

void run_line_parser_tests(){
    test_canonical_line();
    test_soft_fixes();
    test_rejections();
    test_skipped_lines();
    test_idempotence();
    test_parse_file_text();
    test_whole_file_reject();
    test_partial_load();
    test_no_cards();
    std::cout << "Line parser tests passed\n";
}
