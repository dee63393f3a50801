#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include "flashdeck/diagnostics.hpp"
#include "flashdeck/diagnostics_json.hpp"
#include "flashdeck/loader.hpp"
#include "flashdeck/session.hpp"

static int usage(){
    std::cerr << "usage: flashdeck [--check] [--json] <flashcards.txt>\n";
    return 2;
}

static void print_help(){
    std::cout << "commands:\n"
                 "  l          list terms\n"
                 "  <n>        reveal definition of card n\n"
                 "  s          shuffle\n"
                 "  o <path>   open another file\n"
                 "  r          reload current file\n"
                 "  d          debug console\n"
                 "  h          help\n"
                 "  q          quit\n";
}

static void print_terms(const flashdeck::Session& s){
    if(s.size()==0){ std::cout << "No flashcards loaded\n"; return; }
    auto terms = s.terms();
    for(size_t i=0;i<terms.size();++i) std::cout << "  " << (i+1) << ". " << terms[i] << "\n";
    std::cout << "Loaded " << terms.size() << " flashcard" << (terms.size()==1? "":"s") << "\n";
}

static void print_debug_console(const flashdeck::Session& s){
    std::cout << "Debug Console\n";
    if(s.last_path().empty()){ std::cout << "(no file opened)\n"; return; }
    std::cout << "File: " << s.last_path() << "\n";
    const auto& diags = s.diagnostics();
    if(diags.empty()) std::cout << "(no parsing issues)\n";
    else std::cout << flashdeck::format_console(diags);
    const auto& r = s.last_result();
    if(r.success) std::cout << "Found " << r.deck.size() << " valid flashcards.\n";
    else std::cout << "ERROR: " << r.error_message << "\n";
}

static void report_load(const flashdeck::Session& s){
    const auto& r = s.last_result();
    std::cout << flashdeck::summary_message(r) << "\n";
    if(r.success) print_terms(s);
    else if(r.failure!=flashdeck::FailureKind::IoError) std::cout << "(type 'd' to open the debug console)\n";
}

static int run_check(const std::string& path, bool json){
    auto r = flashdeck::load_deck_file(path);
    if(json) std::cout << flashdeck::diagnostics_to_json(r) << "\n";
    else std::cout << flashdeck::summary_message(r) << "\n";
    if(r.success) return 0;
    return r.failure==flashdeck::FailureKind::IoError? 2 : 1;
}

static int run_interactive(const std::string& path){
    flashdeck::Session session;
    session.open(path);
    report_load(session);

    std::string line;
    while(std::cout << "> " << std::flush, std::getline(std::cin, line)){
        std::istringstream ls(line);
        std::string cmd; ls >> cmd;
        if(cmd.empty()) continue;
        if(cmd=="q") break;
        if(cmd=="h"){ print_help(); continue; }
        if(cmd=="l"){ print_terms(session); continue; }
        if(cmd=="d"){ print_debug_console(session); continue; }
        if(cmd=="s"){
            if(session.size()==0){ std::cout << "No flashcards loaded\n"; continue; }
            session.shuffle(); print_terms(session); continue;
        }
        if(cmd=="r"){ session.reload(); report_load(session); continue; }
        if(cmd=="o"){
            std::string next; std::getline(ls >> std::ws, next);
            if(next.empty()){ std::cout << "usage: o <path>\n"; continue; }
            session.open(next); report_load(session); continue;
        }
        bool numeric = cmd.find_first_not_of("0123456789")==std::string::npos;
        if(numeric){
            const flashdeck::Flashcard* card = nullptr;
            unsigned long n = cmd.size()<10? std::stoul(cmd) : 0;
            if(n>0) card = session.card(static_cast<size_t>(n-1));
            if(!card){ std::cout << "no card " << cmd << "\n"; continue; }
            std::cout << "Definition: " << card->term << "\n  " << card->definition << "\n";
            continue;
        }
        std::cout << "unknown command '" << cmd << "' (h for help)\n";
    }
    return 0;
}

int main(int argc, char** argv){
    try{
        bool check=false, json=false;
        std::string path;
        for(int i=1;i<argc;i++){
            std::string a=argv[i];
            if(a=="--check") check=true;
            else if(a=="--json") json=true;
            else if(!a.empty() && a[0]=='-') return usage();
            else if(path.empty()) path=a;
            else return usage();
        }
        if(path.empty()) return usage();
        if(check || json) return run_check(path, json);
        return run_interactive(path);
    } catch(const std::exception& e){
        std::cerr << "flashdeck: exception: " << e.what() << "\n";
        return 1;
    }
}
