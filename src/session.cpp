#include "flashdeck/session.hpp"
#include "flashdeck/features.hpp"
#include "flashdeck/loader.hpp"

namespace flashdeck {

static std::uint32_t initial_seed(){
    if(auto seed = shuffle_seed()) return *seed;
    return std::random_device{}();
}

Session::Session(ParseOptions opts): opts_(opts), rng_(initial_seed()) {}

Session::Session(ParseOptions opts, std::uint32_t seed): opts_(opts), rng_(seed) {}

const ParseResult& Session::open(const std::string& path){
    last_path_ = path;
    last_ = load_deck_file(path, opts_);
    if(last_.success) deck_ = last_.deck;
    else deck_.clear();
    return last_;
}

const ParseResult& Session::reload(){
    if(last_path_.empty()){
        last_ = ParseResult{};
        last_.failure = FailureKind::IoError;
        last_.error_message = "no file has been opened";
        return last_;
    }
    const std::string path = last_path_;
    return open(path);
}

void Session::shuffle(){
    if(deck_.empty()) return;
    deck_ = shuffled(deck_, rng_);
}

} // namespace flashdeck
