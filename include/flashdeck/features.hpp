// features.hpp - environment flags controlling parsing policy and tracing
#pragma once
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>

namespace flashdeck {

inline bool flag_enabled(const char* name) {
    const char* v = std::getenv(name);
    if(!v) return false;
    return *v=='1' || *v=='t' || *v=='T' || *v=='y' || *v=='Y';
}
inline bool partial_load_enabled(){ return flag_enabled("FLASHDECK_PARTIAL_LOAD"); }
inline bool debug_trace_enabled(){ return flag_enabled("FLASHDECK_DEBUG"); }
inline bool diag_json_enabled(){ return flag_enabled("FLASHDECK_DIAG_JSON"); }

// FLASHDECK_SHUFFLE_SEED=<unsigned>; unset or malformed means nondeterministic.
inline std::optional<std::uint32_t> shuffle_seed(){
    const char* v = std::getenv("FLASHDECK_SHUFFLE_SEED");
    if(!v || !*v) return std::nullopt;
    char* end = nullptr;
    unsigned long parsed = std::strtoul(v, &end, 10);
    if(!end || *end!='\0') return std::nullopt;
    return static_cast<std::uint32_t>(parsed);
}

} // namespace flashdeck
