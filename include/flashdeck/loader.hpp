// loader.hpp - one-shot file reads feeding the line parser
#pragma once
#include "flashdeck/line_parser.hpp"
#include <optional>
#include <string>

namespace flashdeck {

// Whole file as bytes, or nullopt when it cannot be opened or read.
std::optional<std::string> read_text_file(const std::string& path);

bool is_valid_utf8(const std::string& bytes);

// Read, validate and parse. I/O and encoding failures come back as FailureKind::IoError.
ParseResult load_deck_file(const std::string& path, const ParseOptions& opts = ParseOptions::from_env());

} // namespace flashdeck
