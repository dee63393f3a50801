#pragma once
#include <tao/pegtl.hpp>

namespace flashdeck::grammar {
using namespace tao::pegtl;

// Character classes rewritten by the normalization rules
struct unicode_space : sor< utf8::one< 0x00A0, 0x1680, 0x202F, 0x205F, 0x3000 >,
                            utf8::range< 0x2000, 0x200A >,
                            one< '\t' > > {};
struct invisible : utf8::one< 0x200B, 0x200C, 0x200D, 0x2060, 0xFEFF > {};
struct dash_variant : utf8::one< 0x2010, 0x2011, 0x2012, 0x2013, 0x2014, 0x2015,
                                 0x2212, 0x2E3A, 0x2E3B, 0xFE63, 0xFF0D > {};
// Invalid UTF-8 bytes pass through untouched
struct other_char : sor< utf8::any, any > {};

struct space_scan : seq< star< sor< unicode_space, invisible, other_char > >, eof > {};
struct dash_scan : seq< star< sor< dash_variant, other_char > >, eof > {};

// Leading numbering: "12. ", "3) ", "(4) ", "5 ". A number directly followed by
// the separator is the term itself ("2024 - year") and is not numbering.
struct numeral : plus< digit > {};
struct punctuated_number : sor< seq< one< '(' >, numeral, one< ')' > >,
                                seq< numeral, one< '.', ')' > > > {};
struct numbering_gap : seq< plus< blank >, not_at< one< '-' > > > {};
struct numbering : seq< star< blank >, sor< punctuated_number, numeral >, numbering_gap > {};
struct punctuated_numbering : seq< star< blank >, punctuated_number, numbering_gap > {};

// Canonical delimiter between term and definition
struct separator : string< ' ', '-', ' ' > {};
struct separator_scan : seq< star< sor< separator, any > >, eof > {};

struct utf8_text : seq< star< utf8::any >, eof > {};

} // namespace flashdeck::grammar
