#ifndef SHELLFRAME_ANSI_TOKENIZER_H
#define SHELLFRAME_ANSI_TOKENIZER_H

#include "styled_rune.h"

#include <istream>
#include <string_view>
#include <vector>

namespace shellframe {

// Decodes UTF-8 text carrying ANSI SGR escape sequences into styled runes.
//
// Bold, italic and underline set their own bit of the style word, the
// resulting style class is the sum of the active attributes. Escape
// sequences other than SGR are skipped, carriage returns are dropped and
// invalid UTF-8 decodes to U+FFFD.
//
// Throws InputStreamError for unreadable streams and for an escape
// sequence that is cut off by the end of the input.
[[nodiscard]] auto tokenize_ansi(std::string_view text) -> std::vector<StyledRune>;
[[nodiscard]] auto tokenize_ansi(std::istream &in) -> std::vector<StyledRune>;

// xterm 256 color palette, out-of-range indices are clamped
[[nodiscard]] auto xterm_color(int index) -> Rgb;

}  // namespace shellframe

#endif
