#ifndef SHELLFRAME_CONTENT_INGESTOR_H
#define SHELLFRAME_CONTENT_INGESTOR_H

#include "styled_rune.h"

#include <span>
#include <vector>

namespace shellframe {

// Inserts a line break, styled like the rune that overflows, whenever a
// line grows past `columns` runes.
//
// The column counter starts at zero on every call, so separate calls are
// wrapped as independent paragraphs. The rune that triggers the break
// starts the new line while the counter restarts at zero.
[[nodiscard]] auto wrap_runes(std::span<const StyledRune> runes, int columns)
    -> std::vector<StyledRune>;

}  // namespace shellframe

#endif
