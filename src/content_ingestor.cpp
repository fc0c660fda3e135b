#include "content_ingestor.h"

namespace shellframe {

auto wrap_runes(std::span<const StyledRune> runes, int columns) -> std::vector<StyledRune> {
    auto result = std::vector<StyledRune> {};
    result.reserve(runes.size());

    auto counter = 0;
    for (const auto &rune : runes) {
        ++counter;

        if (rune.symbol == U'\n') {
            counter = 0;
        }

        if (counter > columns) {
            counter = 0;
            result.push_back(StyledRune {.symbol = U'\n', .style = rune.style});
        }

        result.push_back(rune);
    }

    return result;
}

}  // namespace shellframe
