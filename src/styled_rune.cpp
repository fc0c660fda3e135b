#include "styled_rune.h"

namespace shellframe {

auto encode_color(Rgb color, int shift) -> StyleWord {
    const auto packed = StyleWord {color.r} | (StyleWord {color.g} << 8) |
                        (StyleWord {color.b} << 16);
    return packed << shift;
}

auto decode_color(StyleWord word, int shift) -> Rgb {
    return Rgb {
        .r = static_cast<uint8_t>((word >> shift) & 0xFF),
        .g = static_cast<uint8_t>((word >> (shift + 8)) & 0xFF),
        .b = static_cast<uint8_t>((word >> (shift + 16)) & 0xFF),
    };
}

auto decode_style(StyleWord word) -> Style {
    auto style = Style {};

    style.style_class =
        static_cast<StyleClass>((word & style_class_mask) >> style_class_shift);

    if ((word & style_foreground_bit) != 0) {
        style.has_foreground = true;
        style.foreground = decode_color(word, style_foreground_shift);
    }

    if ((word & style_background_bit) != 0) {
        style.has_background = true;
        style.background = decode_color(word, style_background_shift);
    }

    return style;
}

auto encode_style(const Style &style) -> StyleWord {
    auto word = (StyleWord {static_cast<uint8_t>(style.style_class)}
                 << style_class_shift) &
                style_class_mask;

    if (style.has_foreground) {
        word |= style_foreground_bit | encode_color(style.foreground, style_foreground_shift);
    }

    if (style.has_background) {
        word |= style_background_bit | encode_color(style.background, style_background_shift);
    }

    return word;
}

auto is_control_symbol(char32_t symbol) -> bool {
    return symbol == U'\n' || symbol == U'\t';
}

//
// Rune Stream
//

auto RuneStream::append(const StyledRune &rune) -> void {
    runes_.push_back(rune);
}

auto RuneStream::append(std::span<const StyledRune> runes) -> void {
    runes_.insert(runes_.end(), runes.begin(), runes.end());
}

auto RuneStream::size() const noexcept -> std::size_t {
    return runes_.size();
}

auto RuneStream::empty() const noexcept -> bool {
    return runes_.empty();
}

auto RuneStream::operator[](std::size_t index) const -> const StyledRune & {
    return runes_.at(index);
}

auto RuneStream::begin() const noexcept -> const_iterator {
    return runes_.begin();
}

auto RuneStream::end() const noexcept -> const_iterator {
    return runes_.end();
}

auto RuneStream::symbols() const -> std::u32string {
    auto result = std::u32string {};
    result.reserve(runes_.size());

    for (const auto &rune : runes_) {
        result.push_back(rune.symbol);
    }

    return result;
}

auto RuneStream::utf8() const -> std::string {
    return to_utf8(symbols());
}

//
// UTF-8
//

auto append_utf8(std::string &out, char32_t codepoint) -> void {
    if (codepoint > 0x10FFFF || (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
        codepoint = 0xFFFD;
    }

    if (codepoint < 0x80) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}

auto to_utf8(std::u32string_view text) -> std::string {
    auto result = std::string {};
    result.reserve(text.size());

    for (const auto codepoint : text) {
        append_utf8(result, codepoint);
    }

    return result;
}

}  // namespace shellframe
