#include "ansi_tokenizer.h"

#include "errors.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>

namespace shellframe {

namespace {

constexpr char escape = '\x1b';
constexpr char32_t replacement_character = 0xFFFD;

constexpr auto base_palette = std::array<Rgb, 16> {{
    {0x00, 0x00, 0x00},
    {0xCD, 0x00, 0x00},
    {0x00, 0xCD, 0x00},
    {0xCD, 0xCD, 0x00},
    {0x00, 0x00, 0xEE},
    {0xCD, 0x00, 0xCD},
    {0x00, 0xCD, 0xCD},
    {0xE5, 0xE5, 0xE5},
    {0x7F, 0x7F, 0x7F},
    {0xFF, 0x00, 0x00},
    {0x00, 0xFF, 0x00},
    {0xFF, 0xFF, 0x00},
    {0x5C, 0x5C, 0xFF},
    {0xFF, 0x00, 0xFF},
    {0x00, 0xFF, 0xFF},
    {0xFF, 0xFF, 0xFF},
}};

constexpr auto cube_levels = std::array<uint8_t, 6> {0, 95, 135, 175, 215, 255};

constexpr StyleWord color_field = 0xFFFFFF;

auto set_color(StyleWord &word, StyleWord flag, int shift, Rgb color) -> void {
    word &= ~(color_field << shift);
    word |= flag | encode_color(color, shift);
}

auto clear_color(StyleWord &word, StyleWord flag, int shift) -> void {
    word &= ~(color_field << shift);
    word &= ~flag;
}

[[nodiscard]] auto clamp_channel(int value) -> uint8_t {
    return static_cast<uint8_t>(std::clamp(value, 0, 255));
}

auto parse_params(std::string_view s, std::vector<int> &out) -> void {
    out.clear();
    int cur = 0;
    bool have = false;
    for (const char ch : s) {
        if (ch >= '0' && ch <= '9') {
            have = true;
            cur = std::min(cur * 10 + (ch - '0'), 0xFFFF);
            continue;
        }
        if (ch == ';' || ch == ':') {
            out.push_back(have ? cur : 0);
            cur = 0;
            have = false;
            continue;
        }
        // private markers such as '?' carry no meaning here
    }
    out.push_back(have ? cur : 0);
}

// Consumes the extended color arguments after 38 or 48, returns the
// number of parameters used beyond the introducer.
[[nodiscard]] auto apply_extended_color(StyleWord &word, StyleWord flag, int shift,
                                        const std::vector<int> &params,
                                        std::size_t i) -> std::size_t {
    if (i + 1 >= params.size()) {
        return params.size() - i - 1;
    }

    switch (params[i + 1]) {
        case 5:
            if (i + 2 < params.size()) {
                set_color(word, flag, shift, xterm_color(params[i + 2]));
                return 2;
            }
            break;
        case 2:
            if (i + 4 < params.size()) {
                set_color(word, flag, shift,
                          Rgb {clamp_channel(params[i + 2]), clamp_channel(params[i + 3]),
                               clamp_channel(params[i + 4])});
                return 4;
            }
            break;
        default:
            break;
    }

    // malformed, ignore the rest of the sequence
    return params.size() - i - 1;
}

auto apply_sgr(StyleWord &word, const std::vector<int> &params) -> void {
    for (std::size_t i = 0; i < params.size(); ++i) {
        const auto p = params[i];

        if (p == 0) {
            word = 0;
        } else if (p == 1) {
            word |= style_bold_bit;
        } else if (p == 3) {
            word |= style_italic_bit;
        } else if (p == 4) {
            word |= style_underline_bit;
        } else if (p == 22) {
            word &= ~style_bold_bit;
        } else if (p == 23) {
            word &= ~style_italic_bit;
        } else if (p == 24) {
            word &= ~style_underline_bit;
        } else if (p >= 30 && p <= 37) {
            set_color(word, style_foreground_bit, style_foreground_shift,
                      xterm_color(p - 30));
        } else if (p >= 90 && p <= 97) {
            set_color(word, style_foreground_bit, style_foreground_shift,
                      xterm_color(p - 90 + 8));
        } else if (p >= 40 && p <= 47) {
            set_color(word, style_background_bit, style_background_shift,
                      xterm_color(p - 40));
        } else if (p >= 100 && p <= 107) {
            set_color(word, style_background_bit, style_background_shift,
                      xterm_color(p - 100 + 8));
        } else if (p == 38) {
            i += apply_extended_color(word, style_foreground_bit, style_foreground_shift,
                                      params, i);
        } else if (p == 48) {
            i += apply_extended_color(word, style_background_bit, style_background_shift,
                                      params, i);
        } else if (p == 39) {
            clear_color(word, style_foreground_bit, style_foreground_shift);
        } else if (p == 49) {
            clear_color(word, style_background_bit, style_background_shift);
        }
    }
}

[[nodiscard]] auto decode_utf8(std::string_view text, std::size_t &i) -> char32_t {
    const auto lead = static_cast<uint8_t>(text[i]);

    auto length = std::size_t {0};
    auto codepoint = char32_t {0};
    if (lead < 0x80) {
        ++i;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        codepoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        codepoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        codepoint = lead & 0x07;
    } else {
        ++i;
        return replacement_character;
    }

    if (i + length > text.size()) {
        ++i;
        return replacement_character;
    }

    for (std::size_t k = 1; k < length; ++k) {
        const auto next = static_cast<uint8_t>(text[i + k]);
        if ((next & 0xC0) != 0x80) {
            ++i;
            return replacement_character;
        }
        codepoint = (codepoint << 6) | (next & 0x3F);
    }

    // reject overlong forms and surrogates
    constexpr char32_t minimum[] = {0, 0, 0x80, 0x800, 0x10000};
    if (codepoint < minimum[length] || codepoint > 0x10FFFF ||
        (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
        ++i;
        return replacement_character;
    }

    i += length;
    return codepoint;
}

// Returns the index after the escape sequence starting at i.
[[nodiscard]] auto parse_escape(std::string_view text, std::size_t i, StyleWord &word,
                                std::vector<int> &params) -> std::size_t {
    const auto start = i;
    if (i + 1 >= text.size()) {
        throw InputStreamError("Unterminated escape sequence at byte " +
                               std::to_string(start));
    }

    const auto kind = text[i + 1];
    i += 2;

    if (kind == '[') {
        const auto params_begin = i;
        while (i < text.size()) {
            const auto ch = static_cast<uint8_t>(text[i]);
            if (ch >= 0x40 && ch <= 0x7E) {
                if (ch == 'm') {
                    parse_params(text.substr(params_begin, i - params_begin), params);
                    apply_sgr(word, params);
                }
                return i + 1;
            }
            ++i;
        }
    } else if (kind == ']') {
        // operating system command, terminated by BEL or ST
        while (i < text.size()) {
            if (text[i] == '\a') {
                return i + 1;
            }
            if (text[i] == escape && i + 1 < text.size() && text[i + 1] == '\\') {
                return i + 2;
            }
            ++i;
        }
    } else {
        // intermediate bytes, e.g. charset designation ESC ( B
        i = start + 1;
        while (i < text.size() && static_cast<uint8_t>(text[i]) >= 0x20 &&
               static_cast<uint8_t>(text[i]) <= 0x2F) {
            ++i;
        }
        if (i < text.size()) {
            const auto final_byte = static_cast<uint8_t>(text[i]);
            return final_byte >= 0x30 && final_byte <= 0x7E ? i + 1 : i;
        }
    }

    throw InputStreamError("Unterminated escape sequence at byte " +
                           std::to_string(start));
}

}  // namespace

auto xterm_color(int index) -> Rgb {
    index = std::clamp(index, 0, 255);

    if (index < 16) {
        return base_palette[static_cast<std::size_t>(index)];
    }

    if (index < 232) {
        const auto cube = index - 16;
        return Rgb {
            .r = cube_levels[static_cast<std::size_t>(cube / 36)],
            .g = cube_levels[static_cast<std::size_t>((cube / 6) % 6)],
            .b = cube_levels[static_cast<std::size_t>(cube % 6)],
        };
    }

    const auto gray = static_cast<uint8_t>(8 + 10 * (index - 232));
    return Rgb {gray, gray, gray};
}

auto tokenize_ansi(std::string_view text) -> std::vector<StyledRune> {
    auto result = std::vector<StyledRune> {};
    result.reserve(text.size());

    auto word = StyleWord {0};
    auto style = decode_style(word);
    auto params = std::vector<int> {};

    auto i = std::size_t {0};
    while (i < text.size()) {
        if (text[i] == escape) {
            i = parse_escape(text, i, word, params);
            style = decode_style(word);
            continue;
        }

        if (text[i] == '\r') {
            ++i;
            continue;
        }

        result.push_back(StyledRune {.symbol = decode_utf8(text, i), .style = style});
    }

    return result;
}

auto tokenize_ansi(std::istream &in) -> std::vector<StyledRune> {
    if (!in) {
        throw InputStreamError("Input stream is not readable");
    }

    const auto text =
        std::string {std::istreambuf_iterator<char> {in}, std::istreambuf_iterator<char> {}};
    if (in.bad()) {
        throw InputStreamError("Failed to read input stream");
    }

    return tokenize_ansi(text);
}

}  // namespace shellframe
