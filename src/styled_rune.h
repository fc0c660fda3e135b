#ifndef SHELLFRAME_STYLED_RUNE_H
#define SHELLFRAME_STYLED_RUNE_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace shellframe {

struct Rgb {
    uint8_t r {};
    uint8_t g {};
    uint8_t b {};

    [[nodiscard]] auto operator==(const Rgb &other) const -> bool = default;
};

// value of bits 2-4 of the style word, not a set of flags
enum class StyleClass : uint8_t {
    regular = 0,
    bold = 1,
    italic = 2,
    bold_italic = 3,
    underline = 4,
};

//
// Packed Style Word
//
// bit 0      foreground color set
// bit 1      background color set
// bits 2-4   style class
// bits 8-31  foreground r, g, b (r in the lowest byte)
// bits 32-55 background r, g, b
//

using StyleWord = uint64_t;

inline constexpr StyleWord style_foreground_bit = 0x01;
inline constexpr StyleWord style_background_bit = 0x02;
inline constexpr StyleWord style_bold_bit = 0x04;
inline constexpr StyleWord style_italic_bit = 0x08;
inline constexpr StyleWord style_underline_bit = 0x10;
inline constexpr StyleWord style_class_mask = 0x1C;
inline constexpr int style_class_shift = 2;
inline constexpr int style_foreground_shift = 8;
inline constexpr int style_background_shift = 32;

struct Style {
    bool has_foreground {false};
    Rgb foreground {};
    bool has_background {false};
    Rgb background {};
    // may hold the out-of-range values 5-7 of the packed word
    StyleClass style_class {StyleClass::regular};

    [[nodiscard]] auto operator==(const Style &other) const -> bool = default;
};

[[nodiscard]] auto decode_style(StyleWord word) -> Style;
[[nodiscard]] auto encode_style(const Style &style) -> StyleWord;

[[nodiscard]] auto encode_color(Rgb color, int shift) -> StyleWord;
[[nodiscard]] auto decode_color(StyleWord word, int shift) -> Rgb;

struct StyledRune {
    char32_t symbol {};
    Style style {};

    [[nodiscard]] auto operator==(const StyledRune &other) const -> bool = default;
};

[[nodiscard]] auto is_control_symbol(char32_t symbol) -> bool;

// Append only sequence of styled runes, the content of a rendering session.
class RuneStream {
   public:
    using const_iterator = std::vector<StyledRune>::const_iterator;

    auto append(const StyledRune &rune) -> void;
    auto append(std::span<const StyledRune> runes) -> void;

    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto empty() const noexcept -> bool;
    [[nodiscard]] auto operator[](std::size_t index) const -> const StyledRune &;
    [[nodiscard]] auto begin() const noexcept -> const_iterator;
    [[nodiscard]] auto end() const noexcept -> const_iterator;

    // literal characters without style
    [[nodiscard]] auto symbols() const -> std::u32string;
    [[nodiscard]] auto utf8() const -> std::string;

   private:
    std::vector<StyledRune> runes_ {};
};

auto append_utf8(std::string &out, char32_t codepoint) -> void;
[[nodiscard]] auto to_utf8(std::u32string_view text) -> std::string;

}  // namespace shellframe

#endif
