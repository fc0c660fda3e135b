#include "stack_blur.h"

#include "errors.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <vector>

namespace shellframe {

namespace {

using Channels = std::array<uint64_t, 4>;

[[nodiscard]] auto unpack(uint32_t pixel) -> Channels {
    return Channels {
        (pixel >> 24) & 0xFF,
        (pixel >> 16) & 0xFF,
        (pixel >> 8) & 0xFF,
        pixel & 0xFF,
    };
}

[[nodiscard]] auto pack(const Channels &sum, uint64_t divisor) -> uint32_t {
    auto pixel = uint32_t {0};
    for (const auto value : sum) {
        pixel = (pixel << 8) | static_cast<uint32_t>(std::min<uint64_t>(value / divisor, 255));
    }
    return pixel;
}

auto add(Channels &target, const Channels &value, uint64_t weight = 1) -> void {
    for (std::size_t c = 0; c < target.size(); ++c) {
        target[c] += value[c] * weight;
    }
}

auto subtract(Channels &target, const Channels &value) -> void {
    for (std::size_t c = 0; c < target.size(); ++c) {
        target[c] -= value[c];
    }
}

// Blurs `count` pixels spaced `step` pixels apart. Every pixel is read
// before the pixel at the same position is written, so this works in place.
auto blur_line(uint32_t *pixels, int count, std::ptrdiff_t step, int radius,
               std::vector<Channels> &stack) -> void {
    const auto div = 2 * radius + 1;
    const auto divisor = static_cast<uint64_t>(radius + 1) * static_cast<uint64_t>(radius + 1);
    const auto last = count - 1;

    auto sum = Channels {};
    auto sum_in = Channels {};
    auto sum_out = Channels {};

    const auto first = unpack(pixels[0]);
    for (int i = 0; i <= radius; ++i) {
        stack[static_cast<std::size_t>(i)] = first;
        add(sum, first, static_cast<uint64_t>(i + 1));
        add(sum_out, first);
    }

    for (int i = 1; i <= radius; ++i) {
        const auto value = unpack(pixels[std::min(i, last) * step]);
        stack[static_cast<std::size_t>(i + radius)] = value;
        add(sum, value, static_cast<uint64_t>(radius + 1 - i));
        add(sum_in, value);
    }

    auto sp = radius;
    auto xp = std::min(radius, last);

    for (int x = 0; x < count; ++x) {
        pixels[x * step] = pack(sum, divisor);

        subtract(sum, sum_out);

        auto stack_start = sp + div - radius;
        if (stack_start >= div) {
            stack_start -= div;
        }
        auto &outgoing = stack[static_cast<std::size_t>(stack_start)];
        subtract(sum_out, outgoing);

        if (xp < last) {
            ++xp;
        }
        outgoing = unpack(pixels[xp * step]);
        add(sum_in, outgoing);
        add(sum, sum_in);

        if (++sp >= div) {
            sp = 0;
        }
        const auto &incoming = stack[static_cast<std::size_t>(sp)];
        add(sum_out, incoming);
        subtract(sum_in, incoming);
    }
}

}  // namespace

auto stack_blur(BLImage &image, uint32_t radius) -> void {
    radius = std::min(radius, max_blur_radius);
    if (radius == 0) {
        return;
    }

    BLImageData data {};
    if (const auto result = image.makeMutable(&data); result != BL_SUCCESS) {
        throw BlurProcessingError("Unable to access shadow pixels for blurring");
    }
    if (data.format != BL_FORMAT_PRGB32) {
        throw BlurProcessingError("Shadow blur requires a PRGB32 image");
    }

    const auto width = data.size.w;
    const auto height = data.size.h;
    if (width <= 0 || height <= 0) {
        return;
    }
    if (data.stride % static_cast<std::ptrdiff_t>(sizeof(uint32_t)) != 0) {
        throw BlurProcessingError("Unsupported image stride for blurring");
    }

    auto *base = static_cast<uint8_t *>(data.pixelData);
    const auto row_step = data.stride / static_cast<std::ptrdiff_t>(sizeof(uint32_t));
    const auto r = static_cast<int>(radius);

    auto stack = std::vector<Channels>(static_cast<std::size_t>(2 * r + 1));

    for (int y = 0; y < height; ++y) {
        auto *row = reinterpret_cast<uint32_t *>(base + y * data.stride);
        blur_line(row, width, 1, r, stack);
    }

    for (int x = 0; x < width; ++x) {
        auto *column = reinterpret_cast<uint32_t *>(base) + x;
        blur_line(column, height, row_step, r, stack);
    }
}

}  // namespace shellframe
