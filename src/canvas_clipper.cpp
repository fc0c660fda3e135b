#include "canvas_clipper.h"

#include "errors.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>

namespace shellframe {

namespace {

[[nodiscard]] auto read_pixels(const BLImage &image) -> BLImageData {
    BLImageData data {};
    if (const auto result = image.getData(&data); result != BL_SUCCESS) {
        throw EncodingError("Unable to access canvas pixels");
    }
    if (data.format != BL_FORMAT_PRGB32 && data.format != BL_FORMAT_XRGB32) {
        throw EncodingError("Canvas clipping requires a 32-bit image");
    }
    return data;
}

}  // namespace

auto find_content_bounds(const BLImage &image) -> std::optional<BLRectI> {
    const auto data = read_pixels(image);
    const auto *base = static_cast<const uint8_t *>(data.pixelData);

    auto min_x = data.size.w;
    auto min_y = data.size.h;
    auto max_x = -1;
    auto max_y = -1;

    for (int y = 0; y < data.size.h; ++y) {
        const auto *row = reinterpret_cast<const uint32_t *>(base + y * data.stride);

        for (int x = 0; x < data.size.w; ++x) {
            // all four channels zero
            if (row[x] == 0) {
                continue;
            }

            min_x = std::min(min_x, x);
            min_y = std::min(min_y, y);
            max_x = std::max(max_x, x);
            max_y = std::max(max_y, y);
        }
    }

    if (max_x < 0) {
        return std::nullopt;
    }

    return BLRectI {min_x, min_y, max_x - min_x + 1, max_y - min_y + 1};
}

auto clip_canvas(const BLImage &image) -> BLImage {
    const auto bounds = find_content_bounds(image);
    if (!bounds) {
        spdlog::warn("CanvasClipper: canvas is fully transparent, keeping {}x{}",
                     image.width(), image.height());
        return image;
    }

    BLImage clipped;
    if (const auto result = clipped.create(bounds->w, bounds->h, image.format());
        result != BL_SUCCESS) {
        throw EncodingError("Unable to allocate clipped canvas");
    }

    BLContext ctx(clipped);
    ctx.setCompOp(BL_COMP_OP_SRC_COPY);
    ctx.blitImage(BLPointI(0, 0), image, *bounds);
    if (const auto result = ctx.end(); result != BL_SUCCESS) {
        throw EncodingError("Unable to copy clipped canvas");
    }

    return clipped;
}

}  // namespace shellframe
