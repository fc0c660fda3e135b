#ifndef SHELLFRAME_CANVAS_CLIPPER_H
#define SHELLFRAME_CANVAS_CLIPPER_H

#include <blend2d.h>

#include <optional>

namespace shellframe {

// Smallest rectangle that covers every pixel with a non-zero channel, or
// nothing if the whole image is transparent.
[[nodiscard]] auto find_content_bounds(const BLImage &image) -> std::optional<BLRectI>;

// Copy of the content bounds of the image. A fully transparent image is
// returned unchanged.
[[nodiscard]] auto clip_canvas(const BLImage &image) -> BLImage;

}  // namespace shellframe

#endif
