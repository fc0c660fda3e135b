#ifndef SHELLFRAME_STACK_BLUR_H
#define SHELLFRAME_STACK_BLUR_H

#include <blend2d.h>

#include <cstdint>

namespace shellframe {

inline constexpr uint32_t max_blur_radius = 255;

// Blurs a PRGB32 image in place with a stack blur of the given radius,
// a horizontal pass followed by a vertical pass. Radius 0 keeps the
// image as it is, radii above 255 are clamped.
//
// Throws BlurProcessingError if the pixels cannot be accessed or the
// image is not PRGB32.
auto stack_blur(BLImage &image, uint32_t radius) -> void;

}  // namespace shellframe

#endif
