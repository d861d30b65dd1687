#ifndef CUTOUT_COMPOSITOR_HPP
#define CUTOUT_COMPOSITOR_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "ImageProcessor.hpp"

namespace cutout {

struct Rgb {
    uint8_t r;
    uint8_t g;
    uint8_t b;

    bool operator==(const Rgb& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
};

/**
 * @brief Places a cut-out foreground onto a solid background color
 */
class Compositor {
public:
    /**
     * @brief Parse a "#RRGGBB" color, hex digits in either case
     * @throws ProcessingError(InvalidColor) for any other form, including
     *         "#RGB", "#RRGGBBAA" and color names
     */
    static Rgb parse_color(const std::string& text);

    /**
     * @brief Source-over composite of an RGBA image onto a solid color
     *
     * Without a color the image is returned unchanged. With a color the
     * result is a fully opaque 3-channel image of the same size.
     *
     * @throws std::invalid_argument if a color is given and the image is not RGBA
     */
    static Image composite(const Image& foreground, const std::optional<Rgb>& background);
};

} // namespace cutout

#endif // CUTOUT_COMPOSITOR_HPP
