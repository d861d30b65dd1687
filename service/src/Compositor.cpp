#include "Compositor.hpp"
#include "Errors.hpp"

#include <stdexcept>

namespace cutout {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// (fg * a + bg * (255 - a)) / 255, rounded to nearest
inline uint8_t blend(uint8_t fg, uint8_t bg, uint8_t alpha) {
    uint32_t sum = static_cast<uint32_t>(fg) * alpha +
                   static_cast<uint32_t>(bg) * (255u - alpha);
    return static_cast<uint8_t>((sum + 127u) / 255u);
}

} // anonymous namespace

Rgb Compositor::parse_color(const std::string& text) {
    if (text.size() != 7 || text[0] != '#') {
        throw ProcessingError(ErrorKind::InvalidColor, "Color '" + text + "' is not #RRGGBB");
    }

    uint8_t channels[3];
    for (int i = 0; i < 3; ++i) {
        int high = hex_value(text[1 + i * 2]);
        int low = hex_value(text[2 + i * 2]);
        if (high < 0 || low < 0) {
            throw ProcessingError(ErrorKind::InvalidColor, "Color '" + text + "' is not hex");
        }
        channels[i] = static_cast<uint8_t>(high * 16 + low);
    }

    return Rgb{channels[0], channels[1], channels[2]};
}

Image Compositor::composite(const Image& foreground, const std::optional<Rgb>& background) {
    if (!background) {
        return foreground;
    }

    if (!foreground.is_valid() || foreground.channels != 4) {
        throw std::invalid_argument("Compositing requires a valid RGBA image");
    }

    const Rgb bg = *background;
    Image result(foreground.width, foreground.height, 3);
    const uint8_t* src = foreground.data.data();
    uint8_t* dst = result.data.data();

    for (size_t i = 0, n = foreground.pixel_count(); i < n; ++i, src += 4, dst += 3) {
        uint8_t alpha = src[3];
        dst[0] = blend(src[0], bg.r, alpha);
        dst[1] = blend(src[1], bg.g, alpha);
        dst[2] = blend(src[2], bg.b, alpha);
    }

    return result;
}

} // namespace cutout
