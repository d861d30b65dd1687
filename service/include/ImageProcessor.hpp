#ifndef CUTOUT_IMAGEPROCESSOR_HPP
#define CUTOUT_IMAGEPROCESSOR_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include <string>
#include <stdexcept>
#include <utility>

namespace cutout {

/**
 * @brief Image container formats the service can decode
 */
enum class ImageFormat {
    PNG,
    JPEG,
    WEBP,
    BMP,
    TIFF,
    UNKNOWN
};

/**
 * @brief Decoded raster
 *
 * Interleaved 8-bit samples, row-major, no row padding.
 */
struct Image {
    int width;
    int height;
    int channels;  // 1=mask, 3=RGB, 4=RGBA
    std::vector<uint8_t> data;

    Image() : width(0), height(0), channels(0) {}

    Image(int w, int h, int c)
        : width(w), height(h), channels(c),
          data(static_cast<size_t>(w) * static_cast<size_t>(h) * static_cast<size_t>(c)) {}

    Image(int w, int h, int c, std::vector<uint8_t> d)
        : width(w), height(h), channels(c), data(std::move(d)) {}

    /**
     * @brief Check if image is valid
     */
    bool is_valid() const {
        return width > 0 && height > 0 && channels > 0 &&
               data.size() == pixel_count() * static_cast<size_t>(channels);
    }

    size_t pixel_count() const {
        return static_cast<size_t>(width) * static_cast<size_t>(height);
    }

    bool has_alpha() const { return channels == 4; }

    /**
     * @brief Get size in bytes
     */
    size_t size_bytes() const {
        return data.size();
    }

    bool operator==(const Image& other) const {
        return width == other.width && height == other.height &&
               channels == other.channels && data == other.data;
    }

    bool operator!=(const Image& other) const { return !(*this == other); }
};

/**
 * @brief Container format and pixel size read from the header alone
 */
struct ImageInfo {
    ImageFormat format;
    int width;
    int height;
};

/**
 * @brief Decoding, encoding and resampling built on stb, libwebp and libtiff
 *
 * All operations are stateless and thread-safe.
 */
class ImageProcessor {
public:
    /**
     * @brief Identify the container format from the leading bytes
     * @return Detected format, UNKNOWN if the signature is not recognised
     */
    static ImageFormat sniff_format(const uint8_t* data, size_t size);

    /**
     * @brief Read format and dimensions without decoding any pixels
     * @param data Pointer to encoded bytes
     * @param size Size of data in bytes
     * @throws std::runtime_error if the format is unknown or the header is unreadable
     */
    static ImageInfo read_info(const uint8_t* data, size_t size);

    /**
     * @brief Decode an image from memory into RGBA
     * @param data Pointer to encoded bytes
     * @param size Size of data in bytes
     * @return 4-channel image
     * @throws std::runtime_error if the format is unknown or decoding fails
     */
    static Image decode(const uint8_t* data, size_t size);

    /**
     * @brief Encode image as PNG
     *
     * 4-channel images keep their alpha channel.
     *
     * @throws std::runtime_error if encoding fails
     */
    static std::vector<uint8_t> encode_png(const Image& img);

    /**
     * @brief Resize image to new dimensions
     * @param src Source image
     * @param new_width Target width
     * @param new_height Target height
     * @return Resized image
     * @throws std::runtime_error if resize fails
     */
    static Image resize(const Image& src, int new_width, int new_height);

    /**
     * @brief Downscale so the longer side is at most max_dimension
     *
     * Aspect ratio is preserved and the shorter side is rounded down. Images
     * already within the bound are returned unchanged; never upscales.
     *
     * @throws std::invalid_argument if max_dimension is not positive
     * @throws std::runtime_error if resize fails
     */
    static Image fit_within(const Image& src, int max_dimension);
};

/**
 * @brief Base64 encoding/decoding utilities
 */
class Base64 {
public:
    /**
     * @brief Encode binary data to base64 string
     * @param data Pointer to binary data
     * @param size Size of data in bytes
     * @return Base64-encoded string
     */
    static std::string encode(const uint8_t* data, size_t size);

    /**
     * @brief Decode base64 string to binary data
     * @param base64 Base64-encoded string
     * @return Decoded binary data
     * @throws std::runtime_error if decoding fails
     */
    static std::vector<uint8_t> decode(const std::string& base64);
};

} // namespace cutout

#endif // CUTOUT_IMAGEPROCESSOR_HPP
