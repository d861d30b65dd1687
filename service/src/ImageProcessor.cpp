#include "ImageProcessor.hpp"
#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <limits>
#include <memory>
#include <mutex>
#include <utility>

// Include stb headers (implementations are in stb_impl.cpp)
#include <stb_image.h>
#include <stb_image_write.h>
#include <stb_image_resize2.h>

#include <webp/decode.h>
#include <tiffio.h>

namespace cutout {

// ============================================================================
// Base64 Implementation
// ============================================================================

static const char base64_chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

std::string Base64::encode(const uint8_t* data, size_t size) {
    std::string result;
    result.reserve(((size + 2) / 3) * 4);

    for (size_t i = 0; i < size; i += 3) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16);
        if (i + 1 < size) triple |= (static_cast<uint32_t>(data[i + 1]) << 8);
        if (i + 2 < size) triple |= data[i + 2];

        result.push_back(base64_chars[(triple >> 18) & 0x3F]);
        result.push_back(base64_chars[(triple >> 12) & 0x3F]);
        result.push_back((i + 1 < size) ? base64_chars[(triple >> 6) & 0x3F] : '=');
        result.push_back((i + 2 < size) ? base64_chars[triple & 0x3F] : '=');
    }

    return result;
}

std::vector<uint8_t> Base64::decode(const std::string& base64) {
    static const std::array<int, 256> decode_table = [] {
        std::array<int, 256> table;
        table.fill(-1);
        for (int i = 0; i < 64; ++i) {
            table[static_cast<uint8_t>(base64_chars[i])] = i;
        }
        return table;
    }();

    // Line breaks are tolerated, everything else must be alphabet or padding
    std::string clean;
    clean.reserve(base64.size());
    for (char c : base64) {
        if (c != '\r' && c != '\n') {
            clean.push_back(c);
        }
    }

    if (clean.size() % 4 != 0) {
        throw std::runtime_error("Invalid base64 length");
    }

    std::vector<uint8_t> result;
    result.reserve((clean.size() / 4) * 3);

    for (size_t i = 0; i < clean.size(); i += 4) {
        uint32_t triple = 0;
        int padding = 0;

        for (int j = 0; j < 4; ++j) {
            char c = clean[i + j];
            if (c == '=') {
                if (i + 4 != clean.size() || j < 2) {
                    throw std::runtime_error("Invalid base64 padding");
                }
                padding++;
            } else {
                if (padding > 0) {
                    throw std::runtime_error("Invalid base64 padding");
                }
                int value = decode_table[static_cast<uint8_t>(c)];
                if (value == -1) {
                    throw std::runtime_error("Invalid base64 character");
                }
                triple |= (static_cast<uint32_t>(value) << (18 - j * 6));
            }
        }

        result.push_back((triple >> 16) & 0xFF);
        if (padding < 2) result.push_back((triple >> 8) & 0xFF);
        if (padding < 1) result.push_back(triple & 0xFF);
    }

    return result;
}

// ============================================================================
// Decoders
// ============================================================================

namespace {

// stb takes the buffer length as int
int stb_length(size_t size) {
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("Image data too large for decoder");
    }
    return static_cast<int>(size);
}

ImageInfo info_with_stb(ImageFormat format, const uint8_t* data, size_t size) {
    int width, height, channels;
    if (!stbi_info_from_memory(data, stb_length(size), &width, &height, &channels)) {
        throw std::runtime_error(std::string("Failed to read image header: ") +
                                 stbi_failure_reason());
    }
    return ImageInfo{format, width, height};
}

Image decode_with_stb(const uint8_t* data, size_t size) {
    int width, height, channels;
    uint8_t* img_data = stbi_load_from_memory(data, stb_length(size),
                                               &width, &height, &channels, 4);

    if (!img_data) {
        throw std::runtime_error(std::string("Failed to load image from memory: ") +
                                 stbi_failure_reason());
    }

    std::unique_ptr<uint8_t, decltype(&stbi_image_free)> owner(img_data, &stbi_image_free);
    size_t data_size = static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
    return Image(width, height, 4, std::vector<uint8_t>(img_data, img_data + data_size));
}

ImageInfo webp_info(const uint8_t* data, size_t size) {
    int width = 0, height = 0;
    if (!WebPGetInfo(data, size, &width, &height)) {
        throw std::runtime_error("Failed to read WebP header");
    }
    return ImageInfo{ImageFormat::WEBP, width, height};
}

Image decode_webp(const uint8_t* data, size_t size) {
    int width = 0, height = 0;
    uint8_t* rgba = WebPDecodeRGBA(data, size, &width, &height);

    if (!rgba) {
        throw std::runtime_error("Failed to decode WebP image");
    }

    std::unique_ptr<uint8_t, decltype(&WebPFree)> owner(rgba, &WebPFree);
    size_t data_size = static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
    return Image(width, height, 4, std::vector<uint8_t>(rgba, rgba + data_size));
}

// libtiff reads through these callbacks so TIFF bytes never touch the disk
struct TiffMemoryStream {
    const uint8_t* data;
    toff_t size;
    toff_t pos;
};

tmsize_t tiff_read(thandle_t handle, void* buffer, tmsize_t count) {
    auto* stream = static_cast<TiffMemoryStream*>(handle);
    if (count <= 0 || stream->pos >= stream->size) {
        return 0;
    }
    toff_t available = stream->size - stream->pos;
    toff_t n = std::min<toff_t>(static_cast<toff_t>(count), available);
    std::memcpy(buffer, stream->data + stream->pos, static_cast<size_t>(n));
    stream->pos += n;
    return static_cast<tmsize_t>(n);
}

tmsize_t tiff_write(thandle_t, void*, tmsize_t) {
    return 0;
}

toff_t tiff_seek(thandle_t handle, toff_t offset, int whence) {
    auto* stream = static_cast<TiffMemoryStream*>(handle);
    switch (whence) {
        case SEEK_SET: stream->pos = offset; break;
        case SEEK_CUR: stream->pos += offset; break;
        case SEEK_END: stream->pos = stream->size + offset; break;
        default: return static_cast<toff_t>(-1);
    }
    return stream->pos;
}

int tiff_close(thandle_t) {
    return 0;
}

toff_t tiff_size(thandle_t handle) {
    return static_cast<TiffMemoryStream*>(handle)->size;
}

int tiff_map(thandle_t handle, void** base, toff_t* size) {
    auto* stream = static_cast<TiffMemoryStream*>(handle);
    *base = const_cast<uint8_t*>(stream->data);
    *size = stream->size;
    return 1;
}

void tiff_unmap(thandle_t, void*, toff_t) {}

using TiffHandle = std::unique_ptr<TIFF, decltype(&TIFFClose)>;

TiffHandle open_tiff(TiffMemoryStream& stream) {
    // libtiff reports through global handlers; failures surface as exceptions instead
    static std::once_flag silence_handlers;
    std::call_once(silence_handlers, [] {
        TIFFSetErrorHandler(nullptr);
        TIFFSetWarningHandler(nullptr);
    });

    TiffHandle tif(
        TIFFClientOpen("memory", "r", static_cast<thandle_t>(&stream),
                       tiff_read, tiff_write, tiff_seek, tiff_close,
                       tiff_size, tiff_map, tiff_unmap),
        &TIFFClose);

    if (!tif) {
        throw std::runtime_error("Failed to open TIFF image");
    }
    return tif;
}

std::pair<uint32_t, uint32_t> tiff_dimensions(TIFF* tif) {
    uint32_t width = 0, height = 0;
    if (!TIFFGetField(tif, TIFFTAG_IMAGEWIDTH, &width) ||
        !TIFFGetField(tif, TIFFTAG_IMAGELENGTH, &height) ||
        width == 0 || height == 0 ||
        width > static_cast<uint32_t>(std::numeric_limits<int>::max()) ||
        height > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("Invalid TIFF dimensions");
    }
    return {width, height};
}

ImageInfo tiff_info(const uint8_t* data, size_t size) {
    TiffMemoryStream stream{data, static_cast<toff_t>(size), 0};
    TiffHandle tif = open_tiff(stream);
    auto [width, height] = tiff_dimensions(tif.get());
    return ImageInfo{ImageFormat::TIFF, static_cast<int>(width), static_cast<int>(height)};
}

Image decode_tiff(const uint8_t* data, size_t size) {
    TiffMemoryStream stream{data, static_cast<toff_t>(size), 0};
    TiffHandle tif = open_tiff(stream);
    auto [width, height] = tiff_dimensions(tif.get());
    if (width > 0x7FFF || height > 0x7FFF) {
        throw std::runtime_error("TIFF dimensions exceed decoder limit");
    }

    std::vector<uint32_t> raster(static_cast<size_t>(width) * height);
    if (!TIFFReadRGBAImageOriented(tif.get(), width, height, raster.data(),
                                   ORIENTATION_TOPLEFT, 0)) {
        throw std::runtime_error("Failed to decode TIFF image");
    }

    Image result(static_cast<int>(width), static_cast<int>(height), 4);
    for (size_t i = 0; i < raster.size(); ++i) {
        uint32_t pixel = raster[i];
        result.data[i * 4 + 0] = static_cast<uint8_t>(TIFFGetR(pixel));
        result.data[i * 4 + 1] = static_cast<uint8_t>(TIFFGetG(pixel));
        result.data[i * 4 + 2] = static_cast<uint8_t>(TIFFGetB(pixel));
        result.data[i * 4 + 3] = static_cast<uint8_t>(TIFFGetA(pixel));
    }
    return result;
}

// Write callback for stbi_write_png_to_func
void write_callback(void* context, void* data, int size) {
    auto* buffer = static_cast<std::vector<uint8_t>*>(context);
    uint8_t* bytes = static_cast<uint8_t*>(data);
    buffer->insert(buffer->end(), bytes, bytes + size);
}

stbir_pixel_layout pixel_layout(int channels) {
    switch (channels) {
        case 1: return STBIR_1CHANNEL;
        case 2: return STBIR_2CHANNEL;
        case 3: return STBIR_RGB;
        case 4: return STBIR_RGBA;
        default:
            throw std::runtime_error("Unsupported channel count for resize: " +
                                     std::to_string(channels));
    }
}

} // anonymous namespace

// ============================================================================
// ImageProcessor Implementation
// ============================================================================

ImageFormat ImageProcessor::sniff_format(const uint8_t* data, size_t size) {
    auto starts_with = [data, size](const char* magic, size_t length, size_t offset = 0) {
        return size >= offset + length && std::memcmp(data + offset, magic, length) == 0;
    };

    if (starts_with("\x89PNG\r\n\x1a\n", 8)) return ImageFormat::PNG;
    if (starts_with("\xFF\xD8\xFF", 3)) return ImageFormat::JPEG;
    if (starts_with("RIFF", 4) && starts_with("WEBP", 4, 8)) return ImageFormat::WEBP;
    if (starts_with("BM", 2)) return ImageFormat::BMP;
    if (starts_with("II*\0", 4) || starts_with("MM\0*", 4)) return ImageFormat::TIFF;

    return ImageFormat::UNKNOWN;
}

ImageInfo ImageProcessor::read_info(const uint8_t* data, size_t size) {
    if (data == nullptr || size == 0) {
        throw std::runtime_error("Empty image data");
    }

    ImageFormat format = sniff_format(data, size);
    switch (format) {
        case ImageFormat::PNG:
        case ImageFormat::JPEG:
        case ImageFormat::BMP:
            return info_with_stb(format, data, size);
        case ImageFormat::WEBP:
            return webp_info(data, size);
        case ImageFormat::TIFF:
            return tiff_info(data, size);
        case ImageFormat::UNKNOWN:
            break;
    }
    throw std::runtime_error("Unrecognised image signature");
}

Image ImageProcessor::decode(const uint8_t* data, size_t size) {
    if (data == nullptr || size == 0) {
        throw std::runtime_error("Empty image data");
    }

    switch (sniff_format(data, size)) {
        case ImageFormat::PNG:
        case ImageFormat::JPEG:
        case ImageFormat::BMP:
            return decode_with_stb(data, size);
        case ImageFormat::WEBP:
            return decode_webp(data, size);
        case ImageFormat::TIFF:
            return decode_tiff(data, size);
        case ImageFormat::UNKNOWN:
            break;
    }
    throw std::runtime_error("Unrecognised image signature");
}

std::vector<uint8_t> ImageProcessor::encode_png(const Image& img) {
    if (!img.is_valid()) {
        throw std::runtime_error("Cannot encode invalid image");
    }

    std::vector<uint8_t> buffer;
    int success = stbi_write_png_to_func(write_callback, &buffer, img.width, img.height,
                                         img.channels, img.data.data(),
                                         img.width * img.channels);

    if (!success || buffer.empty()) {
        throw std::runtime_error("Failed to encode image to memory");
    }

    return buffer;
}

Image ImageProcessor::resize(const Image& src, int new_width, int new_height) {
    if (!src.is_valid()) {
        throw std::runtime_error("Cannot resize invalid image");
    }

    if (new_width <= 0 || new_height <= 0) {
        throw std::runtime_error("Invalid resize dimensions");
    }

    Image result(new_width, new_height, src.channels);

    // Use stb_image_resize2 for high-quality resizing
    void* resize_result = stbir_resize_uint8_linear(
        src.data.data(), src.width, src.height, 0,
        result.data.data(), new_width, new_height, 0,
        pixel_layout(src.channels)
    );

    if (!resize_result) {
        throw std::runtime_error("Failed to resize image");
    }

    return result;
}

Image ImageProcessor::fit_within(const Image& src, int max_dimension) {
    if (max_dimension <= 0) {
        throw std::invalid_argument("max_dimension must be positive");
    }

    if (std::max(src.width, src.height) <= max_dimension) {
        return src;
    }

    // Longer side becomes the bound, shorter side rounds down
    int64_t new_width, new_height;
    if (src.width > src.height) {
        new_width = max_dimension;
        new_height = static_cast<int64_t>(src.height) * max_dimension / src.width;
    } else {
        new_height = max_dimension;
        new_width = static_cast<int64_t>(src.width) * max_dimension / src.height;
    }

    return resize(src,
                  static_cast<int>(std::max<int64_t>(1, new_width)),
                  static_cast<int>(std::max<int64_t>(1, new_height)));
}

} // namespace cutout
