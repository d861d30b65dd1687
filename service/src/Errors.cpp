#include "Errors.hpp"

namespace cutout {

const char* error_code(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::UnsupportedFormat:   return "unsupported_format";
        case ErrorKind::PayloadTooLarge:     return "payload_too_large";
        case ErrorKind::CorruptImage:        return "corrupt_image";
        case ErrorKind::DimensionOutOfRange: return "dimension_out_of_range";
        case ErrorKind::InvalidColor:        return "invalid_color";
        case ErrorKind::SegmentationFailed:  return "segmentation_failed";
        case ErrorKind::EncodingFailed:      return "encoding_failed";
        case ErrorKind::InternalError:       return "internal_error";
    }
    return "internal_error";
}

const char* error_message(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::UnsupportedFormat:
            return "File type not allowed";
        case ErrorKind::PayloadTooLarge:
            return "File too large";
        case ErrorKind::CorruptImage:
            return "Invalid image file";
        case ErrorKind::DimensionOutOfRange:
            return "Image dimensions out of range";
        case ErrorKind::InvalidColor:
            return "Background color must be in hex format (#RRGGBB)";
        case ErrorKind::SegmentationFailed:
            return "Failed to remove background";
        case ErrorKind::EncodingFailed:
            return "Failed to encode result image";
        case ErrorKind::InternalError:
            return "Failed to process image";
    }
    return "Failed to process image";
}

int http_status(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::UnsupportedFormat:   return 415;
        case ErrorKind::PayloadTooLarge:     return 413;
        case ErrorKind::CorruptImage:        return 400;
        case ErrorKind::DimensionOutOfRange: return 422;
        case ErrorKind::InvalidColor:        return 400;
        case ErrorKind::SegmentationFailed:
        case ErrorKind::EncodingFailed:
        case ErrorKind::InternalError:
            return 500;
    }
    return 500;
}

bool is_server_fault(ErrorKind kind) noexcept {
    return http_status(kind) >= 500;
}

} // namespace cutout
