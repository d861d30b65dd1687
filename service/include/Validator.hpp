#ifndef CUTOUT_VALIDATOR_HPP
#define CUTOUT_VALIDATOR_HPP

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "ImageProcessor.hpp"

namespace cutout {

/**
 * @brief Upload as received from the client
 */
struct UploadedImage {
    std::vector<uint8_t> bytes;
    std::string filename;
    std::string content_type;

    size_t size() const { return bytes.size(); }
};

/**
 * @brief Limits an upload must satisfy before any processing happens
 *
 * All bounds are inclusive.
 */
struct ValidationPolicy {
    std::set<std::string> allowed_extensions{"png", "jpg", "jpeg", "webp", "bmp", "tiff"};
    size_t max_upload_bytes = 16 * 1024 * 1024;
    int min_dimension = 100;
    int max_width = 4000;
    int max_height = 4000;
};

/**
 * @brief Checks uploads against a ValidationPolicy
 *
 * Checks run in a fixed order and stop at the first failure:
 * extension, byte size, header dimensions, decode. Pixels are only
 * decoded once the header has passed the dimension bounds. A rejection is raised as a
 * ProcessingError carrying the matching ErrorKind.
 */
class Validator {
public:
    explicit Validator(ValidationPolicy policy);

    /**
     * @brief Validate and decode an upload
     * @return The decoded RGBA image
     * @throws ProcessingError with UnsupportedFormat, PayloadTooLarge,
     *         CorruptImage or DimensionOutOfRange
     */
    Image validate(const UploadedImage& upload) const;

    const ValidationPolicy& policy() const noexcept { return policy_; }

    /**
     * @brief Lower-cased extension of the upload
     *
     * Taken from the filename after the last '.', or mapped from the content
     * type when the filename has none. Empty if neither yields one.
     */
    static std::string declared_extension(const UploadedImage& upload);

private:
    ValidationPolicy policy_;
};

} // namespace cutout

#endif // CUTOUT_VALIDATOR_HPP
