#include "Validator.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace cutout {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string extension_for_content_type(const std::string& content_type) {
    // Drop parameters such as "; charset=..."
    std::string mime = to_lower(content_type.substr(0, content_type.find(';')));
    mime.erase(std::remove_if(mime.begin(), mime.end(),
                              [](unsigned char c) { return std::isspace(c); }),
               mime.end());

    if (mime == "image/png") return "png";
    if (mime == "image/jpeg" || mime == "image/jpg") return "jpeg";
    if (mime == "image/webp") return "webp";
    if (mime == "image/bmp" || mime == "image/x-ms-bmp") return "bmp";
    if (mime == "image/tiff") return "tiff";
    return "";
}

} // anonymous namespace

Validator::Validator(ValidationPolicy policy)
    : policy_(std::move(policy))
{
    std::set<std::string> lowered;
    for (const auto& ext : policy_.allowed_extensions) {
        lowered.insert(to_lower(ext));
    }
    policy_.allowed_extensions = std::move(lowered);
}

std::string Validator::declared_extension(const UploadedImage& upload) {
    auto dot = upload.filename.rfind('.');
    if (dot != std::string::npos) {
        return to_lower(upload.filename.substr(dot + 1));
    }
    return extension_for_content_type(upload.content_type);
}

Image Validator::validate(const UploadedImage& upload) const {
    std::string extension = declared_extension(upload);
    if (extension.empty() || policy_.allowed_extensions.count(extension) == 0) {
        throw ProcessingError(ErrorKind::UnsupportedFormat,
                              "Extension '" + extension + "' is not allowed");
    }

    if (upload.size() > policy_.max_upload_bytes) {
        throw ProcessingError(ErrorKind::PayloadTooLarge,
                              "Upload of " + std::to_string(upload.size()) +
                              " bytes exceeds " + std::to_string(policy_.max_upload_bytes));
    }

    if (upload.bytes.empty()) {
        throw ProcessingError(ErrorKind::CorruptImage, "Empty file provided");
    }

    // Dimensions come from the header so an oversized raster is never allocated
    ImageInfo info;
    try {
        info = ImageProcessor::read_info(upload.bytes.data(), upload.bytes.size());
    } catch (const std::exception& e) {
        throw ProcessingError(ErrorKind::CorruptImage, e.what());
    }

    if (info.width < policy_.min_dimension || info.height < policy_.min_dimension ||
        info.width > policy_.max_width || info.height > policy_.max_height) {
        throw ProcessingError(ErrorKind::DimensionOutOfRange,
                              "Image is " + std::to_string(info.width) + "x" +
                              std::to_string(info.height));
    }

    Image image;
    try {
        image = ImageProcessor::decode(upload.bytes.data(), upload.bytes.size());
    } catch (const std::exception& e) {
        throw ProcessingError(ErrorKind::CorruptImage, e.what());
    }

    if (image.width != info.width || image.height != info.height) {
        throw ProcessingError(ErrorKind::CorruptImage, "Decoded size differs from header");
    }

    return image;
}

} // namespace cutout
