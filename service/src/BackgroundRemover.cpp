#include "BackgroundRemover.hpp"
#include "Errors.hpp"

#include <stdexcept>
#include <utility>

namespace cutout {

BackgroundRemover::BackgroundRemover(std::shared_ptr<const Segmenter> segmenter, bool serialize)
    : segmenter_(std::move(segmenter)), serialize_(serialize)
{
    if (!segmenter_) {
        throw std::invalid_argument("BackgroundRemover requires a segmenter");
    }
}

Image BackgroundRemover::run_segmenter(const Image& rgba) const {
    if (serialize_) {
        std::lock_guard<std::mutex> lock(segment_mutex_);
        return segmenter_->segment(rgba);
    }
    return segmenter_->segment(rgba);
}

Image BackgroundRemover::remove(const Image& input) const {
    if (!input.is_valid() || (input.channels != 3 && input.channels != 4)) {
        throw ProcessingError(ErrorKind::SegmentationFailed,
                              "Unsupported raster layout: " + std::to_string(input.channels) +
                              " channels");
    }

    // The segmenter contract is RGBA in, so opaque RGB gets an alpha channel first
    Image rgba = input;
    if (input.channels == 3) {
        rgba = Image(input.width, input.height, 4);
        for (size_t i = 0, n = input.pixel_count(); i < n; ++i) {
            rgba.data[i * 4 + 0] = input.data[i * 3 + 0];
            rgba.data[i * 4 + 1] = input.data[i * 3 + 1];
            rgba.data[i * 4 + 2] = input.data[i * 3 + 2];
            rgba.data[i * 4 + 3] = 255;
        }
    }

    Image mask;
    try {
        mask = run_segmenter(rgba);
    } catch (const std::exception& e) {
        throw ProcessingError(ErrorKind::SegmentationFailed,
                              segmenter_->name() + ": " + e.what());
    }

    if (!mask.is_valid() || mask.channels != 1 ||
        mask.width != rgba.width || mask.height != rgba.height) {
        throw ProcessingError(ErrorKind::SegmentationFailed,
                              segmenter_->name() + ": mask is " + std::to_string(mask.width) +
                              "x" + std::to_string(mask.height) + "x" +
                              std::to_string(mask.channels));
    }

    for (size_t i = 0, n = rgba.pixel_count(); i < n; ++i) {
        uint32_t alpha = static_cast<uint32_t>(rgba.data[i * 4 + 3]) * mask.data[i];
        rgba.data[i * 4 + 3] = static_cast<uint8_t>((alpha + 127u) / 255u);
    }

    return rgba;
}

} // namespace cutout
