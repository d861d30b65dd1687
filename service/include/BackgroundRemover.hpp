#ifndef CUTOUT_BACKGROUNDREMOVER_HPP
#define CUTOUT_BACKGROUNDREMOVER_HPP

#include <memory>
#include <mutex>

#include "ImageProcessor.hpp"
#include "Segmenter.hpp"

namespace cutout {

/**
 * @brief Turns detected background into transparency
 *
 * Wraps the shared Segmenter. With serialize set, calls into the segmenter
 * are made one at a time under a mutex; otherwise they run concurrently and
 * the segmenter must be safe for that.
 */
class BackgroundRemover {
public:
    /**
     * @throws std::invalid_argument if segmenter is null
     */
    BackgroundRemover(std::shared_ptr<const Segmenter> segmenter, bool serialize);

    BackgroundRemover(const BackgroundRemover&) = delete;
    BackgroundRemover& operator=(const BackgroundRemover&) = delete;

    /**
     * @brief Apply the segmentation mask as alpha
     *
     * Color samples are kept as they are; alpha becomes the source alpha
     * scaled by the mask. The result always has 4 channels.
     *
     * @throws ProcessingError(SegmentationFailed) on any segmenter failure
     */
    Image remove(const Image& rgba) const;

    const Segmenter& segmenter() const noexcept { return *segmenter_; }

    bool serialized() const noexcept { return serialize_; }

private:
    Image run_segmenter(const Image& rgba) const;

    std::shared_ptr<const Segmenter> segmenter_;
    bool serialize_;
    mutable std::mutex segment_mutex_;
};

} // namespace cutout

#endif // CUTOUT_BACKGROUNDREMOVER_HPP
