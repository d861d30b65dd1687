#ifndef CUTOUT_SEGMENTER_HPP
#define CUTOUT_SEGMENTER_HPP

#include <string>

#include "ImageProcessor.hpp"

namespace cutout {

/**
 * @brief Foreground/background segmentation capability
 *
 * Implementations are expensive to construct and cheap to call. One
 * instance is created at start-up and shared by every request, so
 * segment() must not modify observable state.
 */
class Segmenter {
protected:
    Segmenter() = default;

public:
    virtual ~Segmenter() = default;

    /**
     * @brief Classify each pixel of an RGBA image
     * @param rgba 4-channel input
     * @return 1-channel mask of the same size, 0 = background, 255 = foreground
     * @throws std::exception on any model failure
     */
    virtual Image segment(const Image& rgba) const = 0;

    /**
     * @brief Human-readable model identifier for logs and /health
     */
    virtual std::string name() const = 0;

    Segmenter(const Segmenter&) = delete;
    Segmenter& operator=(const Segmenter&) = delete;
    Segmenter(Segmenter&&) = delete;
    Segmenter& operator=(Segmenter&&) = delete;
};

} // namespace cutout

#endif // CUTOUT_SEGMENTER_HPP
