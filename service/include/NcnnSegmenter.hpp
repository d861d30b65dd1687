#ifndef CUTOUT_NCNNSEGMENTER_HPP
#define CUTOUT_NCNNSEGMENTER_HPP

#include <string>

#include <ncnn/net.h>

#include "ModelConfig.hpp"
#include "Segmenter.hpp"

namespace cutout {

/**
 * @brief Salient-object segmentation (U2-Net family) running on ncnn
 *
 * The network is loaded once in the constructor. Each segment() call builds
 * its own extractor and blobs, so the loaded net is only ever read.
 */
class NcnnSegmenter final : public Segmenter {
public:
    /**
     * @throws std::runtime_error if the param or bin file cannot be loaded
     */
    explicit NcnnSegmenter(const ModelConfig& config);

    ~NcnnSegmenter() override = default;

    Image segment(const Image& rgba) const override;

    std::string name() const override;

private:
    ModelConfig config_;
    ncnn::Net net_;
};

} // namespace cutout

#endif // CUTOUT_NCNNSEGMENTER_HPP
