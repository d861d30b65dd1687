#include "NcnnSegmenter.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace cutout {

namespace {

// ImageNet statistics the U2-Net family was trained with
constexpr float kMean[3] = {0.485f * 255.f, 0.456f * 255.f, 0.406f * 255.f};
constexpr float kNorm[3] = {1.f / (0.229f * 255.f), 1.f / (0.224f * 255.f), 1.f / (0.225f * 255.f)};

} // anonymous namespace

NcnnSegmenter::NcnnSegmenter(const ModelConfig& config)
    : config_(config)
{
    if (config_.input_size <= 0) {
        throw std::invalid_argument("NcnnSegmenter input_size must be positive");
    }

    net_.opt.num_threads = std::max(1, config_.threads);
    net_.opt.use_vulkan_compute = false;
    net_.opt.use_local_pool_allocator = true;

    if (net_.load_param(config_.param_path.c_str()) != 0) {
        throw std::runtime_error("ParamLoadError(NcnnSegmenter): " + config_.param_path);
    }
    if (net_.load_model(config_.bin_path.c_str()) != 0) {
        throw std::runtime_error("ModelLoadError(NcnnSegmenter): " + config_.bin_path);
    }
}

Image NcnnSegmenter::segment(const Image& rgba) const {
    if (!rgba.is_valid() || rgba.channels != 4) {
        throw std::invalid_argument("NcnnSegmenter::segment expects a valid RGBA image");
    }

    const int size = config_.input_size;
    ncnn::Mat input = ncnn::Mat::from_pixels_resize(rgba.data.data(), ncnn::Mat::PIXEL_RGBA2RGB,
                                                    rgba.width, rgba.height, size, size);
    input.substract_mean_normalize(kMean, kNorm);

    ncnn::Extractor ex = net_.create_extractor();
    ex.set_light_mode(true);

    if (ex.input(config_.input_blob.c_str(), input) != 0) {
        throw std::runtime_error("Unknown input blob: " + config_.input_blob);
    }

    ncnn::Mat output;
    if (ex.extract(config_.output_blob.c_str(), output) != 0 || output.empty()) {
        throw std::runtime_error("Extraction failed for blob: " + config_.output_blob);
    }

    const float* prediction = output.channel(0);
    const size_t count = static_cast<size_t>(output.w) * static_cast<size_t>(output.h);
    const auto [lowest, highest] = std::minmax_element(prediction, prediction + count);
    const float range = *highest - *lowest;

    // Saliency maps are min-max normalised; a flat map is taken as already in [0, 1]
    Image mask(output.w, output.h, 1);
    for (size_t i = 0; i < count; ++i) {
        float value = range > 1e-6f ? (prediction[i] - *lowest) / range : prediction[i];
        mask.data[i] = static_cast<uint8_t>(std::clamp(value * 255.f + 0.5f, 0.f, 255.f));
    }

    return ImageProcessor::resize(mask, rgba.width, rgba.height);
}

std::string NcnnSegmenter::name() const {
    return "ncnn:" + std::filesystem::path(config_.param_path).stem().string();
}

} // namespace cutout
