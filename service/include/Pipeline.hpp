#ifndef CUTOUT_PIPELINE_HPP
#define CUTOUT_PIPELINE_HPP

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "BackgroundRemover.hpp"
#include "Errors.hpp"
#include "ImageProcessor.hpp"
#include "Validator.hpp"

namespace cutout {

struct PipelineOptions {
    ValidationPolicy validation;
    int processing_max_dimension = 2048;
};

/**
 * @brief Encoded output of a successful run
 */
struct EncodedImage {
    std::vector<uint8_t> bytes;
    std::string content_type;
    int width = 0;
    int height = 0;
    bool has_alpha = false;
};

struct ProcessingFailure {
    ErrorKind kind;
    std::string detail;  // for logs only, never sent to clients
};

/**
 * @brief Either an encoded image or a classified failure, never both
 */
class ProcessingResult {
public:
    static ProcessingResult success(EncodedImage image) {
        ProcessingResult result;
        result.image_ = std::move(image);
        return result;
    }

    static ProcessingResult failure(ErrorKind kind, std::string detail) {
        ProcessingResult result;
        result.failure_ = ProcessingFailure{kind, std::move(detail)};
        return result;
    }

    bool ok() const noexcept { return image_.has_value(); }

    const EncodedImage& image() const { return image_.value(); }
    EncodedImage& image() { return image_.value(); }

    const ProcessingFailure& error() const { return failure_.value(); }

private:
    ProcessingResult() = default;

    std::optional<EncodedImage> image_;
    std::optional<ProcessingFailure> failure_;
};

/**
 * @brief Runs one upload through the whole background-removal sequence
 *
 * validate/decode -> parse color -> resize -> remove background ->
 * composite -> encode PNG. The first failing stage ends the run. Nothing is
 * retried. process() is const and may be called from many threads at once;
 * the only shared state is the BackgroundRemover.
 */
class Pipeline {
public:
    /**
     * @throws std::invalid_argument if remover is null or the processing
     *         bound is not positive
     */
    Pipeline(PipelineOptions options, std::shared_ptr<const BackgroundRemover> remover);

    /**
     * @brief Process an upload
     * @param upload Raw bytes with declared filename/content type
     * @param background_color Optional "#RRGGBB"; absent keeps transparency
     * @return Result holding either the PNG or the failure classification
     */
    ProcessingResult process(const UploadedImage& upload,
                             const std::optional<std::string>& background_color) const;

    const PipelineOptions& options() const noexcept { return options_; }

private:
    PipelineOptions options_;
    Validator validator_;
    std::shared_ptr<const BackgroundRemover> remover_;
};

} // namespace cutout

#endif // CUTOUT_PIPELINE_HPP
