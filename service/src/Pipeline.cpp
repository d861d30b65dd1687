#include "Pipeline.hpp"
#include "Compositor.hpp"

#include <stdexcept>
#include <utility>

namespace cutout {

Pipeline::Pipeline(PipelineOptions options, std::shared_ptr<const BackgroundRemover> remover)
    : options_(std::move(options)),
      validator_(options_.validation),
      remover_(std::move(remover))
{
    if (!remover_) {
        throw std::invalid_argument("Pipeline requires a background remover");
    }
    if (options_.processing_max_dimension <= 0) {
        throw std::invalid_argument("processing_max_dimension must be positive");
    }
}

ProcessingResult Pipeline::process(const UploadedImage& upload,
                                   const std::optional<std::string>& background_color) const {
    try {
        Image image = validator_.validate(upload);

        // Parsed before segmentation so a bad color never costs a model run
        std::optional<Rgb> color;
        if (background_color) {
            color = Compositor::parse_color(*background_color);
        }

        image = ImageProcessor::fit_within(image, options_.processing_max_dimension);
        image = remover_->remove(image);
        image = Compositor::composite(image, color);

        EncodedImage encoded;
        try {
            encoded.bytes = ImageProcessor::encode_png(image);
        } catch (const std::exception& e) {
            throw ProcessingError(ErrorKind::EncodingFailed, e.what());
        }
        encoded.content_type = "image/png";
        encoded.width = image.width;
        encoded.height = image.height;
        encoded.has_alpha = image.has_alpha();

        return ProcessingResult::success(std::move(encoded));

    } catch (const ProcessingError& e) {
        return ProcessingResult::failure(e.kind(), e.what());
    } catch (const std::exception& e) {
        return ProcessingResult::failure(ErrorKind::InternalError, e.what());
    }
}

} // namespace cutout
