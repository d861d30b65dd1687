#ifndef CUTOUT_ERRORS_HPP
#define CUTOUT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace cutout {

/**
 * @brief Classified outcome of a failed pipeline invocation
 */
enum class ErrorKind {
    UnsupportedFormat,
    PayloadTooLarge,
    CorruptImage,
    DimensionOutOfRange,
    InvalidColor,
    SegmentationFailed,
    EncodingFailed,
    InternalError
};

/**
 * @brief Error raised by a pipeline stage
 *
 * what() holds internal detail for the log. Callers facing a client use
 * error_code() and error_message() instead.
 */
class ProcessingError : public std::runtime_error {
public:
    ProcessingError(ErrorKind kind, const std::string& detail)
        : std::runtime_error(detail), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Stable machine-readable code, e.g. "payload_too_large"
 */
const char* error_code(ErrorKind kind) noexcept;

/**
 * @brief Short client-facing message
 */
const char* error_message(ErrorKind kind) noexcept;

/**
 * @brief HTTP status used when the error is returned to a client
 */
int http_status(ErrorKind kind) noexcept;

/**
 * @brief True for kinds that indicate a server-side fault worth logging in full
 */
bool is_server_fault(ErrorKind kind) noexcept;

} // namespace cutout

#endif // CUTOUT_ERRORS_HPP
