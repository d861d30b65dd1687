#ifndef CUTOUT_MODELCONFIG_HPP
#define CUTOUT_MODELCONFIG_HPP

#include <string>

namespace cutout {

/**
 * @brief Where the segmentation network lives and how to drive it
 */
struct ModelConfig {
    std::string param_path = "models/u2net.param";
    std::string bin_path = "models/u2net.bin";
    int input_size = 320;
    std::string input_blob = "in0";
    std::string output_blob = "out0";
    int threads = 1;
    bool serialize = true;  // one segmentation at a time
};

} // namespace cutout

#endif // CUTOUT_MODELCONFIG_HPP
