#ifndef _BACKUP_SIMULATOR_OPTIONS_H_
#define _BACKUP_SIMULATOR_OPTIONS_H_

#include "xfer/progress/progress_configuration.hpp"

#include <optional>
#include <string>

namespace backup_simulator {

struct Options {
    xferstat::ProgressConfiguration progress;
    // Sizes reported by the evidence pass.
    uint64_t new_bytes = 64 * 1024 * 1024;
    uint64_t changed_bytes = 32 * 1024 * 1024;
    // Raw delta bytes produced per changed byte.
    double delta_ratio = 0.6;
    // Written bytes per raw delta byte.
    double compress_ratio = 0.5;
    // Source bytes processed per second.
    uint64_t rate = 8 * 1024 * 1024;
    uint64_t volume_size = 25 * 1024 * 1024;
    bool verbose = false;
};

// Returns std::nullopt if the usage was printed instead.
// Throws std::exception on invalid options.
std::optional<Options> ParseOptions(int argc, char* argv[]);

} // namespace backup_simulator

#endif
