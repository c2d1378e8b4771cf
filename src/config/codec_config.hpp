#pragma once
#include <cstddef>
#include <string>
#include "util/logger.hpp"

namespace binio {

struct WriterConfig {
    // Bytes allocated (zero-filled) at construction
    size_t initial_capacity{256};

    // Below this capacity the buffer doubles; at or above it the buffer
    // grows by linear_growth_step. A write that still does not fit gets
    // exactly the capacity it needs.
    size_t linear_growth_threshold{2048};
    size_t linear_growth_step{2048};
};

struct LoggingConfig {
    std::string log_file{"binio.log"};
    LogLevel min_level{LogLevel::INFO};
};

} // namespace binio
