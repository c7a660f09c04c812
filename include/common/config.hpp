#pragma once

#include "common/logger.hpp"
#include "common/types.hpp"
#include <string>

namespace exchange {

struct SimConfig {
    // Logging
    LogLevel log_level = LogLevel::Info;
    std::string log_file;                   // Empty: stderr

    // Books
    size_t random_symbol_length = DEFAULT_SYMBOL_LENGTH;

    // Runtime
    std::string script_path;                // Empty: run the built-in demo
    bool display_books = true;              // Print each book after its batch

    // Paths
    std::string config_path;
};

/// Defaults overlaid with the keys found in `path`. A missing file yields
/// the defaults; a present key with a bad value throws ParseError.
SimConfig load_config(const std::string& path);
SimConfig default_config();

} // namespace exchange
