#pragma once

#include "export.hpp"

#include <spdlog/logger.h>

#include <memory>

namespace libctdi {

/// The library logger.  Defaults to a stderr sink named "libctdi" at
/// level warn; composition and module build emit debug records, lazy
/// component construction emits trace records.
LIBCTDI_EXPORT std::shared_ptr<spdlog::logger> get_logger();

/// Route library records to `logger`.  Passing nullptr restores the default.
LIBCTDI_EXPORT void set_logger(std::shared_ptr<spdlog::logger> logger);

} // namespace libctdi
