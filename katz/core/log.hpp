#pragma once

#include "katz/core/macros.hpp"

#include <spdlog/spdlog.h>

#include <memory>

// =============================================================================
// FILE: katz/core/log.hpp
// BRIEF: Library logger ("katz", stderr sink)
//
// The logger is created on first use. Its initial level comes from the
// KATZ_LOG_LEVEL environment variable (trace, debug, info, warn, err,
// critical, off) and defaults to warn.
// =============================================================================

namespace katz::log {

/// @brief Shared "katz" logger. Never null.
KATZ_EXPORT auto logger() -> const std::shared_ptr<spdlog::logger>&;

/// @brief Change the level of the "katz" logger at runtime.
KATZ_EXPORT void set_level(spdlog::level::level_enum level);

/// @brief Current level of the "katz" logger.
KATZ_EXPORT auto level() -> spdlog::level::level_enum;

} // namespace katz::log
