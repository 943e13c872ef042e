/// @file logging.hpp
/// @brief Logger configuration for docdiff-cpp.
///
/// The library logs through the spdlog logger registered under
/// `logger_name`. When no such logger is registered, messages go to
/// spdlog's default logger.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace docdiff_cpp {

/// Name of the spdlog logger the library looks up.
inline constexpr std::string_view logger_name = "docdiff";

/// Register `logger` as the library logger, replacing any logger
/// previously registered under `logger_name`. The logger's own name is
/// ignored. Passing nullptr drops the registration.
void set_logger(std::shared_ptr<spdlog::logger> logger);

}  // namespace docdiff_cpp
