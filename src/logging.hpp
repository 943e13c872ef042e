#pragma once

// Internal header — not installed.
// Library-side access to the "docdiff" spdlog logger.

#include <docdiff-cpp/logging.hpp>

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace docdiff_cpp::detail {

// The registered "docdiff" logger, or spdlog's default logger.
inline auto logger() -> std::shared_ptr<spdlog::logger> {
    if (auto registered = spdlog::get(std::string{logger_name})) {
        return registered;
    }
    return spdlog::default_logger();
}

}  // namespace docdiff_cpp::detail
