#include <docdiff-cpp/logging.hpp>

#include <string>
#include <utility>

namespace docdiff_cpp {

void set_logger(std::shared_ptr<spdlog::logger> logger) {
    const auto name = std::string{logger_name};
    spdlog::drop(name);
    if (!logger) return;

    // Registered loggers are keyed by their own name; clone under ours.
    auto named = logger->clone(name);
    spdlog::register_logger(std::move(named));
}

}  // namespace docdiff_cpp
