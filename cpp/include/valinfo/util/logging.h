#ifndef VALINFO_LOGGING_H
#define VALINFO_LOGGING_H

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace valinfo::log {

    inline constexpr std::string_view LOGGER_NAME = "valinfo";

    /**
     * The shared library logger, created on first use with a stderr sink so that log output never mixes with
     * rendered reports on stdout.
     */
    std::shared_ptr<spdlog::logger> logger();

    // trace|debug|info|warning|error|critical|off, throws std::invalid_argument on anything else.
    void set_level(std::string_view level);

} // namespace valinfo::log

#endif // VALINFO_LOGGING_H
