#include <valinfo/util/logging.h>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <fmt/format.h>

#include <mutex>
#include <stdexcept>
#include <string>

namespace valinfo::log {

    std::shared_ptr<spdlog::logger> logger() {
        static std::once_flag once;
        std::call_once(once, [] {
            if (!spdlog::get(std::string{LOGGER_NAME})) {
                auto lgr = spdlog::stderr_color_mt(std::string{LOGGER_NAME});
                lgr->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                lgr->set_level(spdlog::level::warn);
            }
        });
        return spdlog::get(std::string{LOGGER_NAME});
    }

    void set_level(std::string_view level) {
        auto lvl = spdlog::level::from_str(std::string{level});
        // from_str maps anything it does not recognise to off, only accept that when it was asked for
        if (lvl == spdlog::level::off && level != "off") {
            throw std::invalid_argument(fmt::format("Unknown log level: '{}'", level));
        }
        logger()->set_level(lvl);
    }

} // namespace valinfo::log
