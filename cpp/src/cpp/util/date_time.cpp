#include <valinfo/util/date_time.h>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <ctime>
#include <limits>

namespace valinfo {

    std::optional<std::string> format_local_time(std::time_t value) {
        std::tm tm{};
        if (localtime_r(&value, &tm) == nullptr) return std::nullopt;
        return fmt::format("{:%Y-%m-%d %H:%M:%S}", tm);
    }

    std::string human_timestamp(std::uint64_t unix_seconds) {
        if (unix_seconds > static_cast<std::uint64_t>(std::numeric_limits<std::time_t>::max())) {
            return fmt::format("{}", unix_seconds);
        }
        auto local = format_local_time(static_cast<std::time_t>(unix_seconds));
        if (!local) return fmt::format("{}", unix_seconds);
        return fmt::format("{} ({})", *local, unix_seconds);
    }

    std::optional<std::uint64_t> parse_timestamp(std::string_view text) {
        if (text.empty()) return std::nullopt;

        bool all_digits = true;
        for (char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                all_digits = false;
                break;
            }
        }
        if (all_digits) {
            std::uint64_t value = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
            return value;
        }

        std::tm tm{};
        std::string buffer{text};
        const char *end = strptime(buffer.c_str(), "%Y-%m-%d %H:%M:%S", &tm);
        if (end == nullptr || *end != '\0') return std::nullopt;
        tm.tm_isdst = -1;
        std::time_t tt = std::mktime(&tm);
        if (tt < 0) return std::nullopt;
        return static_cast<std::uint64_t>(tt);
    }

}  // namespace valinfo
