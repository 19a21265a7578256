#ifndef VALINFO_DATE_TIME_H
#define VALINFO_DATE_TIME_H

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace valinfo
{

    // "YYYY-MM-DD HH:MM:SS" in the local time zone, nullopt when the time cannot be broken down.
    std::optional<std::string> format_local_time(std::time_t value);

    // The human readable stamp injected into every record: "<local date time> (<raw key>)". Keys outside the
    // calendar range render as the raw key alone.
    std::string human_timestamp(std::uint64_t unix_seconds);

    // Accepts either a raw integer timestamp or "YYYY-MM-DD HH:MM:SS" (local time).
    std::optional<std::uint64_t> parse_timestamp(std::string_view text);

}  // namespace valinfo
#endif  // VALINFO_DATE_TIME_H
