/*
 * The core imports for valinfo. Use this to keep the third-party import order consistent across the library,
 * the json alias in particular is used by almost every translation unit.
 */

#ifndef VALINFO_BASE_H
#define VALINFO_BASE_H

#include <nlohmann/json.hpp>

#include <fmt/format.h>
#include <fmt/chrono.h>
#include <fmt/ranges.h>

#include <valinfo/util/date_time.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace valinfo {
    // Insertion ordered, records keep their stored field order and typed trees keep schema order
    using json = nlohmann::ordered_json;

    using store_key_t = std::uint64_t;
} // namespace valinfo

#endif //VALINFO_BASE_H
