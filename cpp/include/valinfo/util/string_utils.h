#ifndef VALINFO_STRING_UTILS_H
#define VALINFO_STRING_UTILS_H

#include <string>
#include <string_view>
#include <vector>

namespace valinfo {
    [[nodiscard]] std::string_view trim(std::string_view text);

    // Split on '\n', a trailing newline does not produce an empty last element.
    [[nodiscard]] std::vector<std::string> split_lines(std::string_view text);

    // Split on runs of blanks (space or tab).
    [[nodiscard]] std::vector<std::string_view> split_fields(std::string_view text);

    [[nodiscard]] bool starts_with(std::string_view text, std::string_view prefix);

    [[nodiscard]] std::string pluralise(long long count, std::string_view unit);
} // namespace valinfo

#endif  // VALINFO_STRING_UTILS_H
