#include <valinfo/util/string_utils.h>

#include <fmt/format.h>

namespace valinfo {
    std::string_view trim(std::string_view text) {
        constexpr std::string_view blanks = " \t\r\n";
        auto first = text.find_first_not_of(blanks);
        if (first == std::string_view::npos) return {};
        auto last = text.find_last_not_of(blanks);
        return text.substr(first, last - first + 1);
    }

    std::vector<std::string> split_lines(std::string_view text) {
        std::vector<std::string> lines;
        size_t start = 0;
        while (start < text.size()) {
            auto end = text.find('\n', start);
            if (end == std::string_view::npos) {
                lines.emplace_back(text.substr(start));
                break;
            }
            lines.emplace_back(text.substr(start, end - start));
            start = end + 1;
        }
        return lines;
    }

    std::vector<std::string_view> split_fields(std::string_view text) {
        std::vector<std::string_view> fields;
        size_t pos = 0;
        while (pos < text.size()) {
            while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) ++pos;
            if (pos >= text.size()) break;
            size_t end = pos;
            while (end < text.size() && text[end] != ' ' && text[end] != '\t') ++end;
            fields.push_back(text.substr(pos, end - pos));
            pos = end;
        }
        return fields;
    }

    bool starts_with(std::string_view text, std::string_view prefix) {
        return text.substr(0, prefix.size()) == prefix;
    }

    std::string pluralise(long long count, std::string_view unit) {
        return count == 1 ? fmt::format("{} {}", count, unit) : fmt::format("{} {}s", count, unit);
    }
} // namespace valinfo
