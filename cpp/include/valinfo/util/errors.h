#ifndef VALINFO_UTIL_ERRORS
#define VALINFO_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <cstdint>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace valinfo {

    /**
     * A requested [from, to] window where from > to. Rejected before any store is touched.
     */
    struct InvalidRange : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    /**
     * A stored value that does not decode to a JSON object. Aborts the query for the store holding it.
     */
    struct DecodeError : std::runtime_error {
        explicit DecodeError(const std::string &msg, std::optional<std::uint64_t> key = std::nullopt)
            : std::runtime_error{msg}, _key{key} {
        }

        [[nodiscard]] std::optional<std::uint64_t> key() const noexcept { return _key; }

    private:
        std::optional<std::uint64_t> _key;
    };

    struct ProbeFailure : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    struct StoreError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    struct InvalidPath : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    /**
     * A dotted field path that does not resolve inside a record.
     */
    struct MissingPath : std::out_of_range {
        MissingPath(std::string path, std::string_view detail)
            : std::out_of_range{fmt::format("Field path '{}' not found: {}", path, detail)}, _path{std::move(path)} {
        }

        [[nodiscard]] const std::string &path() const noexcept { return _path; }

    private:
        std::string _path;
    };

    template<typename Error = std::runtime_error, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] constexpr auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Overload (I) - takes error msg and appends source location
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format("{} [{}:{}]", msg, loc.file_name(), loc.line())};
    }

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace valinfo

#endif // VALINFO_UTIL_ERRORS
