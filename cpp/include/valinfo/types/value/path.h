#pragma once

/**
 * @file path.h
 * @brief Path-based navigation for the canonical JSON of a record.
 *
 * Enables selection of single fields using path expressions like:
 * - "Node_info.Name" (field access)
 * - "Pool_info.Reachable_nodes[0]" (index access)
 * - "Node_info[\"Metrics\"].uptime" (quoted field access, for names containing dots)
 *
 * Usage:
 * @code
 * ValuePath path = parse_path("Node_info.Metrics.uptime");
 * const json& uptime = navigate(record, path);   // throws MissingPath
 * @endcode
 */

#include <valinfo/valinfo_base.h>

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace valinfo::value {

    /**
     * A single step of a path, either a field name (objects) or an index (arrays).
     */
    class PathElement {
    public:
        static PathElement field(std::string name) {
            PathElement elem;
            elem._data = std::move(name);
            return elem;
        }

        static PathElement index(size_t idx) {
            PathElement elem;
            elem._data = idx;
            return elem;
        }

        [[nodiscard]] bool is_field() const noexcept { return std::holds_alternative<std::string>(_data); }
        [[nodiscard]] bool is_index() const noexcept { return std::holds_alternative<size_t>(_data); }

        [[nodiscard]] const std::string& name() const { return std::get<std::string>(_data); }
        [[nodiscard]] size_t get_index() const { return std::get<size_t>(_data); }

        [[nodiscard]] std::string to_string() const {
            return is_field() ? name() : fmt::format("[{}]", get_index());
        }

        bool operator==(const PathElement&) const = default;

    private:
        PathElement() = default;

        std::variant<std::string, size_t> _data;
    };

    using ValuePath = std::vector<PathElement>;

    /**
     * Parse a path string. An empty string is the empty path (the whole record).
     * @throws InvalidPath on invalid syntax
     */
    [[nodiscard]] ValuePath parse_path(std::string_view path_str);

    [[nodiscard]] std::string path_to_string(const ValuePath& path);

    /**
     * Navigate through a JSON document using a path. Field elements only match objects, index elements only match
     * arrays.
     * @throws MissingPath if a step does not resolve
     */
    [[nodiscard]] const json& navigate(const json& root, const ValuePath& path);

} // namespace valinfo::value
