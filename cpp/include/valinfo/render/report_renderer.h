#pragma once

/**
 * @file report_renderer.h
 * @brief Text forms of a record: canonical JSON, a flat indented tree and the fixed narrative report.
 *
 * Narrative lines are authored with VERBOSE_MARKER in front of the lines only shown in verbose mode.
 * filter_marked_lines() applies the convention: non-verbose output drops every marked line, both modes strip the
 * marker from what remains.
 */

#include <valinfo/types/schema/schema_value.h>

#include <string>
#include <string_view>
#include <vector>

namespace valinfo::render {

    enum class OutputMode { Json, Tree, Narrative };

    inline constexpr std::string_view EMPTY_TOKEN = "n/a";
    inline constexpr std::string_view TREE_INDENT = "    ";

    // Pretty printed with a four space indent
    [[nodiscard]] std::string render_json(const schema::SchemaValue& tree);
    [[nodiscard]] std::string render_json(const json& document);

    /**
     * One line per leaf ("key": value), a "key": line before each nested mapping or list, list items without a key.
     * Empty mappings and lists render as n/a.
     */
    [[nodiscard]] std::vector<std::string> render_tree(const json& document, size_t indent = 0);

    // Narrative lines, still carrying their markers
    [[nodiscard]] std::vector<std::string> narrative_lines(const schema::SchemaValue& tree);

    [[nodiscard]] std::vector<std::string> filter_marked_lines(const std::vector<std::string>& lines, bool verbose);

    // Narrative lines filtered for the tree's verbose flag, joined by newlines
    [[nodiscard]] std::string render_narrative(const schema::SchemaValue& tree);

    [[nodiscard]] std::string render(const schema::SchemaValue& tree, OutputMode mode);

    /**
     * The value at path in the canonical JSON, as a flat tree whose first line names the path.
     * @throws MissingPath when the path does not resolve
     */
    [[nodiscard]] std::string render_field(const json& canonical, std::string_view path);

} // namespace valinfo::render
