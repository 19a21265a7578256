#include <valinfo/render/report_renderer.h>
#include <valinfo/types/schema/validator_schema.h>
#include <valinfo/types/value/path.h>
#include <valinfo/util/string_utils.h>

#include <fmt/format.h>

namespace valinfo::render {

    namespace {
        using schema::SchemaValue;
        namespace f = schema::fields;

        std::string scalar_text(const json& value) {
            if (value.is_string()) return value.get<std::string>();
            if (value.is_null()) return std::string{value::UNKNOWN_TOKEN};
            return value.dump();
        }

        bool is_empty_container(const json& value) {
            return (value.is_object() || value.is_array()) && value.empty();
        }

        void tree_lines(const json& value, size_t depth, std::vector<std::string>& out);

        void member_line(std::string_view prefix, const json& value, size_t depth, std::vector<std::string>& out) {
            std::string indent;
            for (size_t i = 0; i < depth; ++i) indent += TREE_INDENT;

            if (is_empty_container(value)) {
                out.push_back(fmt::format("{}{}{}", indent, prefix, EMPTY_TOKEN));
            } else if (value.is_object() || value.is_array()) {
                if (!prefix.empty()) out.push_back(fmt::format("{}{}", indent, trim(prefix)));
                tree_lines(value, prefix.empty() ? depth : depth + 1, out);
            } else {
                out.push_back(fmt::format("{}{}{}", indent, prefix, scalar_text(value)));
            }
        }

        void tree_lines(const json& value, size_t depth, std::vector<std::string>& out) {
            if (is_empty_container(value)) {
                member_line({}, value, depth, out);
            } else if (value.is_object()) {
                for (const auto& [key, item] : value.items()) {
                    member_line(fmt::format("\"{}\": ", key), item, depth, out);
                }
            } else if (value.is_array()) {
                for (const auto& item : value) {
                    if ((item.is_array() || item.is_object()) && !item.empty()) {
                        // Each nested item opens with a dash so adjacent items stay distinguishable
                        std::string indent;
                        for (size_t i = 0; i < depth; ++i) indent += TREE_INDENT;
                        out.push_back(fmt::format("{}-", indent));
                        tree_lines(item, depth + 1, out);
                    } else {
                        member_line({}, item, depth, out);
                    }
                }
            } else {
                member_line({}, value, depth, out);
            }
        }

        std::string text(const SchemaValue& tree, std::initializer_list<std::string_view> path) {
            auto cell = tree.cell_at(path);
            return cell == nullptr ? std::string{value::UNKNOWN_TOKEN} : cell->render();
        }

        void host_lines(const SchemaValue& tree, std::string_view label, std::string_view count_field,
                        std::string_view aliases_field, std::vector<std::string>& out) {
            out.push_back(fmt::format("{}{}/{}", label, text(tree, {f::POOL_INFO, count_field}),
                                      text(tree, {f::POOL_INFO, f::TOTAL_NODES})));
            auto aliases = tree.cell_at({f::POOL_INFO, aliases_field});
            if (aliases == nullptr || aliases->is_unknown()) return;
            for (auto& line : split_lines(aliases->render())) out.push_back(std::move(line));
        }
    } // namespace

    std::string render_json(const json& document) { return document.dump(4); }

    std::string render_json(const SchemaValue& tree) { return render_json(tree.to_json()); }

    std::vector<std::string> render_tree(const json& document, size_t indent) {
        std::vector<std::string> out;
        tree_lines(document, indent, out);
        return out;
    }

    std::vector<std::string> narrative_lines(const SchemaValue& tree) {
        const std::string marker{value::VERBOSE_MARKER};
        std::vector<std::string> lines;

        lines.push_back(fmt::format("Validator {} is {}", text(tree, {f::NODE_INFO, f::NAME}), text(tree, {f::STATE})));
        lines.push_back(fmt::format("Update time:     {}", text(tree, {f::UPDATE_TIME})));
        lines.push_back(fmt::format("Validator DID:    {}", text(tree, {f::NODE_INFO, f::DID})));
        lines.push_back(fmt::format("Verification Key: {}", text(tree, {f::NODE_INFO, f::VERKEY})));
        lines.push_back(fmt::format("{}BLS Key:          {}", marker, text(tree, {f::NODE_INFO, f::BLS_KEY})));
        lines.push_back(fmt::format("Node Port:        {}", text(tree, {f::NODE_INFO, f::NODE_PORT})));
        lines.push_back(fmt::format("Client Port:      {}", text(tree, {f::NODE_INFO, f::CLIENT_PORT})));

        lines.emplace_back("Metrics:");
        lines.push_back(fmt::format("  Uptime: {}", text(tree, {f::NODE_INFO, f::METRICS, f::UPTIME})));

        auto txn = [&tree](std::string_view counter) {
            return text(tree, {f::NODE_INFO, f::METRICS, f::TRANSACTION_COUNT, counter});
        };
        lines.push_back(fmt::format("{}  Total Config Transactions:  {}", marker, txn(f::CONFIG)));
        lines.push_back(fmt::format("  Total Ledger Transactions:  {}", txn(f::LEDGER)));
        lines.push_back(fmt::format("  Total Pool Transactions:    {}", txn(f::POOL)));
        lines.push_back(fmt::format("{}  Total Audit Transactions:   {}", marker, txn(f::AUDIT)));

        auto rate = [&tree](std::string_view counter) {
            return text(tree, {f::NODE_INFO, f::METRICS, f::AVERAGE_PER_SECOND, counter});
        };
        lines.push_back(fmt::format("  Read Transactions/Seconds:  {}", rate(f::READ_TRANSACTIONS)));
        lines.push_back(fmt::format("  Write Transactions/Seconds: {}", rate(f::WRITE_TRANSACTIONS)));

        host_lines(tree, "Reachable Hosts:   ", f::REACHABLE_COUNT, f::REACHABLE_NODES, lines);
        host_lines(tree, "Unreachable Hosts: ", f::UNREACHABLE_COUNT, f::UNREACHABLE_NODES, lines);

        lines.push_back(fmt::format("{}Software Versions:", marker));
        if (auto software = tree.node(f::SOFTWARE)) {
            for (size_t i = 0; i < software->size(); ++i) {
                auto cell = software->cell(software->name_at(i));
                lines.push_back(fmt::format("{}  {}: {}", marker, software->name_at(i),
                                            cell ? cell->render() : std::string{value::UNKNOWN_TOKEN}));
            }
        }
        return lines;
    }

    std::vector<std::string> filter_marked_lines(const std::vector<std::string>& lines, bool verbose) {
        std::vector<std::string> out;
        out.reserve(lines.size());
        for (const auto& line : lines) {
            if (starts_with(line, value::VERBOSE_MARKER)) {
                if (!verbose) continue;
                out.push_back(line.substr(value::VERBOSE_MARKER.size()));
            } else {
                out.push_back(line);
            }
        }
        return out;
    }

    std::string render_narrative(const SchemaValue& tree) {
        return fmt::format("{}", fmt::join(filter_marked_lines(narrative_lines(tree), tree.verbose()), "\n"));
    }

    std::string render(const SchemaValue& tree, OutputMode mode) {
        switch (mode) {
            case OutputMode::Json: return render_json(tree);
            case OutputMode::Tree: return fmt::format("{}", fmt::join(render_tree(tree.to_json()), "\n"));
            case OutputMode::Narrative: return render_narrative(tree);
        }
        return render_narrative(tree);
    }

    std::string render_field(const json& canonical, std::string_view path) {
        const auto& selected = value::navigate(canonical, value::parse_path(path));
        std::vector<std::string> lines;
        member_line(fmt::format("\"{}\": ", path), selected, 0, lines);
        return fmt::format("{}", fmt::join(lines, "\n"));
    }

} // namespace valinfo::render
