#include <valinfo/types/value/path.h>
#include <valinfo/util/errors.h>

#include <cctype>
#include <limits>

namespace valinfo::value {

    namespace {
        [[noreturn]] void invalid(std::string_view path_str, std::string_view reason) {
            throw_error<InvalidPath>("Invalid path '{}': {}", path_str, reason);
        }
    } // namespace

    ValuePath parse_path(std::string_view path_str) {
        ValuePath path;
        if (path_str.empty()) { return path; }

        size_t pos = 0;
        const size_t len = path_str.length();

        if (path_str[0] == '.') { invalid(path_str, "leading dot"); }

        while (pos < len) {
            if (pos > 0 && path_str[pos] == '.') {
                ++pos;
                if (pos >= len) { invalid(path_str, "trailing dot"); }
                if (path_str[pos] == '.') { invalid(path_str, "consecutive dots"); }
                if (path_str[pos] == '[') { invalid(path_str, "dot before bracket"); }
            }

            if (path_str[pos] == '[') {
                ++pos;
                if (pos >= len) { invalid(path_str, "unclosed bracket"); }

                if (path_str[pos] == '"' || path_str[pos] == '\'') {
                    char quote_char = path_str[pos++];
                    size_t key_start = pos;
                    while (pos < len && path_str[pos] != quote_char) { ++pos; }
                    if (pos >= len) { invalid(path_str, "unclosed string key"); }

                    std::string key_str(path_str.substr(key_start, pos - key_start));
                    ++pos;
                    if (pos >= len || path_str[pos] != ']') { invalid(path_str, "expected ] after string key"); }
                    ++pos;
                    path.push_back(PathElement::field(std::move(key_str)));
                } else {
                    size_t end_bracket = path_str.find(']', pos);
                    if (end_bracket == std::string_view::npos) { invalid(path_str, "unclosed bracket"); }

                    std::string_view index_str = path_str.substr(pos, end_bracket - pos);
                    if (index_str.empty()) { invalid(path_str, "empty index"); }

                    size_t idx = 0;
                    for (char c : index_str) {
                        if (c == '-') { invalid(path_str, "negative index"); }
                        if (!std::isdigit(static_cast<unsigned char>(c))) { invalid(path_str, "non-numeric index"); }
                        if (idx > (std::numeric_limits<size_t>::max() - 9) / 10) { invalid(path_str, "index too large"); }
                        idx = idx * 10 + static_cast<size_t>(c - '0');
                    }
                    path.push_back(PathElement::index(idx));
                    pos = end_bracket + 1;
                }

                if (pos < len && path_str[pos] != '.' && path_str[pos] != '[') {
                    invalid(path_str, "expected . or [ after ]");
                }
            } else if (path_str[pos] == ']') {
                invalid(path_str, "unexpected closing bracket");
            } else if (std::isspace(static_cast<unsigned char>(path_str[pos]))) {
                invalid(path_str, "whitespace not allowed");
            } else {
                size_t name_start = pos;
                while (pos < len && path_str[pos] != '.' && path_str[pos] != '[' && path_str[pos] != ']' &&
                       !std::isspace(static_cast<unsigned char>(path_str[pos]))) {
                    ++pos;
                }
                path.push_back(PathElement::field(std::string(path_str.substr(name_start, pos - name_start))));
            }
        }

        return path;
    }

    std::string path_to_string(const ValuePath& path) {
        std::string result;
        for (const auto& elem : path) {
            if (elem.is_field()) {
                if (!result.empty()) { result += '.'; }
                result += elem.name();
            } else {
                result += elem.to_string();
            }
        }
        return result;
    }

    const json& navigate(const json& root, const ValuePath& path) {
        const json* current = &root;
        ValuePath walked;
        for (const auto& elem : path) {
            walked.push_back(elem);
            if (elem.is_field()) {
                if (!current->is_object()) {
                    throw MissingPath(path_to_string(path),
                                      fmt::format("'{}' is a {}, not an object", path_to_string(walked), current->type_name()));
                }
                auto it = current->find(elem.name());
                if (it == current->end()) {
                    throw MissingPath(path_to_string(path), fmt::format("no field '{}'", path_to_string(walked)));
                }
                current = &*it;
            } else {
                if (!current->is_array()) {
                    throw MissingPath(path_to_string(path),
                                      fmt::format("'{}' is a {}, not a list", path_to_string(walked), current->type_name()));
                }
                if (elem.get_index() >= current->size()) {
                    throw MissingPath(path_to_string(path),
                                      fmt::format("index {} out of range (size {})", elem.get_index(), current->size()));
                }
                current = &(*current)[elem.get_index()];
            }
        }
        return *current;
    }

} // namespace valinfo::value
