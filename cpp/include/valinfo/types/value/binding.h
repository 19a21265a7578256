#pragma once

#include <valinfo/valinfo_base.h>

#include <cstdint>
#include <string>
#include <vector>

namespace valinfo::value {

    /**
     * A listener socket found for a declared port. ip is either "address/prefix" or the bare address when the
     * prefix could not be resolved; the wildcard addresses are written as 0.0.0.0/0 and ::/0.
     */
    struct Binding {
        std::uint16_t port{0};
        std::string protocol;
        std::string ip;

        bool operator==(const Binding&) const = default;
    };

    using BindingList = std::vector<Binding>;

    void to_json(json& j, const Binding& b);
    void from_json(const json& j, Binding& b);

    // Appends unless an equal (port, protocol, ip) triple is already present.
    void add_unique(BindingList& bindings, Binding binding);

    [[nodiscard]] std::string to_string(const Binding& binding);

} // namespace valinfo::value
