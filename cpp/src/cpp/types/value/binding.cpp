#include <valinfo/types/value/binding.h>

#include <algorithm>

namespace valinfo::value {

    void to_json(json& j, const Binding& b) {
        j = json{{"port", b.port}, {"protocol", b.protocol}, {"ip", b.ip}};
    }

    void from_json(const json& j, Binding& b) {
        j.at("port").get_to(b.port);
        j.at("protocol").get_to(b.protocol);
        j.at("ip").get_to(b.ip);
    }

    void add_unique(BindingList& bindings, Binding binding) {
        if (std::find(bindings.begin(), bindings.end(), binding) == bindings.end()) {
            bindings.push_back(std::move(binding));
        }
    }

    std::string to_string(const Binding& binding) {
        return fmt::format("{} {}/{}", binding.ip, binding.port, binding.protocol);
    }

} // namespace valinfo::value
