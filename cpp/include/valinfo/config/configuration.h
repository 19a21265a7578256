#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace valinfo {

    /**
     * The two supported process control planes for the validator service.
     */
    enum class ControlPlane { Systemd, Supervisor };

    [[nodiscard]] ControlPlane parse_control_plane(std::string_view text);
    [[nodiscard]] std::string_view to_string(ControlPlane plane);

    /**
     * Settings for a history run. Start from the defaults, apply the environment (VALINFO_*), then let the command
     * line override individual values.
     */
    struct Configuration {
        using env_lookup_t = std::function<const char*(const char*)>;

        std::string history_dir{"/var/lib/indy/validator-info-history"};
        std::string store_suffix{".validator_info.db"};
        ControlPlane control_plane{ControlPlane::Systemd};
        std::string service_name{"indy-node"};
        std::vector<std::string> packages{"indy-node", "sovrin"};
        std::string log_level{"warning"};

        static Configuration from_environment();
        static Configuration from_environment(const env_lookup_t& lookup);
    };

} // namespace valinfo
