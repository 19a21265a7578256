#include <valinfo/config/configuration.h>
#include <valinfo/util/errors.h>
#include <valinfo/util/string_utils.h>

#include <cstdlib>

namespace valinfo {

    ControlPlane parse_control_plane(std::string_view text) {
        auto value = trim(text);
        if (value == "systemd" || value == "systemctl") return ControlPlane::Systemd;
        if (value == "supervisor" || value == "supervisorctl") return ControlPlane::Supervisor;
        throw_error<std::invalid_argument>("Unknown control plane '{}', expected systemd or supervisor", text);
    }

    std::string_view to_string(ControlPlane plane) {
        switch (plane) {
            case ControlPlane::Systemd: return "systemd";
            case ControlPlane::Supervisor: return "supervisor";
        }
        return "systemd";
    }

    Configuration Configuration::from_environment() {
        return from_environment([](const char* name) { return std::getenv(name); });
    }

    Configuration Configuration::from_environment(const env_lookup_t& lookup) {
        Configuration config;
        if (auto v = lookup("VALINFO_HISTORY_DIR"); v != nullptr && *v != '\0') config.history_dir = v;
        if (auto v = lookup("VALINFO_CONTROL_PLANE"); v != nullptr && *v != '\0') {
            config.control_plane = parse_control_plane(v);
        }
        if (auto v = lookup("VALINFO_SERVICE_NAME"); v != nullptr && *v != '\0') config.service_name = v;
        if (auto v = lookup("VALINFO_LOG_LEVEL"); v != nullptr && *v != '\0') config.log_level = v;
        return config;
    }

} // namespace valinfo
