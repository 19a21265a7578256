#include <valinfo/probes/system_probes.h>
#include <valinfo/util/logging.h>
#include <valinfo/util/string_utils.h>

#include <fmt/format.h>

#include <charconv>

namespace valinfo::probes {

    std::string_view to_string(RunState state) {
        switch (state) {
            case RunState::Running: return "running";
            case RunState::Stopped: return "stopped";
            case RunState::Indeterminate: return "indeterminate";
        }
        return "indeterminate";
    }

    std::string_view to_string(EnabledState state) {
        switch (state) {
            case EnabledState::Enabled: return "enabled";
            case EnabledState::Disabled: return "disabled";
            case EnabledState::Indeterminate: return "indeterminate";
        }
        return "indeterminate";
    }

    RunState parse_systemd_active(std::string_view output) {
        auto value = trim(output);
        if (value == "active") return RunState::Running;
        if (value == "inactive" || value == "failed") return RunState::Stopped;
        return RunState::Indeterminate;
    }

    EnabledState parse_systemd_enabled(std::string_view output) {
        auto value = trim(output);
        if (value == "enabled") return EnabledState::Enabled;
        if (value == "disabled") return EnabledState::Disabled;
        return EnabledState::Indeterminate;
    }

    RunState parse_supervisor_status(std::string_view output, std::string_view service) {
        for (const auto& line : split_lines(output)) {
            auto fields = split_fields(line);
            if (fields.size() < 2 || fields[0] != service) continue;
            if (fields[1] == "RUNNING") return RunState::Running;
            if (fields[1] == "STOPPED" || fields[1] == "EXITED" || fields[1] == "FATAL") return RunState::Stopped;
            return RunState::Indeterminate;
        }
        return RunState::Indeterminate;
    }

    EnabledState parse_supervisor_avail(std::string_view output, std::string_view service) {
        for (const auto& line : split_lines(output)) {
            auto fields = split_fields(line);
            if (fields.empty() || fields[0] != service) continue;
            for (auto field : fields) {
                if (field == "auto") return EnabledState::Enabled;
                if (field == "manual") return EnabledState::Disabled;
            }
            return EnabledState::Indeterminate;
        }
        return EnabledState::Indeterminate;
    }

    std::vector<SocketEntry> parse_ss_listeners(std::string_view output) {
        // Netid State Recv-Q Send-Q Local-Address:Port Peer-Address:Port [Process]
        constexpr size_t LOCAL_COLUMN = 4;
        std::vector<SocketEntry> entries;
        for (const auto& line : split_lines(output)) {
            auto fields = split_fields(line);
            if (fields.size() <= LOCAL_COLUMN) continue;

            auto local = fields[LOCAL_COLUMN];
            auto colon = local.rfind(':');
            if (colon == std::string_view::npos) continue;
            auto address = local.substr(0, colon);
            if (address.size() >= 2 && address.front() == '[' && address.back() == ']') {
                address = address.substr(1, address.size() - 2);
            }
            // "10.0.0.2%eth0" - the interface scope is not part of the address
            if (auto scope = address.find('%'); scope != std::string_view::npos) address = address.substr(0, scope);
            if (address.empty()) continue;

            entries.push_back({std::string{fields[0]}, std::string{address}});
        }
        return entries;
    }

    std::optional<int> parse_ip_addr_prefix(std::string_view output, std::string_view ip) {
        for (const auto& line : split_lines(output)) {
            auto fields = split_fields(line);
            for (size_t i = 0; i + 1 < fields.size(); ++i) {
                if (fields[i] != "inet" && fields[i] != "inet6") continue;
                auto cidr = fields[i + 1];
                auto slash = cidr.find('/');
                if (slash == std::string_view::npos || cidr.substr(0, slash) != ip) continue;
                auto prefix_text = cidr.substr(slash + 1);
                int prefix = 0;
                auto [ptr, ec] = std::from_chars(prefix_text.data(), prefix_text.data() + prefix_text.size(), prefix);
                if (ec == std::errc() && ptr == prefix_text.data() + prefix_text.size()) return prefix;
            }
        }
        return std::nullopt;
    }

    SystemdControl::SystemdControl(std::string service, CommandRunner runner)
        : _service{std::move(service)}, _runner{std::move(runner)} {
    }

    RunState SystemdControl::run_state() {
        // is-active exits non-zero for anything but active, the printed state is what matters
        return parse_systemd_active(_runner("systemctl", {"is-active", _service}).output);
    }

    EnabledState SystemdControl::enabled_state() {
        return parse_systemd_enabled(_runner("systemctl", {"is-enabled", _service}).output);
    }

    SupervisorControl::SupervisorControl(std::string service, CommandRunner runner)
        : _service{std::move(service)}, _runner{std::move(runner)} {
    }

    RunState SupervisorControl::run_state() {
        return parse_supervisor_status(_runner("supervisorctl", {"status", _service}).output, _service);
    }

    EnabledState SupervisorControl::enabled_state() {
        return parse_supervisor_avail(_runner("supervisorctl", {"avail"}).output, _service);
    }

    std::vector<SocketEntry> SsSocketTable::list_bindings(std::uint16_t port) {
        auto result = _runner("ss", {"-H", "-l", "-n", "-t", "-u", "sport", "=", fmt::format(":{}", port)});
        if (!result.succeeded()) {
            log::logger()->info("ss exited with {} while listing port {}", result.exit_code, port);
            return {};
        }
        return parse_ss_listeners(result.output);
    }

    std::optional<int> IpAddressTable::prefix_length(const std::string& ip) {
        auto result = _runner("ip", {"-o", "addr", "show"});
        if (!result.succeeded()) {
            log::logger()->info("ip exited with {} while resolving {}", result.exit_code, ip);
            return std::nullopt;
        }
        return parse_ip_addr_prefix(result.output, ip);
    }

    std::optional<std::string> DpkgPackages::installed_version(const std::string& package) {
        auto result = _runner("dpkg-query", {"-W", "-f=${Version}", package});
        if (!result.succeeded()) return std::nullopt;
        auto version = trim(result.output);
        if (version.empty()) return std::nullopt;
        return std::string{version};
    }

    std::unique_ptr<ProcessControlProbe> make_process_control(const Configuration& config, CommandRunner runner) {
        switch (config.control_plane) {
            case ControlPlane::Supervisor:
                return std::make_unique<SupervisorControl>(config.service_name, std::move(runner));
            case ControlPlane::Systemd:
                break;
        }
        return std::make_unique<SystemdControl>(config.service_name, std::move(runner));
    }

    SystemProbes::SystemProbes(const Configuration& config, CommandRunner runner)
        : _process{make_process_control(config, runner)}, _sockets{runner}, _addresses{runner},
          _packages{std::move(runner)} {
    }

} // namespace valinfo::probes
