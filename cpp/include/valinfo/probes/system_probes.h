#pragma once

/**
 * @file system_probes.h
 * @brief Probe implementations backed by OS tools (systemctl, supervisorctl, ss, ip, dpkg-query).
 *
 * The command runner is injectable so the output parsing can be exercised without the tools installed.
 */

#include <valinfo/config/configuration.h>
#include <valinfo/probes/probes.h>
#include <valinfo/util/command.h>

#include <functional>
#include <memory>

namespace valinfo::probes {

    using CommandRunner = std::function<CommandResult(const std::string&, const std::vector<std::string>&)>;

    // ========== Output interpretation ==========

    [[nodiscard]] RunState parse_systemd_active(std::string_view output);
    [[nodiscard]] EnabledState parse_systemd_enabled(std::string_view output);
    [[nodiscard]] RunState parse_supervisor_status(std::string_view output, std::string_view service);
    [[nodiscard]] EnabledState parse_supervisor_avail(std::string_view output, std::string_view service);

    // Rows of `ss -H -l -n -t -u`, the local address column split into protocol and ip
    [[nodiscard]] std::vector<SocketEntry> parse_ss_listeners(std::string_view output);

    // Finds ip in `ip -o addr show` output and returns its prefix length
    [[nodiscard]] std::optional<int> parse_ip_addr_prefix(std::string_view output, std::string_view ip);

    // ========== Probes ==========

    class SystemdControl : public ProcessControlProbe {
    public:
        explicit SystemdControl(std::string service, CommandRunner runner = run_command);
        [[nodiscard]] std::string_view backend_name() const override { return "systemd"; }
        RunState run_state() override;
        EnabledState enabled_state() override;

    private:
        std::string _service;
        CommandRunner _runner;
    };

    class SupervisorControl : public ProcessControlProbe {
    public:
        explicit SupervisorControl(std::string service, CommandRunner runner = run_command);
        [[nodiscard]] std::string_view backend_name() const override { return "supervisor"; }
        RunState run_state() override;
        EnabledState enabled_state() override;

    private:
        std::string _service;
        CommandRunner _runner;
    };

    class SsSocketTable : public SocketTableProbe {
    public:
        explicit SsSocketTable(CommandRunner runner = run_command) : _runner{std::move(runner)} {}
        std::vector<SocketEntry> list_bindings(std::uint16_t port) override;

    private:
        CommandRunner _runner;
    };

    class IpAddressTable : public AddressProbe {
    public:
        explicit IpAddressTable(CommandRunner runner = run_command) : _runner{std::move(runner)} {}
        std::optional<int> prefix_length(const std::string& ip) override;

    private:
        CommandRunner _runner;
    };

    class DpkgPackages : public PackageProbe {
    public:
        explicit DpkgPackages(CommandRunner runner = run_command) : _runner{std::move(runner)} {}
        std::optional<std::string> installed_version(const std::string& package) override;

    private:
        CommandRunner _runner;
    };

    std::unique_ptr<ProcessControlProbe> make_process_control(const Configuration& config,
                                                              CommandRunner runner = run_command);

    /**
     * Owns one production instance of each probe, the control plane selected by the configuration.
     */
    class SystemProbes {
    public:
        explicit SystemProbes(const Configuration& config, CommandRunner runner = run_command);

        [[nodiscard]] ProbeSet probes() { return {*_process, _sockets, _addresses, _packages}; }

    private:
        std::unique_ptr<ProcessControlProbe> _process;
        SsSocketTable _sockets;
        IpAddressTable _addresses;
        DpkgPackages _packages;
    };

} // namespace valinfo::probes
