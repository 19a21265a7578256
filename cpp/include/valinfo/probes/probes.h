#pragma once

/**
 * @file probes.h
 * @brief Injectable views of live system state used to fill in unknown record fields.
 *
 * Production implementations shell out to OS tools (see system_probes.h), tests substitute fakes. Any probe may
 * throw ProbeFailure when it cannot run at all; an answer it cannot interpret is reported as indeterminate / empty,
 * not as an error.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace valinfo::probes {

    enum class RunState { Running, Stopped, Indeterminate };
    enum class EnabledState { Enabled, Disabled, Indeterminate };

    [[nodiscard]] std::string_view to_string(RunState state);
    [[nodiscard]] std::string_view to_string(EnabledState state);

    class ProcessControlProbe {
    public:
        virtual ~ProcessControlProbe() = default;
        [[nodiscard]] virtual std::string_view backend_name() const = 0;
        virtual RunState run_state() = 0;
        virtual EnabledState enabled_state() = 0;
    };

    struct SocketEntry {
        std::string protocol;  // "tcp" / "udp"
        std::string ip;        // local address as reported, "*" for the wildcard

        bool operator==(const SocketEntry&) const = default;
    };

    class SocketTableProbe {
    public:
        virtual ~SocketTableProbe() = default;
        virtual std::vector<SocketEntry> list_bindings(std::uint16_t port) = 0;
    };

    class AddressProbe {
    public:
        virtual ~AddressProbe() = default;
        // Prefix length of the network an address is configured on, nullopt when no interface carries it
        virtual std::optional<int> prefix_length(const std::string& ip) = 0;
    };

    class PackageProbe {
    public:
        virtual ~PackageProbe() = default;
        virtual std::optional<std::string> installed_version(const std::string& package) = 0;
    };

    /**
     * The set of probes an enrichment pass draws on. Non-owning.
     */
    struct ProbeSet {
        ProcessControlProbe& process;
        SocketTableProbe& sockets;
        AddressProbe& addresses;
        PackageProbe& packages;
    };

} // namespace valinfo::probes
