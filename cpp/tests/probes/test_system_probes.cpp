/**
 * @file test_system_probes.cpp
 * @brief Output parsing of the OS tool backed probes, driven through a scripted command runner.
 */

#include <catch2/catch_test_macros.hpp>
#include <valinfo/probes/system_probes.h>
#include <valinfo/util/errors.h>

#include <map>

using namespace valinfo;
using namespace valinfo::probes;

namespace {

    struct ScriptedRunner {
        std::map<std::string, CommandResult> replies;  // keyed by "binary arg arg ..."
        std::vector<std::string> seen;

        CommandRunner runner() {
            return [this](const std::string& binary, const std::vector<std::string>& args) {
                auto line = fmt::format("{} {}", binary, fmt::join(args, " "));
                seen.push_back(line);
                auto it = replies.find(line);
                if (it == replies.end()) throw ProbeFailure(fmt::format("unexpected command: {}", line));
                return it->second;
            };
        }
    };

}  // namespace

// ============================================================================
// Parsers
// ============================================================================

TEST_CASE("parse_systemd_active", "[probes][systemd]") {
    CHECK(parse_systemd_active("active\n") == RunState::Running);
    CHECK(parse_systemd_active("inactive\n") == RunState::Stopped);
    CHECK(parse_systemd_active("failed") == RunState::Stopped);
    CHECK(parse_systemd_active("activating\n") == RunState::Indeterminate);
    CHECK(parse_systemd_active("") == RunState::Indeterminate);
}

TEST_CASE("parse_systemd_enabled", "[probes][systemd]") {
    CHECK(parse_systemd_enabled("enabled\n") == EnabledState::Enabled);
    CHECK(parse_systemd_enabled("disabled\n") == EnabledState::Disabled);
    CHECK(parse_systemd_enabled("static\n") == EnabledState::Indeterminate);
}

TEST_CASE("parse_supervisor_status", "[probes][supervisor]") {
    CHECK(parse_supervisor_status("indy-node    RUNNING   pid 1234, uptime 1:02:03\n", "indy-node") ==
          RunState::Running);
    CHECK(parse_supervisor_status("indy-node    STOPPED   Nov 01 10:00 AM\n", "indy-node") == RunState::Stopped);
    CHECK(parse_supervisor_status("indy-node    FATAL     Exited too quickly\n", "indy-node") == RunState::Stopped);
    CHECK(parse_supervisor_status("indy-node    STARTING\n", "indy-node") == RunState::Indeterminate);
    CHECK(parse_supervisor_status("other        RUNNING\n", "indy-node") == RunState::Indeterminate);
}

TEST_CASE("parse_supervisor_avail", "[probes][supervisor]") {
    std::string output = "indy-node    in use    auto      999:999\n"
                         "other        avail     manual    999:999\n";
    CHECK(parse_supervisor_avail(output, "indy-node") == EnabledState::Enabled);
    CHECK(parse_supervisor_avail(output, "other") == EnabledState::Disabled);
    CHECK(parse_supervisor_avail(output, "missing") == EnabledState::Indeterminate);
}

TEST_CASE("parse_ss_listeners - addresses and protocols", "[probes][sockets]") {
    std::string output = "tcp   LISTEN 0      128        10.0.0.2:9701       0.0.0.0:*\n"
                         "udp   UNCONN 0      0                 *:9701             *:*\n"
                         "tcp   LISTEN 0      128            [::]:9701          [::]:*\n"
                         "tcp   LISTEN 0      128   [fe80::1%eth0]:9701          [::]:*\n"
                         "garbage\n";
    auto entries = parse_ss_listeners(output);
    REQUIRE(entries.size() == 4);
    CHECK(entries[0] == SocketEntry{"tcp", "10.0.0.2"});
    CHECK(entries[1] == SocketEntry{"udp", "*"});
    CHECK(entries[2] == SocketEntry{"tcp", "::"});
    CHECK(entries[3] == SocketEntry{"tcp", "fe80::1"});
}

TEST_CASE("parse_ip_addr_prefix", "[probes][addresses]") {
    std::string output =
        "1: lo    inet 127.0.0.1/8 scope host lo\\       valid_lft forever preferred_lft forever\n"
        "2: eth0    inet 10.0.0.2/24 brd 10.0.0.255 scope global eth0\\       valid_lft forever\n"
        "2: eth0    inet6 fe80::1/64 scope link \\       valid_lft forever preferred_lft forever\n";
    CHECK(parse_ip_addr_prefix(output, "10.0.0.2") == 24);
    CHECK(parse_ip_addr_prefix(output, "fe80::1") == 64);
    CHECK_FALSE(parse_ip_addr_prefix(output, "10.0.0.3").has_value());
}

// ============================================================================
// Backends
// ============================================================================

TEST_CASE("SystemdControl - issues systemctl queries", "[probes][systemd]") {
    ScriptedRunner script;
    script.replies["systemctl is-active indy-node"] = {3, "inactive\n"};
    script.replies["systemctl is-enabled indy-node"] = {0, "enabled\n"};

    SystemdControl control{"indy-node", script.runner()};
    CHECK(control.run_state() == RunState::Stopped);
    CHECK(control.enabled_state() == EnabledState::Enabled);
    CHECK(control.backend_name() == "systemd");
}

TEST_CASE("SupervisorControl - issues supervisorctl queries", "[probes][supervisor]") {
    ScriptedRunner script;
    script.replies["supervisorctl status indy-node"] = {0, "indy-node RUNNING pid 1, uptime 0:01:00\n"};
    script.replies["supervisorctl avail"] = {0, "indy-node in use manual 999:999\n"};

    SupervisorControl control{"indy-node", script.runner()};
    CHECK(control.run_state() == RunState::Running);
    CHECK(control.enabled_state() == EnabledState::Disabled);
}

TEST_CASE("SsSocketTable - filters on the source port", "[probes][sockets]") {
    ScriptedRunner script;
    script.replies["ss -H -l -n -t -u sport = :9701"] = {0, "tcp LISTEN 0 128 0.0.0.0:9701 0.0.0.0:*\n"};

    SsSocketTable table{script.runner()};
    auto entries = table.list_bindings(9701);
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].ip == "0.0.0.0");
}

TEST_CASE("SsSocketTable - failing ss yields no entries", "[probes][sockets]") {
    ScriptedRunner script;
    script.replies["ss -H -l -n -t -u sport = :9701"] = {1, ""};

    SsSocketTable table{script.runner()};
    CHECK(table.list_bindings(9701).empty());
}

TEST_CASE("DpkgPackages - version or nothing", "[probes][packages]") {
    ScriptedRunner script;
    script.replies["dpkg-query -W -f=${Version} indy-node"] = {0, "1.12.6\n"};
    script.replies["dpkg-query -W -f=${Version} sovrin"] = {1, ""};

    DpkgPackages packages{script.runner()};
    CHECK(packages.installed_version("indy-node") == "1.12.6");
    CHECK_FALSE(packages.installed_version("sovrin").has_value());
}

TEST_CASE("make_process_control - follows the configured control plane", "[probes][config]") {
    ScriptedRunner script;
    Configuration config;
    config.control_plane = ControlPlane::Supervisor;
    CHECK(make_process_control(config, script.runner())->backend_name() == "supervisor");

    config.control_plane = ControlPlane::Systemd;
    CHECK(make_process_control(config, script.runner())->backend_name() == "systemd");
}

TEST_CASE("run_command - captures stdout and exit code", "[probes][command]") {
    auto result = run_command("sh", {"-c", "echo hello; exit 3"});
    CHECK(result.exit_code == 3);
    CHECK(result.output == "hello\n");
    CHECK_FALSE(result.succeeded());
}

TEST_CASE("run_command - missing binary is a probe failure", "[probes][command]") {
    CHECK_THROWS_AS(run_command("valinfo-no-such-binary", {}), ProbeFailure);
}
