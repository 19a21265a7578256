#include <valinfo/config/configuration.h>
#include <valinfo/probes/system_probes.h>
#include <valinfo/runtime/history_service.h>
#include <valinfo/util/errors.h>
#include <valinfo/util/logging.h>

#include <boost/program_options.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <iostream>

namespace po = boost::program_options;

namespace {

    constexpr int EXIT_OK = 0;
    constexpr int EXIT_STORE_FAILURE = 1;
    constexpr int EXIT_BAD_REQUEST = 2;

    valinfo::store_key_t timestamp_option(const po::variables_map& vm, const char* name) {
        const auto& text = vm[name].as<std::string>();
        auto parsed = valinfo::parse_timestamp(text);
        if (!parsed) {
            throw po::error(
                fmt::format("--{} expects an integer timestamp or 'YYYY-MM-DD HH:MM:SS', got '{}'", name, text));
        }
        return *parsed;
    }

    void print_reports(const std::vector<valinfo::StoreReport>& reports) {
        for (const auto& report : reports) {
            fmt::print("==> {} <==\n", report.name);
            if (report.error) {
                fmt::print(stderr, "{}: {}\n", report.name, *report.error);
                continue;
            }
            for (const auto& block : report.blocks) {
                if (block.empty()) continue;
                fmt::print("{}\n\n", block);
            }
            for (const auto& missing : report.missing_paths) { fmt::print(stderr, "{}: {}\n", report.name, missing); }
        }
    }

} // namespace

int main(int argc, char** argv) {
    using namespace valinfo;

    po::options_description desc("valinfo_history - show recorded validator info samples");
    // clang-format off
    desc.add_options()
        ("help,h", "show this help")
        ("history-dir", po::value<std::string>(), "directory holding the <node>.validator_info.db stores")
        ("node", po::value<std::string>(), "only show this node's store")
        ("count,n", po::value<size_t>()->default_value(1), "number of most recent records, 0 for all")
        ("from-start", po::bool_switch(), "all records from the first one (count is not applied)")
        ("from", po::value<std::string>(), "first timestamp of a window (integer or 'YYYY-MM-DD HH:MM:SS')")
        ("to", po::value<std::string>(), "last timestamp of a window (integer or 'YYYY-MM-DD HH:MM:SS')")
        ("json", po::bool_switch(), "canonical JSON output")
        ("tree", po::bool_switch(), "flat indented tree output")
        ("verbose,v", po::bool_switch(), "include verbose narrative lines")
        ("field", po::value<std::vector<std::string>>()->composing(), "only show this dotted field path (repeatable)")
        ("control-plane", po::value<std::string>(), "process control backend: systemd or supervisor")
        ("log-level", po::value<std::string>(), "trace, debug, info, warning, error, critical or off");
    // clang-format on

    Configuration config;
    HistoryRequest request;
    try {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << desc << '\n';
            return EXIT_OK;
        }

        config = Configuration::from_environment();
        if (vm.count("history-dir")) config.history_dir = vm["history-dir"].as<std::string>();
        if (vm.count("control-plane")) config.control_plane = parse_control_plane(vm["control-plane"].as<std::string>());
        if (vm.count("log-level")) config.log_level = vm["log-level"].as<std::string>();
        log::set_level(config.log_level);

        auto count = vm["count"].as<size_t>();
        request.query.count = count == 0 ? std::nullopt : std::optional<size_t>{count};
        request.query.from_start = vm["from-start"].as<bool>();
        if (vm.count("from")) request.query.from_ts = timestamp_option(vm, "from");
        if (vm.count("to")) request.query.to_ts = timestamp_option(vm, "to");
        if (vm.count("node")) request.node = vm["node"].as<std::string>();
        if (vm.count("field")) request.field_paths = vm["field"].as<std::vector<std::string>>();
        request.verbose = vm["verbose"].as<bool>();

        if (vm["json"].as<bool>() && vm["tree"].as<bool>()) {
            throw po::error("--json and --tree are mutually exclusive");
        }
        if (vm["json"].as<bool>()) request.mode = render::OutputMode::Json;
        if (vm["tree"].as<bool>()) request.mode = render::OutputMode::Tree;
    } catch (const po::error& e) {
        std::cerr << e.what() << '\n' << desc << '\n';
        return EXIT_BAD_REQUEST;
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "{}\n", e.what());
        return EXIT_BAD_REQUEST;
    }

    log::logger()->debug("History dir {}, control plane {}", config.history_dir, to_string(config.control_plane));

    try {
        schema::ValidatorInfoSchema schema{config.packages};
        probes::SystemProbes system{config};
        HistoryService service{schema, system.probes()};
        storage::StoreCatalog catalog{config.history_dir, config.store_suffix};

        auto reports = service.run(catalog, request);
        print_reports(reports);

        bool all_ok = std::ranges::all_of(reports, [](const StoreReport& r) { return r.ok(); });
        return all_ok ? EXIT_OK : EXIT_STORE_FAILURE;
    } catch (const InvalidRange& e) {
        fmt::print(stderr, "{}\n", e.what());
        return EXIT_BAD_REQUEST;
    } catch (const InvalidPath& e) {
        fmt::print(stderr, "{}\n", e.what());
        return EXIT_BAD_REQUEST;
    } catch (const StoreError& e) {
        fmt::print(stderr, "{}\n", e.what());
        return EXIT_STORE_FAILURE;
    }
}
