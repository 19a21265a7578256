#include <valinfo/enrichment/enrichment.h>
#include <valinfo/types/schema/validator_schema.h>

namespace valinfo::schema {

    ValidatorInfoSchema::ValidatorInfoSchema(std::vector<std::string> packages) : _packages{std::move(packages)} {
        using namespace value;
        using std::string;

        _transaction_count = SchemaNodeBuilder()
            .add_field(string{fields::CONFIG}, plain_type())
            .add_field(string{fields::LEDGER}, plain_type())
            .add_field(string{fields::POOL}, plain_type())
            .add_field(string{fields::AUDIT}, plain_type())
            .build("TransactionCount");

        _average_per_second = SchemaNodeBuilder()
            .add_field(string{fields::READ_TRANSACTIONS}, float_type())
            .add_field(string{fields::WRITE_TRANSACTIONS}, float_type())
            .build("AveragePerSecond");

        _metrics = SchemaNodeBuilder()
            .add_field(string{fields::UPTIME}, duration_type())
            .add_field(string{fields::TRANSACTION_COUNT}, _transaction_count.get())
            .add_field(string{fields::AVERAGE_PER_SECOND}, _average_per_second.get())
            .build("Metrics");

        _node_info = SchemaNodeBuilder()
            .add_field(string{fields::NAME}, plain_type())
            .add_field(string{fields::DID}, plain_type())
            .add_field(string{fields::VERKEY}, plain_type())
            .add_field(string{fields::BLS_KEY}, plain_type())
            .add_field(string{fields::NODE_PORT}, bindings_type(), enrichment::bindings_enricher())
            .add_field(string{fields::CLIENT_PORT}, bindings_type(), enrichment::bindings_enricher())
            .add_field(string{fields::METRICS}, _metrics.get())
            .build("NodeInfo");

        _pool_info = SchemaNodeBuilder()
            .add_field(string{fields::TOTAL_NODES}, plain_type())
            .add_field(string{fields::REACHABLE_COUNT}, plain_type())
            .add_field(string{fields::REACHABLE_NODES}, alias_list_type())
            .add_field(string{fields::UNREACHABLE_COUNT}, plain_type())
            .add_field(string{fields::UNREACHABLE_NODES}, alias_list_type())
            .build("PoolInfo");

        SchemaNodeBuilder software;
        for (const auto& package : _packages) {
            software.add_field(package, software_version_type(), enrichment::package_version_enricher());
        }
        _software = software.build("SoftwareInfo");

        _root = SchemaNodeBuilder()
            .add_field(string{fields::RESPONSE_VERSION}, plain_type())
            .add_field(string{fields::TIMESTAMP}, plain_type())
            .add_field(string{fields::UPDATE_TIME}, plain_type())
            .add_field(string{fields::NODE_INFO}, _node_info.get())
            .add_field(string{fields::STATE}, run_state_type(), enrichment::run_state_enricher())
            .add_field(string{fields::ENABLED}, enabled_state_type(), enrichment::enabled_state_enricher())
            .add_field(string{fields::POOL_INFO}, _pool_info.get())
            .add_field(string{fields::SOFTWARE}, _software.get())
            .build("ValidatorInfo");
    }

} // namespace valinfo::schema
