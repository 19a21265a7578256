#pragma once

/**
 * @file validator_schema.h
 * @brief The shape of one persisted validator info sample.
 *
 * ValidatorInfo
 *   response-version, timestamp, Update_time
 *   Node_info      Name, did, verkey, BLS_key, Node_port, Client_port,
 *                  Metrics { uptime, transaction-count {config, ledger, pool, audit},
 *                            average-per-second {read-transactions, write-transactions} }
 *   state, enabled
 *   Pool_info      Total_nodes_count, Reachable_nodes_count, Reachable_nodes, Unreachable_nodes_count,
 *                  Unreachable_nodes
 *   Software       one version per configured package
 */

#include <valinfo/types/schema/schema_node.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace valinfo::schema {

    namespace fields {
        inline constexpr std::string_view RESPONSE_VERSION = "response-version";
        inline constexpr std::string_view TIMESTAMP = "timestamp";
        inline constexpr std::string_view UPDATE_TIME = "Update_time";
        inline constexpr std::string_view NODE_INFO = "Node_info";
        inline constexpr std::string_view STATE = "state";
        inline constexpr std::string_view ENABLED = "enabled";
        inline constexpr std::string_view POOL_INFO = "Pool_info";
        inline constexpr std::string_view SOFTWARE = "Software";

        inline constexpr std::string_view NAME = "Name";
        inline constexpr std::string_view DID = "did";
        inline constexpr std::string_view VERKEY = "verkey";
        inline constexpr std::string_view BLS_KEY = "BLS_key";
        inline constexpr std::string_view NODE_PORT = "Node_port";
        inline constexpr std::string_view CLIENT_PORT = "Client_port";
        inline constexpr std::string_view METRICS = "Metrics";

        inline constexpr std::string_view UPTIME = "uptime";
        inline constexpr std::string_view TRANSACTION_COUNT = "transaction-count";
        inline constexpr std::string_view AVERAGE_PER_SECOND = "average-per-second";
        inline constexpr std::string_view CONFIG = "config";
        inline constexpr std::string_view LEDGER = "ledger";
        inline constexpr std::string_view POOL = "pool";
        inline constexpr std::string_view AUDIT = "audit";
        inline constexpr std::string_view READ_TRANSACTIONS = "read-transactions";
        inline constexpr std::string_view WRITE_TRANSACTIONS = "write-transactions";

        inline constexpr std::string_view TOTAL_NODES = "Total_nodes_count";
        inline constexpr std::string_view REACHABLE_COUNT = "Reachable_nodes_count";
        inline constexpr std::string_view REACHABLE_NODES = "Reachable_nodes";
        inline constexpr std::string_view UNREACHABLE_COUNT = "Unreachable_nodes_count";
        inline constexpr std::string_view UNREACHABLE_NODES = "Unreachable_nodes";
    } // namespace fields

    class ValidatorInfoSchema {
    public:
        explicit ValidatorInfoSchema(std::vector<std::string> packages = {"indy-node", "sovrin"});

        [[nodiscard]] const SchemaNode& root() const { return *_root; }
        [[nodiscard]] const std::vector<std::string>& packages() const { return _packages; }

    private:
        std::vector<std::string> _packages;
        std::unique_ptr<SchemaNode> _transaction_count;
        std::unique_ptr<SchemaNode> _average_per_second;
        std::unique_ptr<SchemaNode> _metrics;
        std::unique_ptr<SchemaNode> _node_info;
        std::unique_ptr<SchemaNode> _pool_info;
        std::unique_ptr<SchemaNode> _software;
        std::unique_ptr<SchemaNode> _root;
    };

} // namespace valinfo::schema
