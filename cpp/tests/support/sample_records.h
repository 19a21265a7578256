#pragma once

#include <valinfo/valinfo_base.h>

namespace valinfo::testing {

    // A complete sample as the collector writes it
    inline json sample_record() {
        return json::parse(R"({
            "response-version": "0.0.1",
            "timestamp": 1700000000,
            "Node_info": {
                "Name": "Node1",
                "did": "Gw6pDLhcBcoQesN72qfotTgFa7cbuqZpkX3Xo6pLhPhv",
                "verkey": "33nHHYKnqmtGAVfZZGoP8hpeExeH45Fo8cKmd5mcnKYk7XgWNBxkkKJ",
                "BLS_key": "4N8aUNHSgjQVgkpm8nhNEfDf6txHznoYREg9kirmJrkivgL4oSEimFF6nsQ6M41QvhM2Z33nves5vfSn9n1UwNFJBYtWVnHYMATn76vLuL3zU88KyeAYcHfsih3He6UHcXDxcaecHVz6jhCYz1P2UZn2bDVruL5wXpehgBfBaLKm3Ba",
                "Node_port": [{"port": 9701, "protocol": "tcp", "ip": "10.0.0.2/24"}],
                "Client_port": [{"port": 9702, "protocol": "tcp", "ip": "0.0.0.0/0"}],
                "Metrics": {
                    "uptime": 90061,
                    "transaction-count": {"config": 0, "ledger": 12, "pool": 4, "audit": 30},
                    "average-per-second": {"read-transactions": 0.5, "write-transactions": 1.25}
                }
            },
            "state": "running",
            "enabled": true,
            "Pool_info": {
                "Total_nodes_count": 4,
                "Reachable_nodes_count": 3,
                "Reachable_nodes": [["Node1", 0], ["Node2", 1], ["Node3", null]],
                "Unreachable_nodes_count": 1,
                "Unreachable_nodes": [["Node4", null]]
            },
            "Software": {"indy-node": "1.12.6", "sovrin": "1.1.89"}
        })");
    }

} // namespace valinfo::testing
