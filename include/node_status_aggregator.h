#pragma once

#include <vector>
#include "cluster_types.h"

class StatusProbe;

/**
 * Builds the normalized status of a single member from its agent and consensus store probes. The two
 * probes are independent: a member whose agent is down still reports its consensus role and vice versa.
 */
class NodeStatusAggregator {
private:
    StatusProbe& probe;

public:
    explicit NodeStatusAggregator(StatusProbe& probe);

    // `expected_role` comes from the topology and the primary's replication report, not from the node itself.
    node_status_t status_for(const node_address_t& address, NodeStatusRole expected_role);

    // Picks the sync or async replica role from the primary's list of synchronous standbys.
    node_status_t replica_status_for(const node_address_t& address,
                                     const std::vector<node_address_t>& sync_replica_addresses);

    static std::vector<node_address_t> sync_replica_addresses(const raw_agent_status_t& primary_status);
};
