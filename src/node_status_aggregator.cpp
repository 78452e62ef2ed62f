#include <algorithm>
#include "node_status_aggregator.h"
#include "status_probe.h"
#include "logger.h"

NodeStatusAggregator::NodeStatusAggregator(StatusProbe& probe): probe(probe) {

}

std::vector<node_address_t> NodeStatusAggregator::sync_replica_addresses(const raw_agent_status_t& primary_status) {
    std::vector<node_address_t> sync_addresses;

    for(const auto& peer: primary_status.replication) {
        if(peer.sync_state == "sync") {
            sync_addresses.push_back(peer.peer_address);
        }
    }

    return sync_addresses;
}

node_status_t NodeStatusAggregator::status_for(const node_address_t& address, const NodeStatusRole expected_role) {
    node_status_t node;
    node.address = address;

    const std::optional<raw_agent_status_t> agent_status = probe.probe_agent(address);
    const std::optional<raw_consensus_status_t> consensus_status = probe.probe_consensus(address);

    if(agent_status) {
        node.role = expected_role;
        node.log_position = (expected_role == NodeStatusRole::LEADER) ? agent_status->log_position :
                                                                         agent_status->replayed_position;
        node.timeline = agent_status->timeline;
        node.alive = (agent_status->state == "running");

        if(!node.alive) {
            node.errors.push_back("Node not running");
        }

        if(expected_role == NodeStatusRole::LEADER) {
            node.sync_replicas = sync_replica_addresses(agent_status.value());
        }

        node.reports_primary = (agent_status->role == "master" || agent_status->role == "primary" ||
                                agent_status->state == "master");
    } else {
        node.role = NodeStatusRole::UNKNOWN;
        node.alive = false;
        node.errors.push_back("Could not retrieve DB status");
    }

    if(consensus_status) {
        node.consensus_role = consensus_status->role;
    } else {
        node.consensus_role = ConsensusRole::DEAD;
        node.errors.push_back("Could not retrieve etcd status");
    }

    return node;
}

node_status_t NodeStatusAggregator::replica_status_for(const node_address_t& address,
                                                       const std::vector<node_address_t>& sync_replica_addresses) {
    const bool is_sync = std::find(sync_replica_addresses.begin(), sync_replica_addresses.end(), address) !=
                         sync_replica_addresses.end();
    return status_for(address, is_sync ? NodeStatusRole::SYNC_REPLICA : NodeStatusRole::ASYNC_REPLICA);
}
