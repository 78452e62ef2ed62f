#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "option.h"
#include "cluster_types.h"

class Config;
class ConsensusStore;
class ClusterAgent;
class ProxyBackends;

struct consensus_member_t {
    std::string id;
    node_address_t address;
};

class TopologyResolver {
public:
    virtual ~TopologyResolver() = default;

    // Current primary (empty when it cannot be determined) and the remaining members as replicas.
    virtual Option<cluster_topology_t> resolve() = 0;
};

// Resolves topology from the consensus store's member list and the HA agent's record of the primary.
class ConsensusTopologyResolver: public TopologyResolver {
private:
    const Config& config;
    ConsensusStore& store;
    ClusterAgent& agent;

public:
    ConsensusTopologyResolver(const Config& config, ConsensusStore& store, ClusterAgent& agent);

    Option<cluster_topology_t> resolve() override;
};

// Resolves topology from the database proxy's health-checked backends: the backend that is UP is the primary.
class ProxyTopologyResolver: public TopologyResolver {
private:
    ProxyBackends& backends;

public:
    explicit ProxyTopologyResolver(ProxyBackends& backends);

    Option<cluster_topology_t> resolve() override;
};

/**
 * Parses `etcdctl member list` output, e.g.
 *   abc123def: name=etcd192_0_2_1 peerURLs=https://192.0.2.1:2380 clientURLs=https://192.0.2.1:2379 isLeader=false
 * Lines that do not match are logged and skipped.
 */
std::vector<consensus_member_t> parse_member_list(const std::string& text, uint32_t peer_port);

// Extracts the host from a DSN of the form `host=192.0.2.1 port=5432`.
std::optional<node_address_t> parse_primary_dsn(const std::string& dsn, uint32_t db_port);

// Picks the resolver matching the node role: database nodes talk to the consensus store directly,
// client nodes only see the proxy.
Option<std::shared_ptr<TopologyResolver>> create_topology_resolver(const Config& config, ConsensusStore& store,
                                                                   ClusterAgent& agent, ProxyBackends& backends);
