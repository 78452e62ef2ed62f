#include <regex>
#include "topology_resolver.h"
#include "cluster_agent.h"
#include "cluster_errors.h"
#include "consensus_store.h"
#include "pgquorum_config.h"
#include "proxy_backends.h"
#include "string_utils.h"
#include "logger.h"

std::vector<consensus_member_t> parse_member_list(const std::string& text, const uint32_t peer_port) {
    // the address is matched up to `:<peer port> clientURLs` so that IPv6 addresses survive
    const std::regex member_regex("^([^:]+):.*peerURLs=https://(.+):" + std::to_string(peer_port) + " clientURLs");

    std::vector<consensus_member_t> members;

    for(const auto& line: StringUtils::split_lines(text)) {
        std::smatch match;
        if(!std::regex_search(line, match, member_regex)) {
            LOG(WARNING) << "Skipping unrecognised member list line: " << line;
            continue;
        }

        members.push_back(consensus_member_t{match[1].str(), match[2].str()});
    }

    return members;
}

std::optional<node_address_t> parse_primary_dsn(const std::string& dsn, const uint32_t db_port) {
    const std::regex dsn_regex("host=(.*) port=" + std::to_string(db_port));

    std::smatch match;
    if(!std::regex_search(dsn, match, dsn_regex) || match[1].str().empty()) {
        return std::nullopt;
    }

    return match[1].str();
}

ConsensusTopologyResolver::ConsensusTopologyResolver(const Config& config, ConsensusStore& store,
                                                     ClusterAgent& agent):
        config(config), store(store), agent(agent) {

}

Option<cluster_topology_t> ConsensusTopologyResolver::resolve() {
    const auto health_op = store.cluster_health();
    if(!health_op.ok()) {
        return Option<cluster_topology_t>(cluster_error::TOPOLOGY_UNAVAILABLE, health_op.error());
    }

    const std::string& health = health_op.get_ref();
    if(health.find("cluster is unavailable") != std::string::npos ||
       health.find("failed to list members") != std::string::npos) {
        LOG(ERROR) << "Etcd cluster health check failed: " << health;
        return Option<cluster_topology_t>(cluster_error::TOPOLOGY_UNAVAILABLE,
                                          "Etcd is not responding on this node. "
                                          "Please retry this command on another DB cluster node.");
    }

    const auto members_op = store.member_list();
    if(!members_op.ok()) {
        return Option<cluster_topology_t>(cluster_error::TOPOLOGY_UNAVAILABLE,
                                          "Could not list etcd members: " + members_op.error());
    }

    const std::vector<consensus_member_t> members = parse_member_list(members_op.get_ref(),
                                                                      config.get_consensus_peer_port());

    cluster_topology_t topology;

    const auto dsn_op = agent.primary_dsn();
    if(dsn_op.ok()) {
        topology.primary = parse_primary_dsn(dsn_op.get_ref(), config.get_db_port());
    } else {
        LOG(WARNING) << "Could not retrieve primary DSN: " << dsn_op.error();
    }

    if(!topology.primary) {
        LOG(WARNING) << "Could not determine the current primary.";
    }

    for(const auto& member: members) {
        if(!topology.is_member(member.address)) {
            topology.replicas.push_back(member.address);
        }
    }

    return Option<cluster_topology_t>(topology);
}

ProxyTopologyResolver::ProxyTopologyResolver(ProxyBackends& backends): backends(backends) {

}

Option<cluster_topology_t> ProxyTopologyResolver::resolve() {
    const auto backends_op = backends.list_backends();
    if(!backends_op.ok()) {
        return Option<cluster_topology_t>(cluster_error::TOPOLOGY_UNAVAILABLE,
                                          "Could not read DB proxy backends: " + backends_op.error());
    }

    cluster_topology_t topology;

    for(const auto& backend: backends_op.get_ref()) {
        const node_address_t address = HaproxyBackends::backend_address(backend.svname);
        if(address.empty()) {
            LOG(WARNING) << "Skipping proxy backend without an address: " << backend.svname;
            continue;
        }

        if(topology.is_member(address)) {
            continue;
        }

        if(backend.status == "UP") {
            if(!topology.primary) {
                topology.primary = address;
                continue;
            }

            LOG(ERROR) << "More than one DB proxy backend is UP: " << topology.primary.value()
                       << " and " << address << ". Listing " << address << " as a replica.";
        }

        topology.replicas.push_back(address);
    }

    return Option<cluster_topology_t>(topology);
}

Option<std::shared_ptr<TopologyResolver>> create_topology_resolver(const Config& config, ConsensusStore& store,
                                                                   ClusterAgent& agent, ProxyBackends& backends) {
    switch(config.get_node_role()) {
        case NodeRole::DATABASE:
            return Option<std::shared_ptr<TopologyResolver>>(
                    std::make_shared<ConsensusTopologyResolver>(config, store, agent));
        case NodeRole::CLIENT:
            return Option<std::shared_ptr<TopologyResolver>>(std::make_shared<ProxyTopologyResolver>(backends));
        default:
            break;
    }

    return Option<std::shared_ptr<TopologyResolver>>(cluster_error::ROLE_UNSUPPORTED,
                                                     "Can only list DB nodes from a manager or DB node.");
}
