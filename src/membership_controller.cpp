#include "membership_controller.h"
#include "access_list.h"
#include "cluster_agent.h"
#include "cluster_errors.h"
#include "consensus_store.h"
#include "pgquorum_config.h"
#include "proxy_backends.h"
#include "service_manager.h"
#include "status_probe.h"
#include "topology_resolver.h"
#include "logger.h"

MembershipController::MembershipController(const Config& config, TopologyResolver& resolver, StatusProbe& probe,
                                           ConsensusStore& store, ClusterAgent& agent, ProxyBackends& backends,
                                           ServiceManager& services, sleep_fn_t sleep_fn):
        config(config), resolver(resolver), probe(probe), store(store), agent(agent),
        backends(backends), services(services), sleep_fn(std::move(sleep_fn)) {

}

Option<bool> MembershipController::restart_dependent_services() {
    LOG(INFO) << "Restarting DB proxy and DB-dependent services.";

    for(const auto& service: config.get_dependent_services()) {
        const auto restart_op = services.restart(service);
        if(!restart_op.ok()) {
            return restart_op;
        }
    }

    return Option<bool>(true);
}

Option<bool> MembershipController::add(const node_address_t& address) {
    if(config.get_node_role() == NodeRole::DATABASE) {
        return Option<bool>(cluster_error::WRONG_ROLE,
                            "Database cluster nodes should be added to the cluster during install, "
                            "by setting the appropriate entries in the configuration.");
    }

    const auto topology_op = resolver.resolve();
    if(!topology_op.ok()) {
        return Option<bool>(topology_op.code(), topology_op.error());
    }

    if(topology_op.get_ref().is_member(address)) {
        return Option<bool>(cluster_error::ALREADY_MEMBER,
                            "Cannot add DB node " + address + " to cluster, as it is already part of the cluster.");
    }

    if(!probe.probe_agent(address)) {
        return Option<bool>(cluster_error::NODE_NOT_RESPONDING,
                            "DB cluster node " + address + " does not appear to be operational. Please ensure "
                            "DB cluster management software is installed and running before trying to add the node.");
    }

    const auto append_op = backends.append_backend(address);
    if(!append_op.ok()) {
        return append_op;
    }

    const auto restart_op = restart_dependent_services();
    if(!restart_op.ok()) {
        return restart_op;
    }

    LOG(INFO) << "Node " << address << " added.";
    return Option<bool>(true);
}

Option<bool> MembershipController::remove_consensus_member(const node_address_t& address) {
    const auto members_op = store.member_list();
    if(!members_op.ok()) {
        return Option<bool>(members_op.code(), members_op.error());
    }

    std::string member_id;
    for(const auto& member: parse_member_list(members_op.get_ref(), config.get_consensus_peer_port())) {
        if(member.address == address) {
            member_id = member.id;
            break;
        }
    }

    if(member_id.empty()) {
        return Option<bool>(cluster_error::MEMBER_NOT_FOUND,
                            "Cannot find node with address " + address + " for removal.");
    }

    // a blob that cannot be edited must fail the call before the membership changes
    const auto precheck_blob_op = store.get_key(config.get_config_blob_key(), true);
    if(!precheck_blob_op.ok()) {
        return Option<bool>(precheck_blob_op.code(), precheck_blob_op.error());
    }

    const auto precheck_op = remove_node_entries(precheck_blob_op.get_ref(), address);
    if(!precheck_op.ok()) {
        return Option<bool>(precheck_op.code(), precheck_op.error());
    }

    LOG(INFO) << "Removing etcd node " << address << " (" << member_id << ")";

    const auto remove_op = store.remove_member(member_id);
    if(!remove_op.ok()) {
        return remove_op;
    }

    LOG(INFO) << "Updating pg_hba to remove " << address;

    // read back after the membership change so that no concurrent edit of the blob is lost
    const auto blob_op = store.get_key(config.get_config_blob_key(), true);
    if(!blob_op.ok()) {
        return Option<bool>(blob_op.code(), blob_op.error());
    }

    const auto updated_blob_op = remove_node_entries(blob_op.get_ref(), address);
    if(!updated_blob_op.ok()) {
        return Option<bool>(updated_blob_op.code(), updated_blob_op.error());
    }

    return store.set_key(config.get_config_blob_key(), updated_blob_op.get_ref(), true);
}

Option<bool> MembershipController::remove(const node_address_t& address) {
    const auto topology_op = resolver.resolve();
    if(!topology_op.ok()) {
        return Option<bool>(topology_op.code(), topology_op.error());
    }

    const cluster_topology_t& topology = topology_op.get_ref();

    if(topology.replicas.size() < 2) {
        return Option<bool>(cluster_error::LAST_REPLICA,
                            "The last replica cannot be removed. "
                            "A new replica must be added before removing the target node.");
    }

    if(topology.is_primary(address)) {
        return Option<bool>(cluster_error::CANNOT_REMOVE_PRIMARY,
                            "The currently active DB master node cannot be removed. "
                            "Please set the master to a different node before retrying this command.");
    }

    const NodeRole role = config.get_node_role();

    if(role == NodeRole::DATABASE) {
        const auto remove_op = remove_consensus_member(address);
        if(!remove_op.ok()) {
            return remove_op;
        }
    } else if(role == NodeRole::CLIENT) {
        const auto remove_op = backends.remove_backend(address);
        if(!remove_op.ok()) {
            return remove_op;
        }

        const auto restart_op = restart_dependent_services();
        if(!restart_op.ok()) {
            return restart_op;
        }
    } else {
        return Option<bool>(cluster_error::ROLE_UNSUPPORTED, "Can only remove DB nodes from a manager or DB node.");
    }

    LOG(INFO) << "Node " << address << " removed.";
    return Option<bool>(true);
}

Option<bool> MembershipController::reinit(const node_address_t& address) {
    const auto topology_op = resolver.resolve();
    if(!topology_op.ok()) {
        return Option<bool>(topology_op.code(), topology_op.error());
    }

    const cluster_topology_t& topology = topology_op.get_ref();

    if(topology.is_primary(address)) {
        return Option<bool>(cluster_error::CANNOT_REINIT_PRIMARY,
                            "The currently active DB master node cannot be reinitialised.");
    }

    if(!topology.is_member(address)) {
        return Option<bool>(cluster_error::NOT_A_MEMBER,
                            "Cannot reinitialise DB node " + address + ", as it is not part of the cluster.");
    }

    if(config.get_node_role() != NodeRole::DATABASE) {
        return Option<bool>(cluster_error::WRONG_ROLE, "Reinitialise can only be run from a DB node.");
    }

    LOG(INFO) << "Reinitialising DB node " << address;

    const auto reinit_op = agent.reinit(agent_member_name(address));
    if(!reinit_op.ok()) {
        return reinit_op;
    }

    LOG(INFO) << "DB node " << address << " reinitialised.";
    return Option<bool>(true);
}

Option<bool> MembershipController::promote(const node_address_t& address) {
    const auto topology_op = resolver.resolve();
    if(!topology_op.ok()) {
        return Option<bool>(topology_op.code(), topology_op.error());
    }

    const cluster_topology_t& topology = topology_op.get_ref();

    if(topology.is_primary(address)) {
        return Option<bool>(cluster_error::ALREADY_PRIMARY, "The selected node is the current master.");
    }

    if(!topology.is_member(address)) {
        return Option<bool>(cluster_error::NOT_A_MEMBER,
                            "Cannot make DB node " + address + " master, as it is not part of the cluster.");
    }

    if(config.get_node_role() != NodeRole::DATABASE) {
        return Option<bool>(cluster_error::WRONG_ROLE, "Set master can only be run from a DB node.");
    }

    LOG(INFO) << "Changing master to " << address;

    const auto switchover_op = agent.switchover(agent_member_name(address));
    if(!switchover_op.ok()) {
        return switchover_op;
    }

    const uint32_t attempts = config.get_promote_poll_attempts();
    std::string current_primary = "unknown";

    for(uint32_t attempt = 0; attempt < attempts; attempt++) {
        const auto poll_op = resolver.resolve();

        if(poll_op.ok()) {
            if(poll_op.get_ref().is_primary(address)) {
                LOG(INFO) << "Master changed to " << address;
                return Option<bool>(true);
            }

            current_primary = poll_op.get_ref().primary.value_or("unknown");
        } else {
            LOG(WARNING) << "Could not resolve the cluster topology: " << poll_op.error();
        }

        LOG(INFO) << "Waiting for master to change to " << address << ". Current master is " << current_primary << ".";

        if(attempt + 1 < attempts) {
            sleep_fn(config.get_promote_poll_interval_ms());
        }
    }

    LOG(WARNING) << "Master has not changed to " << address << ". Master is currently " << current_primary << ". "
                 << "This may indicate the master changed to the specified node and then changed again, "
                 << "or that the change did not occur. Please check cluster health before retrying this operation.";

    return Option<bool>(true);
}

Option<bool> MembershipController::grant_access(const node_address_t& address) {
    if(config.get_node_role() != NodeRole::DATABASE) {
        return Option<bool>(cluster_error::WRONG_ROLE, "Access can only be granted from a DB node.");
    }

    const auto blob_op = store.get_key(config.get_config_blob_key(), true);
    if(!blob_op.ok()) {
        return Option<bool>(blob_op.code(), blob_op.error());
    }

    bool changed = false;
    const auto updated_blob_op = ensure_node_access(blob_op.get_ref(), address, changed);
    if(!updated_blob_op.ok()) {
        return Option<bool>(updated_blob_op.code(), updated_blob_op.error());
    }

    if(!changed) {
        LOG(INFO) << "pg_hba already allows " << address;
        return Option<bool>(true);
    }

    LOG(INFO) << "Updating pg_hba to allow " << address;
    return store.set_key(config.get_config_blob_key(), updated_blob_op.get_ref(), true);
}
